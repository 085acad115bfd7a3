//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolEngine.cpp
// Purpose: JSON-RPC correlation engine and typed MCP operations
//==========================================================================================================

#include "mcprt/ProtocolEngine.h"

#include <atomic>
#include <mutex>
#include <unordered_map>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcprt/async/FutureAwaitable.h"
#include "mcprt/async/Task.h"

namespace mcprt {

using namespace std::chrono;

namespace {

template <typename T>
std::future<T> failedFuture(std::exception_ptr ex) {
    std::promise<T> p;
    p.set_exception(ex);
    return p.get_future();
}

std::string joinErrors(const std::vector<std::string>& errs) {
    std::string out;
    for (size_t k = 0; k < errs.size(); ++k) {
        if (k > 0) out += "; ";
        out += errs[k];
    }
    return out;
}

template <typename T, typename F>
std::vector<T> listFrom(const JSONValue& result, const char* key, F convert) {
    std::vector<T> out;
    const JSONValue* arr = FindMember(result, key);
    if (!arr || !arr->IsArray()) return out;
    for (const auto& item : std::get<JSONValue::Array>(arr->value)) {
        if (item && item->IsObject()) out.push_back(convert(*item));
    }
    return out;
}

////////////////////////////////////////// Coroutine helpers //////////////////////////////////////////

async::Task<InitializeResult> coInitialize(std::future<JSONValue> fut) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    InitializeResult r = InitializeResultFromJSON(result);
    if (!IsVersionSupported(r.protocolVersion)) {
        throw errors::ProtocolError("Server responded with unsupported protocol version: " + r.protocolVersion);
    }
    co_return r;
}

async::Task<void> coDiscard(std::future<JSONValue> fut) {
    (void)co_await async::makeFutureAwaitable(std::move(fut));
    co_return;
}

async::Task<std::vector<Tool>> coListTools(std::future<JSONValue> fut) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    co_return listFrom<Tool>(result, "tools", ToolFromJSON);
}

async::Task<std::vector<Resource>> coListResources(std::future<JSONValue> fut) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    co_return listFrom<Resource>(result, "resources", ResourceFromJSON);
}

async::Task<std::vector<Prompt>> coListPrompts(std::future<JSONValue> fut) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    co_return listFrom<Prompt>(result, "prompts", PromptFromJSON);
}

async::Task<std::vector<Root>> coListRoots(std::future<JSONValue> fut) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    co_return listFrom<Root>(result, "roots", RootFromJSON);
}

async::Task<CallToolResult> coCallTool(std::future<JSONValue> fut) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    co_return CallToolResultFromJSON(result);
}

async::Task<GetPromptResult> coGetPrompt(std::future<JSONValue> fut) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    co_return GetPromptResultFromJSON(result);
}

async::Task<JSONValue> coReadResource(std::future<JSONValue> fut, std::string uri) {
    JSONValue result = co_await async::makeFutureAwaitable(std::move(fut));
    const JSONValue* contents = FindMember(result, "contents");
    if (!contents || !contents->IsArray() || std::get<JSONValue::Array>(contents->value).empty()
        || !std::get<JSONValue::Array>(contents->value).front()) {
        throw errors::ProtocolError("No content returned for resource: " + uri);
    }
    co_return *std::get<JSONValue::Array>(contents->value).front();
}

} // namespace

////////////////////////////////////////// Impl //////////////////////////////////////////

struct ProtocolEngine::Impl : std::enable_shared_from_this<ProtocolEngine::Impl> {
    struct Pending {
        uint64_t seq = 0;
        std::string displayId;
        std::string method;
        std::promise<JSONValue> promise;
        std::shared_ptr<net::steady_timer> timer;
        steady_clock::time_point start;
    };

    EventLoop& loop;
    mutable std::mutex mutex;
    std::unordered_map<std::string, Pending> pending;
    std::atomic<uint64_t> idCounter{0};
    uint64_t nextSeq{0};
    milliseconds requestTimeout;

    Impl(EventLoop& l, milliseconds timeout) : loop(l), requestTimeout(timeout) {}

    // Removes the entry only when it is still the same registration.
    std::optional<Pending> take(const std::string& key, std::optional<uint64_t> seq = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = pending.find(key);
        if (it == pending.end()) return std::nullopt;
        if (seq && it->second.seq != *seq) return std::nullopt;
        Pending p = std::move(it->second);
        pending.erase(it);
        return p;
    }

    void onTimeout(const std::string& key, uint64_t seq) {
        auto p = take(key, seq);
        if (!p) return;
        auto elapsed = duration_cast<milliseconds>(steady_clock::now() - p->start).count();
        LOG_WARN("Request {} ({}) timed out after {}ms", p->displayId, p->method, elapsed);
        p->promise.set_exception(std::make_exception_ptr(errors::TimeoutError(
            "Request " + p->displayId + " timed out after " + std::to_string(elapsed) + "ms")));
    }
};

ProtocolEngine::ProtocolEngine(EventLoop& loop, ProtocolOptions options) {
    FUNC_SCOPE();
    milliseconds timeout = options.requestTimeout;
    if (auto envMs = GetEnvMilliseconds("MCPRT_REQUEST_TIMEOUT_MS")) {
        timeout = milliseconds(*envMs);
        LOG_DEBUG("ProtocolEngine: request timeout overridden by MCPRT_REQUEST_TIMEOUT_MS={}", *envMs);
    }
    pImpl = std::make_shared<Impl>(loop, timeout);
}

ProtocolEngine::~ProtocolEngine() {
    FUNC_SCOPE();
    Cleanup();
}

////////////////////////////////////////// Construction //////////////////////////////////////////

JSONRPCId ProtocolEngine::GenerateId() {
    auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    uint64_t n = ++pImpl->idCounter;
    return JSONRPCId{"mcp-" + std::to_string(ms) + "-" + std::to_string(n)};
}

JSONRPCRequest ProtocolEngine::CreateRequest(const std::string& method, std::optional<JSONValue> params,
                                             std::optional<JSONRPCId> id) {
    return JSONRPCRequest(id ? std::move(*id) : GenerateId(), method, std::move(params));
}

JSONRPCNotification ProtocolEngine::CreateNotification(const std::string& method, std::optional<JSONValue> params) {
    return JSONRPCNotification(method, std::move(params));
}

JSONRPCResponse ProtocolEngine::CreateResponse(const JSONRPCId& id, JSONValue result) {
    return JSONRPCResponse(id, std::move(result));
}

JSONRPCResponse ProtocolEngine::CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                    const std::optional<JSONValue>& data) {
    return JSONRPCResponse(id, CreateErrorObject(code, message, data), true);
}

JSONValue ProtocolEngine::CreateError(int code, const std::string& message, const std::optional<JSONValue>& data) {
    return CreateErrorObject(code, message, data);
}

////////////////////////////////////////// Parsing //////////////////////////////////////////

MessageValidation ProtocolEngine::ValidateMessage(const JSONValue& message) {
    MessageValidation v;
    auto fail = [&v](std::string e) { v.valid = false; v.errors.push_back(std::move(e)); };

    if (!message.IsObject()) {
        fail("Message must be a JSON object");
        return v;
    }
    auto version = GetString(message, "jsonrpc");
    if (!version || *version != "2.0") {
        fail("jsonrpc field must be \"2.0\"");
    }
    const JSONValue* method = FindMember(message, "method");
    const JSONValue* id = FindMember(message, "id");
    if (!method && !id) {
        fail("Message must have either method or id field");
        return v;
    }
    if (method && !method->IsString()) {
        fail("method must be a string");
    }
    if (const JSONValue* params = FindMember(message, "params")) {
        if (!params->IsObject() && !params->IsArray()) {
            fail("params must be an object or array");
        }
    }
    if (method && id) {
        if (id->IsNull()) {
            fail("Request ID must not be null");
        } else if (!id->IsString() && !std::holds_alternative<int64_t>(id->value)) {
            fail("Request ID must be a string or number");
        }
    } else if (id) {
        if (!id->IsNull() && !id->IsString() && !std::holds_alternative<int64_t>(id->value)) {
            fail("Response ID must be a string, number or null");
        }
        const JSONValue* result = FindMember(message, "result");
        const JSONValue* error = FindMember(message, "error");
        if (!result && !error) {
            fail("Response must have either result or error");
        } else if (result && error) {
            fail("Response must not have both result and error");
        } else if (error && (!GetInteger(*error, "code") || !GetString(*error, "message"))) {
            fail("Response error must be an object with integer code and string message");
        }
    }
    return v;
}

ParsedMessage ProtocolEngine::ParseMessage(const std::string& raw) {
    FUNC_SCOPE();
    JSONValue value = ParseJSON(raw);
    MessageValidation v = ValidateMessage(value);
    if (!v.valid) {
        throw errors::ProtocolError("Invalid JSON-RPC message: " + joinErrors(v.errors));
    }
    const bool hasMethod = FindMember(value, "method") != nullptr;
    const bool hasId = FindMember(value, "id") != nullptr;
    if (hasMethod && hasId) {
        JSONRPCRequest req;
        req.FromJSON(value);
        return req;
    }
    if (hasMethod) {
        JSONRPCNotification n;
        n.FromJSON(value);
        return n;
    }
    JSONRPCResponse resp;
    resp.FromJSON(value);
    return resp;
}

////////////////////////////////////////// Correlation //////////////////////////////////////////

std::future<JSONValue> ProtocolEngine::SendRequest(ITransport& transport, const std::string& method,
                                                   std::optional<JSONValue> params) {
    return SendRequest(transport, GenerateId(), method, std::move(params));
}

std::future<JSONValue> ProtocolEngine::SendRequest(ITransport& transport, const JSONRPCId& id, const std::string& method,
                                                   std::optional<JSONValue> params,
                                                   std::optional<milliseconds> timeout) {
    FUNC_SCOPE();
    const std::string key = IdKey(id);
    std::future<JSONValue> fut;
    uint64_t seq = 0;
    milliseconds effectiveTimeout{0};
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->pending.count(key) != 0) {
            return failedFuture<JSONValue>(std::make_exception_ptr(
                errors::ProtocolError("Duplicate request id: " + IdToString(id))));
        }
        Impl::Pending p;
        p.seq = seq = ++pImpl->nextSeq;
        p.displayId = IdToString(id);
        p.method = method;
        p.start = steady_clock::now();
        fut = p.promise.get_future();
        pImpl->pending.emplace(key, std::move(p));
        effectiveTimeout = timeout.value_or(pImpl->requestTimeout);
    }

    std::weak_ptr<Impl> weak = pImpl;
    auto timer = pImpl->loop.ScheduleTimer(effectiveTimeout, [weak, key, seq]() {
        if (auto impl = weak.lock()) impl->onTimeout(key, seq);
    });
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->pending.find(key);
        if (it != pImpl->pending.end() && it->second.seq == seq) {
            it->second.timer = timer;
        } else {
            // Already settled (fast response or timeout); the timer is no longer needed.
            pImpl->loop.CancelTimer(timer);
        }
    }

    JSONRPCRequest request(id, method, std::move(params));
    LOG_DEBUG("-> {} id={}", method, IdToString(id));
    try {
        transport.Send(request.Serialize()).get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to send request {} ({}): {}", IdToString(id), method, e.what());
        if (auto p = pImpl->take(key, seq)) {
            pImpl->loop.CancelTimer(p->timer);
            p->promise.set_exception(std::current_exception());
        }
    }
    return fut;
}

std::future<void> ProtocolEngine::SendNotification(ITransport& transport, const std::string& method,
                                                   std::optional<JSONValue> params) {
    FUNC_SCOPE();
    LOG_DEBUG("-> notification {}", method);
    JSONRPCNotification n(method, std::move(params));
    return transport.Send(n.Serialize());
}

bool ProtocolEngine::HandleResponse(const JSONRPCResponse& response) {
    FUNC_SCOPE();
    auto p = pImpl->take(IdKey(response.id));
    if (!p) {
        LOG_WARN("Received response for unknown request id {}", IdToString(response.id));
        return false;
    }
    pImpl->loop.CancelTimer(p->timer);
    if (response.IsError()) {
        auto err = errors::mcpErrorFromErrorValue(response.error.value());
        if (!err) {
            errors::McpError e;
            e.code = JSONRPCErrorCodes::InternalError;
            e.message = "Malformed error response";
            e.category = errors::ErrorCategory::JsonRpcInternal;
            err = std::move(e);
        }
        LOG_DEBUG("<- error for {} id={}: {}", p->method, p->displayId, err->message);
        p->promise.set_exception(std::make_exception_ptr(errors::RemoteError(std::move(*err))));
    } else {
        LOG_DEBUG("<- result for {} id={}", p->method, p->displayId);
        p->promise.set_value(response.result.has_value() ? response.result->DeepCopy() : JSONValue(nullptr));
    }
    return true;
}

bool ProtocolEngine::CancelPending(const JSONRPCId& id, errors::CancellationReason reason) {
    auto p = pImpl->take(IdKey(id));
    if (!p) return false;
    pImpl->loop.CancelTimer(p->timer);
    LOG_DEBUG("Request {} ({}) cancelled: {}", p->displayId, p->method, errors::toString(reason));
    p->promise.set_exception(std::make_exception_ptr(errors::CancellationError(
        "Request " + p->displayId + " cancelled: " + errors::toString(reason), reason)));
    return true;
}

bool ProtocolEngine::HasPending(const JSONRPCId& id) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pending.count(IdKey(id)) != 0;
}

std::size_t ProtocolEngine::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pending.size();
}

void ProtocolEngine::SetRequestTimeout(milliseconds timeout) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->requestTimeout = timeout;
}

milliseconds ProtocolEngine::GetRequestTimeout() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->requestTimeout;
}

void ProtocolEngine::Cleanup() {
    FUNC_SCOPE();
    std::unordered_map<std::string, Impl::Pending> drained;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        drained.swap(pImpl->pending);
    }
    if (!drained.empty()) {
        LOG_DEBUG("ProtocolEngine cleanup rejecting {} pending request(s)", drained.size());
    }
    for (auto& [key, p] : drained) {
        pImpl->loop.CancelTimer(p.timer);
        p.promise.set_exception(std::make_exception_ptr(errors::CancellationError(
            "Protocol cleanup - request cancelled", errors::CancellationReason::Shutdown)));
    }
}

////////////////////////////////////////// MCP operations //////////////////////////////////////////

std::future<InitializeResult> ProtocolEngine::Initialize(ITransport& transport, const InitializeParams& params) {
    FUNC_SCOPE();
    if (!IsVersionSupported(params.protocolVersion)) {
        return failedFuture<InitializeResult>(std::make_exception_ptr(
            errors::ProtocolError("Unsupported protocol version: " + params.protocolVersion)));
    }
    return coInitialize(SendRequest(transport, Methods::Initialize, ToJSON(params))).toFuture();
}

std::future<void> ProtocolEngine::Initialized(ITransport& transport) {
    return SendNotification(transport, Methods::Initialized);
}

std::future<void> ProtocolEngine::Ping(ITransport& transport) {
    return coDiscard(SendRequest(transport, Methods::Ping)).toFuture();
}

std::future<std::vector<Tool>> ProtocolEngine::ListTools(ITransport& transport) {
    return coListTools(SendRequest(transport, Methods::ListTools)).toFuture();
}

std::future<CallToolResult> ProtocolEngine::CallTool(ITransport& transport, const std::string& name,
                                                     const JSONValue& arguments) {
    JSONValue params = MakeObject({{"name", JSONValue(name)}, {"arguments", arguments}});
    return coCallTool(SendRequest(transport, Methods::CallTool, std::move(params))).toFuture();
}

std::future<std::vector<Resource>> ProtocolEngine::ListResources(ITransport& transport) {
    return coListResources(SendRequest(transport, Methods::ListResources)).toFuture();
}

std::future<JSONValue> ProtocolEngine::ReadResource(ITransport& transport, const std::string& uri) {
    return coReadResource(SendRequest(transport, Methods::ReadResource, MakeObject({{"uri", JSONValue(uri)}})), uri)
        .toFuture();
}

std::future<void> ProtocolEngine::SubscribeResource(ITransport& transport, const std::string& uri) {
    return coDiscard(SendRequest(transport, Methods::Subscribe, MakeObject({{"uri", JSONValue(uri)}}))).toFuture();
}

std::future<void> ProtocolEngine::UnsubscribeResource(ITransport& transport, const std::string& uri) {
    return coDiscard(SendRequest(transport, Methods::Unsubscribe, MakeObject({{"uri", JSONValue(uri)}}))).toFuture();
}

std::future<std::vector<Prompt>> ProtocolEngine::ListPrompts(ITransport& transport) {
    return coListPrompts(SendRequest(transport, Methods::ListPrompts)).toFuture();
}

std::future<GetPromptResult> ProtocolEngine::GetPrompt(ITransport& transport, const std::string& name,
                                                       std::optional<JSONValue> arguments) {
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    if (arguments) params["arguments"] = std::make_shared<JSONValue>(std::move(*arguments));
    return coGetPrompt(SendRequest(transport, Methods::GetPrompt, JSONValue{std::move(params)})).toFuture();
}

std::future<std::vector<Root>> ProtocolEngine::ListRoots(ITransport& transport) {
    return coListRoots(SendRequest(transport, Methods::ListRoots)).toFuture();
}

std::future<void> ProtocolEngine::SetLoggingLevel(ITransport& transport, LoggingLevel level) {
    return coDiscard(SendRequest(transport, Methods::SetLogLevel, MakeObject({{"level", JSONValue(toString(level))}})))
        .toFuture();
}

std::future<void> ProtocolEngine::SendProgressNotification(ITransport& transport, const JSONValue& progressToken,
                                                           double progress, std::optional<double> total) {
    JSONValue::Object params;
    params["progressToken"] = std::make_shared<JSONValue>(progressToken);
    params["progress"] = std::make_shared<JSONValue>(progress);
    if (total) params["total"] = std::make_shared<JSONValue>(*total);
    return SendNotification(transport, Methods::Progress, JSONValue{std::move(params)});
}

std::future<void> ProtocolEngine::SendCancelledNotification(ITransport& transport, const JSONRPCId& requestId,
                                                            std::optional<std::string> reason) {
    JSONValue::Object params;
    params["requestId"] = std::make_shared<JSONValue>(IdToJSON(requestId));
    if (reason) params["reason"] = std::make_shared<JSONValue>(*reason);
    return SendNotification(transport, Methods::Cancelled, JSONValue{std::move(params)});
}

std::future<void> ProtocolEngine::Shutdown(ITransport& transport) {
    return coDiscard(SendRequest(transport, Methods::Shutdown)).toFuture();
}

////////////////////////////////////////// Helpers //////////////////////////////////////////

InitializeParams ProtocolEngine::CreateInitializeParams(Implementation clientInfo, ClientCapabilities capabilities) {
    InitializeParams p;
    p.protocolVersion = PROTOCOL_VERSION;
    p.capabilities = std::move(capabilities);
    p.clientInfo = std::move(clientInfo);
    return p;
}

std::string ProtocolEngine::FormatError(const JSONValue& errorObject) {
    auto err = errors::mcpErrorFromErrorValue(errorObject);
    if (!err) return "Unknown error";
    return "[" + std::to_string(err->code) + "] " + err->message;
}

} // namespace mcprt
