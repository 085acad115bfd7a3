//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: JSON text codec and JSON-RPC message (de)serialization using only the std library
//==========================================================================================================

#include <charconv>
#include <cctype>
#include <cmath>
#include <sstream>
#include <iomanip>
#include "mcprt/JSONRPCTypes.h"
#include "mcprt/errors/Errors.h"
#include "logging/Logger.h"

namespace mcprt {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

JSONValue JSONValue::DeepCopy() const {
    if (IsArray()) {
        Array out;
        for (const auto& item : std::get<Array>(value)) {
            out.push_back(std::make_shared<JSONValue>(item ? item->DeepCopy() : JSONValue{}));
        }
        return JSONValue{std::move(out)};
    }
    if (IsObject()) {
        Object out;
        for (const auto& [key, item] : std::get<Object>(value)) {
            out[key] = std::make_shared<JSONValue>(item ? item->DeepCopy() : JSONValue{});
        }
        return JSONValue{std::move(out)};
    }
    return *this;
}

// -------------------------------
// Recursive descent JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw errors::ParseError("Invalid JSON at offset " + std::to_string(i) + ": " + what);
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected '\"'");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("unpaired surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("expected value");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("digit expected after '.'");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("digit expected in exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Integer overflow falls through to double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc() || ptr != last) fail("number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        ++i; // '['
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' or ']' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        ++i; // '{'
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("expected ',' or '}' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        if (++depth > kMaxDepth) fail("nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else {
            out = parseNumber();
        }
        --depth;
        return out;
    }
};

void serializeString(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void serializeInto(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                oss << "null";
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
            if (ec == std::errc()) {
                oss << std::string(buf, ptr);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            serializeString(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                if (v[k]) serializeInto(oss, *v[k]); else oss << "null";
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                serializeString(oss, key);
                oss << ':';
                if (val) serializeInto(oss, *val); else oss << "null";
            }
            oss << '}';
        }
    }, value.get());
}

std::optional<JSONValue> optionalMember(const JSONValue& obj, const char* key) {
    if (const JSONValue* m = FindMember(obj, key)) return *m;
    return std::nullopt;
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("trailing characters");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::ostringstream oss;
    serializeInto(oss, value);
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------
// Accessors
//----------------------------------------------------------------------------------------------------------
const JSONValue* FindMember(const JSONValue& object, const std::string& key) {
    if (!object.IsObject()) return nullptr;
    const auto& obj = std::get<JSONValue::Object>(object.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) return nullptr;
    return it->second.get();
}

std::optional<std::string> GetString(const JSONValue& object, const std::string& key) {
    const JSONValue* m = FindMember(object, key);
    if (!m || !m->IsString()) return std::nullopt;
    return std::get<std::string>(m->value);
}

std::optional<double> AsNumber(const JSONValue& value) {
    if (std::holds_alternative<int64_t>(value.value)) return static_cast<double>(std::get<int64_t>(value.value));
    if (std::holds_alternative<double>(value.value)) return std::get<double>(value.value);
    return std::nullopt;
}

std::optional<double> GetNumber(const JSONValue& object, const std::string& key) {
    const JSONValue* m = FindMember(object, key);
    if (!m) return std::nullopt;
    return AsNumber(*m);
}

std::optional<int64_t> GetInteger(const JSONValue& object, const std::string& key) {
    const JSONValue* m = FindMember(object, key);
    if (!m) return std::nullopt;
    if (std::holds_alternative<int64_t>(m->value)) return std::get<int64_t>(m->value);
    if (std::holds_alternative<double>(m->value)) {
        double d = std::get<double>(m->value);
        if (std::floor(d) == d && std::fabs(d) < 9.0e15) return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

std::optional<bool> GetBool(const JSONValue& object, const std::string& key) {
    const JSONValue* m = FindMember(object, key);
    if (!m || !m->IsBool()) return std::nullopt;
    return std::get<bool>(m->value);
}

JSONValue MakeObject(std::initializer_list<std::pair<std::string, JSONValue>> members) {
    JSONValue::Object obj;
    for (const auto& [key, val] : members) {
        obj[key] = std::make_shared<JSONValue>(val);
    }
    return JSONValue{std::move(obj)};
}

JSONValue MakeArray(const std::vector<JSONValue>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item));
    }
    return JSONValue{std::move(arr)};
}

//----------------------------------------------------------------------------------------------------------
// Ids
//----------------------------------------------------------------------------------------------------------
std::string IdKey(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) return "s:" + std::get<std::string>(id);
    if (std::holds_alternative<int64_t>(id)) return "n:" + std::to_string(std::get<int64_t>(id));
    return "null";
}

std::string IdToString(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) return std::get<std::string>(id);
    if (std::holds_alternative<int64_t>(id)) return std::to_string(std::get<int64_t>(id));
    return "null";
}

JSONValue IdToJSON(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) return JSONValue(std::get<std::string>(id));
    if (std::holds_alternative<int64_t>(id)) return JSONValue(std::get<int64_t>(id));
    return JSONValue(nullptr);
}

std::optional<JSONRPCId> IdFromJSON(const JSONValue& v) {
    if (v.IsString()) return JSONRPCId{std::get<std::string>(v.value)};
    if (std::holds_alternative<int64_t>(v.value)) return JSONRPCId{std::get<int64_t>(v.value)};
    if (v.IsNull()) return JSONRPCId{nullptr};
    return std::nullopt;
}

//----------------------------------------------------------------------------------------------------------
// JSONRPCRequest
//----------------------------------------------------------------------------------------------------------
JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue{std::move(obj)};
}

bool JSONRPCRequest::FromJSON(const JSONValue& value) {
    auto m = GetString(value, "method");
    const JSONValue* idNode = FindMember(value, "id");
    if (!m || !idNode) return false;
    auto parsedId = IdFromJSON(*idNode);
    if (!parsedId) return false;
    method = std::move(*m);
    id = std::move(*parsedId);
    params = optionalMember(value, "params");
    return true;
}

//----------------------------------------------------------------------------------------------------------
// JSONRPCResponse
//----------------------------------------------------------------------------------------------------------
JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    } else {
        obj["result"] = std::make_shared<JSONValue>(result.has_value() ? result.value() : JSONValue(nullptr));
    }
    return JSONValue{std::move(obj)};
}

bool JSONRPCResponse::FromJSON(const JSONValue& value) {
    const JSONValue* idNode = FindMember(value, "id");
    if (!idNode) return false;
    auto parsedId = IdFromJSON(*idNode);
    if (!parsedId) return false;
    id = std::move(*parsedId);
    result = optionalMember(value, "result");
    error = optionalMember(value, "error");
    return result.has_value() != error.has_value();
}

//----------------------------------------------------------------------------------------------------------
// JSONRPCNotification
//----------------------------------------------------------------------------------------------------------
JSONValue JSONRPCNotification::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue{std::move(obj)};
}

bool JSONRPCNotification::FromJSON(const JSONValue& value) {
    auto m = GetString(value, "method");
    if (!m || FindMember(value, "id") != nullptr) return false;
    method = std::move(*m);
    params = optionalMember(value, "params");
    return true;
}

//----------------------------------------------------------------------------------------------------------
// Error helpers
//----------------------------------------------------------------------------------------------------------
JSONValue CreateErrorObject(int code, const std::string& message, const std::optional<JSONValue>& data) {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    obj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        obj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue{std::move(obj)};
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                     const std::optional<JSONValue>& data) {
    return std::make_unique<JSONRPCResponse>(id, CreateErrorObject(code, message, data), true);
}

} // namespace mcprt
