//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RootsManager.cpp
// Purpose: Root registry, file URI conversion and lexical path containment
//==========================================================================================================

#include "mcprt/RootsManager.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <system_error>

#include <unistd.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {

namespace fs = std::filesystem;

namespace {

constexpr const char* kFileScheme = "file://";
constexpr std::size_t kFileSchemeLength = 7;

bool isFileUri(const std::string& uri) {
    return uri.rfind(kFileScheme, 0) == 0;
}

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& in, const std::string& uri) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        const int hi = i + 1 < in.size() ? hexValue(in[i + 1]) : -1;
        const int lo = i + 2 < in.size() ? hexValue(in[i + 2]) : -1;
        if (hi < 0 || lo < 0) throw errors::ValidationError("Invalid percent escape in URI: " + uri);
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

std::string stripTrailingSeparators(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

std::optional<std::string> tryNormalize(const std::string& uri) {
    try {
        return NormalizeRootUri(uri);
    } catch (const errors::ValidationError&) {
        return std::nullopt;
    }
}

void inspect(RootInfo& info) {
    const std::string& path = *info.absolutePath;
    std::error_code ec;
    const bool exists = fs::exists(path, ec) && !ec;
    info.exists = exists;
    if (exists) {
        info.readable = ::access(path.c_str(), R_OK) == 0;
        info.writable = ::access(path.c_str(), W_OK) == 0;
    } else {
        info.readable.reset();
        info.writable.reset();
    }
}

void validateRootPath(const std::string& path) {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) throw errors::ValidationError("Root path does not exist: " + path);
    if (!fs::is_directory(st)) throw errors::ValidationError("Root path is not a directory: " + path);
    if (::access(path.c_str(), R_OK) != 0) throw errors::ValidationError("Root path is not readable: " + path);
}

} // namespace

////////////////////////////////////////// URI helpers //////////////////////////////////////////

std::string FileUriToPath(const std::string& uri) {
    if (!isFileUri(uri)) throw errors::ValidationError("Not a file URI: " + uri);
    std::string rest = uri.substr(kFileSchemeLength);
    rest = rest.substr(0, rest.find_first_of("?#"));
    const auto slash = rest.find('/');
    const std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    if (!authority.empty() && authority != "localhost") {
        throw errors::ValidationError("File URI names a remote host: " + uri);
    }
    if (slash == std::string::npos) throw errors::ValidationError("File URI has no path: " + uri);
    std::string path = percentDecode(rest.substr(slash), uri);
    if (path.find('\0') != std::string::npos) throw errors::ValidationError("File URI decodes to a NUL byte: " + uri);
    return path;
}

std::string NormalizeLocalPath(const std::string& path) {
    fs::path p(path);
    if (p.is_relative()) {
        std::error_code ec;
        const fs::path cwd = fs::current_path(ec);
        if (ec) throw errors::ValidationError("Cannot resolve '" + path + "': " + ec.message());
        p = cwd / p;
    }
    return stripTrailingSeparators(p.lexically_normal().string());
}

std::string PathToFileUri(const std::string& path) {
    static const char* hex = "0123456789ABCDEF";
    std::string uri = kFileScheme;
    for (unsigned char c : NormalizeLocalPath(path)) {
        if (isUnreserved(c) || c == '/') {
            uri.push_back(static_cast<char>(c));
        } else {
            uri.push_back('%');
            uri.push_back(hex[c >> 4]);
            uri.push_back(hex[c & 0x0F]);
        }
    }
    return uri;
}

std::string NormalizeRootUri(const std::string& uri) {
    return isFileUri(uri) ? PathToFileUri(FileUriToPath(uri)) : uri;
}

bool IsPathInRoot(const std::string& path, const std::string& rootPath) {
    const std::string p = NormalizeLocalPath(path);
    const std::string r = NormalizeLocalPath(rootPath);
    if (r == "/") return true;
    return p == r || (p.size() > r.size() && p.compare(0, r.size(), r) == 0 && p[r.size()] == '/');
}

////////////////////////////////////////// Impl //////////////////////////////////////////

struct RootsManager::Impl {
    RootsOptions options;
    mutable std::mutex mutex;
    std::vector<RootInfo> roots;  // registration order

    explicit Impl(RootsOptions opts) : options(opts) {}

    RootInfo parse(const Root& root) const {
        RootInfo info;
        info.uri = NormalizeRootUri(root.uri);
        info.name = root.name;
        if (isFileUri(info.uri)) {
            info.absolutePath = FileUriToPath(info.uri);
            if (options.validatePaths) inspect(info);
        }
        return info;
    }

    RootInfo parseForAdd(const Root& root) const {
        RootInfo info = parse(root);
        if (options.validatePaths && info.absolutePath) validateRootPath(*info.absolutePath);
        return info;
    }

    std::vector<RootInfo>::iterator findLocked(const std::string& uri) {
        return std::find_if(roots.begin(), roots.end(), [&uri](const RootInfo& r) { return r.uri == uri; });
    }

    std::vector<RootInfo>::const_iterator findLocked(const std::string& uri) const {
        return std::find_if(roots.begin(), roots.end(), [&uri](const RootInfo& r) { return r.uri == uri; });
    }

    std::vector<RootInfo> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return roots;
    }
};

RootsManager::RootsManager(RootsOptions options, const std::vector<Root>& initial)
    : pImpl(std::make_unique<Impl>(options)) {
    if (!initial.empty()) SetRoots(initial);
}

RootsManager::~RootsManager() = default;

////////////////////////////////////////// Registry //////////////////////////////////////////

RootInfo RootsManager::AddRoot(const Root& root) {
    RootInfo info = pImpl->parseForAdd(root);
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->findLocked(info.uri);
        if (it != pImpl->roots.end()) {
            *it = info;
        } else {
            pImpl->roots.push_back(info);
        }
    }
    LOG_DEBUG("Root added: {}", info.uri);
    Emit(RootsEvent{"root:added", info, std::nullopt, 0});
    return info;
}

bool RootsManager::RemoveRoot(const std::string& uri) {
    auto key = tryNormalize(uri);
    if (!key) return false;
    RootInfo removed;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->findLocked(*key);
        if (it == pImpl->roots.end()) return false;
        removed = std::move(*it);
        pImpl->roots.erase(it);
    }
    LOG_DEBUG("Root removed: {}", removed.uri);
    Emit(RootsEvent{"root:removed", removed, std::nullopt, 0});
    return true;
}

std::optional<RootInfo> RootsManager::UpdateRoot(const std::string& uri, const RootUpdate& update) {
    auto key = tryNormalize(uri);
    if (!key) return std::nullopt;
    auto existing = GetRoot(*key);
    if (!existing) return std::nullopt;

    Root merged{update.uri.value_or(existing->uri), update.name ? update.name : existing->name};
    RootInfo updated = update.uri ? pImpl->parseForAdd(merged) : pImpl->parse(merged);

    RootInfo previous;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        auto it = pImpl->findLocked(*key);
        if (it == pImpl->roots.end()) return std::nullopt;
        if (updated.uri != *key && pImpl->findLocked(updated.uri) != pImpl->roots.end()) {
            throw errors::ValidationError("A root with URI " + updated.uri + " already exists");
        }
        previous = *it;
        *it = updated;
    }
    Emit(RootsEvent{"root:updated", updated, previous, 0});
    return updated;
}

void RootsManager::SetRoots(const std::vector<Root>& roots) {
    std::vector<RootInfo> next;
    next.reserve(roots.size());
    for (const auto& root : roots) {
        RootInfo info = pImpl->parseForAdd(root);
        auto it = std::find_if(next.begin(), next.end(), [&info](const RootInfo& r) { return r.uri == info.uri; });
        if (it != next.end()) {
            *it = std::move(info);
        } else {
            next.push_back(std::move(info));
        }
    }
    const std::size_t count = next.size();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->roots = std::move(next);
    }
    LOG_DEBUG("Roots replaced: {} root(s)", count);
    Emit(RootsEvent{"roots:set", std::nullopt, std::nullopt, count});
}

void RootsManager::ClearRoots() {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        count = pImpl->roots.size();
        pImpl->roots.clear();
    }
    Emit(RootsEvent{"roots:cleared", std::nullopt, std::nullopt, count});
}

bool RootsManager::HasRoot(const std::string& uri) const {
    return GetRoot(uri).has_value();
}

std::optional<RootInfo> RootsManager::GetRoot(const std::string& uri) const {
    auto key = tryNormalize(uri);
    if (!key) return std::nullopt;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->findLocked(*key);
    if (it == pImpl->roots.end()) return std::nullopt;
    return *it;
}

std::vector<RootInfo> RootsManager::GetRoots() const {
    return pImpl->snapshot();
}

std::vector<Root> RootsManager::GetRootsForProtocol() const {
    std::vector<Root> out;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    out.reserve(pImpl->roots.size());
    for (const auto& r : pImpl->roots) out.push_back(Root{r.uri, r.name});
    return out;
}

////////////////////////////////////////// Paths //////////////////////////////////////////

bool RootsManager::IsPathInRoots(const std::string& path) const {
    return GetRootForPath(path).has_value();
}

std::optional<RootInfo> RootsManager::GetRootForPath(const std::string& path) const {
    const std::string target = NormalizeLocalPath(path);
    std::optional<RootInfo> best;
    for (const auto& r : pImpl->snapshot()) {
        if (!r.absolutePath || !IsPathInRoot(target, *r.absolutePath)) continue;
        if (!best || r.absolutePath->size() > best->absolutePath->size()) best = r;
    }
    return best;
}

std::optional<std::string> RootsManager::ResolvePath(const std::string& relativePath) const {
    for (const auto& r : pImpl->snapshot()) {
        if (!r.absolutePath) continue;
        const std::string candidate =
            stripTrailingSeparators((fs::path(*r.absolutePath) / relativePath).lexically_normal().string());
        if (!IsPathInRoot(candidate, *r.absolutePath)) {
            LOG_DEBUG("'{}' escapes root {}", relativePath, r.uri);
            continue;
        }
        std::error_code ec;
        if (fs::exists(candidate, ec) && !ec) return candidate;
    }
    return std::nullopt;
}

////////////////////////////////////////// Dynamic roots //////////////////////////////////////////

RootInfo RootsManager::AddRootFromPath(const std::string& path, const std::optional<std::string>& name) {
    if (!pImpl->options.allowDynamicRoots) throw errors::ValidationError("Dynamic roots are not allowed");
    return AddRoot(Root{PathToFileUri(path), name});
}

RootInfo RootsManager::AddCwdRoot(const std::string& name) {
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (ec) throw errors::ValidationError("Could not determine the working directory: " + ec.message());
    return AddRootFromPath(cwd.string(), name);
}

RootInfo RootsManager::AddHomeRoot(const std::string& name) {
    const std::string home = GetEnvOrDefault("HOME", "");
    if (home.empty()) throw errors::ValidationError("Could not determine home directory");
    return AddRootFromPath(home, name);
}

void RootsManager::RefreshRoots() {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (auto& r : pImpl->roots) {
            if (r.absolutePath && pImpl->options.validatePaths) inspect(r);
        }
        count = pImpl->roots.size();
    }
    Emit(RootsEvent{"roots:refreshed", std::nullopt, std::nullopt, count});
}

RootsStats RootsManager::GetStats() const {
    RootsStats stats;
    stats.allowDynamicRoots = pImpl->options.allowDynamicRoots;
    stats.validatePaths = pImpl->options.validatePaths;
    for (const auto& r : pImpl->snapshot()) {
        ++stats.totalRoots;
        if (r.absolutePath) ++stats.fileRoots;
        if (r.exists.value_or(false)) ++stats.existingRoots;
        if (r.readable.value_or(false)) ++stats.readableRoots;
        if (r.writable.value_or(false)) ++stats.writableRoots;
    }
    return stats;
}

} // namespace mcprt
