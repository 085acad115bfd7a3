//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RootsManager.h
// Purpose: Registry of the roots a client exposes to servers, with file:// path mapping and containment
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcprt/EventEmitter.h"
#include "mcprt/Protocol.h"

namespace mcprt {

//==========================================================================================================
// File URI helpers
//   FileUriToPath: "file:///a%20b/c" -> "/a b/c". Accepts an empty or "localhost" authority. Throws
//                  errors::ValidationError for other schemes, remote hosts, relative paths or bad escapes.
//   PathToFileUri: Makes the path absolute against the working directory, normalises "." and "..",
//                  drops a trailing separator and percent-encodes everything except unreserved and "/".
//   NormalizeRootUri: file:// URIs go through both helpers so equivalent spellings compare equal. Any
//                  other scheme is returned unchanged.
//==========================================================================================================
std::string FileUriToPath(const std::string& uri);
std::string PathToFileUri(const std::string& path);
std::string NormalizeRootUri(const std::string& uri);

// Absolute, lexically normalised form of a local path without a trailing separator.
std::string NormalizeLocalPath(const std::string& path);

struct RootInfo {
    std::string uri;                          // normalised
    std::optional<std::string> name;
    std::optional<std::string> absolutePath;  // file:// roots only
    // Filled only when path validation is enabled.
    std::optional<bool> exists;
    std::optional<bool> readable;
    std::optional<bool> writable;
};

struct RootsOptions {
    bool allowDynamicRoots = true;
    // Reject file:// roots that are missing, not directories or unreadable.
    bool validatePaths = true;
};

// Fields left unset keep their current value.
struct RootUpdate {
    std::optional<std::string> uri;
    std::optional<std::string> name;
};

struct RootsStats {
    std::size_t totalRoots = 0;
    std::size_t fileRoots = 0;
    std::size_t existingRoots = 0;
    std::size_t readableRoots = 0;
    std::size_t writableRoots = 0;
    bool allowDynamicRoots = true;
    bool validatePaths = true;
};

//==========================================================================================================
// RootsEvent
// Purpose: Payload for "root:added", "root:removed", "root:updated" (with previous), "roots:set",
//          "roots:cleared" and "roots:refreshed" (the last three with count).
//==========================================================================================================
struct RootsEvent {
    std::string type;
    std::optional<RootInfo> root;
    std::optional<RootInfo> previous;
    std::size_t count = 0;
};

//==========================================================================================================
// RootsManager
// Purpose: Ordered set of roots keyed by normalised URI. Answers roots/list and decides whether a local
//          path falls inside any file:// root.
// Notes:
//   Thread-safe. Events are emitted after the registry lock is released.
//   Path checks are lexical: symlinks are not resolved.
//==========================================================================================================
class RootsManager : public EventEmitter<RootsEvent> {
public:
    explicit RootsManager(RootsOptions options = {}, const std::vector<Root>& initial = {});
    ~RootsManager() override;

    ////////////////////////////////////////// Registry //////////////////////////////////////////
    // Adds or replaces (in place) the root with the same normalised URI.
    // Throws errors::ValidationError for a malformed file URI or, with validation on, an unusable path.
    RootInfo AddRoot(const Root& root);
    bool RemoveRoot(const std::string& uri);
    // Returns std::nullopt when no root matches. A new uri that collides with another root throws
    // errors::ValidationError.
    std::optional<RootInfo> UpdateRoot(const std::string& uri, const RootUpdate& update);
    // Replaces every root at once; nothing changes when any entry is rejected.
    void SetRoots(const std::vector<Root>& roots);
    void ClearRoots();

    bool HasRoot(const std::string& uri) const;
    std::optional<RootInfo> GetRoot(const std::string& uri) const;
    std::vector<RootInfo> GetRoots() const;
    // Plain {uri, name} pairs in registration order, as sent in a roots/list result.
    std::vector<Root> GetRootsForProtocol() const;

    ////////////////////////////////////////// Paths //////////////////////////////////////////
    bool IsPathInRoots(const std::string& path) const;
    // The deepest root containing the path.
    std::optional<RootInfo> GetRootForPath(const std::string& path) const;
    // Joins a path onto each file root in order and returns the first existing result that stays inside
    // that root.
    std::optional<std::string> ResolvePath(const std::string& relativePath) const;

    ////////////////////////////////////////// Dynamic roots //////////////////////////////////////////
    // Throw errors::ValidationError when dynamic roots are disabled.
    RootInfo AddRootFromPath(const std::string& path, const std::optional<std::string>& name = std::nullopt);
    RootInfo AddCwdRoot(const std::string& name = "Current Directory");
    RootInfo AddHomeRoot(const std::string& name = "Home Directory");

    // Re-reads existence and permissions of every file root.
    void RefreshRoots();
    RootsStats GetStats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// True when path equals root or lies beneath it. Both are normalised first.
bool IsPathInRoot(const std::string& path, const std::string& rootPath);

} // namespace mcprt
