//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_roots_manager.cpp
// Purpose: Root registry, file URI normalisation, path containment and resolution
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcprt/RootsManager.h"
#include "mcprt/errors/Errors.h"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace mcprt;
namespace fs = std::filesystem;

namespace {

// Scratch directory removed on destruction.
struct TempDir {
    fs::path path;
    TempDir() {
        static std::atomic<int> counter{0};
        path = fs::temp_directory_path() /
               ("mcprt-roots-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    std::string dir(const std::string& rel) const {
        fs::create_directories(path / rel);
        return (path / rel).string();
    }
    std::string file(const std::string& rel) const {
        fs::create_directories((path / rel).parent_path());
        std::ofstream(path / rel) << "x";
        return (path / rel).string();
    }
};

RootsOptions lexicalOnly() {
    RootsOptions o;
    o.validatePaths = false;
    return o;
}

} // namespace

TEST(FileUri, DecodesPathAndRejectsForeignForms) {
    EXPECT_EQ(FileUriToPath("file:///tmp/a%20b"), "/tmp/a b");
    EXPECT_EQ(FileUriToPath("file://localhost/srv/data"), "/srv/data");
    EXPECT_EQ(FileUriToPath("file:///x?query#frag"), "/x");
    EXPECT_THROW(FileUriToPath("https://example.com/x"), errors::ValidationError);
    EXPECT_THROW(FileUriToPath("file://fileserver/share"), errors::ValidationError);
    EXPECT_THROW(FileUriToPath("file:///bad%zz"), errors::ValidationError);
    EXPECT_THROW(FileUriToPath("file:///trailing%2"), errors::ValidationError);
}

TEST(FileUri, NormalisesEquivalentSpellings) {
    EXPECT_EQ(PathToFileUri("/tmp/a b/../c/"), "file:///tmp/c");
    EXPECT_EQ(NormalizeRootUri("file:///work/./src/"), "file:///work/src");
    EXPECT_EQ(NormalizeRootUri("file://localhost/work/%73rc"), "file:///work/src");
    EXPECT_EQ(NormalizeRootUri("file:///"), "file:///");
    EXPECT_EQ(NormalizeRootUri("https://example.com/repo/"), "https://example.com/repo/");
    EXPECT_EQ(PathToFileUri("relative/dir"), PathToFileUri((fs::current_path() / "relative/dir").string()));
}

TEST(FileUri, ContainmentIsComponentWise) {
    EXPECT_TRUE(IsPathInRoot("/a/b/c", "/a"));
    EXPECT_TRUE(IsPathInRoot("/a", "/a/"));
    EXPECT_FALSE(IsPathInRoot("/ab", "/a"));
    EXPECT_FALSE(IsPathInRoot("/a/../b", "/a"));
    EXPECT_TRUE(IsPathInRoot("/anything", "/"));
}

TEST(RootsManager, ValidationRejectsUnusablePaths) {
    TempDir tmp;
    RootsManager mgr;
    EXPECT_THROW(mgr.AddRoot(Root{PathToFileUri((tmp.path / "missing").string()), std::nullopt}),
                 errors::ValidationError);
    EXPECT_THROW(mgr.AddRoot(Root{PathToFileUri(tmp.file("plain.txt")), std::nullopt}), errors::ValidationError);
    EXPECT_THROW(mgr.AddRoot(Root{"file:///bad%", std::nullopt}), errors::ValidationError);
    EXPECT_TRUE(mgr.GetRoots().empty());

    auto info = mgr.AddRoot(Root{PathToFileUri(tmp.dir("project")), std::string("project")});
    EXPECT_EQ(info.absolutePath.value_or(""), NormalizeLocalPath((tmp.path / "project").string()));
    EXPECT_TRUE(info.exists.value_or(false));
    EXPECT_TRUE(info.readable.value_or(false));

    // Non-file roots carry no local path and skip validation.
    auto remote = mgr.AddRoot(Root{"https://example.com/repo", std::nullopt});
    EXPECT_FALSE(remote.absolutePath.has_value());
    EXPECT_EQ(mgr.GetRoots().size(), 2u);
}

TEST(RootsManager, RegistryOperationsEmitEvents) {
    RootsManager mgr(lexicalOnly());
    std::vector<std::string> events;
    mgr.On("*", [&events](const RootsEvent& ev) { events.push_back(ev.type); });

    mgr.AddRoot(Root{"file:///work/", std::string("work")});
    EXPECT_TRUE(mgr.HasRoot("file:///work"));
    EXPECT_TRUE(mgr.HasRoot("file://localhost/work/./"));
    EXPECT_FALSE(mgr.HasRoot("file://elsewhere/work"));

    // Same root under another spelling replaces in place.
    mgr.AddRoot(Root{"file:///work", std::string("renamed")});
    ASSERT_EQ(mgr.GetRoots().size(), 1u);
    EXPECT_EQ(mgr.GetRoots()[0].name.value_or(""), "renamed");

    auto updated = mgr.UpdateRoot("file:///work", RootUpdate{std::nullopt, std::string("again")});
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->uri, "file:///work");
    EXPECT_EQ(updated->name.value_or(""), "again");

    RootsEvent lastUpdate;
    mgr.On("root:updated", [&lastUpdate](const RootsEvent& ev) { lastUpdate = ev; });
    auto moved = mgr.UpdateRoot("file:///work", RootUpdate{std::string("file:///work2/"), std::nullopt});
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved->uri, "file:///work2");
    EXPECT_EQ(moved->name.value_or(""), "again");
    ASSERT_TRUE(lastUpdate.previous.has_value());
    EXPECT_EQ(lastUpdate.previous->uri, "file:///work");
    EXPECT_FALSE(mgr.HasRoot("file:///work"));

    mgr.AddRoot(Root{"file:///other", std::nullopt});
    EXPECT_THROW(mgr.UpdateRoot("file:///other", RootUpdate{std::string("file:///work2"), std::nullopt}),
                 errors::ValidationError);
    EXPECT_FALSE(mgr.UpdateRoot("file:///unknown", RootUpdate{}).has_value());

    EXPECT_TRUE(mgr.RemoveRoot("file:///other/"));
    EXPECT_FALSE(mgr.RemoveRoot("file:///other"));
    EXPECT_FALSE(mgr.RemoveRoot("file:///bad%"));

    mgr.ClearRoots();
    EXPECT_TRUE(mgr.GetRoots().empty());
    EXPECT_EQ(events, (std::vector<std::string>{"root:added", "root:added", "root:updated", "root:updated",
                                                "root:added", "root:removed", "roots:cleared"}));
}

TEST(RootsManager, SetRootsIsAllOrNothing) {
    RootsManager mgr(lexicalOnly(), {Root{"file:///keep", std::nullopt}});
    std::size_t setCount = 0;
    mgr.On("roots:set", [&setCount](const RootsEvent& ev) { setCount = ev.count; });

    EXPECT_THROW(mgr.SetRoots({Root{"file:///a", std::nullopt}, Root{"file://host/b", std::nullopt}}),
                 errors::ValidationError);
    ASSERT_EQ(mgr.GetRoots().size(), 1u);
    EXPECT_EQ(mgr.GetRoots()[0].uri, "file:///keep");

    mgr.SetRoots({Root{"file:///a", std::nullopt}, Root{"file:///b", std::string("b")},
                  Root{"file:///a/", std::string("a")}});
    auto listed = mgr.GetRootsForProtocol();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].uri, "file:///a");
    EXPECT_EQ(listed[0].name.value_or(""), "a");
    EXPECT_EQ(listed[1].uri, "file:///b");
    EXPECT_EQ(setCount, 2u);
}

TEST(RootsManager, PicksDeepestRootForPath) {
    RootsManager mgr(lexicalOnly());
    mgr.AddRoot(Root{"file:///repo", std::string("repo")});
    mgr.AddRoot(Root{"file:///repo/vendor", std::string("vendor")});
    mgr.AddRoot(Root{"https://example.com/repo", std::nullopt});

    EXPECT_TRUE(mgr.IsPathInRoots("/repo/src/main.cpp"));
    EXPECT_TRUE(mgr.IsPathInRoots("/repo/vendor/../src"));
    EXPECT_FALSE(mgr.IsPathInRoots("/repository/x"));
    EXPECT_FALSE(mgr.IsPathInRoots("/repo/../etc/passwd"));

    auto vendor = mgr.GetRootForPath("/repo/vendor/lib/a.h");
    ASSERT_TRUE(vendor.has_value());
    EXPECT_EQ(vendor->name.value_or(""), "vendor");
    auto repo = mgr.GetRootForPath("/repo/vendorized");
    ASSERT_TRUE(repo.has_value());
    EXPECT_EQ(repo->name.value_or(""), "repo");
    EXPECT_FALSE(mgr.GetRootForPath("/srv").has_value());
}

TEST(RootsManager, ResolvePathStaysInsideRoots) {
    TempDir tmp;
    const std::string first = tmp.dir("first");
    const std::string second = tmp.dir("second");
    const std::string target = tmp.file("second/docs/readme.md");
    tmp.file("secret.txt");

    RootsManager mgr;
    mgr.AddRootFromPath(first);
    mgr.AddRootFromPath(second);

    auto resolved = mgr.ResolvePath("docs/readme.md");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, NormalizeLocalPath(target));
    EXPECT_FALSE(mgr.ResolvePath("docs/missing.md").has_value());
    EXPECT_FALSE(mgr.ResolvePath("../secret.txt").has_value());
    EXPECT_EQ(mgr.ResolvePath(target).value_or(""), NormalizeLocalPath(target));
    EXPECT_FALSE(mgr.ResolvePath((tmp.path / "secret.txt").string()).has_value());
}

TEST(RootsManager, DynamicRootsAndStats) {
    TempDir tmp;
    RootsOptions fixed;
    fixed.allowDynamicRoots = false;
    RootsManager locked(fixed);
    EXPECT_THROW(locked.AddCwdRoot(), errors::ValidationError);
    EXPECT_THROW(locked.AddRootFromPath(tmp.path.string()), errors::ValidationError);

    RootsManager mgr;
    auto cwd = mgr.AddCwdRoot();
    EXPECT_EQ(cwd.uri, PathToFileUri(fs::current_path().string()));
    EXPECT_EQ(cwd.name.value_or(""), "Current Directory");
    const std::string dir = tmp.dir("data");
    mgr.AddRootFromPath(dir + "/", std::string("data"));
    mgr.AddRoot(Root{"https://example.com/repo", std::nullopt});

    auto stats = mgr.GetStats();
    EXPECT_EQ(stats.totalRoots, 3u);
    EXPECT_EQ(stats.fileRoots, 2u);
    EXPECT_EQ(stats.existingRoots, 2u);
    EXPECT_EQ(stats.readableRoots, 2u);
    EXPECT_TRUE(stats.allowDynamicRoots);
    EXPECT_TRUE(stats.validatePaths);

    fs::remove_all(dir);
    std::size_t refreshed = 0;
    mgr.On("roots:refreshed", [&refreshed](const RootsEvent& ev) { refreshed = ev.count; });
    mgr.RefreshRoots();
    EXPECT_EQ(refreshed, 3u);
    EXPECT_EQ(mgr.GetStats().existingRoots, 1u);
    auto data = mgr.GetRoot(PathToFileUri(dir));
    ASSERT_TRUE(data.has_value());
    EXPECT_FALSE(data->exists.value_or(true));
}
