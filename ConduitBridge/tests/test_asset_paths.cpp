// test_asset_paths.cpp
// Unit tests for asset path normalization
//
// These tests verify that:
// 1. Any slash style maps to "<root>/<relative>"
// 2. The root prefix is matched case-insensitively and appears exactly once
// 3. Normalization is idempotent
// 4. Physical paths are the root directory joined with the relative part
// 5. Directory creation failures surface as DirectoryCreateFailed

#include "Assets/AssetPaths.h"
#include "Utils/FileUtils.h"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

using namespace Conduit;
using namespace Conduit::Assets;
namespace fs = std::filesystem;

// ============================================================================
// Test Framework (minimal)
// ============================================================================

static int g_testsPassed = 0;
static int g_testsFailed = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "[FAIL] " << __FUNCTION__ << ": " << message << std::endl; \
            g_testsFailed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS() \
    do { \
        std::cout << "[PASS] " << __FUNCTION__ << std::endl; \
        g_testsPassed++; \
        return true; \
    } while(0)

// Scratch directory removed when the test exits
struct TempDir {
    fs::path path;
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("conduit_paths_" + std::to_string(stamp));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

static const AssetPaths g_paths("Assets", fs::path("/project/Assets"));

// ============================================================================
// Normalization
// ============================================================================

bool test_prepends_root() {
    auto p = g_paths.Normalize("Scripts/Player.lua");
    TEST_ASSERT(p.logical == "Assets/Scripts/Player.lua", "got " << p.logical);
    TEST_ASSERT(p.relative == "Scripts/Player.lua", "got " << p.relative);
    TEST_PASS();
}

bool test_backslashes_and_edge_slashes() {
    auto p = g_paths.Normalize("\\Assets\\Scripts\\AI\\Brain.lua\\");
    TEST_ASSERT(p.logical == "Assets/Scripts/AI/Brain.lua", "got " << p.logical);

    auto q = g_paths.Normalize("//Scripts//Brain.lua");
    TEST_ASSERT(q.logical == "Assets/Scripts/Brain.lua", "duplicate slashes collapse, got " << q.logical);
    TEST_PASS();
}

bool test_root_prefix_case_insensitive() {
    auto p = g_paths.Normalize("assets/Materials/Red.mat");
    TEST_ASSERT(p.logical == "Assets/Materials/Red.mat", "prefix canonicalized, got " << p.logical);

    auto q = g_paths.Normalize("ASSETS");
    TEST_ASSERT(q.logical == "Assets" && q.IsRoot(), "bare root, got " << q.logical);
    TEST_PASS();
}

bool test_root_prefix_appears_once() {
    auto p = g_paths.Normalize("Assets/assets/ASSETS/Textures/wood.png");
    TEST_ASSERT(p.logical == "Assets/Textures/wood.png", "got " << p.logical);
    TEST_ASSERT(p.logical.find("Assets/", 1) == std::string::npos, "root repeated");
    TEST_PASS();
}

bool test_prefix_match_is_by_segment() {
    // "AssetsExtra" is a folder of its own, not the root
    auto p = g_paths.Normalize("AssetsExtra/file.txt");
    TEST_ASSERT(p.logical == "Assets/AssetsExtra/file.txt", "got " << p.logical);
    TEST_PASS();
}

bool test_dot_segments() {
    auto p = g_paths.Normalize("Assets/./Scripts/../Data/items.lua");
    TEST_ASSERT(p.logical == "Assets/Data/items.lua", "got " << p.logical);

    // Parent references never escape the root
    auto q = g_paths.Normalize("../../etc/passwd");
    TEST_ASSERT(q.logical == "Assets/etc/passwd", "got " << q.logical);
    TEST_ASSERT(q.physical == fs::path("/project/Assets/etc/passwd"), "physical escaped the root");
    TEST_PASS();
}

bool test_drive_and_stream_segments() {
    // A drive letter must not re-root the physical path
    auto p = g_paths.Normalize("C:/Windows/x.txt");
    TEST_ASSERT(p.logical == "Assets/Windows/x.txt", "got " << p.logical);
    TEST_ASSERT(p.physical == fs::path("/project/Assets") / "Windows" / "x.txt", "got " << p.physical.string());

    auto q = g_paths.Normalize("D:");
    TEST_ASSERT(q.logical == "Assets", "bare drive maps to the root, got " << q.logical);

    auto r = g_paths.Normalize("Scripts/a.lua:hidden/b.lua");
    TEST_ASSERT(r.logical == "Assets/Scripts/b.lua", "stream segment dropped, got " << r.logical);
    TEST_PASS();
}

bool test_idempotent() {
    const std::vector<std::string> inputs = {
        "", "/", "Assets", "assets\\", "Scripts/A.lua", "\\Assets\\Assets\\b\\c",
        "x/../y", "Assets/./z/", "AssetsX/q", "a//b///c"
    };
    for (const auto& in : inputs) {
        auto once = g_paths.Normalize(in);
        auto twice = g_paths.Normalize(once.logical);
        TEST_ASSERT(once.logical == twice.logical, "not idempotent for '" << in << "'");
        TEST_ASSERT(once.physical == twice.physical, "physical drifted for '" << in << "'");
        TEST_ASSERT(once.logical.rfind("Assets", 0) == 0, "missing root for '" << in << "'");
    }
    TEST_PASS();
}

bool test_physical_path() {
    auto p = g_paths.Normalize("Materials/Red.mat");
    TEST_ASSERT(p.physical == fs::path("/project/Assets/Materials/Red.mat"), "got " << p.physical.string());

    auto root = g_paths.Normalize("");
    TEST_ASSERT(root.physical == fs::path("/project/Assets"), "root physical");
    TEST_PASS();
}

bool test_file_name_and_parent() {
    auto p = g_paths.Normalize("Scripts/AI/Brain.lua");
    TEST_ASSERT(p.FileName() == "Brain.lua", "got " << p.FileName());
    TEST_ASSERT(p.ParentLogical() == "Assets/Scripts/AI", "got " << p.ParentLogical());
    TEST_PASS();
}

bool test_to_logical() {
    auto logical = g_paths.ToLogical(fs::path("/project/Assets/Scripts/Player.lua"));
    TEST_ASSERT(logical == "Assets/Scripts/Player.lua", "got " << logical);
    TEST_ASSERT(g_paths.ToLogical(fs::path("/project/Assets")) == "Assets", "root maps to root");
    TEST_PASS();
}

bool test_custom_root_name() {
    AssetPaths paths("Content", fs::path("/game/Content"));
    auto p = paths.Normalize("content\\Maps\\level1.json");
    TEST_ASSERT(p.logical == "Content/Maps/level1.json", "got " << p.logical);

    auto q = paths.Normalize("Assets/Maps");
    TEST_ASSERT(q.logical == "Content/Assets/Maps", "other names are ordinary folders, got " << q.logical);
    TEST_PASS();
}

// ============================================================================
// Directory creation
// ============================================================================

bool test_ensure_directory_creates_nested() {
    TempDir tmp;
    AssetPaths paths("Assets", tmp.path / "Assets");

    auto folder = paths.Normalize("Scripts/Deep/Nested");
    auto result = paths.EnsureDirectory(folder);
    TEST_ASSERT(result.IsOk(), "nested creation failed");
    TEST_ASSERT(fs::is_directory(folder.physical), "directory missing");

    auto again = paths.EnsureDirectory(folder);
    TEST_ASSERT(again.IsOk(), "existing directory should succeed");
    TEST_PASS();
}

bool test_ensure_directory_reports_failure() {
    TempDir tmp;
    AssetPaths paths("Assets", tmp.path / "Assets");
    fs::create_directories(tmp.path / "Assets");

    // A regular file where a folder is needed
    auto blocker = paths.Normalize("Blocked");
    TEST_ASSERT(Utils::WriteTextFile(blocker.physical, "x").IsOk(), "setup write failed");

    auto result = paths.EnsureDirectory(paths.Normalize("Blocked/Child"));
    TEST_ASSERT(result.IsErr(), "creation under a file must fail");
    TEST_ASSERT(result.Error().code == ErrorCode::DirectoryCreateFailed, "expected DirectoryCreateFailed");
    TEST_PASS();
}

int main() {
    spdlog::set_level(spdlog::level::off);

    std::cout << "================================================" << std::endl;
    std::cout << "Asset Path Normalization Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_prepends_root();
    test_backslashes_and_edge_slashes();
    test_root_prefix_case_insensitive();
    test_root_prefix_appears_once();
    test_prefix_match_is_by_segment();
    test_dot_segments();
    test_drive_and_stream_segments();
    test_idempotent();
    test_physical_path();
    test_file_name_and_parent();
    test_to_logical();
    test_custom_root_name();

    std::cout << "\n--- Filesystem ---" << std::endl;
    test_ensure_directory_creates_nested();
    test_ensure_directory_reports_failure();

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
