// test_config_loader.cpp
// Unit tests for bridge configuration loading
//
// Verifies per-key defaults, tolerance of missing or malformed files, and
// the fix-ups applied to project settings.

#include "Utils/ConfigLoader.h"
#include "Utils/FileUtils.h"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>

using namespace Conduit;
using namespace Conduit::Utils;
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

struct TempDir {
    fs::path path;
    TempDir() {
        static int counter = 0;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("conduit_config_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

static bool WriteConfig(const TempDir& dir, const std::string& text) {
    return WriteTextFile(dir.path / "bridge_defaults.json", text).IsOk();
}

bool test_missing_file_yields_defaults() {
    TempDir dir;
    auto result = ConfigLoader::LoadBridgeConfig(dir.path.string());
    TEST_ASSERT(result.IsOk(), "missing file is not an error");
    const auto& c = result.Value();
    TEST_ASSERT(c.project.assetRootName == "Assets", "root name default");
    TEST_ASSERT(c.project.scriptExtension == ".lua", "extension default");
    TEST_ASSERT(c.pipeline.active == "universal", "pipeline default");
    TEST_ASSERT(c.scene.path.empty(), "no scene by default");
    TEST_PASS();
}

bool test_malformed_file_yields_defaults() {
    TempDir dir;
    TEST_ASSERT(WriteConfig(dir, "{ \"project\": "), "setup");
    auto result = ConfigLoader::LoadBridgeConfig(dir.path.string());
    TEST_ASSERT(result.IsOk(), "malformed file is not fatal");
    TEST_ASSERT(result.Value().logging.level == "info", "logging default");
    TEST_PASS();
}

bool test_values_and_per_key_fallback() {
    TempDir dir;
    TEST_ASSERT(WriteConfig(dir, R"({
        "project": { "assetRootName": "Content", "materialsFolder": 12, "scriptExtension": "luau" },
        "pipeline": { "active": "hdrp" },
        "scene": { "path": "scenes/main.json" },
        "logging": { "level": "debug" }
    })"), "setup");

    auto result = ConfigLoader::LoadBridgeConfig(dir.path.string());
    TEST_ASSERT(result.IsOk(), "load failed");
    const auto& c = result.Value();
    TEST_ASSERT(c.project.assetRootName == "Content", "root name read");
    TEST_ASSERT(c.project.materialsFolder == "Materials", "mistyped key keeps its default");
    TEST_ASSERT(c.project.scriptExtension == ".luau", "leading dot added, got " << c.project.scriptExtension);
    TEST_ASSERT(c.project.scriptsFolder == "Scripts", "absent key keeps its default");
    TEST_ASSERT(c.pipeline.active == "hdrp", "pipeline read");
    TEST_ASSERT(c.scene.path == "scenes/main.json", "scene read");
    TEST_ASSERT(c.logging.level == "debug", "level read");
    TEST_PASS();
}

bool test_empty_root_name_restored() {
    TempDir dir;
    TEST_ASSERT(WriteConfig(dir, R"({"project": {"assetRootName": ""}})"), "setup");
    auto result = ConfigLoader::LoadBridgeConfig(dir.path.string());
    TEST_ASSERT(result.IsOk() && result.Value().project.assetRootName == "Assets", "empty root name replaced");
    TEST_PASS();
}

bool test_read_json_file_errors() {
    TempDir dir;
    auto missing = ConfigLoader::ReadJsonFile((dir.path / "none.json").string());
    TEST_ASSERT(missing.IsErr() && missing.Error().code == ErrorCode::NotFound, "missing file is NotFound");

    TEST_ASSERT(WriteTextFile(dir.path / "bad.json", "[1, 2").IsOk(), "setup");
    auto bad = ConfigLoader::ReadJsonFile((dir.path / "bad.json").string());
    TEST_ASSERT(bad.IsErr() && bad.Error().code == ErrorCode::MalformedRequest, "parse error is MalformedRequest");
    TEST_PASS();
}

int main() {
    spdlog::set_level(spdlog::level::off);

    std::cout << "================================================" << std::endl;
    std::cout << "Bridge Configuration Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_missing_file_yields_defaults();
    test_malformed_file_yields_defaults();
    test_values_and_per_key_fallback();
    test_empty_root_name_restored();
    test_read_json_file_errors();

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
