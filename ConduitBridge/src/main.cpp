#include "Core/BridgeHost.h"
#include "Utils/ConfigLoader.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace Conduit;

namespace {

// stdout carries the protocol, so console logging goes to stderr
void ConfigureLogging(const Utils::BridgeConfig::Logging& logging) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!logging.file.empty()) {
        std::error_code ec;
        const auto parent = std::filesystem::path(logging.file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        if (ec) {
            std::cerr << "Could not create log directory " << parent.string() << ": " << ec.message() << "\n";
        } else {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file, true));
            } catch (const spdlog::spdlog_ex& e) {
                std::cerr << "Could not open log file " << logging.file << ": " << e.what() << "\n";
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>("conduit", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    auto level = spdlog::level::from_str(logging.level);
    if (level == spdlog::level::off && logging.level != "off") {
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string configDir = argc > 1 ? argv[1] : "assets/config";

    // Config is read before logging is configured; its own messages go to
    // the default logger.
    spdlog::set_default_logger(spdlog::stderr_color_mt("bootstrap"));
    auto configResult = Utils::ConfigLoader::LoadBridgeConfig(configDir);
    const Utils::BridgeConfig config = configResult.ValueOr(Utils::BridgeConfig{});

    spdlog::drop("bootstrap");
    ConfigureLogging(config.logging);

    spdlog::info("===================================");
    spdlog::info("  Conduit: Editor Automation Bridge");
    spdlog::info("===================================");

    try {
        BridgeHost host;
        auto init = host.Initialize(config);
        if (init.IsErr()) {
            spdlog::critical("Failed to initialize bridge: {} {}", init.Error().message, init.Error().detail);
            return 1;
        }

        host.Run(std::cin, std::cout);
        spdlog::info("Bridge shut down cleanly");
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        spdlog::shutdown();
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
