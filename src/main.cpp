#include "huddle/core/application.hpp"
#include "huddle/services/transport/stdio_transport.hpp"
#include "huddle/utils/logger.hpp"
#include "version.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include <signal.h>

namespace {
    std::atomic<bool> g_shutdown_requested{false};

    void handle_shutdown_signal(int /* signal */) {
        g_shutdown_requested = true;
    }

    // No SA_RESTART: a blocking read on stdin returns so the loop sees the flag
    void register_signal_handlers() {
        struct sigaction action{};
        action.sa_handler = handle_shutdown_signal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;

        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
        std::signal(SIGPIPE, SIG_IGN);
    }

    std::unique_ptr<huddle::utils::Logger> setup_logging(const huddle::core::ApplicationConfig& config) {
        using namespace huddle::utils;

        auto logger = std::make_unique<Logger>(config.log_level);

        // stdout carries the protocol, so the console sink writes to stderr
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        if (!config.log_file.empty()) {
            std::filesystem::path log_path(config.log_file);
            auto file_sink = std::make_unique<FileSink>(log_path, false);
            if (file_sink->is_open()) {
                logger->add_sink(std::move(file_sink));
                std::cerr << "Logging to: " << log_path << std::endl;
            } else {
                std::cerr << "Could not open log file " << log_path << std::endl;
            }
        }

        return logger;
    }

    void print_usage(const char* program) {
        std::cerr << "Usage: " << program << " [config.yaml]\n"
                  << "Reads line-delimited JSON requests from stdin and writes replies and events to stdout.\n";
    }
} // anonymous namespace

int main(int argc, char* argv[]) {
    std::filesystem::path config_path;
    if (argc > 2) {
        print_usage(argv[0]);
        return 2;
    }
    if (argc == 2) {
        const std::string_view arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        config_path = arg;
    }

    auto config_service = std::make_shared<huddle::core::ConfigManager>(config_path);
    if (!config_service->load()) {
        std::cerr << "Using default configuration" << std::endl;
    }

    const auto config = config_service->get();
    huddle::utils::LoggerManager::set_instance(setup_logging(config));

    HUDDLE_LOG_INFO("Main", std::string("huddle v") + HUDDLE_VERSION_STRING + " starting...");
    HUDDLE_LOG_DEBUG("Main", "Log level: " + huddle::utils::to_string(config.log_level));

    register_signal_handlers();

    try {
        HUDDLE_LOG_DEBUG("Main", "Creating application...");
        auto app_result = huddle::core::create_application(config_service->path());
        if (!app_result) {
            HUDDLE_LOG_ERROR("Main", "Application creation failed");
            return 1;
        }

        auto app = std::move(*app_result);

        if (!app->initialize()) {
            HUDDLE_LOG_ERROR("Main", "Application initialization failed");
            return 1;
        }

        if (!app->start()) {
            HUDDLE_LOG_ERROR("Main", "Application start failed");
            return 1;
        }

        auto bus = app->get_event_bus();
        auto presence = app->get_presence_engine();
        auto voice = app->get_voice_relay();
        if (!bus || !presence || !voice) {
            HUDDLE_LOG_ERROR("Main", "Services unavailable after start");
            app->stop();
            app->shutdown();
            return 1;
        }

        huddle::services::StdioTransport transport(*bus, *presence, *voice, std::cout);
        transport.start();

        std::cerr << "\nhuddle v" << HUDDLE_VERSION_STRING << " running\n"
                  << "Reading requests from stdin, Ctrl+C or EOF to exit\n" << std::endl;

        const auto handled = transport.run(std::cin, g_shutdown_requested);
        HUDDLE_LOG_INFO("Main", "Handled " + std::to_string(handled) + " requests");

        HUDDLE_LOG_INFO("Main", "Shutting down...");
        transport.stop();
        app->stop();
        app->shutdown();

        HUDDLE_LOG_INFO("Main", "Shutdown complete");
        huddle::utils::LoggerManager::get_instance().flush();
        return 0;

    } catch (const std::exception& e) {
        HUDDLE_LOG_ERROR("Main", "Fatal: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
