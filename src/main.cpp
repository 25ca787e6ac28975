#include "assistant.h"
#include "core/config.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

namespace coop_assist {

static std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    (void)signal;
    g_running = false;
}

/// "<user_id>\t<message>" or a bare message from the default user
static void split_line(const std::string& line, std::string& user_id, std::string& message) {
    size_t tab = line.find('\t');
    if (tab == std::string::npos) {
        user_id = "cli";
        message = line;
        return;
    }
    user_id = utils::trim_copy(line.substr(0, tab));
    if (user_id.empty()) {
        user_id = "cli";
    }
    message = line.substr(tab + 1);
}

static void print_response(const Response& response) {
    std::cout << response.text << "\n";
    for (size_t i = 0; i < response.options.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << response.options[i].display_text
                  << "  [" << response.options[i].payload << "]\n";
    }
    std::cout << std::flush;
}

} // namespace coop_assist

int main(int argc, char* argv[]) {
    // Console logging until the config names a level and file
    coop_assist::Logger::initialize(coop_assist::LogLevel::INFO);

    std::string config_path = "config/config.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    auto loaded = coop_assist::Config::load(config_path);
    if (loaded.is_error()) {
        coop_assist::Logger::error("Failed to load config " + config_path + ": " + loaded.error().message);
        coop_assist::Logger::shutdown();
        return 1;
    }
    const coop_assist::Config& config = loaded.value();

    coop_assist::Logger::shutdown();
    coop_assist::Logger::initialize(coop_assist::parse_log_level(config.logging.level), config.logging.file);

    coop_assist::Assistant assistant(config);
    auto init = assistant.initialize();
    if (init.is_error()) {
        coop_assist::Logger::error(std::string("Startup failed (") +
                                   coop_assist::error_type_name(init.error().type) + "): " +
                                   init.error().message);
        coop_assist::Logger::shutdown();
        return 1;
    }

    // Set up signal handlers
    std::signal(SIGINT, coop_assist::signal_handler);
    std::signal(SIGTERM, coop_assist::signal_handler);

    assistant.start();
    coop_assist::Logger::info("Reading messages from stdin (\":stats\" for cache stats, \":quit\" to exit)");

    std::string line;
    while (coop_assist::g_running && std::getline(std::cin, line)) {
        std::string trimmed = coop_assist::utils::trim_copy(line);
        if (trimmed == ":quit") {
            break;
        }
        if (trimmed == ":stats") {
            std::cout << assistant.cache_stats().to_json().dump(2) << std::endl;
            continue;
        }

        std::string user_id;
        std::string message;
        coop_assist::split_line(line, user_id, message);
        coop_assist::print_response(assistant.handle(message, user_id));
    }

    coop_assist::Logger::info("Shutting down...");
    assistant.stop();
    coop_assist::Logger::shutdown();
    return 0;
}
