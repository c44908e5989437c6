#include "backend/Config.hpp"
#include "backend/PlaybackStore.hpp"
#include "collectors/MetadataCollector.hpp"
#include "decoder/FieldDecoder.hpp"
#include "http/HttpServer.hpp"
#include "http/MetadataResponder.hpp"
#include "util/Logger.hpp"
#include <iostream>
#include <memory>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <unistd.h>

using namespace std::chrono_literals;
using namespace shairmeta;

// Set from the signal handler or a failed worker thread
static std::atomic<bool> g_shutdown{false};
static std::atomic<int> g_exit_code{0};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static transport::MqttSettings make_mqtt_settings(const backend::Config& config) {
    transport::MqttSettings settings;
    settings.host = config.mqtt_host;
    settings.port = static_cast<uint16_t>(config.mqtt_port);
    settings.client_id = config.mqtt_client_id.empty()
        ? "shairmeta-" + std::to_string(::getpid())
        : config.mqtt_client_id;
    settings.topic_filter = config.topic_prefix + "/#";
    settings.keepalive_seconds = static_cast<uint16_t>(config.mqtt_keepalive_seconds);
    if (config.has_mqtt_credentials()) {
        settings.username = config.mqtt_username;
        settings.password = config.mqtt_password;
    }
    return settings;
}

static http::HttpSettings make_http_settings(const backend::Config& config) {
    http::HttpSettings settings;
    settings.host = config.http_host;
    settings.port = static_cast<uint16_t>(config.http_port);
    settings.workers = static_cast<size_t>(config.http_workers);
    settings.max_pending = settings.workers * 16;
    return settings;
}

// Thread body wrapper: a component that dies takes the process down with it
template <typename Fn>
static void run_component(const char* name, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        util::Logger::error(std::string(name) + " failed: " + e.what());
        g_exit_code.store(1);
        g_shutdown.store(true);
    }
}

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "shairmeta";

    try {
        auto cmd = backend::ConfigLoader::parse_arguments(std::vector<std::string>(argv + 1, argv + argc));
        if (cmd.help) {
            std::cout << backend::ConfigLoader::usage(program);
            return 0;
        }

        auto config = backend::ConfigLoader::load_config(cmd);
        auto level = util::Logger::parse_level(config.log_level).value_or(util::Logger::Level::Info);
        util::Logger::init(level, config.log_file);
        util::Logger::info("SHAIRMETA starting...");

        auto mqtt_settings = make_mqtt_settings(config);
        util::Logger::info("MQTT broker: " + mqtt_settings.host + ":" + std::to_string(mqtt_settings.port) +
                           ", topics " + mqtt_settings.topic_filter +
                           (mqtt_settings.username ? ", user " + *mqtt_settings.username : std::string()));

        auto store = std::make_shared<backend::PlaybackStore>();
        collectors::MetadataCollector collector(store, decoder::FieldDecoder(config.topic_prefix),
                                                std::move(mqtt_settings));

        auto responder = std::make_shared<http::MetadataResponder>(store);
        http::HttpServer server(make_http_settings(config), responder);
        // Bind here so a taken port fails startup instead of a worker thread
        server.bind();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGPIPE, SIG_IGN);

        std::jthread collector_thread([&collector](std::stop_token st) {
            run_component("MetadataCollector", [&] { collector.run(st); });
        });
        std::jthread http_thread([&server](std::stop_token st) {
            run_component("HttpServer", [&] { server.run(st); });
        });

        util::Logger::info("Serving http://" + config.http_host + ":" + std::to_string(server.bound_port()) +
                           "/metadata");

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(100ms);
        }

        util::Logger::info("Shutting down...");
        collector_thread.request_stop();
        http_thread.request_stop();
        collector_thread.join();
        http_thread.join();

        util::Logger::info("SHAIRMETA stopped");
        return g_exit_code.load();

    } catch (const backend::ConfigError& e) {
        std::cerr << program << ": " << e.what() << "\n"
                  << "Try '" << program << " --help' for more information.\n";
        return 1;
    } catch (const std::exception& e) {
        util::Logger::error("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
