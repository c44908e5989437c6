#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/TextCodec.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <charconv>
#include <string>

namespace shairmeta::backend {

namespace {
    struct OptionSpec {
        const char* key;    // Dotted key: "<section>.<name>" in the config file
        const char* env;    // Environment variable, or nullptr
        const char* flag;   // Command line flag, or nullptr
        const char* help;
    };

    // Every setting reachable from file, environment or command line
    constexpr OptionSpec kOptions[] = {
        {"mqtt.host",              "MQTT_HOST",    "--mqtt-host",      "MQTT broker host (default: localhost)"},
        {"mqtt.port",              "MQTT_PORT",    "--mqtt-port",      "MQTT broker port (default: 1883)"},
        {"mqtt.username",          "MQTT_USER",    "--mqtt-user",      "MQTT username (optional)"},
        {"mqtt.password",          "MQTT_PASS",    "--mqtt-pass",      "MQTT password (optional)"},
        {"mqtt.topic_prefix",      "TOPIC_PREFIX", "--topic-prefix",   "MQTT topic prefix (default: shairport-sync)"},
        {"mqtt.client_id",         nullptr,        "--mqtt-client-id", "MQTT client id (default: shairmeta-<pid>)"},
        {"mqtt.keepalive_seconds", nullptr,        nullptr,            "MQTT keepalive interval (default: 60)"},
        {"http.host",              "HTTP_HOST",    "--http-host",      "HTTP server host (default: 0.0.0.0)"},
        {"http.port",              "HTTP_PORT",    "--http-port",      "HTTP server port (default: 5000)"},
        {"http.workers",           nullptr,        "--http-workers",   "HTTP worker threads (default: 4)"},
        {"log.level",              nullptr,        "--log-level",      "debug, info, warn or error (default: info)"},
        {"log.file",               nullptr,        "--log-file",       "Also append log lines to this file"},
    };

    const OptionSpec* find_flag(const std::string& flag) {
        for (const auto& option : kOptions) {
            if (option.flag && flag == option.flag) return &option;
        }
        return nullptr;
    }

    int parse_int(const std::string& key, const std::string& value, int min, int max) {
        int result = 0;
        const char* end = value.data() + value.size();
        auto [ptr, ec] = std::from_chars(value.data(), end, result);
        if (value.empty() || ec != std::errc() || ptr != end) {
            throw ConfigError(key + ": '" + value + "' is not an integer");
        }
        if (result < min || result > max) {
            throw ConfigError(key + ": " + value + " is out of range [" +
                              std::to_string(min) + ", " + std::to_string(max) + "]");
        }
        return result;
    }
}

std::optional<std::string> ConfigLoader::system_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

std::filesystem::path ConfigLoader::get_config_file() {
    if (auto xdg = system_env("XDG_CONFIG_HOME"); xdg && !xdg->empty()) {
        return std::filesystem::path(*xdg) / "shairmeta" / "config.toml";
    }
    if (auto home = system_env("HOME"); home && !home->empty()) {
        return std::filesystem::path(*home) / ".config" / "shairmeta" / "config.toml";
    }
    return ".config/shairmeta/config.toml";
}

bool ConfigLoader::set_value(Config& cfg, const std::string& key, const std::string& value) {
    if (key == "mqtt.host") cfg.mqtt_host = value;
    else if (key == "mqtt.port") cfg.mqtt_port = parse_int(key, value, 1, 65535);
    else if (key == "mqtt.username") cfg.mqtt_username = value;
    else if (key == "mqtt.password") cfg.mqtt_password = value;
    else if (key == "mqtt.topic_prefix") cfg.topic_prefix = value;
    else if (key == "mqtt.client_id") cfg.mqtt_client_id = value;
    else if (key == "mqtt.keepalive_seconds") cfg.mqtt_keepalive_seconds = parse_int(key, value, 5, 65535);
    else if (key == "http.host") cfg.http_host = value;
    else if (key == "http.port") cfg.http_port = parse_int(key, value, 1, 65535);
    else if (key == "http.workers") cfg.http_workers = parse_int(key, value, 1, 256);
    else if (key == "log.level") {
        if (!util::Logger::parse_level(value)) {
            throw ConfigError(key + ": unknown level '" + value + "'");
        }
        cfg.log_level = value;
    }
    else if (key == "log.file") cfg.log_file = std::filesystem::path(value);
    else return false;
    return true;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path, Config base) {
    util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot read config file " + path.string());
    }

    Config cfg = std::move(base);
    std::string raw_line, current_section;
    int line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        std::string line(util::trim(raw_line));

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = std::string(util::trim(std::string_view(line).substr(1, line.length() - 2)));
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: " + path.string() + ":" + std::to_string(line_number) +
                               ": expected 'key = value', line ignored");
            continue;
        }

        std::string key(util::trim(std::string_view(line).substr(0, eq_pos)));
        std::string value(util::trim(std::string_view(line).substr(eq_pos + 1)));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        std::string dotted = current_section.empty() ? key : current_section + "." + key;
        bool known = false;
        try {
            known = set_value(cfg, dotted, value);
        } catch (const ConfigError& e) {
            throw ConfigError(path.string() + ":" + std::to_string(line_number) + ": " + e.what());
        }
        if (!known) {
            util::Logger::warn("Config: " + path.string() + ":" + std::to_string(line_number) +
                               ": unknown setting '" + dotted + "', ignored");
        }
    }

    return cfg;
}

void ConfigLoader::apply_environment(Config& cfg, const EnvLookup& env) {
    for (const auto& option : kOptions) {
        if (!option.env) continue;
        auto value = env(option.env);
        if (!value || value->empty()) continue;
        try {
            if (!set_value(cfg, option.key, *value)) {
                throw ConfigError(std::string("unknown setting '") + option.key + "'");
            }
        } catch (const ConfigError& e) {
            throw ConfigError(std::string("environment ") + option.env + ": " + e.what());
        }
    }
}

CommandLine ConfigLoader::parse_arguments(const std::vector<std::string>& args) {
    CommandLine cmd;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];

        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
            continue;
        }
        if (arg == "--debug") {
            cmd.debug = true;
            continue;
        }

        // Accept both "--flag value" and "--flag=value"
        std::optional<std::string> inline_value;
        if (auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            inline_value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }

        auto take_value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) {
                throw ConfigError("missing value for " + arg);
            }
            return args[++i];
        };

        if (arg == "--config") {
            cmd.config_path = std::filesystem::path(take_value());
            continue;
        }

        const OptionSpec* option = find_flag(arg);
        if (!option) {
            throw ConfigError("unknown argument '" + args[i] + "'");
        }
        cmd.settings[option->key] = take_value();
    }

    return cmd;
}

void ConfigLoader::apply_command_line(Config& cfg, const CommandLine& cmd) {
    for (const auto& [key, value] : cmd.settings) {
        if (!set_value(cfg, key, value)) {
            throw ConfigError("unknown setting '" + key + "'");
        }
    }
    if (cmd.debug) {
        cfg.log_level = "debug";
    }
}

void ConfigLoader::validate(const Config& cfg) {
    if (cfg.mqtt_host.empty()) throw ConfigError("mqtt.host must not be empty");
    if (cfg.http_host.empty()) throw ConfigError("http.host must not be empty");
    if (cfg.topic_prefix.find_first_of("#+") != std::string::npos) {
        throw ConfigError("mqtt.topic_prefix must not contain MQTT wildcards");
    }
    if (cfg.mqtt_username.empty() != cfg.mqtt_password.empty()) {
        util::Logger::warn("Config: MQTT username and password must both be set; connecting anonymously");
    }
}

Config ConfigLoader::load_config(const CommandLine& cmd, const EnvLookup& env) {
    util::Logger::debug("Config: Loading configuration");

    Config cfg;
    auto config_file = cmd.config_path.value_or(get_config_file());
    if (std::filesystem::exists(config_file)) {
        cfg = load_from_file(config_file, cfg);
        util::Logger::info("Config: Loaded " + config_file.string());
    } else if (cmd.config_path) {
        throw ConfigError("config file not found: " + config_file.string());
    }

    apply_environment(cfg, env);
    apply_command_line(cfg, cmd);
    validate(cfg);
    return cfg;
}

std::string ConfigLoader::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n\n"
        << "Shairport Sync metadata server: subscribes to MQTT metadata topics and\n"
        << "serves the current Now Playing state over HTTP (/metadata, /health).\n\n"
        << "Options:\n"
        << "  --config <path>          Config file (default: " << get_config_file().string() << ")\n";
    for (const auto& option : kOptions) {
        if (!option.flag) continue;
        std::string flag = std::string(option.flag) + " <value>";
        out << "  " << flag;
        for (size_t pad = flag.size(); pad < 25; ++pad) out << ' ';
        out << option.help;
        if (option.env) out << " [env: " << option.env << "]";
        out << "\n";
    }
    out << "  --debug                  Enable debug logging\n"
        << "  -h, --help               Show this help\n";
    return out.str();
}

}  // namespace shairmeta::backend
