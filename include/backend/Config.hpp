#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>

namespace shairmeta::backend {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct Config {
    // MQTT feed
    std::string mqtt_host = "localhost";
    int mqtt_port = 1883;
    std::string mqtt_username;
    std::string mqtt_password;
    std::string topic_prefix = "shairport-sync";
    std::string mqtt_client_id;  // Empty: "shairmeta-<pid>"
    int mqtt_keepalive_seconds = 60;

    // HTTP query interface
    std::string http_host = "0.0.0.0";
    int http_port = 5000;
    int http_workers = 4;

    // Logging
    std::string log_level = "info";
    std::filesystem::path log_file;

    // Credentials are sent only when both are present
    [[nodiscard]] bool has_mqtt_credentials() const {
        return !mqtt_username.empty() && !mqtt_password.empty();
    }
};

// Command line, already split into settings and process flags
struct CommandLine {
    std::unordered_map<std::string, std::string> settings;  // dotted key → value
    std::optional<std::filesystem::path> config_path;
    bool debug = false;
    bool help = false;
};

class ConfigLoader {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    // `args` excludes argv[0]. Throws ConfigError on unknown flags or missing values.
    static CommandLine parse_arguments(const std::vector<std::string>& args);

    // Defaults < config file < environment < command line
    static Config load_config(const CommandLine& cmd, const EnvLookup& env = system_env);

    static Config load_from_file(const std::filesystem::path& path, Config base = {});
    static void apply_environment(Config& cfg, const EnvLookup& env = system_env);
    static void apply_command_line(Config& cfg, const CommandLine& cmd);

    // Set one dotted key ("mqtt.port"). Returns false for an unknown key,
    // throws ConfigError for a bad value.
    static bool set_value(Config& cfg, const std::string& key, const std::string& value);

    static void validate(const Config& cfg);
    static std::string usage(const std::string& program);

    static std::optional<std::string> system_env(const std::string& name);
    static std::filesystem::path get_config_file();
};

}  // namespace shairmeta::backend
