#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace shairmeta::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Lines below `threshold` are dropped. Lines always go to stderr and,
    // when `file` is set, are appended there as well.
    static void init(Level threshold, const std::filesystem::path& file = {});
    static void set_threshold(Level threshold);
    [[nodiscard]] static Level threshold();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "debug", "info", "warn"/"warning", "error"
    static std::optional<Level> parse_level(const std::string& name);
};

}  // namespace shairmeta::util
