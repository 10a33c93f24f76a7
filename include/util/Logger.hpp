#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace cadence::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static constexpr const char* DEFAULT_LOG_FILE = "/tmp/cadence_debug.log";

    static void init();
    static void init(const std::filesystem::path& file, Level min_level = Level::Info);
    static void set_level(Level min_level);
    static Level level();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "debug", "info", "warn"/"warning", "error"; nullopt otherwise
    static std::optional<Level> parse_level(std::string_view name);
};

}  // namespace cadence::util
