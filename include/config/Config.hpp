#pragma once

#include "timing/AdvancedDebouncer.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace cadence::config {

struct Config {
    // Search settings
    int delay_ms = 300;
    int max_wait_ms = 0;      // 0 = no deadline
    bool leading = false;
    bool trailing = true;
    int max_results = 20;

    // Log settings
    std::string log_level = "info";
    std::filesystem::path log_file = "/tmp/cadence_debug.log";

    timing::DebounceOptions debounce_options() const;
    std::chrono::milliseconds delay() const { return std::chrono::milliseconds(delay_ms); }
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static void save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

private:
    static Config create_default_config();
};

}  // namespace cadence::config
