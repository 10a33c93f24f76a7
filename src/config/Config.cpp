#include "config/Config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include "util/Logger.hpp"

namespace cadence::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

void parse_int(const std::string& key, const std::string& value, int& out) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        util::Logger::warn("Config: Ignoring non-numeric value for " + key + ": '" + value + "'");
        return;
    }
    out = parsed;
}

}  // namespace

timing::DebounceOptions Config::debounce_options() const {
    timing::DebounceOptions options;
    if (max_wait_ms > 0) {
        options.max_wait = std::chrono::milliseconds(max_wait_ms);
    }
    options.leading = leading;
    options.trailing = trailing;
    return options;
}

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "search") {
            if (key == "delay_ms") parse_int(key, value, cfg.delay_ms);
            else if (key == "max_wait_ms") parse_int(key, value, cfg.max_wait_ms);
            else if (key == "max_results") parse_int(key, value, cfg.max_results);
            else if (key == "leading") cfg.leading = (value == "true");
            else if (key == "trailing") cfg.trailing = (value == "true");
        }
        else if (current_section == "log") {
            if (key == "level") {
                if (util::Logger::parse_level(value)) {
                    cfg.log_level = value;
                } else {
                    util::Logger::warn("Config: Unknown log level '" + value + "'");
                }
            }
            else if (key == "file") cfg.log_file = std::filesystem::path(value);
        }
    }

    return cfg;
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration");

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return;
    }

    file << "# CADENCE Config\n\n";

    file << "[search]\n";
    file << "# Quiet period after the last keystroke before filtering (ms)\n";
    file << "delay_ms = " << cfg.delay_ms << "\n\n";
    file << "# Filter at least this often while typing continuously; 0 disables\n";
    file << "max_wait_ms = " << cfg.max_wait_ms << "\n\n";
    file << "# Filter on the first keystroke of a burst\n";
    file << "leading = " << (cfg.leading ? "true" : "false") << "\n\n";
    file << "# Filter once typing settles\n";
    file << "trailing = " << (cfg.trailing ? "true" : "false") << "\n\n";
    file << "# Rows shown below the search box\n";
    file << "max_results = " << cfg.max_results << "\n\n";

    file << "[log]\n";
    file << "# Level: \"debug\", \"info\", \"warn\", \"error\"\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";
}

std::filesystem::path ConfigLoader::get_config_file() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "cadence" / "config.toml";
    }
    return ".config/cadence/config.toml";
}

Config ConfigLoader::create_default_config() {
    return Config{};
}

}  // namespace cadence::config
