#include "../framework/SimpleTest.hpp"
#include "config/Config.hpp"
#include "events/Scheduler.hpp"
#include "timing/AdvancedDebouncer.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace cadence::config;
using namespace std::chrono_literals;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream f(path);
    f << body;
    return path;
}

}  // namespace

TEST_CASE(test_config_missing_file_uses_defaults) {
    auto cfg = ConfigLoader::load_from_file("/nonexistent/cadence/config.toml");

    ASSERT_EQ(cfg.delay_ms, 300);
    ASSERT_EQ(cfg.max_wait_ms, 0);
    ASSERT_FALSE(cfg.leading);
    ASSERT_TRUE(cfg.trailing);
    ASSERT_EQ(cfg.max_results, 20);
    ASSERT_EQ(cfg.log_level, std::string("info"));
}

TEST_CASE(test_config_parses_sections) {
    auto path = write_temp("cadence_test_config.toml",
        "# comment\n"
        "[search]\n"
        "delay_ms = 150\n"
        "  max_wait_ms=  900  \n"
        "leading = true\n"
        "trailing = false\n"
        "max_results = 5\n"
        "\n"
        "[log]\n"
        "level = \"debug\"\n"
        "file = \"/tmp/cadence_other.log\"\n");

    auto cfg = ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_EQ(cfg.delay_ms, 150);
    ASSERT_EQ(cfg.max_wait_ms, 900);
    ASSERT_TRUE(cfg.leading);
    ASSERT_FALSE(cfg.trailing);
    ASSERT_EQ(cfg.max_results, 5);
    ASSERT_EQ(cfg.log_level, std::string("debug"));
    ASSERT_TRUE(cfg.log_file == std::filesystem::path("/tmp/cadence_other.log"));
}

TEST_CASE(test_config_ignores_bad_values) {
    auto path = write_temp("cadence_test_bad_config.toml",
        "[search]\n"
        "delay_ms = soon\n"
        "max_results = 12abc\n"
        "[log]\n"
        "level = loud\n"
        "[unknown]\n"
        "delay_ms = 1\n");

    auto cfg = ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_EQ(cfg.delay_ms, 300);
    ASSERT_EQ(cfg.max_results, 20);
    ASSERT_EQ(cfg.log_level, std::string("info"));
}

TEST_CASE(test_config_debounce_options) {
    Config cfg;
    auto options = cfg.debounce_options();
    ASSERT_FALSE(options.max_wait.has_value());
    ASSERT_FALSE(options.leading);
    ASSERT_TRUE(options.trailing);

    cfg.max_wait_ms = 2000;
    cfg.leading = true;
    options = cfg.debounce_options();
    ASSERT_TRUE(options.max_wait == std::chrono::milliseconds(2000));
    ASSERT_TRUE(options.leading);
    ASSERT_TRUE(cfg.delay() == 300ms);
}

TEST_CASE(test_config_with_no_edges_fails_debouncer) {
    Config cfg;
    cfg.leading = false;
    cfg.trailing = false;

    cadence::events::ManualClock clock;
    cadence::events::Scheduler scheduler(clock);
    ASSERT_THROWS(cadence::timing::AdvancedDebouncer(scheduler, cfg.delay(), cfg.debounce_options()),
                  cadence::timing::DebounceConfigError);
}

TEST_CASE(test_config_save_then_load) {
    auto path = std::filesystem::temp_directory_path() / "cadence_test_dir" / "config.toml";

    Config cfg;
    cfg.delay_ms = 75;
    cfg.max_wait_ms = 400;
    cfg.leading = true;
    cfg.log_level = "warn";
    ConfigLoader::save_config(cfg, path);

    auto loaded = ConfigLoader::load_from_file(path);
    std::filesystem::remove_all(path.parent_path());

    ASSERT_EQ(loaded.delay_ms, 75);
    ASSERT_EQ(loaded.max_wait_ms, 400);
    ASSERT_TRUE(loaded.leading);
    ASSERT_TRUE(loaded.trailing);
    ASSERT_EQ(loaded.log_level, std::string("warn"));
}

int main() {
    return cadence::test::TestRunner::instance().run_all();
}
