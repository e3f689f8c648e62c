#include "../framework/SimpleTest.hpp"
#include "config/Config.hpp"
#include "timer/Errors.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tickwheel::config;
using tickwheel::util::Logger;
using namespace std::chrono_literals;

namespace {

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

}  // namespace

TEST_CASE(test_config_defaults_are_valid) {
    Config cfg;
    ASSERT_EQ(cfg.wheel_size, 64u);
    ASSERT_EQ(cfg.tick_duration.count(), 100);
    ASSERT_EQ(cfg.transfer_batch, 10000u);
    ConfigLoader::validate(cfg);
}

TEST_CASE(test_config_validate_rejects_unusable_values) {
    Config zero_wheel;
    zero_wheel.wheel_size = 0;
    ASSERT_THROWS(ConfigLoader::validate(zero_wheel), tickwheel::timer::InvalidArgumentError);

    Config zero_tick;
    zero_tick.tick_duration = 0ms;
    ASSERT_THROWS(ConfigLoader::validate(zero_tick), tickwheel::timer::InvalidArgumentError);

    Config zero_batch;
    zero_batch.transfer_batch = 0;
    ASSERT_THROWS(ConfigLoader::validate(zero_batch), tickwheel::timer::InvalidArgumentError);

    Config negative_poll;
    negative_poll.join_poll_interval = -5ms;
    ASSERT_THROWS(ConfigLoader::validate(negative_poll), tickwheel::timer::InvalidArgumentError);
}

TEST_CASE(test_config_validate_caps_tick_duration) {
    Config longest;
    longest.tick_duration = Config::max_tick_duration;
    ConfigLoader::validate(longest);

    Config too_long;
    too_long.tick_duration = Config::max_tick_duration + 1ms;
    ASSERT_THROWS(ConfigLoader::validate(too_long), tickwheel::timer::InvalidArgumentError);

    // A file value far beyond the cap loads, then fails validation
    const std::filesystem::path path = "/tmp/tickwheel_test_huge_tick.toml";
    write_file(path,
               "[timer]\n"
               "tick_duration_ms = 9223372036854775807\n");
    auto cfg = ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_EQ(cfg.tick_duration.count(), 9223372036854775807LL);
    ASSERT_THROWS(ConfigLoader::validate(cfg), tickwheel::timer::InvalidArgumentError);
}

TEST_CASE(test_config_load_from_file) {
    const std::filesystem::path path = "/tmp/tickwheel_test_config.toml";
    write_file(path,
               "# comment line\n"
               "[timer]\n"
               "wheel_size = 128\n"
               "  tick_duration_ms = \"20\"  \n"
               "transfer_batch = 500\n"
               "\n"
               "[logging]\n"
               "level = \"debug\"\n"
               "file = \"/tmp/tickwheel_custom.log\"\n");

    auto cfg = ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_EQ(cfg.wheel_size, 128u);
    ASSERT_EQ(cfg.tick_duration.count(), 20);
    ASSERT_EQ(cfg.transfer_batch, 500u);
    ASSERT_EQ(cfg.join_poll_interval.count(), 100);
    ASSERT_TRUE(cfg.log_level == Logger::Level::Debug);
    ASSERT_EQ(cfg.log_file.string(), std::string("/tmp/tickwheel_custom.log"));
}

TEST_CASE(test_config_bad_values_keep_defaults) {
    const std::filesystem::path path = "/tmp/tickwheel_test_bad_config.toml";
    write_file(path,
               "[timer]\n"
               "wheel_size = lots\n"
               "transfer_batch = -3\n"
               "tick_duration_ms = 50ms\n"
               "no_equals_sign\n"
               "unknown_key = 1\n"
               "[logging]\n"
               "level = \"verbose\"\n");

    auto cfg = ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(cfg == Config{});
}

TEST_CASE(test_config_missing_file_gives_defaults) {
    auto cfg = ConfigLoader::load_from_file("/tmp/tickwheel_does_not_exist.toml");
    ASSERT_TRUE(cfg == Config{});
}

TEST_CASE(test_config_save_then_load) {
    const std::filesystem::path path = "/tmp/tickwheel_test_dir/config.toml";
    Config cfg;
    cfg.wheel_size = 256;
    cfg.tick_duration = 10ms;
    cfg.transfer_batch = 42;
    cfg.join_poll_interval = 25ms;
    cfg.log_level = Logger::Level::Warn;
    cfg.log_file = "/tmp/tickwheel_saved.log";

    ConfigLoader::save_config(cfg, path);
    auto loaded = ConfigLoader::load_from_file(path);
    std::filesystem::remove_all(path.parent_path());

    ASSERT_TRUE(loaded == cfg);
}

TEST_CASE(test_logger_filters_by_level) {
    const std::filesystem::path path = "/tmp/tickwheel_test_logger.log";
    Logger::init(path, Logger::Level::Warn);

    Logger::info("hidden info line");
    Logger::warn("visible warn line");
    Logger::error("visible error line");

    auto content = read_file(path);
    ASSERT_TRUE(content.find("hidden info line") == std::string::npos);
    ASSERT_TRUE(content.find("[WARN]  visible warn line") != std::string::npos);
    ASSERT_TRUE(content.find("[ERROR] visible error line") != std::string::npos);

    Logger::set_level(Logger::Level::Debug);
    ASSERT_TRUE(Logger::level() == Logger::Level::Debug);
    Logger::debug("now visible debug line");
    ASSERT_TRUE(read_file(path).find("[DEBUG] now visible debug line") != std::string::npos);

    Logger::init(path, Logger::Level::Info);
    std::filesystem::remove(path);
}

TEST_CASE(test_apply_logging_uses_config) {
    const std::filesystem::path path = "/tmp/tickwheel_test_apply.log";
    Config cfg;
    cfg.log_file = path;
    cfg.log_level = Logger::Level::Error;

    ConfigLoader::apply_logging(cfg);
    ASSERT_TRUE(Logger::level() == Logger::Level::Error);
    Logger::warn("suppressed warning");
    Logger::error("kept error");

    auto content = read_file(path);
    ASSERT_TRUE(content.find("suppressed warning") == std::string::npos);
    ASSERT_TRUE(content.find("kept error") != std::string::npos);

    Logger::init(path, Logger::Level::Info);
    std::filesystem::remove(path);
}

int main(int argc, char** argv) {
    return tickwheel::test::TestRunner::instance().run_all(argc, argv);
}
