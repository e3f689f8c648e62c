#pragma once

#include "util/Logger.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>

namespace tickwheel::config {

struct Config {
    // Wheel settings; fixed once a WheelTimer is constructed
    size_t wheel_size = 64;
    std::chrono::milliseconds tick_duration{100};
    static constexpr std::chrono::milliseconds max_tick_duration{std::chrono::hours(24)};

    // Inbound tasks moved into slots per tick
    size_t transfer_batch = 10000;

    // How long shutdown waits on a thread before logging and waiting again
    std::chrono::milliseconds join_poll_interval{100};

    // Logging
    std::filesystem::path log_file;
    util::Logger::Level log_level = util::Logger::Level::Info;

    bool operator==(const Config&) const = default;
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static void save_config(const Config& cfg, const std::filesystem::path& path);

    // Throws timer::InvalidArgumentError for values a WheelTimer cannot run with
    static void validate(const Config& cfg);

    // Opens cfg.log_file (when set) at cfg.log_level
    static void apply_logging(const Config& cfg);

private:
    static std::filesystem::path get_config_file();
};

}  // namespace tickwheel::config
