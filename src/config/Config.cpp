#include "config/Config.hpp"
#include "timer/Errors.hpp"
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>

namespace tickwheel::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::optional<long long> parse_integer(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            util::Logger::warn("Config: Trailing characters in " + key + " = " + value + ", ignored");
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception& e) {
        util::Logger::warn("Config: Invalid number for " + key + " = " + value + " (" + e.what() + ")");
        return std::nullopt;
    }
}

std::optional<size_t> parse_count(const std::string& key, const std::string& value) {
    auto parsed = parse_integer(key, value);
    if (!parsed) return std::nullopt;
    if (*parsed < 0) {
        util::Logger::warn("Config: Negative value for " + key + " ignored");
        return std::nullopt;
    }
    return static_cast<size_t>(*parsed);
}

std::optional<util::Logger::Level> parse_level(const std::string& value) {
    if (value == "debug") return util::Logger::Level::Debug;
    if (value == "info") return util::Logger::Level::Info;
    if (value == "warn") return util::Logger::Level::Warn;
    if (value == "error") return util::Logger::Level::Error;
    return std::nullopt;
}

const char* level_name(util::Logger::Level level) {
    switch (level) {
        case util::Logger::Level::Debug: return "debug";
        case util::Logger::Level::Info:  return "info";
        case util::Logger::Level::Warn:  return "warn";
        case util::Logger::Level::Error: return "error";
    }
    return "info";
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    return Config{};
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg;

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
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Malformed line ignored: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "timer") {
            if (key == "wheel_size") {
                if (auto v = parse_count(key, value)) cfg.wheel_size = *v;
            } else if (key == "tick_duration_ms") {
                if (auto v = parse_integer(key, value)) cfg.tick_duration = std::chrono::milliseconds(*v);
            } else if (key == "transfer_batch") {
                if (auto v = parse_count(key, value)) cfg.transfer_batch = *v;
            } else if (key == "join_poll_interval_ms") {
                if (auto v = parse_integer(key, value)) cfg.join_poll_interval = std::chrono::milliseconds(*v);
            } else {
                util::Logger::warn("Config: Unknown key timer." + key);
            }
        } else if (current_section == "logging") {
            if (key == "file") {
                cfg.log_file = std::filesystem::path(value);
            } else if (key == "level") {
                if (auto level = parse_level(value)) {
                    cfg.log_level = *level;
                } else {
                    util::Logger::warn("Config: Unknown log level " + value);
                }
            } else {
                util::Logger::warn("Config: Unknown key logging." + key);
            }
        } else {
            util::Logger::warn("Config: Key outside known sections: " + key);
        }
    }

    return cfg;
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return;
    }

    file << "# tickwheel config\n\n";

    file << "[timer]\n";
    file << "# Number of slots in the wheel\n";
    file << "wheel_size = " << cfg.wheel_size << "\n\n";
    file << "# Duration of one tick; tasks fire at most one tick late\n";
    file << "tick_duration_ms = " << cfg.tick_duration.count() << "\n\n";
    file << "# Inbound tasks moved into slots per tick\n";
    file << "transfer_batch = " << cfg.transfer_batch << "\n\n";
    file << "# Shutdown wait between checks on a busy thread\n";
    file << "join_poll_interval_ms = " << cfg.join_poll_interval.count() << "\n\n";

    file << "[logging]\n";
    file << "# Level: \"debug\", \"info\", \"warn\", \"error\"\n";
    file << "level = \"" << level_name(cfg.log_level) << "\"\n";
    if (!cfg.log_file.empty()) {
        file << "file = \"" << cfg.log_file.string() << "\"\n";
    } else {
        file << "# file = \"/tmp/tickwheel.log\"\n";
    }
}

void ConfigLoader::validate(const Config& cfg) {
    if (cfg.wheel_size == 0) {
        throw timer::InvalidArgumentError("Config: wheel_size must be > 0");
    }
    if (cfg.tick_duration <= std::chrono::milliseconds::zero()) {
        throw timer::InvalidArgumentError("Config: tick_duration must be > 0");
    }
    if (cfg.tick_duration > Config::max_tick_duration) {
        throw timer::InvalidArgumentError("Config: tick_duration must be <= " +
                                          std::to_string(Config::max_tick_duration.count()) + "ms, got " +
                                          std::to_string(cfg.tick_duration.count()) + "ms");
    }
    if (cfg.transfer_batch == 0) {
        throw timer::InvalidArgumentError("Config: transfer_batch must be > 0");
    }
    if (cfg.join_poll_interval <= std::chrono::milliseconds::zero()) {
        throw timer::InvalidArgumentError("Config: join_poll_interval must be > 0");
    }
}

void ConfigLoader::apply_logging(const Config& cfg) {
    if (cfg.log_file.empty()) {
        util::Logger::set_level(cfg.log_level);
        return;
    }
    util::Logger::init(cfg.log_file, cfg.log_level);
}

std::filesystem::path ConfigLoader::get_config_file() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "tickwheel" / "config.toml";
    }
    return ".config/tickwheel/config.toml";
}

}  // namespace tickwheel::config
