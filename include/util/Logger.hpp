#pragma once

#include <filesystem>
#include <string>

namespace tickwheel::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens the default log file (/tmp/tickwheel.log), truncating it
    static void init();
    static void init(const std::filesystem::path& path, Level min_level = Level::Info);

    static void set_level(Level level);
    [[nodiscard]] static Level level();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace tickwheel::util
