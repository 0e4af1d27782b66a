#ifndef FLOODRISK_LOGGING_HPP
#define FLOODRISK_LOGGING_HPP

#include <map>
#include <string>

#include "floodrisk/config.hpp"

namespace floodrisk {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

using LogFields = std::map<std::string, std::string>;

class Logger {
public:
    explicit Logger(std::string name, LogFields fields = {});

    void log(LogLevel level, const std::string& message, const LogFields& extra = {}) const;

    void debug(const std::string& message, const LogFields& extra = {}) const;
    void info(const std::string& message, const LogFields& extra = {}) const;
    void warn(const std::string& message, const LogFields& extra = {}) const;
    void error(const std::string& message, const LogFields& extra = {}) const;

    Logger with_fields(const LogFields& fields) const;

private:
    std::string name_;
    LogFields fields_;
};

void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

}  // namespace floodrisk

#endif  // FLOODRISK_LOGGING_HPP
