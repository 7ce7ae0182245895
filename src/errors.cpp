#include <blueswitch/errors.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

MalformedRecordError::MalformedRecordError(const std::string& line)
    : std::runtime_error(fmt::format("unexpected blueutil output, failed to match: {}", line)),
      line_(line) {}

const std::string& MalformedRecordError::line() const {
    return line_;
}

DeviceNotFoundError::DeviceNotFoundError(const std::string& address)
    : std::runtime_error(fmt::format("Could not find device id : '{}'", address)),
      address_(address) {}

const std::string& DeviceNotFoundError::address() const {
    return address_;
}

LaunchError::LaunchError(const std::string& command, const std::string& reason)
    : std::runtime_error(fmt::format("failed to run {}: {}", command, reason)),
      command_(command) {}

const std::string& LaunchError::command() const {
    return command_;
}

int report_error(const std::string& message, std::ostream& err) {
    err << message << '\n';
    if (auto logger = spdlog::get("logfile")) {
        logger->error("{}", message);
    }
    return 1;
}
