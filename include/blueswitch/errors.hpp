#ifndef BLUESWITCH_ERRORS_HPP
#define BLUESWITCH_ERRORS_HPP

#include <ostream>
#include <stdexcept>
#include <string>

class MalformedRecordError : public std::runtime_error {
  private:
    std::string line_;

  public:
    explicit MalformedRecordError(const std::string& line);

    const std::string& line() const;
};

class DeviceNotFoundError : public std::runtime_error {
  private:
    std::string address_;

  public:
    explicit DeviceNotFoundError(const std::string& address);

    const std::string& address() const;
};

class LaunchError : public std::runtime_error {
  private:
    std::string command_;

  public:
    LaunchError(const std::string& command, const std::string& reason);

    const std::string& command() const;
};

// Writes `message` to `err` regardless of the log level or destination, and
// also to the log file when one is configured. Returns the process exit status.
int report_error(const std::string& message, std::ostream& err);

#endif
