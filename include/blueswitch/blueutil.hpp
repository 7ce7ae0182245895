#ifndef BLUESWITCH_BLUEUTIL_HPP
#define BLUESWITCH_BLUEUTIL_HPP

#include <blueswitch/command_runner.hpp>
#include <blueswitch/config.hpp>
#include <blueswitch/device.hpp>

#include <string>
#include <vector>

class DeviceControl {
  public:
    virtual ~DeviceControl() = default;

    // Paired devices in the order the control tool reports them.
    virtual std::vector<DeviceRecord> list_paired() = 0;
    virtual void connect(const std::string& address) = 0;
    virtual void disconnect(const std::string& address) = 0;
};

class BlueutilClient : public DeviceControl {
  private:
    CommandRunner* runner_;
    std::string executable_;

    CommandOutput run(const std::vector<std::string>& args, bool merge_stderr);

  public:
    BlueutilClient(const Config& config, CommandRunner& runner);
    BlueutilClient(const BlueutilClient&) = delete;
    BlueutilClient& operator=(const BlueutilClient&) = delete;

    const std::string& executable() const;

    std::vector<DeviceRecord> list_paired() override;
    void connect(const std::string& address) override;
    void disconnect(const std::string& address) override;
};

#endif
