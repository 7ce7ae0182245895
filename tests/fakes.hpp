#ifndef BLUESWITCH_TESTS_FAKES_HPP
#define BLUESWITCH_TESTS_FAKES_HPP

#include <blueswitch/blueutil.hpp>
#include <blueswitch/command_runner.hpp>
#include <blueswitch/device.hpp>

#include <string>
#include <utility>
#include <vector>

class FakeDeviceControl : public DeviceControl {
  public:
    std::vector<DeviceRecord> devices;
    std::vector<std::string> connected_to;
    std::vector<std::string> disconnected_from;
    int list_calls{0};

    explicit FakeDeviceControl(std::vector<DeviceRecord> canned = {}) : devices(std::move(canned)) {}

    std::vector<DeviceRecord> list_paired() override {
        ++list_calls;
        return devices;
    }

    void connect(const std::string& address) override {
        connected_to.push_back(address);
    }

    void disconnect(const std::string& address) override {
        disconnected_from.push_back(address);
    }
};

struct RecordedCommand {
    std::string program;
    std::vector<std::string> args;
    bool merge_stderr;
};

class FakeCommandRunner : public CommandRunner {
  public:
    CommandOutput output;
    std::vector<RecordedCommand> commands;

    CommandOutput run(const std::string& program, const std::vector<std::string>& args,
                      bool merge_stderr) override {
        commands.push_back(RecordedCommand{program, args, merge_stderr});
        return output;
    }
};

// device1 is disconnected, device2 and device3 are connected.
inline std::vector<DeviceRecord> default_device_list() {
    return {
        DeviceRecord{"device1", "disconnected-address", false},
        DeviceRecord{"device2", "connected-address", true},
        DeviceRecord{"device3", "connected-address-2", true},
    };
}

#endif
