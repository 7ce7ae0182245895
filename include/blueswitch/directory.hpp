#ifndef BLUESWITCH_DIRECTORY_HPP
#define BLUESWITCH_DIRECTORY_HPP

#include <blueswitch/blueutil.hpp>
#include <blueswitch/device.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

struct AllDevices {};

struct SpecificAddresses {
    std::vector<std::string> addresses;
};

struct NameContains {
    std::string value;
};

using DeviceFilter = std::variant<AllDevices, SpecificAddresses, NameContains>;

struct ListOptions {
    DeviceFilter filter{AllDevices{}};
    // Only affects ordering: the matching device is moved to the front.
    std::optional<std::string> previous_address;

    static ListOptions all_devices();
};

std::vector<DeviceRecord> apply_filter(std::vector<DeviceRecord> devices, const DeviceFilter& filter);

// Connected devices first, then the previous device (if any) in front of everything.
void order_devices(std::vector<DeviceRecord>& devices, const std::optional<std::string>& previous_address);

class DeviceDirectory {
  private:
    DeviceControl* control_;

  public:
    explicit DeviceDirectory(DeviceControl& control);

    std::vector<DeviceRecord> list_devices(const ListOptions& options) const;

    // Throws DeviceNotFoundError. With duplicate addresses the first match wins.
    DeviceRecord device_info(const std::string& address) const;
    bool is_connected(const std::string& address) const;
};

#endif
