#include <blueswitch/directory.hpp>
#include <blueswitch/errors.hpp>
#include <blueswitch/utils.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

ListOptions ListOptions::all_devices() {
    return ListOptions{AllDevices{}, std::nullopt};
}

namespace {
struct FilterVisitor {
    std::vector<DeviceRecord>& devices;

    void operator()(const AllDevices&) const {}

    void operator()(const SpecificAddresses& f) const {
        auto wanted = [&f](const DeviceRecord& d) {
            return std::any_of(f.addresses.begin(), f.addresses.end(), [&d](const std::string& a) {
                return iequals(a, d.address());
            });
        };
        devices.erase(std::remove_if(devices.begin(), devices.end(), [&](const DeviceRecord& d) {
            return !wanted(d);
        }), devices.end());
    }

    void operator()(const NameContains& f) const {
        auto needle = to_lower(f.value);
        devices.erase(std::remove_if(devices.begin(), devices.end(), [&needle](const DeviceRecord& d) {
            return to_lower(d.name()).find(needle) == std::string::npos;
        }), devices.end());
    }
};
}

std::vector<DeviceRecord> apply_filter(std::vector<DeviceRecord> devices, const DeviceFilter& filter) {
    std::visit(FilterVisitor{devices}, filter);
    return devices;
}

void order_devices(std::vector<DeviceRecord>& devices, const std::optional<std::string>& previous_address) {
    std::stable_sort(devices.begin(), devices.end(), [](const DeviceRecord& a, const DeviceRecord& b) {
        return a.connected() && !b.connected();
    });

    if (previous_address) {
        std::stable_partition(devices.begin(), devices.end(), [&previous_address](const DeviceRecord& d) {
            return iequals(d.address(), *previous_address);
        });
    }
}

DeviceDirectory::DeviceDirectory(DeviceControl& control) : control_(&control) {}

std::vector<DeviceRecord> DeviceDirectory::list_devices(const ListOptions& options) const {
    auto devices = apply_filter(control_->list_paired(), options.filter);
    order_devices(devices, options.previous_address);
    return devices;
}

DeviceRecord DeviceDirectory::device_info(const std::string& address) const {
    auto devices = list_devices(ListOptions{SpecificAddresses{{address}}, std::nullopt});
    auto it = std::find_if(devices.begin(), devices.end(), [&address](const DeviceRecord& d) {
        return iequals(d.address(), address);
    });
    if (it == devices.end()) {
        throw DeviceNotFoundError{address};
    }
    spdlog::debug("found {} ({}), connected: {}", it->name(), it->address(), it->connected());
    return *it;
}

bool DeviceDirectory::is_connected(const std::string& address) const {
    return device_info(address).connected();
}
