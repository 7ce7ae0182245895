#include <blueswitch/toggler.hpp>

#include <spdlog/spdlog.h>

ConnectionToggler::ConnectionToggler(const DeviceDirectory& directory, DeviceControl& control)
    : directory_(&directory), control_(&control) {}

void ConnectionToggler::connect(const std::string& address) {
    control_->connect(address);
}

void ConnectionToggler::disconnect(const std::string& address) {
    control_->disconnect(address);
}

bool ConnectionToggler::toggle(const std::string& address) {
    auto device = directory_->device_info(address);

    if (device.connected()) {
        spdlog::info("disconnecting from {}", device.name());
        disconnect(address);
        return false;
    }
    spdlog::info("connecting to {}", device.name());
    connect(address);
    return true;
}
