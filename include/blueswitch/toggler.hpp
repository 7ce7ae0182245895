#ifndef BLUESWITCH_TOGGLER_HPP
#define BLUESWITCH_TOGGLER_HPP

#include <blueswitch/blueutil.hpp>
#include <blueswitch/directory.hpp>

#include <string>

// Flips a device's connection state. The read and the action are separate
// blueutil calls, so a concurrent state change in between is not detected.
class ConnectionToggler {
  private:
    const DeviceDirectory* directory_;
    DeviceControl* control_;

  public:
    ConnectionToggler(const DeviceDirectory& directory, DeviceControl& control);

    void connect(const std::string& address);
    void disconnect(const std::string& address);

    // Returns true if the device was connected to, false if it was disconnected.
    bool toggle(const std::string& address);
};

#endif
