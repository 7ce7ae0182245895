#ifndef BLUESWITCH_DEVICE_HPP
#define BLUESWITCH_DEVICE_HPP

#include <string>
#include <string_view>

class DeviceRecord {
  private:
    std::string name_;
    std::string address_;
    bool connected_{false};

  public:
    DeviceRecord(std::string name, std::string address, bool connected);

    // Parses one line of `blueutil --paired` output, e.g.
    //   address: 80-3b-5c-c2-b1-7f, connected (master, 0 dBm), ..., name: "AirPods Max", ...
    // Throws MalformedRecordError if the line does not have the address/name layout.
    static DeviceRecord from_raw_line(std::string_view line);

    const std::string& name() const;
    const std::string& address() const;
    bool connected() const;

    bool operator==(const DeviceRecord& other) const;
    bool operator!=(const DeviceRecord& other) const;
};

#endif
