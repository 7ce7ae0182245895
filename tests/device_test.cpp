#include <blueswitch/device.hpp>
#include <blueswitch/errors.hpp>

#include <cassert>
#include <string>

static bool parse_fails(const std::string& line) {
    try {
        DeviceRecord::from_raw_line(line);
    } catch (const MalformedRecordError& e) {
        assert(e.line() == line);
        return true;
    }
    return false;
}

int main() {
    {
        auto device = DeviceRecord::from_raw_line(
            R"(address: 5c-2e-fg-da-a3-43, not connected, not favourite, paired, name: "AirPods Pro", recent access date: 2022-08-01 12:00:10 +0000)");
        assert(device.name() == "AirPods Pro");
        assert(device.address() == "5c-2e-fg-da-a3-43");
        assert(!device.connected());
    }

    {
        auto device = DeviceRecord::from_raw_line(
            R"(address: 80-3b-5c-c2-b1-7f, connected (master, 0 dBm), not favourite, paired, name: "AirPods Max", recent access date: 2022-08-01 12:10:10 +0000)");
        assert(device.name() == "AirPods Max");
        assert(device.address() == "80-3b-5c-c2-b1-7f");
        assert(device.connected());
    }

    {
        auto device = DeviceRecord::from_raw_line(R"(address: aa-bb-cc-dd-ee-ff, paired, name: "")");
        assert(device.name().empty());
        assert(device.address() == "aa-bb-cc-dd-ee-ff");
        assert(device.connected());
    }

    {
        // The marker is matched anywhere on the line, including inside the name.
        auto device = DeviceRecord::from_raw_line(
            R"(address: aa-bb-cc-dd-ee-ff, connected (slave, -40 dBm), paired, name: "Speaker not connected")");
        assert(device.name() == "Speaker not connected");
        assert(!device.connected());
    }

    {
        assert(parse_fails("address: 5c-2e-fg-da-a3-43"));
        assert(parse_fails(R"(address: 5c-2e-fg, not connected, name: "Short")"));
        assert(parse_fails(R"(name: "AirPods Pro", address: 5c-2e-fg-da-a3-43, not connected)"));
        assert(parse_fails(""));
    }

    {
        DeviceRecord a{"device1", "address", true};
        DeviceRecord b{"device1", "address", true};
        DeviceRecord c{"device1", "address", false};
        assert(a == b);
        assert(a != c);
    }

    return 0;
}
