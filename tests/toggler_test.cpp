#include "fakes.hpp"

#include <blueswitch/directory.hpp>
#include <blueswitch/errors.hpp>
#include <blueswitch/toggler.hpp>

#include <cassert>

int main() {
    {
        FakeDeviceControl control{default_device_list()};
        DeviceDirectory directory{control};
        ConnectionToggler toggler{directory, control};
        assert(!toggler.toggle("connected-address"));
        assert(control.disconnected_from.size() == 1);
        assert(control.disconnected_from[0] == "connected-address");
        assert(control.connected_to.empty());
    }

    {
        FakeDeviceControl control{default_device_list()};
        DeviceDirectory directory{control};
        ConnectionToggler toggler{directory, control};
        assert(toggler.toggle("disconnected-address"));
        assert(control.connected_to.size() == 1);
        assert(control.connected_to[0] == "disconnected-address");
        assert(control.disconnected_from.empty());
    }

    {
        FakeDeviceControl control{default_device_list()};
        DeviceDirectory directory{control};
        ConnectionToggler toggler{directory, control};
        bool threw = false;
        try {
            toggler.toggle("missing-address");
        } catch (const DeviceNotFoundError& e) {
            threw = true;
            assert(e.address() == "missing-address");
        }
        assert(threw);
        assert(control.connected_to.empty());
        assert(control.disconnected_from.empty());
    }

    {
        // connect and disconnect go straight to blueutil without a lookup.
        FakeDeviceControl control;
        DeviceDirectory directory{control};
        ConnectionToggler toggler{directory, control};
        toggler.connect("address");
        toggler.disconnect("address");
        assert(control.list_calls == 0);
        assert(control.connected_to.size() == 1);
        assert(control.disconnected_from.size() == 1);
    }

    return 0;
}
