#include <blueswitch/alfred.hpp>
#include <blueswitch/utils.hpp>

#include <utility>

nlohmann::json alfred_items(const std::vector<DeviceRecord>& devices) {
    auto items = nlohmann::json::array();
    for (const auto& device : devices) {
        auto title = device.connected() ? device.name() + " (Connected)" : device.name();
        nlohmann::json item = {
            {"type", "default"},
            {"title", title},
            {"subtitle", "MAC:" + device.address()},
            {"arg", device.address()},
        };
        items.push_back(std::move(item));
    }
    nlohmann::json output;
    output["items"] = std::move(items);
    return output;
}

void print_alfred_items(const std::vector<DeviceRecord>& devices, std::ostream& out) {
    out << alfred_items(devices).dump() << '\n';
}

std::optional<std::vector<std::string>> parse_address_list(std::string_view text) {
    std::vector<std::string> addresses;
    for (auto entry : split(text, ',')) {
        entry = trim(entry);
        if (!entry.empty()) {
            addresses.emplace_back(entry);
        }
    }
    if (addresses.empty()) {
        return std::nullopt;
    }
    return addresses;
}
