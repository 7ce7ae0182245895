#include <blueswitch/device.hpp>
#include <blueswitch/errors.hpp>

#include <regex>
#include <utility>

static const std::regex& record_regex() {
    static const std::regex re{R"re(^address: ([a-zA-Z0-9_-]{17}),.*name: "([^"]*)")re"};
    return re;
}

DeviceRecord::DeviceRecord(std::string name, std::string address, bool connected)
    : name_(std::move(name)), address_(std::move(address)), connected_(connected) {}

DeviceRecord DeviceRecord::from_raw_line(std::string_view line) {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(line.begin(), line.end(), match, record_regex())) {
        throw MalformedRecordError{std::string(line)};
    }

    // Any line without the marker counts as connected.
    bool connected = line.find("not connected") == std::string_view::npos;
    return DeviceRecord{match[2].str(), match[1].str(), connected};
}

const std::string& DeviceRecord::name() const {
    return name_;
}

const std::string& DeviceRecord::address() const {
    return address_;
}

bool DeviceRecord::connected() const {
    return connected_;
}

bool DeviceRecord::operator==(const DeviceRecord& other) const {
    return name_ == other.name_ && address_ == other.address_ && connected_ == other.connected_;
}

bool DeviceRecord::operator!=(const DeviceRecord& other) const {
    return !(*this == other);
}
