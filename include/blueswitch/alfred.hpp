#ifndef BLUESWITCH_ALFRED_HPP
#define BLUESWITCH_ALFRED_HPP

#include <blueswitch/device.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// Script filter output understood by Alfred: {"items": [{type, title, subtitle, arg}, ...]}
nlohmann::json alfred_items(const std::vector<DeviceRecord>& devices);
void print_alfred_items(const std::vector<DeviceRecord>& devices, std::ostream& out);

// Comma separated addresses from the command line. Returns nullopt if none are given.
std::optional<std::vector<std::string>> parse_address_list(std::string_view text);

#endif
