#ifndef BLUESWITCH_CONFIG_HPP
#define BLUESWITCH_CONFIG_HPP

#include <optional>
#include <string>

struct Config {
    std::optional<std::string> blueutil_dir;
    std::optional<std::string> previous_address;
    std::string log_level{"warning"};
    std::string log_file;

    // Reads BLUEUTIL_PATH and AIRPODS_MAC. Empty values count as unset.
    static Config from_environment();
};

#endif
