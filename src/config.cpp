#include <blueswitch/config.hpp>

#include <cstdlib>

static std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

Config Config::from_environment() {
    Config config;
    config.blueutil_dir = env_value("BLUEUTIL_PATH");
    config.previous_address = env_value("AIRPODS_MAC");
    return config;
}
