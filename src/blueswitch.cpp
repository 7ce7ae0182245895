#include <blueswitch/alfred.hpp>
#include <blueswitch/blueutil.hpp>
#include <blueswitch/command_runner.hpp>
#include <blueswitch/config.hpp>
#include <blueswitch/directory.hpp>
#include <blueswitch/errors.hpp>
#include <blueswitch/toggler.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <iostream>
#include <string>
#include <utility>

// Name filter used by `list` when neither -a nor -d is given.
static const char* DEFAULT_NAME_FILTER = "airpod";

static void init_logging(const Config& config) {
    auto lvl = spdlog::level::warn;
    if (config.log_level == "trace") {
        lvl = spdlog::level::trace;
    } else if (config.log_level == "debug") {
        lvl = spdlog::level::debug;
    } else if (config.log_level == "info") {
        lvl = spdlog::level::info;
    } else if (config.log_level == "warning") {
        lvl = spdlog::level::warn;
    } else if (config.log_level == "error") {
        lvl = spdlog::level::err;
    } else if (config.log_level == "off") {
        lvl = spdlog::level::off;
    }
    // stdout carries the command output, so the console logger writes to stderr.
    if (!config.log_file.empty()) {
        auto logger = spdlog::basic_logger_mt("logfile", config.log_file);
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    } else {
        auto logger = spdlog::stderr_color_mt("console");
        logger->set_level(lvl);
        spdlog::set_default_logger(std::move(logger));
    }
}

int blueswitch(int argc, const char* const* argv) {
    auto config = Config::from_environment();
    bool all_devices{false};
    std::string device_list;
    std::string device_id;

    CLI::App app("Utility to simplify connecting/disconnecting to Airpods from Alfred");
    app.add_option("-l,--log-level", config.log_level, "Logging level: trace, debug, info, warning, error, off")->capture_default_str();
    app.add_option("--log-file", config.log_file, "File to write logs to (stderr if not specified)");

    auto list_cmd = app.add_subcommand("list", "List paired devices as Alfred items")->fallthrough();
    list_cmd->add_option("-a,--all-devices", all_devices, "List every paired device instead of only Airpods");
    list_cmd->add_option("-d,--device-list", device_list, "Comma separated addresses of the devices to list");

    auto connect_cmd = app.add_subcommand("connect", "Connect to a device")->fallthrough();
    connect_cmd->add_option("device_id", device_id, "Device address")->required();

    auto disconnect_cmd = app.add_subcommand("disconnect", "Disconnect from a device")->fallthrough();
    disconnect_cmd->add_option("device_id", device_id, "Device address")->required();

    auto toggle_cmd = app.add_subcommand("toggle", "Toggle the connection to a device")->fallthrough();
    toggle_cmd->add_option("device_id", device_id, "Device address")->required();

    auto status_cmd = app.add_subcommand("status", "Print whether a device is connected")->fallthrough();
    status_cmd->add_option("device_id", device_id, "Device address")->required();

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    init_logging(config);
    if (config.blueutil_dir) {
        spdlog::debug("using blueutil from {}", *config.blueutil_dir);
    }

    PipeCommandRunner runner;
    BlueutilClient client{config, runner};
    DeviceDirectory directory{client};
    ConnectionToggler toggler{directory, client};

    if (app.got_subcommand(list_cmd)) {
        ListOptions options;
        if (all_devices) {
            options.filter = AllDevices{};
        } else {
            options.filter = NameContains{DEFAULT_NAME_FILTER};
        }
        if (auto addresses = parse_address_list(device_list)) {
            options.filter = SpecificAddresses{std::move(*addresses)};
        }
        options.previous_address = config.previous_address;
        print_alfred_items(directory.list_devices(options), std::cout);
        return 0;
    } else if (app.got_subcommand(connect_cmd)) {
        toggler.connect(device_id);
        std::cout << "Connected to device\n";
        return 0;
    } else if (app.got_subcommand(disconnect_cmd)) {
        toggler.disconnect(device_id);
        std::cout << "Disconnected from device\n";
        return 0;
    } else if (app.got_subcommand(toggle_cmd)) {
        std::cout << (toggler.toggle(device_id) ? "connected" : "disconnected") << '\n';
        return 0;
    } else if (app.got_subcommand(status_cmd)) {
        std::cout << (directory.is_connected(device_id) ? "connected" : "disconnected") << '\n';
        return 0;
    }
    return report_error("unknown command", std::cerr);
}

int main(int argc, char** argv) {
    try {
        return blueswitch(argc, argv);
    } catch (const std::exception& e) {
        return report_error(e.what(), std::cerr);
    } catch (...) {
        return report_error("unknown error", std::cerr);
    }
}
