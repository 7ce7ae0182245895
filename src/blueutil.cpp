#include <blueswitch/blueutil.hpp>
#include <blueswitch/utils.hpp>

#include <spdlog/spdlog.h>

static std::string blueutil_executable(const Config& config) {
    if (config.blueutil_dir) {
        return *config.blueutil_dir + "/blueutil";
    }
    return "blueutil";
}

BlueutilClient::BlueutilClient(const Config& config, CommandRunner& runner)
    : runner_(&runner), executable_(blueutil_executable(config)) {}

const std::string& BlueutilClient::executable() const {
    return executable_;
}

CommandOutput BlueutilClient::run(const std::vector<std::string>& args, bool merge_stderr) {
    return runner_->run(executable_, args, merge_stderr);
}

std::vector<DeviceRecord> BlueutilClient::list_paired() {
    // stderr stays out of the parsed listing.
    auto output = run({"--paired"}, false);
    if (output.status != 0) {
        spdlog::warn("{} --paired exited with status {}", executable_, output.status);
    }

    std::vector<DeviceRecord> devices;
    for (auto line : split(output.out, '\n')) {
        if (line.empty()) {
            continue;
        }
        devices.push_back(DeviceRecord::from_raw_line(line));
    }
    spdlog::debug("blueutil reported {} paired devices", devices.size());
    return devices;
}

void BlueutilClient::connect(const std::string& address) {
    auto output = run({"--connect", address}, true);
    spdlog::trace("{}", output.out);
    if (output.status != 0) {
        spdlog::debug("{} --connect {} exited with status {}", executable_, address, output.status);
    }
}

void BlueutilClient::disconnect(const std::string& address) {
    auto output = run({"--disconnect", address, "--info", address}, true);
    spdlog::trace("{}", output.out);
    if (output.status != 0) {
        spdlog::debug("{} --disconnect {} exited with status {}", executable_, address, output.status);
    }
}
