/**
 * @file route_switch.cpp
 * @brief Subprocess-backed RouteSwitch.
 */
#include "skywan/routing/route_switch.hpp"
#include "skywan/os/subprocess.hpp"

#include <spdlog/spdlog.h>

namespace skywan::routing {

std::string CommandRouteSwitch::run_step(const std::vector<std::string>& base,
                                         const std::string& iface) const {
    if (base.empty()) return "no route command configured";

    auto argv = base;
    argv.push_back(iface);
    spdlog::debug("route switch: {}", os::describe(argv));

    auto run = os::run_command(argv, timeout_);
    if (!run) return os::describe(argv) + ": " + os::to_string(run.error().code) + " " + run.error().detail;
    if (!run->ok()) return os::describe(argv) + " exited with status " + std::to_string(run->exit_status);
    return {};
}

SwitchResult CommandRouteSwitch::apply(const std::string& from, const std::string& to) {
    SwitchResult r;
    r.detail = run_step(down_argv_, from);
    r.down_ok = r.detail.empty();
    if (!r.down_ok) return r;

    r.detail = run_step(up_argv_, to);
    r.up_ok = r.detail.empty();
    return r;
}

bool CommandRouteSwitch::bring_up(const std::string& iface) {
    const auto err = run_step(up_argv_, iface);
    if (!err.empty()) spdlog::warn("failed to bring up {}: {}", iface, err);
    return err.empty();
}

bool CommandRouteSwitch::available(const std::string& iface) {
    if (status_argv_.empty()) return true;
    const auto err = run_step(status_argv_, iface);
    if (!err.empty()) spdlog::info("{} is not available: {}", iface, err);
    return err.empty();
}

} // namespace skywan::routing
