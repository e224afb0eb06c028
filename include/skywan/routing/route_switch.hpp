#pragma once
/**
 * @file route_switch.hpp
 * @brief Route Switch Executor: takes one uplink down and brings the other up.
 */

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace skywan::routing {

/** @struct SwitchResult
 *  @brief Per-step outcome of a switch attempt.
 */
struct SwitchResult {
    bool        down_ok{false}; ///< Old interface was taken down
    bool        up_ok{false};   ///< New interface was brought up
    std::string detail;         ///< Diagnostic for the failing step

    [[nodiscard]] bool ok() const noexcept { return down_ok && up_ok; }
};

/** @class RouteSwitch
 *  @brief Narrow interface over the routing subsystem.
 */
class RouteSwitch {
public:
    virtual ~RouteSwitch() = default;

    /// Take @p from down, then bring @p to up. Stops at the first failing step.
    virtual SwitchResult apply(const std::string& from, const std::string& to) = 0;

    /// Bring a single interface up. Used to roll back a failed switch.
    virtual bool bring_up(const std::string& iface) = 0;

    /// Whether @p iface can carry traffic now (mwan3 reports it online or tracking).
    virtual bool available(const std::string& iface) = 0;
};

/** @class CommandRouteSwitch
 *  @brief Runs `down_argv + [iface]` and `up_argv + [iface]` (e.g. mwan3 ifdown / ifup).
 *
 *  Availability runs `status_argv + [iface]`; exit status 0 means usable. Without a status
 *  command every interface counts as available.
 */
class CommandRouteSwitch final : public RouteSwitch {
public:
    CommandRouteSwitch(std::vector<std::string> down_argv,
                       std::vector<std::string> up_argv,
                       std::chrono::milliseconds timeout,
                       std::vector<std::string> status_argv = {})
        : down_argv_(std::move(down_argv)), up_argv_(std::move(up_argv)),
          status_argv_(std::move(status_argv)), timeout_(timeout) {}

    SwitchResult apply(const std::string& from, const std::string& to) override;
    bool bring_up(const std::string& iface) override;
    bool available(const std::string& iface) override;

private:
    /// Run `base + [iface]`; empty string on success, diagnostic otherwise.
    std::string run_step(const std::vector<std::string>& base, const std::string& iface) const;

    std::vector<std::string>  down_argv_;
    std::vector<std::string>  up_argv_;
    std::vector<std::string>  status_argv_;
    std::chrono::milliseconds timeout_;
};

} // namespace skywan::routing
