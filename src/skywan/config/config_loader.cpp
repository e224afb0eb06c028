/**
 * @file config_loader.cpp
 * @brief nlohmann::json backed Loader.
 */
#include "skywan/config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace skywan::config {

    using nlohmann::json;
    using namespace skywan::config::constants;

    namespace {

        ConfigError error(ConfigErrc code, std::string detail) { return ConfigError{code, std::move(detail)}; }

        /// Raised for values the JSON types accept but the field cannot hold.
        struct OutOfRange : std::runtime_error {
            using std::runtime_error::runtime_error;
        };

        template<class T>
        void read_opt(const json& j, const char* key, T& out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
                // get<unsigned>() wraps negative numbers instead of failing
                if (it->is_number_integer() && !it->is_number_unsigned() && it->get<int64_t>() < 0) {
                    throw OutOfRange(fmt::format("'{}' must be non-negative", key));
                }
                if (it->is_number_float() && it->get<double>() < 0.0) {
                    throw OutOfRange(fmt::format("'{}' must be non-negative", key));
                }
            }
            out = it->get<T>();
        }

        /// argv arrays; a bare string is accepted as a single-element command.
        void read_argv(const json& j, const char* key, std::vector<std::string>& out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            if (it->is_string()) out = {it->get<std::string>()};
            else out = it->get<std::vector<std::string>>();
        }

        void read_thresholds(const json& j, routing::Thresholds& t) {
            read_opt(j, "latency_spike_ms", t.latency_spike_ms);
            read_opt(j, "packet_loss_spike", t.packet_loss_spike);
            read_opt(j, "snr_drop", t.snr_drop);
            read_opt(j, "satellite_handoff_s", t.satellite_handoff_s);
            read_opt(j, "failover_cooldown_s", t.failover_cooldown_s);
            read_opt(j, "required_stability_checks", t.required_stability_checks);
            read_opt(j, "failback_stability_checks", t.failback_stability_checks);
            read_opt(j, "failback_max_packet_loss", t.failback_max_packet_loss);
            read_opt(j, "failback_max_latency_ms", t.failback_max_latency_ms);
            read_opt(j, "failback_max_obstruction", t.failback_max_obstruction);
            read_opt(j, "reactive_bypasses_cooldown", t.reactive_bypasses_cooldown);
        }

        bool env_flag(const char* name, bool& out) {
            const char* v = std::getenv(name);
            if (!v) return false;
            const std::string s(v);
            if (s == "1" || s == "true" || s == "yes" || s == "on")   { out = true;  return true; }
            if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
            return false;
        }

        bool blank(const json& v) {
            if (v.is_null()) return true;
            if (v.is_string()) return v.get_ref<const std::string&>().empty();
            return (v.is_array() || v.is_object()) && v.empty();
        }

        bool fraction(double v) { return v >= 0.0 && v <= 1.0; }

    } // namespace

    ConfigResult Loader::load_from_string(std::string_view text) {
        EngineConfig cfg;
        try {
            const json j = json::parse(text.begin(), text.end());
            if (!j.is_object()) return skywan_detail::unexpected(error(ConfigErrc::ParseError, "top level must be an object"));

            for (const char* key : {"primary_interface", "backup_interface", "state_dir", "metrics_command"}) {
                if (!j.contains(key) || blank(j.at(key))) {
                    return skywan_detail::unexpected(error(ConfigErrc::MissingKey, fmt::format("'{}' is required", key)));
                }
            }

            cfg.primary_interface = j.at("primary_interface").get<std::string>();
            cfg.backup_interface  = j.at("backup_interface").get<std::string>();
            cfg.state_dir         = j.at("state_dir").get<std::string>();
            read_argv(j, "metrics_command", cfg.metrics_command);
            read_argv(j, "scorer_command", cfg.scorer_command);
            read_argv(j, "route_down_command", cfg.route_down_command);
            read_argv(j, "route_up_command", cfg.route_up_command);
            read_argv(j, "notify_command", cfg.notify_command);
            read_argv(j, "status_command", cfg.status_command);

            std::string audit;
            read_opt(j, "audit_log", audit);
            cfg.audit_log = audit.empty() ? cfg.state_dir / AUDIT_LOG_FILE_NAME : std::filesystem::path(audit);

            read_opt(j, "check_interval_s", cfg.check_interval_s);
            read_opt(j, "command_timeout_s", cfg.command_timeout_s);
            read_opt(j, "lock_timeout_s", cfg.lock_timeout_s);
            read_opt(j, "history_length", cfg.history_length);
            read_opt(j, "dry_run", cfg.dry_run);
            read_opt(j, "debug", cfg.debug);

            if (auto it = j.find("thresholds"); it != j.end()) {
                if (!it->is_object()) return skywan_detail::unexpected(error(ConfigErrc::ParseError, "'thresholds' must be an object"));
                read_thresholds(*it, cfg.thresholds);
            }
        } catch (const OutOfRange& e) {
            return skywan_detail::unexpected(error(ConfigErrc::InvalidValue, e.what()));
        } catch (const json::exception& e) {
            return skywan_detail::unexpected(error(ConfigErrc::ParseError, e.what()));
        }

        if (auto v = validate(cfg); !v) return skywan_detail::unexpected(v.error());
        return cfg;
    }

    ConfigResult Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return skywan_detail::unexpected(error(ConfigErrc::NotFound, "cannot read " + path));
        std::ostringstream ss;
        ss << in.rdbuf();

        auto cfg = load_from_string(ss.str());
        if (!cfg) cfg.error().detail = path + ": " + cfg.error().detail;
        return cfg;
    }

    void Loader::apply_env_overrides(EngineConfig& cfg) {
        env_flag("DRY_RUN", cfg.dry_run);
        bool on = false;
        if ((env_flag("DEBUG", on) && on) || (env_flag("VERBOSE", on) && on)) cfg.debug = true;
    }

    skywan_detail::expected<void, ConfigError> Loader::validate(const EngineConfig& cfg) {
        const auto bad = [](std::string detail) {
            return skywan_detail::unexpected(error(ConfigErrc::InvalidValue, std::move(detail)));
        };
        const auto& t = cfg.thresholds;

        if (cfg.primary_interface == cfg.backup_interface) return bad("primary_interface and backup_interface must differ");
        if (cfg.metrics_command.empty() || cfg.metrics_command.front().empty()) return bad("metrics_command is empty");
        if (t.latency_spike_ms < 0 || t.failback_max_latency_ms < 0) return bad("latency thresholds must be non-negative");
        if (!fraction(t.packet_loss_spike) || !fraction(t.failback_max_packet_loss) ||
            !fraction(t.failback_max_obstruction)) {
            return bad("loss and obstruction thresholds must be within [0, 1]");
        }
        if (t.snr_drop < 0.0 || t.satellite_handoff_s < 0.0) return bad("trend thresholds must be non-negative");
        if (t.failover_cooldown_s < 0) return bad("failover_cooldown_s must be non-negative");
        if (t.required_stability_checks < 1 || t.failback_stability_checks < 1) return bad("stability checks must be >= 1");
        if (cfg.check_interval_s < 1) return bad("check_interval_s must be >= 1");
        if (cfg.command_timeout_s < 1) return bad("command_timeout_s must be >= 1");
        if (cfg.history_length < 2) return bad("history_length must be >= 2");
        return {};
    }

    const char* to_string(ConfigErrc code) noexcept {
        switch (code) {
            case ConfigErrc::NotFound:     return "not_found";
            case ConfigErrc::ParseError:   return "parse_error";
            case ConfigErrc::MissingKey:   return "missing_key";
            case ConfigErrc::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

} // namespace skywan::config
