#pragma once
/**
 * @file observability.hpp
 * @brief Decision events and the sinks that record them (CSV audit log, logger, notifier).
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <string_view>
#include <vector>

#include "skywan/compat/expected.hpp"

namespace skywan::obs {

    /** @enum EventType
     *  @brief Audit event categories.
     */
    enum class EventType : uint8_t { Evaluation, Failover, Failback, FailoverFailed };

    /** @enum Outcome */
    enum class Outcome : uint8_t { Success, Failed };

    /** @struct DecisionEvent
     *  @brief One append-only audit record.
     */
    struct DecisionEvent {
        int64_t     timestamp{0};                ///< Unix epoch seconds
        EventType   type{EventType::Evaluation}; ///< Category
        std::string from;                        ///< Interface before the decision
        std::string to;                          ///< Interface after (or intended)
        std::string reason;                      ///< Human-readable reason
        Outcome     outcome{Outcome::Success};   ///< Result

        bool operator==(const DecisionEvent&) const = default;
    };

    /** @class AuditSink
     *  @brief Event sink interface.
     */
    class AuditSink {
    public:
        virtual ~AuditSink() = default;
        /// Record a single decision event. Sinks never throw.
        virtual void record(const DecisionEvent& e) = 0;
    };

    struct AuditError {
        std::string detail;
    };

    /** @class CsvAuditLog
     *  @brief Append-only CSV file: `timestamp,eventType,fromInterface,toInterface,result,reason`.
     */
    class CsvAuditLog final : public AuditSink {
    public:
        explicit CsvAuditLog(std::filesystem::path path) : path_(std::move(path)) {}

        void record(const DecisionEvent& e) override;

        /// Append, reporting failure instead of logging it.
        skywan_detail::expected<void, AuditError> append(const DecisionEvent& e);

        /// Last @p n events, oldest first. Unparseable rows are skipped.
        std::vector<DecisionEvent> recent(std::size_t n) const;

        const std::filesystem::path& path() const noexcept { return path_; }

        static constexpr std::string_view kHeader = "timestamp,eventType,fromInterface,toInterface,result,reason";

    private:
        std::filesystem::path path_;
        std::mutex            mu_;
    };

    /** @class LogSink
     *  @brief Mirrors events to the default spdlog logger.
     */
    class LogSink final : public AuditSink {
    public:
        void record(const DecisionEvent& e) override;
    };

    /** @class CommandNotifier
     *  @brief Runs `argv + [eventType, reason]` for FAILOVER, FAILBACK and FAILOVER_FAILED events.
     */
    class CommandNotifier final : public AuditSink {
    public:
        CommandNotifier(std::vector<std::string> argv, std::chrono::milliseconds timeout)
            : argv_(std::move(argv)), timeout_(timeout) {}

        void record(const DecisionEvent& e) override;

    private:
        std::vector<std::string>  argv_;
        std::chrono::milliseconds timeout_;
    };

    /** @class FanoutSink
     *  @brief Forwards each event to every attached sink in order.
     */
    class FanoutSink final : public AuditSink {
    public:
        void add(std::shared_ptr<AuditSink> s) { sinks_.push_back(std::move(s)); }
        void record(const DecisionEvent& e) override {
            for (auto& s : sinks_) s->record(e);
        }

    private:
        std::vector<std::shared_ptr<AuditSink>> sinks_;
    };

    const char* to_string(EventType t) noexcept;
    const char* to_string(Outcome o) noexcept;

    /// Quote a CSV field when it contains a comma, quote or line break.
    std::string csv_escape(std::string_view field);

    /// Split one CSV row honouring quoted fields.
    std::vector<std::string> csv_split(std::string_view row);

} // namespace skywan::obs
