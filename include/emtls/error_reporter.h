#ifndef EMTLS_ERROR_REPORTER_H
#define EMTLS_ERROR_REPORTER_H

#include <emtls/config.h>
#include <emtls/error.h>
#include <emtls/result.h>
#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include <ostream>
#include <sstream>
#include <atomic>
#include <mutex>

namespace emtls {
namespace v13 {

/**
 * ErrorReporter provides the diagnostic and logging facility of the
 * library. Reports are filtered by level, formatted and written to the
 * configured stream, then handed to any registered callbacks.
 *
 * Callers must never pass key material or application plaintext; the
 * library itself only logs record sizes, message types, state names and
 * error codes.
 */
class EMTLS_API ErrorReporter {
public:
    enum class LogLevel {
        TRACE,      // Per-record and per-transition detail
        DEBUG,      // Detailed diagnostic information
        INFO,       // General operational information
        WARNING,    // Peer alerts, rejected input
        ERROR       // Failed operations
    };

    enum class OutputFormat {
        HUMAN_READABLE,
        JSON
    };

    struct ReportingConfig {
        LogLevel minimum_level = LogLevel::WARNING;
        OutputFormat format = OutputFormat::HUMAN_READABLE;
        bool include_timestamps = true;

        // Null disables stream output; callbacks still run
        std::ostream* output = nullptr;
    };

    struct ErrorReport {
        LogLevel level;
        TLSError error_code;
        std::string component;
        std::string message;
        std::chrono::system_clock::time_point timestamp;

        ErrorReport(LogLevel lvl, TLSError error, std::string comp, std::string msg)
            : level(lvl)
            , error_code(error)
            , component(std::move(comp))
            , message(std::move(msg))
            , timestamp(std::chrono::system_clock::now()) {}
    };

    using ReporterCallback = std::function<void(const ErrorReport&)>;

    struct ReportingStatistics {
        std::atomic<uint64_t> total_reports{0};
        std::atomic<uint64_t> reports_by_level[5]{};
    };

    ErrorReporter();
    explicit ErrorReporter(const ReportingConfig& config);
    ~ErrorReporter();

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    /** Process-wide reporter used by the EMTLS_LOG_* macros. */
    static ErrorReporter& instance();

    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= minimum_level_.load(std::memory_order_relaxed);
    }

    /**
     * Report a diagnostic message with no associated error code.
     * @param level Log level for the report
     * @param component Reporting component, e.g. "connection", "record"
     * @param message Descriptive message (no sensitive data)
     */
    void report(LogLevel level, const std::string& component, const std::string& message);

    /**
     * Report an error with its code.
     * @param level Log level for the report
     * @param error TLS error code
     * @param component Reporting component
     * @param message Descriptive message (no sensitive data)
     * @return Result of report operation
     */
    Result<void> report_error(LogLevel level,
                              TLSError error,
                              const std::string& component,
                              const std::string& message);

    Result<void> update_configuration(const ReportingConfig& config);
    ReportingConfig get_configuration() const;

    void add_reporter_callback(ReporterCallback callback);
    void clear_reporter_callbacks();

    const ReportingStatistics& get_statistics() const { return stats_; }
    void reset_statistics();

    static std::string log_level_to_string(LogLevel level);

private:
    ReportingConfig config_;
    std::atomic<int> minimum_level_;
    mutable std::mutex config_mutex_;
    mutable std::mutex output_mutex_;

    std::vector<ReporterCallback> custom_reporters_;
    mutable std::mutex reporters_mutex_;

    mutable ReportingStatistics stats_;

    void submit(const ErrorReport& report);
    std::string format_report(const ErrorReport& report, const ReportingConfig& config) const;
    std::string format_timestamp(const std::chrono::system_clock::time_point& timestamp) const;
};

} // namespace v13
} // namespace emtls

// Logging macros: the message expression is only formatted when the level is enabled
#define EMTLS_LOG(level, component, expr) \
    do { \
        auto& _emtls_reporter = ::emtls::v13::ErrorReporter::instance(); \
        if (_emtls_reporter.is_enabled(level)) { \
            std::ostringstream _emtls_oss; \
            _emtls_oss << expr; \
            _emtls_reporter.report((level), (component), _emtls_oss.str()); \
        } \
    } while (0)

#define EMTLS_LOG_TRACE(component, expr) \
    EMTLS_LOG(::emtls::v13::ErrorReporter::LogLevel::TRACE, component, expr)

#define EMTLS_LOG_DEBUG(component, expr) \
    EMTLS_LOG(::emtls::v13::ErrorReporter::LogLevel::DEBUG, component, expr)

#define EMTLS_LOG_INFO(component, expr) \
    EMTLS_LOG(::emtls::v13::ErrorReporter::LogLevel::INFO, component, expr)

#define EMTLS_LOG_WARN(component, expr) \
    EMTLS_LOG(::emtls::v13::ErrorReporter::LogLevel::WARNING, component, expr)

#define EMTLS_LOG_ERROR(component, expr) \
    EMTLS_LOG(::emtls::v13::ErrorReporter::LogLevel::ERROR, component, expr)

// Report a failed operation with its error code
#define EMTLS_REPORT_ERROR(level, error, component, message) \
    do { \
        auto& _emtls_reporter = ::emtls::v13::ErrorReporter::instance(); \
        if (_emtls_reporter.is_enabled(level)) { \
            (void)_emtls_reporter.report_error((level), (error), (component), (message)); \
        } \
    } while (0)

#endif // EMTLS_ERROR_REPORTER_H
