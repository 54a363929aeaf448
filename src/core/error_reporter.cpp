#include <emtls/error_reporter.h>
#include <iostream>
#include <iomanip>
#include <ctime>

namespace emtls {
namespace v13 {

ErrorReporter::ErrorReporter() : ErrorReporter(ReportingConfig{}) {}

ErrorReporter::ErrorReporter(const ReportingConfig& config)
    : config_(config)
    , minimum_level_(static_cast<int>(config.minimum_level)) {}

ErrorReporter::~ErrorReporter() = default;

ErrorReporter& ErrorReporter::instance() {
    static ErrorReporter reporter([] {
        ReportingConfig config;
        config.output = &std::cerr;
        return config;
    }());
    return reporter;
}

void ErrorReporter::report(LogLevel level, const std::string& component, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }
    submit(ErrorReport(level, TLSError::SUCCESS, component, message));
}

Result<void> ErrorReporter::report_error(LogLevel level,
                                         TLSError error,
                                         const std::string& component,
                                         const std::string& message) {
    if (!is_enabled(level)) {
        return make_result();
    }
    submit(ErrorReport(level, error, component, message));
    return make_result();
}

Result<void> ErrorReporter::update_configuration(const ReportingConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
    minimum_level_.store(static_cast<int>(config.minimum_level), std::memory_order_relaxed);
    return make_result();
}

ErrorReporter::ReportingConfig ErrorReporter::get_configuration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ErrorReporter::add_reporter_callback(ReporterCallback callback) {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.push_back(std::move(callback));
}

void ErrorReporter::clear_reporter_callbacks() {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.clear();
}

void ErrorReporter::reset_statistics() {
    stats_.total_reports = 0;
    for (auto& counter : stats_.reports_by_level) {
        counter = 0;
    }
}

void ErrorReporter::submit(const ErrorReport& report) {
    ReportingConfig config = get_configuration();

    stats_.total_reports++;
    size_t level_index = static_cast<size_t>(report.level);
    if (level_index < 5) {
        stats_.reports_by_level[level_index]++;
    }

    if (config.output != nullptr) {
        std::string formatted = format_report(report, config);
        std::lock_guard<std::mutex> lock(output_mutex_);
        *config.output << formatted << '\n';
    }

    std::lock_guard<std::mutex> lock(reporters_mutex_);
    for (const auto& callback : custom_reporters_) {
        callback(report);
    }
}

std::string ErrorReporter::format_report(const ErrorReport& report,
                                         const ReportingConfig& config) const {
    std::ostringstream oss;

    if (config.format == OutputFormat::JSON) {
        oss << "{";
        if (config.include_timestamps) {
            oss << "\"time\":\"" << format_timestamp(report.timestamp) << "\",";
        }
        oss << "\"level\":\"" << log_level_to_string(report.level) << "\""
            << ",\"component\":\"" << report.component << "\"";
        if (report.error_code != TLSError::SUCCESS) {
            oss << ",\"error\":" << static_cast<int>(report.error_code);
        }
        oss << ",\"message\":\"" << report.message << "\"}";
    } else {
        if (config.include_timestamps) {
            oss << format_timestamp(report.timestamp) << " ";
        }
        oss << "[" << log_level_to_string(report.level) << "] [" << report.component << "] ";
        if (report.error_code != TLSError::SUCCESS) {
            oss << "Error " << static_cast<int>(report.error_code)
                << " (" << to_string(report.error_code) << "): ";
        }
        oss << report.message;
    }

    return oss.str();
}

std::string ErrorReporter::format_timestamp(const std::chrono::system_clock::time_point& timestamp) const {
    auto time = std::chrono::system_clock::to_time_t(timestamp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        timestamp.time_since_epoch()).count() % 1000000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(6) << std::setfill('0') << micros << "Z";
    return oss.str();
}

std::string ErrorReporter::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace v13
} // namespace emtls
