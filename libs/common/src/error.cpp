#include "fixrec/common/error.hpp"
#include <sstream>
#include <iomanip>

namespace fixrec {

const char* FixrecErrorCategory::name() const noexcept { return "fixrec"; }

String FixrecErrorCategory::message(int code) const {
    switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::UNKNOWN_ERROR: return "Unknown error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::MISSING_PARAMETERS: return "Missing layout parameters";
        case ErrorCode::INVALID_POSITION: return "Invalid layout position";
        case ErrorCode::INVALID_LENGTH: return "Invalid layout length";
        case ErrorCode::INVALID_OCCURRENCE: return "Invalid layout occurrence";
        case ErrorCode::NOT_A_REFERENCE: return "Target is not a record reference";
        case ErrorCode::MISSING_OCCURRENCE: return "Sequence field requires an occurrence";
        case ErrorCode::TRUNCATED_FIELD: return "Field runs past end of buffer";
        case ErrorCode::INVALID_BOOLEAN: return "Invalid boolean";
        case ErrorCode::INVALID_INTEGER: return "Invalid integer";
        case ErrorCode::INVALID_FLOAT: return "Invalid float";
        case ErrorCode::TEXT_TOO_LONG: return "Text too long";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::INVALID_CONFIG_VALUE: return "Invalid configuration value";
    }
    return "Unknown fixrec error";
}

const std::error_category& fixrec_error_category() noexcept {
    static FixrecErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode e) noexcept {
    return {static_cast<int>(e), fixrec_error_category()};
}

ErrorInfo::ErrorInfo(ErrorCode c, String msg, String comp, std::source_location loc)
    : code(c), message(std::move(msg)), component(std::move(comp))
    , timestamp(SystemClock::now()), location(loc) {}

ErrorInfo& ErrorInfo::with_context(String key, String value) {
    context[std::move(key)] = std::move(value);
    return *this;
}

ErrorInfo& ErrorInfo::with_component(String comp) {
    component = std::move(comp);
    return *this;
}

ErrorInfo& ErrorInfo::within_field(StringView name) {
    auto it = context.find("field");
    if (it == context.end() || it->second.empty()) {
        context["field"] = String(name);
    } else if (it->second.front() == '[') {
        it->second = String(name) + it->second;
    } else {
        it->second = String(name) + "." + it->second;
    }
    return *this;
}

Optional<String> ErrorInfo::context_value(StringView key) const {
    auto it = context.find(String(key));
    if (it == context.end()) return nullopt;
    return it->second;
}

String ErrorInfo::field_path() const {
    return context_value("field").value_or("");
}

String ErrorInfo::to_string() const {
    String text = std::format("[{}] {}: {}", static_cast<int>(code),
        fixrec_error_category().message(static_cast<int>(code)), message);
    if (auto field = context_value("field")) {
        text += std::format(" (field {})", *field);
    }
    return text;
}

String ErrorInfo::to_json() const {
    std::ostringstream oss;
    oss << R"({"code":)" << static_cast<int>(code)
        << R"(,"message":")" << message << R"(")"
        << R"(,"component":")" << component << R"(")"
        << R"(,"field":")" << field_path() << R"("})";
    return oss.str();
}

String ErrorInfo::format_full() const {
    std::ostringstream oss;
    oss << "Error: " << to_string() << "\n";
    oss << "  Component: " << (component.empty() ? "unknown" : component) << "\n";
    oss << "  Location: " << location.file_name() << ":" << location.line() << "\n";
    oss << "  Function: " << location.function_name() << "\n";
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [k, v] : context) {
            oss << "    " << k << ": " << v << "\n";
        }
    }
    return oss.str();
}

FixrecException::FixrecException(ErrorInfo info)
    : std::runtime_error(info.to_string()), error_info_(std::move(info)) {}

FixrecException::FixrecException(ErrorCode code, const String& message, std::source_location loc)
    : std::runtime_error(message), error_info_(code, message, "", loc) {}

String FixrecException::detailed_message() const {
    return error_info_.format_full();
}

ErrorStatistics& ErrorStatistics::instance() {
    static ErrorStatistics stats;
    return stats;
}

void ErrorStatistics::record_error(const ErrorInfo& info) {
    std::unique_lock lock(mutex_);
    error_counts_[info.code]++;
    if (!info.component.empty()) {
        component_errors_[info.component]++;
    }
}

void ErrorStatistics::reset() {
    std::unique_lock lock(mutex_);
    error_counts_.clear();
    component_errors_.clear();
}

UInt64 ErrorStatistics::get_error_count(ErrorCode code) const {
    std::shared_lock lock(mutex_);
    auto it = error_counts_.find(code);
    return it != error_counts_.end() ? it->second.get() : 0;
}

UInt64 ErrorStatistics::get_component_error_count(const String& component) const {
    std::shared_lock lock(mutex_);
    auto it = component_errors_.find(component);
    return it != component_errors_.end() ? it->second.get() : 0;
}

UInt64 ErrorStatistics::total_errors() const {
    UInt64 total = 0;
    std::shared_lock lock(mutex_);
    for (const auto& [_, count] : error_counts_) {
        total += count.get();
    }
    return total;
}

StringView error_category_name(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c >= 1000 && c < 1100) return "General";
    if (c >= 1100 && c < 1200) return "Layout";
    if (c >= 1200 && c < 1300) return "Structure";
    if (c >= 1300 && c < 1400) return "Coercion";
    if (c >= 1400 && c < 1500) return "Config";
    return "Unknown";
}

String format_error_code(ErrorCode code) {
    return std::format("FXR{:04d}", static_cast<int>(code));
}

} // namespace fixrec
