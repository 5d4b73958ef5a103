#pragma once
// =============================================================================
// fixrec - Error Handling (C++20)
// Version: 1.0.0
// =============================================================================

#include "fixrec/common/types.hpp"
#include <system_error>
#include <stdexcept>

namespace fixrec {

// =============================================================================
// Error Codes
// =============================================================================
enum class ErrorCode : Int32 {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1000,
    INVALID_ARGUMENT = 1001,
    IO_ERROR = 1002,
    FILE_NOT_FOUND = 1003,
    
    // Layout Errors (1100-1199)
    MISSING_PARAMETERS = 1100,
    INVALID_POSITION = 1101,
    INVALID_LENGTH = 1102,
    INVALID_OCCURRENCE = 1103,
    
    // Structural Errors (1200-1299)
    NOT_A_REFERENCE = 1200,
    MISSING_OCCURRENCE = 1201,
    TRUNCATED_FIELD = 1202,
    
    // Coercion Errors (1300-1399)
    INVALID_BOOLEAN = 1300,
    INVALID_INTEGER = 1301,
    INVALID_FLOAT = 1302,
    TEXT_TOO_LONG = 1303,
    
    // Configuration Errors (1400-1499)
    CONFIG_ERROR = 1400,
    INVALID_CONFIG_VALUE = 1401
};

// =============================================================================
// Error Category
// =============================================================================
class FixrecErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override;
    [[nodiscard]] String message(int code) const override;
};

[[nodiscard]] const std::error_category& fixrec_error_category() noexcept;
[[nodiscard]] std::error_code make_error_code(ErrorCode e) noexcept;

} // namespace fixrec

namespace std {
    template<>
    struct is_error_code_enum<fixrec::ErrorCode> : true_type {};
}

namespace fixrec {

// =============================================================================
// ErrorInfo - Detailed error information
// =============================================================================
struct ErrorInfo {
    ErrorCode code = ErrorCode::SUCCESS;
    String message;
    String component;
    SystemTimePoint timestamp = SystemClock::now();
    std::source_location location = std::source_location::current();
    std::unordered_map<String, String> context;
    
    ErrorInfo() = default;
    ErrorInfo(ErrorCode c, String msg, String comp = "",
              std::source_location loc = std::source_location::current());
    
    ErrorInfo& with_context(String key, String value);
    ErrorInfo& with_component(String comp);
    
    // Prefixes `name` onto the "field" context path ("Outer.Inner[2]").
    ErrorInfo& within_field(StringView name);
    
    [[nodiscard]] Optional<String> context_value(StringView key) const;
    [[nodiscard]] String field_path() const;
    
    [[nodiscard]] String to_string() const;
    [[nodiscard]] String to_json() const;
    [[nodiscard]] String format_full() const;
};

// =============================================================================
// Result<T> - Monadic error handling
// =============================================================================
template<typename T>
class Result {
private:
    Variant<T, ErrorInfo> data_;
    
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ErrorInfo error) : data_(std::move(error)) {}
    
    [[nodiscard]] bool is_success() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_error() const { return std::holds_alternative<ErrorInfo>(data_); }
    
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }
    
    [[nodiscard]] ErrorInfo& error() & { return std::get<ErrorInfo>(data_); }
    [[nodiscard]] const ErrorInfo& error() const& { return std::get<ErrorInfo>(data_); }
    
    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    
    [[nodiscard]] T value_or(T default_val) const {
        return is_success() ? value() : std::move(default_val);
    }
    
    template<typename F>
    [[nodiscard]] auto map(F&& f) const -> Result<decltype(f(std::declval<T>()))> {
        if (is_success()) return f(value());
        return error();
    }
    
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> decltype(f(std::declval<T>())) {
        if (is_success()) return f(value());
        return error();
    }
    
    explicit operator bool() const { return is_success(); }
};

// Specialization for void
template<>
class Result<void> {
private:
    Optional<ErrorInfo> error_;
    
public:
    Result() = default;
    Result(ErrorInfo err) : error_(std::move(err)) {}
    
    [[nodiscard]] bool is_success() const { return !error_.has_value(); }
    [[nodiscard]] bool is_error() const { return error_.has_value(); }
    [[nodiscard]] ErrorInfo& error() { return *error_; }
    [[nodiscard]] const ErrorInfo& error() const { return *error_; }
    
    explicit operator bool() const { return is_success(); }
};

// =============================================================================
// Result Factory Functions
// =============================================================================
template<typename T>
[[nodiscard]] Result<T> make_success(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> make_success() {
    return Result<void>();
}

template<typename T>
[[nodiscard]] Result<T> make_error(ErrorCode code, String message,
                                   std::source_location loc = std::source_location::current()) {
    return Result<T>(ErrorInfo(code, std::move(message), "", loc));
}

template<typename T>
[[nodiscard]] Result<T> make_error(const ErrorInfo& info) {
    return Result<T>(info);
}

// =============================================================================
// Exception
// =============================================================================
class FixrecException : public std::runtime_error {
protected:
    ErrorInfo error_info_;
    
public:
    explicit FixrecException(ErrorInfo info);
    FixrecException(ErrorCode code, const String& message,
                    std::source_location loc = std::source_location::current());
    
    [[nodiscard]] ErrorCode code() const { return error_info_.code; }
    [[nodiscard]] const ErrorInfo& error_info() const { return error_info_; }
    [[nodiscard]] String detailed_message() const;
};

// =============================================================================
// Error Statistics
// =============================================================================
class ErrorStatistics {
private:
    std::unordered_map<ErrorCode, AtomicCounter<>> error_counts_;
    std::unordered_map<String, AtomicCounter<>> component_errors_;
    mutable std::shared_mutex mutex_;
    
public:
    static ErrorStatistics& instance();
    
    void record_error(const ErrorInfo& info);
    void reset();
    [[nodiscard]] UInt64 get_error_count(ErrorCode code) const;
    [[nodiscard]] UInt64 get_component_error_count(const String& component) const;
    [[nodiscard]] UInt64 total_errors() const;
};

// =============================================================================
// Helper Functions
// =============================================================================
[[nodiscard]] StringView error_category_name(ErrorCode code);
[[nodiscard]] String format_error_code(ErrorCode code);

// =============================================================================
// Macros
// =============================================================================
#define FIXREC_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) return std::move(_result.error()); \
    } while(0)

#define FIXREC_THROW_IF_ERROR(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) throw fixrec::FixrecException(_result.error()); \
    } while(0)

} // namespace fixrec
