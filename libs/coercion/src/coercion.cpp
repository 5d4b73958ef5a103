// =============================================================================
// fixrec - Type Coercion Implementation
// Version: 1.0.0
// =============================================================================

#include <fixrec/coercion/coercion.hpp>
#include <charconv>
#include <limits>

namespace fixrec {
namespace coercion {

namespace {

ErrorInfo coercion_error(ErrorCode code, StringView text, String message) {
    ErrorInfo info(code, std::move(message), "coercion");
    info.with_context("raw", printable(text));
    return info;
}

Int64 signed_max(UInt8 bits) {
    return bits >= 64 ? std::numeric_limits<Int64>::max()
                      : (Int64{1} << (bits - 1)) - 1;
}

UInt64 unsigned_max(UInt8 bits) {
    return bits >= 64 ? std::numeric_limits<UInt64>::max()
                      : (UInt64{1} << bits) - 1;
}

} // anonymous namespace

Result<bool> parse_boolean(StringView text) {
    if (text == "1" || text == "t" || text == "T" ||
        text == "TRUE" || text == "true" || text == "True") {
        return true;
    }
    if (text == "0" || text == "f" || text == "F" ||
        text == "FALSE" || text == "false" || text == "False") {
        return false;
    }
    return coercion_error(ErrorCode::INVALID_BOOLEAN, text,
        "Cannot parse \"" + printable(text) + "\" as a boolean");
}

Result<Int64> parse_signed(StringView text, UInt8 bits) {
    if (bits != 8 && bits != 16 && bits != 32 && bits != 64) {
        return make_error<Int64>(ErrorCode::INVALID_ARGUMENT,
            std::format("Unsupported integer width {}", bits));
    }
    
    StringView digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        if (!digits.empty() && digits.front() == '-') digits = {};
    }
    
    Int64 value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ec == std::errc::invalid_argument || ptr != digits.data() + digits.size()) {
        return coercion_error(ErrorCode::INVALID_INTEGER, text,
            "Cannot parse \"" + printable(text) + "\" as a base-10 integer");
    }
    
    Int64 max = signed_max(bits);
    Int64 min = -max - 1;
    if (ec == std::errc::result_out_of_range || value > max || value < min) {
        return coercion_error(ErrorCode::INVALID_INTEGER, text,
            std::format("Value \"{}\" out of range for int{}", printable(text), bits));
    }
    return value;
}

Result<UInt64> parse_unsigned(StringView text, UInt8 bits) {
    if (bits != 8 && bits != 16 && bits != 32 && bits != 64) {
        return make_error<UInt64>(ErrorCode::INVALID_ARGUMENT,
            std::format("Unsupported integer width {}", bits));
    }
    
    // from_chars accepts a leading '-' for unsigned types on some libraries
    if (text.empty() || text.front() < '0' || text.front() > '9') {
        return coercion_error(ErrorCode::INVALID_INTEGER, text,
            "Cannot parse \"" + printable(text) + "\" as an unsigned base-10 integer");
    }
    
    UInt64 value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::invalid_argument || ptr != text.data() + text.size()) {
        return coercion_error(ErrorCode::INVALID_INTEGER, text,
            "Cannot parse \"" + printable(text) + "\" as an unsigned base-10 integer");
    }
    if (ec == std::errc::result_out_of_range || value > unsigned_max(bits)) {
        return coercion_error(ErrorCode::INVALID_INTEGER, text,
            std::format("Value \"{}\" out of range for uint{}", printable(text), bits));
    }
    return value;
}

Result<Float64> parse_float(StringView text, UInt8 bits) {
    if (bits != 32 && bits != 64) {
        return make_error<Float64>(ErrorCode::INVALID_ARGUMENT,
            std::format("Unsupported float width {}", bits));
    }
    
    StringView digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        if (!digits.empty() && digits.front() == '-') digits = {};
    }
    
    // Single precision is parsed as such so the value is rounded once
    Float64 value = 0.0;
    std::from_chars_result parsed;
    if (bits == 32) {
        Float32 narrow = 0.0f;
        parsed = std::from_chars(digits.data(), digits.data() + digits.size(), narrow);
        value = narrow;
    } else {
        parsed = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    }
    
    if (digits.empty() || parsed.ec == std::errc::invalid_argument ||
        parsed.ptr != digits.data() + digits.size()) {
        return coercion_error(ErrorCode::INVALID_FLOAT, text,
            "Cannot parse \"" + printable(text) + "\" as a decimal number");
    }
    if (parsed.ec == std::errc::result_out_of_range) {
        return coercion_error(ErrorCode::INVALID_FLOAT, text,
            std::format("Value \"{}\" out of range for float{}", printable(text), bits));
    }
    return value;
}

Result<void> check_text_width(StringView text, Size capacity) {
    if (text.size() > capacity) {
        return coercion_error(ErrorCode::TEXT_TOO_LONG, text,
            std::format("{} bytes do not fit a text field of {}", text.size(), capacity));
    }
    return make_success();
}

} // namespace coercion
} // namespace fixrec
