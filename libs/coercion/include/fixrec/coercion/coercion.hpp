// =============================================================================
// fixrec - Type Coercion Layer
// Version: 1.0.0
// =============================================================================
// Converts the raw bytes of one field into a scalar value. Every input is
// read as text: booleans and numbers in their canonical base-10 forms,
// strings verbatim (no trimming, no code page conversion).
// =============================================================================

#ifndef FIXREC_COERCION_COERCION_HPP
#define FIXREC_COERCION_COERCION_HPP

#include <fixrec/common/types.hpp>
#include <fixrec/common/error.hpp>

namespace fixrec {
namespace coercion {

// =============================================================================
// Native-width integers
// =============================================================================
// Stored in 64 bits; the width used to range-check the text comes from
// DecodeOptions::native_int_bits at schema-build time.

struct NativeInt {
    Int64 value = 0;
    
    NativeInt() = default;
    NativeInt(Int64 v) : value(v) {}
    operator Int64() const { return value; }
    auto operator<=>(const NativeInt&) const = default;
};

struct NativeUInt {
    UInt64 value = 0;
    
    NativeUInt() = default;
    NativeUInt(UInt64 v) : value(v) {}
    operator UInt64() const { return value; }
    auto operator<=>(const NativeUInt&) const = default;
};

// =============================================================================
// Scalar parsers
// =============================================================================

// 1, t, T, TRUE, true, True, 0, f, F, FALSE, false, False
[[nodiscard]] Result<bool> parse_boolean(StringView text);

// bits must be 8, 16, 32 or 64
[[nodiscard]] Result<Int64> parse_signed(StringView text, UInt8 bits);
[[nodiscard]] Result<UInt64> parse_unsigned(StringView text, UInt8 bits);

// bits must be 32 or 64; values outside the range of the width fail
[[nodiscard]] Result<Float64> parse_float(StringView text, UInt8 bits);

// TEXT_TOO_LONG when `text` does not fit a fixed-capacity text target
[[nodiscard]] Result<void> check_text_width(StringView text, Size capacity);

// =============================================================================
// Typed coercion
// =============================================================================

template<typename T>
inline constexpr bool is_fixed_string_v = false;

template<Size N>
inline constexpr bool is_fixed_string_v<FixedString<N>> = true;

template<typename T>
concept ScalarTarget =
    std::same_as<T, bool> ||
    (std::is_integral_v<T> && !std::same_as<T, char> && !std::same_as<T, wchar_t> &&
     !std::same_as<T, char8_t> && !std::same_as<T, char16_t> && !std::same_as<T, char32_t>) ||
    std::same_as<T, float> || std::same_as<T, double> ||
    std::same_as<T, String> || is_fixed_string_v<T> ||
    std::same_as<T, NativeInt> || std::same_as<T, NativeUInt>;

/**
 * @brief Coerce a field slice into `target`.
 * @param native_bits parse width for NativeInt / NativeUInt, ignored otherwise
 *
 * `target` is only written on success.
 */
template<ScalarTarget T>
[[nodiscard]] Result<void> coerce(StringView text, T& target, UInt8 native_bits = 64) {
    if constexpr (std::same_as<T, bool>) {
        auto parsed = parse_boolean(text);
        if (parsed.is_error()) return parsed.error();
        target = parsed.value();
    } else if constexpr (std::same_as<T, NativeInt>) {
        auto parsed = parse_signed(text, native_bits);
        if (parsed.is_error()) return parsed.error();
        target = NativeInt(parsed.value());
    } else if constexpr (std::same_as<T, NativeUInt>) {
        auto parsed = parse_unsigned(text, native_bits);
        if (parsed.is_error()) return parsed.error();
        target = NativeUInt(parsed.value());
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        auto parsed = parse_signed(text, static_cast<UInt8>(sizeof(T) * 8));
        if (parsed.is_error()) return parsed.error();
        target = static_cast<T>(parsed.value());
    } else if constexpr (std::is_integral_v<T>) {
        auto parsed = parse_unsigned(text, static_cast<UInt8>(sizeof(T) * 8));
        if (parsed.is_error()) return parsed.error();
        target = static_cast<T>(parsed.value());
    } else if constexpr (std::is_floating_point_v<T>) {
        auto parsed = parse_float(text, static_cast<UInt8>(sizeof(T) * 8));
        if (parsed.is_error()) return parsed.error();
        target = static_cast<T>(parsed.value());
    } else if constexpr (std::same_as<T, String>) {
        target.assign(text.data(), text.size());
    } else {
        auto fits = check_text_width(text, T::capacity);
        if (fits.is_error()) return fits;
        target = T(text);
    }
    return make_success();
}

} // namespace coercion
} // namespace fixrec

#endif // FIXREC_COERCION_COERCION_HPP
