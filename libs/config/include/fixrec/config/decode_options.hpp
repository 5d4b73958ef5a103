#pragma once
// =============================================================================
// fixrec - Decode Options
// Version: 1.0.0
// =============================================================================

#include "fixrec/common/types.hpp"

namespace fixrec {

// What the decoder does when a field starts inside the buffer but its
// extent runs past the end of it.
enum class TruncationPolicy : UInt8 {
    REJECT,   // fail with TRUNCATED_FIELD
    CLIP      // decode the bytes that are present
};

struct DecodeOptions {
    // Parse width for NativeInt / NativeUInt fields. Resolved when a schema
    // is built, never per decode call.
    UInt8 native_int_bits = 64;
    TruncationPolicy truncation = TruncationPolicy::REJECT;
    
    [[nodiscard]] bool operator==(const DecodeOptions&) const = default;
};

[[nodiscard]] constexpr bool is_valid_int_width(UInt64 bits) noexcept {
    return bits == 8 || bits == 16 || bits == 32 || bits == 64;
}

// Process-wide defaults picked up by schemas built without explicit options.
[[nodiscard]] DecodeOptions default_decode_options();
void set_default_decode_options(const DecodeOptions& options);

} // namespace fixrec
