// =============================================================================
// fixrec - Field Layout Descriptors
// Version: 1.0.0
// =============================================================================
// A layout tag places one record field inside a fixed-width record:
//
//     "<position>,<length>"               single value, nested record or array
//     "<position>,<length>,<occurrence>"  OCCURS clause: repeated value
//
// Positions are 1-based and always relative to the start of the whole
// logical record, never to the buffer handed to a particular decode call.
// =============================================================================

#ifndef FIXREC_LAYOUT_FIELD_DESCRIPTOR_HPP
#define FIXREC_LAYOUT_FIELD_DESCRIPTOR_HPP

#include <fixrec/common/types.hpp>
#include <fixrec/common/error.hpp>
#include <limits>

namespace fixrec {
namespace layout {

struct FieldDescriptor {
    Size position = 1;            // 1-based byte offset into the record
    Size length = 1;              // bytes per value
    Optional<Size> occurrence;    // OCCURS count, >= 2 when present
    
    [[nodiscard]] bool has_occurrence() const { return occurrence.has_value(); }
    
    // Bytes covered by this field given `elements` values of `length` each;
    // the occurrence count takes precedence when present. Saturates at the
    // largest Size rather than wrapping.
    [[nodiscard]] Size extent(Size elements = 1) const;
    
    // Zero-based index of the first byte in the logical record
    [[nodiscard]] Size start_index() const { return position - 1; }
    
    [[nodiscard]] String to_string() const;
    
    bool operator==(const FieldDescriptor&) const = default;
    
    static Result<FieldDescriptor> parse(StringView tag);
};

// a * b and a + b, clamped to the largest Size instead of wrapping
[[nodiscard]] constexpr Size saturating_mul(Size a, Size b) noexcept {
    if (a != 0 && b > std::numeric_limits<Size>::max() / a) {
        return std::numeric_limits<Size>::max();
    }
    return a * b;
}

[[nodiscard]] constexpr Size saturating_add(Size a, Size b) noexcept {
    if (b > std::numeric_limits<Size>::max() - a) {
        return std::numeric_limits<Size>::max();
    }
    return a + b;
}

// Parses a base-10 integer token with an optional sign. No whitespace.
[[nodiscard]] Optional<Int64> parse_tag_integer(StringView token);

} // namespace layout
} // namespace fixrec

#endif // FIXREC_LAYOUT_FIELD_DESCRIPTOR_HPP
