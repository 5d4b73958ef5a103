// =============================================================================
// fixrec - Field Layout Descriptor Implementation
// Version: 1.0.0
// =============================================================================

#include <fixrec/layout/field_descriptor.hpp>
#include <charconv>
#include <limits>

namespace fixrec {
namespace layout {

Size FieldDescriptor::extent(Size elements) const {
    return saturating_mul(length, occurrence ? *occurrence : elements);
}

String FieldDescriptor::to_string() const {
    if (occurrence) {
        return std::format("{},{},{}", position, length, *occurrence);
    }
    return std::format("{},{}", position, length);
}

Optional<Int64> parse_tag_integer(StringView token) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        if (!token.empty() && token.front() == '-') return nullopt;
    }
    if (token.empty()) return nullopt;
    
    Int64 value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size()) {
        return nullopt;
    }
    return value;
}

Result<FieldDescriptor> FieldDescriptor::parse(StringView tag) {
    auto params = split(tag, ',');
    if (params.size() < 2) {
        return make_error<FieldDescriptor>(ErrorCode::MISSING_PARAMETERS,
            "Position and length must be provided, in the form \"pos,len\" or \"pos,len,occurs\": \""
            + String(tag) + "\"");
    }
    
    FieldDescriptor descriptor;
    
    auto position = parse_tag_integer(params[0]);
    if (!position) {
        return make_error<FieldDescriptor>(ErrorCode::INVALID_POSITION,
            "Position is not an integer: \"" + params[0] + "\"");
    }
    if (*position < 1) {
        return make_error<FieldDescriptor>(ErrorCode::INVALID_POSITION,
            std::format("Position cannot be less than 1 (positions are 1-based), got {}", *position));
    }
    descriptor.position = static_cast<Size>(*position);
    
    auto length = parse_tag_integer(params[1]);
    if (!length) {
        return make_error<FieldDescriptor>(ErrorCode::INVALID_LENGTH,
            "Length is not an integer: \"" + params[1] + "\"");
    }
    if (*length < 1) {
        return make_error<FieldDescriptor>(ErrorCode::INVALID_LENGTH,
            std::format("Length cannot be less than 1, got {}", *length));
    }
    descriptor.length = static_cast<Size>(*length);
    
    if (params.size() > 2) {
        auto occurrence = parse_tag_integer(params[2]);
        if (!occurrence) {
            return make_error<FieldDescriptor>(ErrorCode::INVALID_OCCURRENCE,
                "Occurrence is not an integer: \"" + params[2] + "\"");
        }
        if (*occurrence < 2) {
            return make_error<FieldDescriptor>(ErrorCode::INVALID_OCCURRENCE,
                std::format("Occurrence cannot be less than 2, got {}", *occurrence));
        }
        descriptor.occurrence = static_cast<Size>(*occurrence);
    }
    
    // The last byte of the field must be addressable
    constexpr Size max_size = std::numeric_limits<Size>::max();
    if (descriptor.extent() == max_size || descriptor.extent() > max_size - descriptor.start_index()) {
        return make_error<FieldDescriptor>(
            descriptor.occurrence ? ErrorCode::INVALID_OCCURRENCE : ErrorCode::INVALID_LENGTH,
            std::format("Field \"{}\" extends past the largest addressable byte", String(tag)));
    }
    
    return make_success(descriptor);
}

} // namespace layout
} // namespace fixrec
