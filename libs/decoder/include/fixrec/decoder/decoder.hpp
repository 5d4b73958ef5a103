// =============================================================================
// fixrec - Record Decoder
// Version: 1.0.0
// =============================================================================
// Populates a record from a fixed-width buffer, field by field, following
// the layout tags of its schema.
//
// A decode call covers a window of field indices [start_field, start_field +
// max_fields) (max_fields == 0 means "to the end"). The buffer is taken to
// begin at the position of the first tagged field in the window, so a record
// can be decoded from consecutive chunks of its text:
//
//     decode(buffer.substr(0, 17), &account, 0, 3);   // fields 0..2
//     decode(buffer.substr(17),    &account, 3, 0);   // fields 3..
//
// Fields whose slice starts past the end of the buffer are left untouched.
// Any other failure stops the call; fields decoded before it keep their
// new values.
// =============================================================================

#ifndef FIXREC_DECODER_DECODER_HPP
#define FIXREC_DECODER_DECODER_HPP

#include <fixrec/decoder/record_schema.hpp>
#include <fixrec/decoder/field_codec.hpp>
#include <fixrec/common/logging.hpp>

namespace fixrec {

namespace detail {

struct FieldRange {
    Size begin = 0;
    Size end = 0;
};

[[nodiscard]] FieldRange field_range(Size field_count, Size start_field, Size max_fields);

// Tracks the window origin of one decode call and maps field descriptors to
// buffer slices.
class WindowCursor {
private:
    BufferView buffer_;
    TruncationPolicy truncation_;
    Optional<Size> offset_;
    
public:
    WindowCursor(BufferView buffer, TruncationPolicy truncation)
        : buffer_(buffer), truncation_(truncation) {}
    
    // nullopt when the field lies before the window origin or starts past
    // the end of the buffer.
    [[nodiscard]] Result<Optional<BufferView>> slice(const layout::FieldDescriptor& descriptor,
                                                     Size extent);
    
    [[nodiscard]] Optional<Size> offset() const { return offset_; }
};

[[nodiscard]] logging::Logger& decoder_logger();

// Adds the field name and layout tag to an error raised while decoding it
void annotate(ErrorInfo& error, const schema::FieldInfo& field);

// Counts and logs a failed top-level decode call
void report_failure(const ErrorInfo& error, StringView record_name);

[[nodiscard]] ErrorInfo null_target_error(StringView record_name);

template<typename Record>
Result<void> decode_fields(BufferView buffer, const RecordSchema<Record>& schema,
                           Record& target, Size start_field, Size max_fields) {
    const auto range = field_range(schema.size(), start_field, max_fields);
    WindowCursor cursor(buffer, schema.options().truncation);
    
    for (Size i = range.begin; i < range.end; ++i) {
        const auto& info = schema.field(i);
        if (info.is_inert()) continue;
        
        auto descriptor = layout::FieldDescriptor::parse(*info.tag);
        if (descriptor.is_error()) {
            annotate(descriptor.error(), info);
            return descriptor.error();
        }
        
        const auto& binding = schema.binding(i);
        auto slice = cursor.slice(descriptor.value(), binding.extent(descriptor.value()));
        if (slice.is_error()) {
            annotate(slice.error(), info);
            return slice.error();
        }
        if (!slice.value()) {
            decoder_logger().trace("{}.{} skipped: \"{}\" outside window of {} bytes",
                schema.record_name(), info.name, *info.tag, buffer.size());
            continue;
        }
        
        auto assigned = binding.assign(target, *slice.value(), descriptor.value());
        if (assigned.is_error()) {
            annotate(assigned.error(), info);
            return assigned;
        }
    }
    return make_success();
}

} // namespace detail

// =============================================================================
// Decode API
// =============================================================================

/**
 * @brief Decode fields [start_field, start_field + max_fields) of `target`.
 * @param buffer      text of the record, starting at the first tagged field
 *                    of the window
 * @param schema      field layouts of Record
 * @param target      record to populate; null fails with NOT_A_REFERENCE
 * @param start_field index of the first field to consider
 * @param max_fields  number of fields to consider, 0 for all remaining
 */
template<typename Record>
[[nodiscard]] Result<void> decode(BufferView buffer, const RecordSchema<Record>& schema,
                                  Record* target, Size start_field = 0, Size max_fields = 0) {
    if (target == nullptr) {
        auto error = detail::null_target_error(schema.record_name());
        detail::report_failure(error, schema.record_name());
        return error;
    }
    
    auto result = detail::decode_fields(buffer, schema, *target, start_field, max_fields);
    if (result.is_error()) {
        detail::report_failure(result.error(), schema.record_name());
    }
    return result;
}

template<DecodableRecord Record>
[[nodiscard]] Result<void> decode(BufferView buffer, Record* target,
                                  Size start_field = 0, Size max_fields = 0) {
    return decode(buffer, schema_of<Record>(), target, start_field, max_fields);
}

template<DecodableRecord Record>
[[nodiscard]] Result<void> decode(BufferView buffer, Record& target,
                                  Size start_field = 0, Size max_fields = 0) {
    return decode(buffer, schema_of<Record>(), &target, start_field, max_fields);
}

// Decodes every field into a value-initialised record.
template<DecodableRecord Record>
[[nodiscard]] Result<Record> decode_record(BufferView buffer) {
    Record record{};
    auto result = decode(buffer, schema_of<Record>(), &record);
    if (result.is_error()) return std::move(result.error());
    return make_success(std::move(record));
}

template<typename Record>
[[nodiscard]] Result<Record> decode_record(BufferView buffer, const RecordSchema<Record>& schema) {
    Record record{};
    auto result = decode(buffer, schema, &record);
    if (result.is_error()) return std::move(result.error());
    return make_success(std::move(record));
}

} // namespace fixrec

#endif // FIXREC_DECODER_DECODER_HPP
