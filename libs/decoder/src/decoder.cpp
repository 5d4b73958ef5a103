// =============================================================================
// fixrec - Record Decoder Implementation
// Version: 1.0.0
// =============================================================================

#include <fixrec/decoder/decoder.hpp>

namespace fixrec {
namespace detail {

FieldRange field_range(Size field_count, Size start_field, Size max_fields) {
    FieldRange range;
    range.begin = std::min(start_field, field_count);
    range.end = field_count;
    if (max_fields > 0 && max_fields < field_count - range.begin) {
        range.end = range.begin + max_fields;
    }
    return range;
}

Result<Optional<BufferView>> WindowCursor::slice(const layout::FieldDescriptor& descriptor,
                                                 Size extent) {
    if (!offset_) {
        offset_ = descriptor.start_index();
    } else if (descriptor.position <= *offset_) {
        return Optional<BufferView>{};
    }
    
    const Size lower = descriptor.start_index() - *offset_;
    if (lower >= buffer_.size()) {
        return Optional<BufferView>{};
    }
    
    if (extent > buffer_.size() - lower && truncation_ == TruncationPolicy::REJECT) {
        return ErrorInfo(ErrorCode::TRUNCATED_FIELD,
            std::format("Field \"{}\" needs {} bytes from byte {} of the window but only {} are present",
                        descriptor.to_string(), extent, lower, buffer_.size()), "decoder")
            .with_context("window_offset", std::to_string(*offset_));
    }
    
    return Optional<BufferView>{buffer_.subview(lower, extent)};
}

logging::Logger& decoder_logger() {
    static const SharedPtr<logging::Logger> logger =
        logging::LogManager::instance().get_logger("fixrec.decoder");
    return *logger;
}

void annotate(ErrorInfo& error, const schema::FieldInfo& field) {
    error.within_field(field.name);
    if (field.tag && !error.context_value("layout")) {
        error.with_context("layout", *field.tag);
    }
    if (error.component.empty()) {
        error.with_component("decoder");
    }
}

void report_failure(const ErrorInfo& error, StringView record_name) {
    ErrorStatistics::instance().record_error(error);
    decoder_logger().debug("decode {} failed: {}", record_name, error.to_string());
}

ErrorInfo null_target_error(StringView record_name) {
    return ErrorInfo(ErrorCode::NOT_A_REFERENCE,
        std::format("Decode target for {} must be a non-null record reference", record_name),
        "decoder");
}

} // namespace detail
} // namespace fixrec
