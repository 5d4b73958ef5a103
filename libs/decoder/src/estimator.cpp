// =============================================================================
// fixrec - Field Count Estimator Implementation
// Version: 1.0.0
// =============================================================================

#include <fixrec/decoder/estimator.hpp>

namespace fixrec {

Result<FieldEstimate> estimate(BufferView buffer, const schema::SchemaInfo& schema,
                               Size field_offset) {
    FieldEstimate result;
    Size cumulative = 0;
    
    for (Size i = field_offset; i < schema.size(); ++i) {
        const auto& field = schema.field(i);
        if (field.is_inert()) continue;
        
        auto descriptor = layout::FieldDescriptor::parse(*field.tag);
        if (descriptor.is_error()) {
            descriptor.error().within_field(field.name).with_component("estimator");
            return descriptor.error();
        }
        
        const auto& d = descriptor.value();
        const Size elements = field.shape ? field.shape->static_element_count() : 1;
        cumulative = layout::saturating_add(cumulative, d.extent(elements));
        
        if (cumulative <= buffer.size()) {
            ++result.count;
            result.consumed = cumulative;
        } else {
            result.remainder = buffer.subview(cumulative - d.length);
            break;
        }
    }
    
    return make_success(result);
}

} // namespace fixrec
