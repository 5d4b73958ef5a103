// =============================================================================
// fixrec - Type Tree Inspector Implementation
// Version: 1.0.0
// =============================================================================

#include <fixrec/schema/inspector.hpp>
#include <sstream>
#include <iomanip>

namespace fixrec {
namespace schema {

namespace {

// Nested record reachable through this shape, looking through references
// and containers.
const SchemaInfo* nested_schema(const FieldShape& shape) {
    if (const auto* nested = std::get_if<NestedShape>(&shape.kind)) {
        return nested->schema.get();
    }
    if (const auto* ref = std::get_if<ReferenceShape>(&shape.kind)) {
        return ref->target ? nested_schema(*ref->target) : nullptr;
    }
    if (const auto* array = std::get_if<FixedArrayShape>(&shape.kind)) {
        return array->element ? nested_schema(*array->element) : nullptr;
    }
    if (const auto* seq = std::get_if<SequenceShape>(&shape.kind)) {
        return seq->element ? nested_schema(*seq->element) : nullptr;
    }
    return nullptr;
}

void print_fields(std::ostream& out, const SchemaInfo& schema, Size depth) {
    const String indent(depth * 4 + 2, ' ');
    
    for (Size i = 0; i < schema.size(); ++i) {
        const auto& field = schema.field(i);
        out << indent << "[" << i << "] "
            << std::left << std::setw(16) << field.name << " "
            << std::setw(24) << (field.shape ? field.shape->type_name() : String("?"));
        if (field.tag) {
            out << " \"" << *field.tag << "\"";
        } else {
            out << " (inert)";
        }
        out << "\n";
        
        if (field.shape) {
            if (const auto* child = nested_schema(*field.shape)) {
                print_fields(out, *child, depth + 1);
            }
        }
    }
}

} // anonymous namespace

String describe_shape(const FieldShape& shape) {
    return shape.type_name();
}

void print_schema(std::ostream& out, const SchemaInfo& schema) {
    out << schema.record_name() << " (" << schema.size() << " fields, "
        << schema.tagged_field_count() << " tagged)\n";
    print_fields(out, schema, 0);
}

String describe_schema(const SchemaInfo& schema) {
    std::ostringstream oss;
    print_schema(oss, schema);
    return oss.str();
}

} // namespace schema
} // namespace fixrec
