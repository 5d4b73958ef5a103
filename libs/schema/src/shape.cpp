// =============================================================================
// fixrec - Field Shapes Implementation
// Version: 1.0.0
// =============================================================================

#include <fixrec/schema/shape.hpp>
#include <algorithm>
#include <sstream>

namespace fixrec {
namespace schema {

namespace {

struct TypeNameVisitor {
    String operator()(const BooleanShape&) const { return "bool"; }
    
    String operator()(const SignedIntShape& s) const {
        return s.native ? std::format("native int({})", s.bits) : std::format("int{}", s.bits);
    }
    
    String operator()(const UnsignedIntShape& s) const {
        return s.native ? std::format("native uint({})", s.bits) : std::format("uint{}", s.bits);
    }
    
    String operator()(const FloatShape& s) const { return std::format("float{}", s.bits); }
    
    String operator()(const TextShape& s) const {
        return s.fixed_width ? std::format("text[{}]", *s.fixed_width) : String("text");
    }
    
    String operator()(const NestedShape& s) const {
        return s.schema ? "record " + s.schema->record_name() : String("record");
    }
    
    String operator()(const ReferenceShape& s) const {
        return "ref<" + (s.target ? s.target->type_name() : String("?")) + ">";
    }
    
    String operator()(const FixedArrayShape& s) const {
        return std::format("array<{}, {}>", s.size, s.element ? s.element->type_name() : String("?"));
    }
    
    String operator()(const SequenceShape& s) const {
        return "sequence<" + (s.element ? s.element->type_name() : String("?")) + ">";
    }
};

} // anonymous namespace

bool FieldShape::is_scalar() const {
    return std::holds_alternative<BooleanShape>(kind) ||
           std::holds_alternative<SignedIntShape>(kind) ||
           std::holds_alternative<UnsignedIntShape>(kind) ||
           std::holds_alternative<FloatShape>(kind) ||
           std::holds_alternative<TextShape>(kind);
}

Size FieldShape::static_element_count() const {
    if (const auto* array = std::get_if<FixedArrayShape>(&kind)) {
        return array->size;
    }
    if (const auto* reference = std::get_if<ReferenceShape>(&kind)) {
        return reference->target ? reference->target->static_element_count() : 1;
    }
    return 1;
}

String FieldShape::type_name() const {
    return std::visit(TypeNameVisitor{}, kind);
}

Optional<Size> SchemaInfo::index_of(StringView name) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
        [name](const FieldInfo& f) { return f.name == name; });
    if (it == fields_.end()) return nullopt;
    return static_cast<Size>(std::distance(fields_.begin(), it));
}

Size SchemaInfo::tagged_field_count() const {
    return static_cast<Size>(std::count_if(fields_.begin(), fields_.end(),
        [](const FieldInfo& f) { return !f.is_inert(); }));
}

} // namespace schema
} // namespace fixrec
