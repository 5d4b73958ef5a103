// =============================================================================
// fixrec - Field Shapes and Schema Metadata
// Version: 1.0.0
// =============================================================================
// Runtime description of a record type: its fields in declaration order,
// each with a layout tag (or none, for inert fields) and a shape. Shapes form
// a closed set; anything a record member can be is one of the alternatives
// of FieldShape::Kind.
// =============================================================================

#ifndef FIXREC_SCHEMA_SHAPE_HPP
#define FIXREC_SCHEMA_SHAPE_HPP

#include <fixrec/common/types.hpp>
#include <fixrec/config/decode_options.hpp>

namespace fixrec {
namespace schema {

class SchemaInfo;
struct FieldShape;

using ShapePtr = SharedPtr<const FieldShape>;

struct BooleanShape {};

struct SignedIntShape {
    UInt8 bits = 64;
    bool native = false;    // width taken from DecodeOptions
};

struct UnsignedIntShape {
    UInt8 bits = 64;
    bool native = false;
};

struct FloatShape {
    UInt8 bits = 64;
};

struct TextShape {
    Optional<Size> fixed_width;   // FixedString<N> targets
};

struct NestedShape {
    SharedPtr<const SchemaInfo> schema;
};

// Pointer-like member, allocated on demand before decoding into it
struct ReferenceShape {
    ShapePtr target;
};

struct FixedArrayShape {
    Size size = 0;
    ShapePtr element;
};

// Resized to the OCCURS count of its layout tag
struct SequenceShape {
    ShapePtr element;
};

struct FieldShape {
    using Kind = Variant<BooleanShape, SignedIntShape, UnsignedIntShape, FloatShape,
                         TextShape, NestedShape, ReferenceShape, FixedArrayShape,
                         SequenceShape>;
    Kind kind;
    
    [[nodiscard]] bool is_scalar() const;
    [[nodiscard]] bool is_fixed_array() const { return std::holds_alternative<FixedArrayShape>(kind); }
    [[nodiscard]] bool is_sequence() const { return std::holds_alternative<SequenceShape>(kind); }
    
    // Element count used to size a field without an occurrence: the array
    // size for fixed arrays (seen through references), 1 for everything else.
    [[nodiscard]] Size static_element_count() const;
    
    // "int32", "native uint(64)", "text[8]", "array<3, float64>", ...
    [[nodiscard]] String type_name() const;
};

template<typename T>
[[nodiscard]] ShapePtr make_shape(T alternative) {
    return std::make_shared<const FieldShape>(FieldShape{FieldShape::Kind(std::move(alternative))});
}

// =============================================================================
// Field metadata
// =============================================================================

struct FieldInfo {
    String name;
    Optional<String> tag;     // layout tag text; nullopt for inert fields
    ShapePtr shape;
    
    [[nodiscard]] bool is_inert() const { return !tag.has_value(); }
};

// =============================================================================
// Schema metadata (type-erased view of RecordSchema<T>)
// =============================================================================

class SchemaInfo {
protected:
    String record_name_;
    DecodeOptions options_;
    Vector<FieldInfo> fields_;
    
    SchemaInfo(String record_name, DecodeOptions options)
        : record_name_(std::move(record_name)), options_(options) {}
    
public:
    virtual ~SchemaInfo() = default;
    
    SchemaInfo(const SchemaInfo&) = delete;
    SchemaInfo& operator=(const SchemaInfo&) = delete;
    
    [[nodiscard]] const String& record_name() const { return record_name_; }
    [[nodiscard]] const DecodeOptions& options() const { return options_; }
    [[nodiscard]] Size size() const { return fields_.size(); }
    [[nodiscard]] bool empty() const { return fields_.empty(); }
    [[nodiscard]] const FieldInfo& field(Size index) const { return fields_.at(index); }
    [[nodiscard]] const Vector<FieldInfo>& fields() const { return fields_; }
    
    [[nodiscard]] Optional<Size> index_of(StringView name) const;
    [[nodiscard]] Size tagged_field_count() const;
};

} // namespace schema
} // namespace fixrec

#endif // FIXREC_SCHEMA_SHAPE_HPP
