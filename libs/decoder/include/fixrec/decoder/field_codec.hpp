// =============================================================================
// fixrec - Field Codecs
// Version: 1.0.0
// =============================================================================
// One FieldCodec specialisation per kind of record member:
//
//   scalar targets        bool, integers, float/double, String, FixedString<N>,
//                         NativeInt, NativeUInt
//   nested records        any DecodableRecord
//   references            UniquePtr<T>, allocated when null
//   fixed arrays          std::array<T, N>, N slices of `length` bytes
//   sequences             Vector<T>, `occurs` slices of `length` bytes
//
// Member types outside this set have no codec and fail to compile when
// registered with SchemaBuilder::field().
// =============================================================================

#ifndef FIXREC_DECODER_FIELD_CODEC_HPP
#define FIXREC_DECODER_FIELD_CODEC_HPP

#include <fixrec/decoder/record_schema.hpp>
#include <fixrec/coercion/coercion.hpp>

namespace fixrec {

namespace detail {

// Descriptor handed to each element of an array or sequence
[[nodiscard]] inline layout::FieldDescriptor element_descriptor(const layout::FieldDescriptor& field) {
    layout::FieldDescriptor element;
    element.position = 1;
    element.length = field.length;
    return element;
}

[[nodiscard]] inline String element_label(Size index) {
    return std::format("[{}]", index);
}

} // namespace detail

// =============================================================================
// Scalars
// =============================================================================

template<coercion::ScalarTarget Member>
class FieldCodec<Member> {
private:
    UInt8 native_bits_;
    
public:
    explicit FieldCodec(const DecodeOptions& options) : native_bits_(options.native_int_bits) {}
    
    [[nodiscard]] Size extent(const layout::FieldDescriptor& descriptor) const {
        return descriptor.length;
    }
    
    [[nodiscard]] Result<void> decode(Member& target, BufferView slice,
                                      const layout::FieldDescriptor&) const {
        return coercion::coerce(slice.str(), target, native_bits_);
    }
    
    [[nodiscard]] schema::ShapePtr shape() const {
        constexpr auto bits = static_cast<UInt8>(sizeof(Member) * 8);
        if constexpr (std::same_as<Member, bool>) {
            return schema::make_shape(schema::BooleanShape{});
        } else if constexpr (std::same_as<Member, coercion::NativeInt>) {
            return schema::make_shape(schema::SignedIntShape{native_bits_, true});
        } else if constexpr (std::same_as<Member, coercion::NativeUInt>) {
            return schema::make_shape(schema::UnsignedIntShape{native_bits_, true});
        } else if constexpr (std::is_integral_v<Member> && std::is_signed_v<Member>) {
            return schema::make_shape(schema::SignedIntShape{bits, false});
        } else if constexpr (std::is_integral_v<Member>) {
            return schema::make_shape(schema::UnsignedIntShape{bits, false});
        } else if constexpr (std::is_floating_point_v<Member>) {
            return schema::make_shape(schema::FloatShape{bits});
        } else if constexpr (std::same_as<Member, String>) {
            return schema::make_shape(schema::TextShape{});
        } else {
            return schema::make_shape(schema::TextShape{Member::capacity});
        }
    }
};

// =============================================================================
// Nested records
// =============================================================================

template<DecodableRecord Member>
class FieldCodec<Member> {
private:
    SharedPtr<const RecordSchema<Member>> schema_;
    
public:
    // Nested schemas are built with the options of the enclosing schema.
    explicit FieldCodec(const DecodeOptions& options) : schema_(build_schema<Member>(options)) {}
    
    [[nodiscard]] Size extent(const layout::FieldDescriptor& descriptor) const {
        return descriptor.length;
    }
    
    // Nested layout positions are relative to the start of the slice.
    [[nodiscard]] Result<void> decode(Member& target, BufferView slice,
                                      const layout::FieldDescriptor&) const {
        return detail::decode_fields(slice, *schema_, target, 0, 0);
    }
    
    [[nodiscard]] schema::ShapePtr shape() const {
        return schema::make_shape(schema::NestedShape{schema_});
    }
};

// =============================================================================
// References
// =============================================================================

template<typename Target>
class FieldCodec<UniquePtr<Target>> {
private:
    FieldCodec<Target> target_;
    
public:
    explicit FieldCodec(const DecodeOptions& options) : target_(options) {}
    
    [[nodiscard]] Size extent(const layout::FieldDescriptor& descriptor) const {
        return target_.extent(descriptor);
    }
    
    [[nodiscard]] Result<void> decode(UniquePtr<Target>& target, BufferView slice,
                                      const layout::FieldDescriptor& descriptor) const {
        if (!target) {
            target = std::make_unique<Target>();
        }
        return target_.decode(*target, slice, descriptor);
    }
    
    [[nodiscard]] schema::ShapePtr shape() const {
        return schema::make_shape(schema::ReferenceShape{target_.shape()});
    }
};

// =============================================================================
// Fixed arrays
// =============================================================================

template<typename Element, Size N>
class FieldCodec<std::array<Element, N>> {
private:
    FieldCodec<Element> element_;
    
public:
    explicit FieldCodec(const DecodeOptions& options) : element_(options) {}
    
    [[nodiscard]] Size extent(const layout::FieldDescriptor& descriptor) const {
        return layout::saturating_mul(descriptor.length, N);
    }
    
    // Elements whose slice lies entirely past a clipped field are left
    // untouched.
    [[nodiscard]] Result<void> decode(std::array<Element, N>& target, BufferView slice,
                                      const layout::FieldDescriptor& descriptor) const {
        const auto element = detail::element_descriptor(descriptor);
        for (Size i = 0; i < N; ++i) {
            auto part = slice.subview(i * descriptor.length, descriptor.length);
            if (part.empty()) break;
            
            auto result = element_.decode(target[i], part, element);
            if (result.is_error()) {
                result.error().within_field(detail::element_label(i));
                return result;
            }
        }
        return make_success();
    }
    
    [[nodiscard]] schema::ShapePtr shape() const {
        return schema::make_shape(schema::FixedArrayShape{N, element_.shape()});
    }
};

// =============================================================================
// Sequences
// =============================================================================

template<typename Element>
class FieldCodec<Vector<Element>> {
private:
    FieldCodec<Element> element_;
    
    Result<void> decode_element(Vector<Element>& target, Size index, BufferView part,
                                const layout::FieldDescriptor& element) const {
        if constexpr (std::same_as<Element, bool>) {
            bool value = false;
            auto result = element_.decode(value, part, element);
            if (result.is_success()) target[index] = value;
            return result;
        } else {
            return element_.decode(target[index], part, element);
        }
    }
    
public:
    explicit FieldCodec(const DecodeOptions& options) : element_(options) {}
    
    [[nodiscard]] Size extent(const layout::FieldDescriptor& descriptor) const {
        return descriptor.extent();
    }
    
    // The sequence is replaced by exactly `occurs` fresh elements, then
    // each element is decoded from its own slice.
    [[nodiscard]] Result<void> decode(Vector<Element>& target, BufferView slice,
                                      const layout::FieldDescriptor& descriptor) const {
        if (!descriptor.occurrence) {
            return make_error<void>(ErrorCode::MISSING_OCCURRENCE,
                std::format("Sequence field needs an occurrence count in its layout \"{}\"",
                            descriptor.to_string()));
        }
        
        const Size count = *descriptor.occurrence;
        if (count > target.max_size()) {
            return make_error<void>(ErrorCode::INVALID_OCCURRENCE,
                std::format("Occurrence {} exceeds the largest sequence this field can hold", count));
        }
        target.clear();
        target.resize(count);
        
        const auto element = detail::element_descriptor(descriptor);
        for (Size i = 0; i < count; ++i) {
            auto part = slice.subview(i * descriptor.length, descriptor.length);
            if (part.empty()) break;
            
            auto result = decode_element(target, i, part, element);
            if (result.is_error()) {
                result.error().within_field(detail::element_label(i));
                return result;
            }
        }
        return make_success();
    }
    
    [[nodiscard]] schema::ShapePtr shape() const {
        return schema::make_shape(schema::SequenceShape{element_.shape()});
    }
};

} // namespace fixrec

#endif // FIXREC_DECODER_FIELD_CODEC_HPP
