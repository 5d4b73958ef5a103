// =============================================================================
// fixrec - Record Schemas
// Version: 1.0.0
// =============================================================================
// A record type becomes decodable by specialising RecordLayout<T>:
//
//     namespace fixrec {
//     template<>
//     struct RecordLayout<Account> {
//         static constexpr const char* name = "Account";
//         static void define(SchemaBuilder<Account>& s) {
//             s.field("Name", &Account::name, "1,3")
//              .field("Age", &Account::age, "14,3")
//              .field("Notes", &Account::notes);      // inert
//         }
//     };
//     }
//
// Field order in define() is the field index order used by decode windows.
// =============================================================================

#ifndef FIXREC_DECODER_RECORD_SCHEMA_HPP
#define FIXREC_DECODER_RECORD_SCHEMA_HPP

#include <fixrec/common/error.hpp>
#include <fixrec/config/decode_options.hpp>
#include <fixrec/layout/field_descriptor.hpp>
#include <fixrec/schema/shape.hpp>

namespace fixrec {

template<typename Record>
class SchemaBuilder;

template<typename Record>
struct RecordLayout;

template<typename T>
concept DecodableRecord = std::is_class_v<T> && std::default_initializable<T> &&
    requires(SchemaBuilder<T>& builder) {
        { RecordLayout<T>::name } -> std::convertible_to<StringView>;
        RecordLayout<T>::define(builder);
    };

// Member-type specific decoding; specialisations live in field_codec.hpp.
template<typename Member>
class FieldCodec;

template<typename Record>
class RecordSchema;

namespace detail {

template<typename Record>
Result<void> decode_fields(BufferView buffer, const RecordSchema<Record>& schema,
                           Record& target, Size start_field, Size max_fields);

} // namespace detail

// =============================================================================
// Field bindings
// =============================================================================

template<typename Record>
class FieldBinding {
public:
    virtual ~FieldBinding() = default;
    
    // Number of bytes the field occupies for the given descriptor
    [[nodiscard]] virtual Size extent(const layout::FieldDescriptor& descriptor) const = 0;
    
    [[nodiscard]] virtual Result<void> assign(Record& target, BufferView slice,
                                              const layout::FieldDescriptor& descriptor) const = 0;
    
    [[nodiscard]] virtual schema::ShapePtr shape() const = 0;
};

template<typename Record, typename Member>
class MemberBinding final : public FieldBinding<Record> {
private:
    Member Record::* member_;
    FieldCodec<Member> codec_;
    
public:
    MemberBinding(Member Record::* member, const DecodeOptions& options)
        : member_(member), codec_(options) {}
    
    Size extent(const layout::FieldDescriptor& descriptor) const override {
        return codec_.extent(descriptor);
    }
    
    Result<void> assign(Record& target, BufferView slice,
                        const layout::FieldDescriptor& descriptor) const override {
        return codec_.decode(target.*member_, slice, descriptor);
    }
    
    schema::ShapePtr shape() const override { return codec_.shape(); }
};

// =============================================================================
// RecordSchema
// =============================================================================

template<typename Record>
class RecordSchema final : public schema::SchemaInfo {
private:
    Vector<UniquePtr<FieldBinding<Record>>> bindings_;
    
    friend class SchemaBuilder<Record>;
    
    RecordSchema(String record_name, DecodeOptions options)
        : SchemaInfo(std::move(record_name), options) {}
    
    void add(String name, Optional<String> tag, UniquePtr<FieldBinding<Record>> binding) {
        schema::FieldInfo info;
        info.name = std::move(name);
        info.tag = std::move(tag);
        info.shape = binding->shape();
        fields_.push_back(std::move(info));
        bindings_.push_back(std::move(binding));
    }
    
public:
    [[nodiscard]] const FieldBinding<Record>& binding(Size index) const {
        return *bindings_.at(index);
    }
};

// =============================================================================
// SchemaBuilder
// =============================================================================

template<typename Record>
class SchemaBuilder {
private:
    DecodeOptions options_;
    UniquePtr<RecordSchema<Record>> schema_;
    
public:
    explicit SchemaBuilder(String record_name, DecodeOptions options = default_decode_options())
        : options_(options)
        , schema_(new RecordSchema<Record>(std::move(record_name), options)) {}
    
    [[nodiscard]] const DecodeOptions& options() const { return options_; }
    
    // Field decoded from the bytes described by `tag` ("pos,len[,occurs]").
    // The tag is validated when a decode call reaches the field.
    template<typename Member>
    SchemaBuilder& field(String name, Member Record::* member, String tag) {
        schema_->add(std::move(name), std::move(tag),
                     std::make_unique<MemberBinding<Record, Member>>(member, options_));
        return *this;
    }
    
    // Inert field: counted for field indices, never decoded.
    template<typename Member>
    SchemaBuilder& field(String name, Member Record::* member) {
        schema_->add(std::move(name), nullopt,
                     std::make_unique<MemberBinding<Record, Member>>(member, options_));
        return *this;
    }
    
    [[nodiscard]] SharedPtr<const RecordSchema<Record>> build() {
        return SharedPtr<const RecordSchema<Record>>(std::move(schema_));
    }
};

// =============================================================================
// Schema lookup
// =============================================================================

template<DecodableRecord Record>
[[nodiscard]] SharedPtr<const RecordSchema<Record>> build_schema(const DecodeOptions& options) {
    SchemaBuilder<Record> builder(String(RecordLayout<Record>::name), options);
    RecordLayout<Record>::define(builder);
    return builder.build();
}

// Schema built once per type with the process defaults in effect at first use.
template<DecodableRecord Record>
[[nodiscard]] const RecordSchema<Record>& schema_of() {
    static const SharedPtr<const RecordSchema<Record>> schema =
        build_schema<Record>(default_decode_options());
    return *schema;
}

} // namespace fixrec

#endif // FIXREC_DECODER_RECORD_SCHEMA_HPP
