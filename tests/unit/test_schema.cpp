#include "../framework/test_framework.hpp"
#include "fixrec/decoder/record_schema.hpp"
#include "fixrec/decoder/field_codec.hpp"
#include "fixrec/schema/inspector.hpp"

using namespace fixrec;
using namespace fixrec::schema;
using namespace fixrec::test;

struct Line {
    UInt32 sku = 0;
    float price = 0.0f;
};

struct Order {
    FixedString<8> id;
    coercion::NativeUInt customer;
    Int8 priority = 0;
    std::array<Line, 2> lines;
    Vector<UniquePtr<Line>> extras;
    UniquePtr<String> note;
    bool paid = false;
    String internal;
};

namespace fixrec {

template<>
struct RecordLayout<Line> {
    static constexpr const char* name = "Line";
    static void define(SchemaBuilder<Line>& s) {
        s.field("Sku", &Line::sku, "1,6")
         .field("Price", &Line::price, "7,8");
    }
};

template<>
struct RecordLayout<Order> {
    static constexpr const char* name = "Order";
    static void define(SchemaBuilder<Order>& s) {
        s.field("Id", &Order::id, "1,8")
         .field("Customer", &Order::customer, "9,10")
         .field("Priority", &Order::priority, "19,2")
         .field("Lines", &Order::lines, "21,14")
         .field("Extras", &Order::extras, "49,14,3")
         .field("Note", &Order::note, "91,20")
         .field("Paid", &Order::paid, "111,1")
         .field("Internal", &Order::internal);
    }
};

} // namespace fixrec

static_assert(DecodableRecord<Order>);
static_assert(DecodableRecord<Line>);
static_assert(!DecodableRecord<String>);
static_assert(!DecodableRecord<int>);

void test_field_order_and_tags() {
    const auto& schema = schema_of<Order>();
    ASSERT_EQ(schema.record_name(), "Order");
    ASSERT_EQ(schema.size(), 8u);
    ASSERT_EQ(schema.tagged_field_count(), 7u);
    ASSERT_EQ(schema.field(0).name, "Id");
    ASSERT_EQ(*schema.field(3).tag, "21,14");
    ASSERT_TRUE(schema.field(7).is_inert());
    ASSERT_EQ(schema.index_of("Paid").value_or(99), 6u);
    ASSERT_FALSE(schema.index_of("Missing").has_value());
}

void test_shape_kinds() {
    const auto& schema = schema_of<Order>();
    ASSERT_EQ(schema.field(0).shape->type_name(), "text[8]");
    ASSERT_EQ(schema.field(1).shape->type_name(), "native uint(64)");
    ASSERT_EQ(schema.field(2).shape->type_name(), "int8");
    ASSERT_EQ(schema.field(3).shape->type_name(), "array<2, record Line>");
    ASSERT_EQ(schema.field(4).shape->type_name(), "sequence<ref<record Line>>");
    ASSERT_EQ(schema.field(5).shape->type_name(), "ref<text>");
    ASSERT_EQ(schema.field(6).shape->type_name(), "bool");
    ASSERT_EQ(schema.field(7).shape->type_name(), "text");
    
    ASSERT_TRUE(schema.field(6).shape->is_scalar());
    ASSERT_TRUE(schema.field(3).shape->is_fixed_array());
    ASSERT_TRUE(schema.field(4).shape->is_sequence());
    ASSERT_EQ(schema.field(3).shape->static_element_count(), 2u);
    ASSERT_EQ(schema.field(4).shape->static_element_count(), 1u);
}

void test_nested_shape_points_at_schema() {
    const auto& lines = schema_of<Order>().field(3).shape;
    const auto& array = std::get<FixedArrayShape>(lines->kind);
    const auto& nested = std::get<NestedShape>(array.element->kind);
    ASSERT_TRUE(nested.schema != nullptr);
    ASSERT_EQ(nested.schema->record_name(), "Line");
    ASSERT_EQ(nested.schema->size(), 2u);
    ASSERT_EQ(nested.schema->field(1).shape->type_name(), "float32");
}

void test_native_width_captured() {
    DecodeOptions options;
    options.native_int_bits = 32;
    auto schema = build_schema<Order>(options);
    ASSERT_EQ(schema->field(1).shape->type_name(), "native uint(32)");
    ASSERT_TRUE(schema->options() == options);
    
    const auto& kind = std::get<UnsignedIntShape>(schema->field(1).shape->kind);
    ASSERT_EQ(kind.bits, 32);
    ASSERT_TRUE(kind.native);
}

void test_describe_schema() {
    auto text = describe_schema(schema_of<Order>());
    ASSERT_TRUE(text.find("Order (8 fields, 7 tagged)") == 0);
    ASSERT_TRUE(text.find("Lines") != String::npos);
    ASSERT_TRUE(text.find("\"21,14\"") != String::npos);
    ASSERT_TRUE(text.find("(inert)") != String::npos);
    // Nested record fields are listed below their parent field
    ASSERT_TRUE(text.find("Sku") > text.find("Lines"));
    ASSERT_TRUE(text.find("\"1,6\"") != String::npos);
    
    ASSERT_EQ(describe_shape(*schema_of<Order>().field(5).shape), "ref<text>");
}

void test_schema_builder_direct() {
    SchemaBuilder<Line> builder("AdHocLine");
    builder.field("Price", &Line::price, "1,8");
    auto schema = builder.build();
    ASSERT_EQ(schema->record_name(), "AdHocLine");
    ASSERT_EQ(schema->size(), 1u);
    ASSERT_EQ(schema->field(0).shape->type_name(), "float32");
}

int main() {
    TestSuite suite("Record Schema Tests");
    
    suite.add_test("Field order and tags", test_field_order_and_tags);
    suite.add_test("Shape kinds", test_shape_kinds);
    suite.add_test("Nested shape", test_nested_shape_points_at_schema);
    suite.add_test("Native width captured", test_native_width_captured);
    suite.add_test("describe_schema", test_describe_schema);
    suite.add_test("SchemaBuilder", test_schema_builder_direct);
    
    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
