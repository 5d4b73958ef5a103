#include "../framework/test_framework.hpp"
#include "fixrec/layout/field_descriptor.hpp"
#include <limits>

using namespace fixrec;
using namespace fixrec::layout;
using namespace fixrec::test;

void test_parse_position_length() {
    auto result = FieldDescriptor::parse("4,10");
    ASSERT_OK(result);
    ASSERT_EQ(result->position, 4u);
    ASSERT_EQ(result->length, 10u);
    ASSERT_FALSE(result->has_occurrence());
    ASSERT_EQ(result->start_index(), 3u);
    ASSERT_EQ(result->extent(), 10u);
}

void test_parse_occurrence() {
    auto result = FieldDescriptor::parse("34,10,2");
    ASSERT_OK(result);
    ASSERT_EQ(result->position, 34u);
    ASSERT_EQ(result->length, 10u);
    ASSERT_TRUE(result->has_occurrence());
    ASSERT_EQ(*result->occurrence, 2u);
    ASSERT_EQ(result->extent(), 20u);
    ASSERT_EQ(result->extent(5), 20u);
}

void test_parse_ignores_extra_tokens() {
    auto result = FieldDescriptor::parse("1,5,3,junk,more");
    ASSERT_OK(result);
    ASSERT_EQ(*result->occurrence, 3u);
}

void test_parse_signed_tokens() {
    auto plus = FieldDescriptor::parse("+2,+3");
    ASSERT_OK(plus);
    ASSERT_EQ(plus->position, 2u);
    ASSERT_EQ(plus->length, 3u);
    
    ASSERT_ERROR_CODE(FieldDescriptor::parse("-2,3"), ErrorCode::INVALID_POSITION);
    ASSERT_ERROR_CODE(FieldDescriptor::parse("+-2,3"), ErrorCode::INVALID_POSITION);
}

void test_missing_parameters() {
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1"), ErrorCode::MISSING_PARAMETERS);
    ASSERT_ERROR_CODE(FieldDescriptor::parse(""), ErrorCode::MISSING_PARAMETERS);
}

void test_invalid_position() {
    ASSERT_ERROR_CODE(FieldDescriptor::parse("0,5"), ErrorCode::INVALID_POSITION);
    ASSERT_ERROR_CODE(FieldDescriptor::parse("x,5"), ErrorCode::INVALID_POSITION);
    ASSERT_ERROR_CODE(FieldDescriptor::parse(" 1,5"), ErrorCode::INVALID_POSITION);
    ASSERT_ERROR_CODE(FieldDescriptor::parse(",5"), ErrorCode::INVALID_POSITION);
}

void test_invalid_length() {
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1,0"), ErrorCode::INVALID_LENGTH);
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1,-4"), ErrorCode::INVALID_LENGTH);
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1,"), ErrorCode::INVALID_LENGTH);
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1,5.5"), ErrorCode::INVALID_LENGTH);
}

void test_invalid_occurrence() {
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1,5,1"), ErrorCode::INVALID_OCCURRENCE);
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1,5,0"), ErrorCode::INVALID_OCCURRENCE);
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1,5,"), ErrorCode::INVALID_OCCURRENCE);
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1,5,two"), ErrorCode::INVALID_OCCURRENCE);
}

void test_extent_must_be_addressable() {
    // 4 x 2^62 bytes does not fit in Size
    ASSERT_ERROR_CODE(FieldDescriptor::parse("1,4,4611686018427387904"), ErrorCode::INVALID_OCCURRENCE);
    ASSERT_ERROR_CODE(FieldDescriptor::parse("9223372036854775807,9223372036854775807,2"),
                      ErrorCode::INVALID_OCCURRENCE);
    
    auto largest = FieldDescriptor::parse("1,4,4611686018427387903");
    ASSERT_OK(largest);
    ASSERT_EQ(largest->extent(), std::numeric_limits<Size>::max() - 3);
    
    auto wide = FieldDescriptor::parse("1,9223372036854775807");
    ASSERT_OK(wide);
    ASSERT_EQ(wide->extent(4), std::numeric_limits<Size>::max());
}

void test_saturating_arithmetic() {
    constexpr Size max = std::numeric_limits<Size>::max();
    ASSERT_EQ(saturating_mul(4, Size{1} << 62), max);
    ASSERT_EQ(saturating_mul(0, max), 0u);
    ASSERT_EQ(saturating_mul(3, 5), 15u);
    ASSERT_EQ(saturating_add(max - 1, 2), max);
    ASSERT_EQ(saturating_add(2, 3), 5u);
}

void test_parse_is_deterministic() {
    auto first = FieldDescriptor::parse("17,15");
    auto second = FieldDescriptor::parse("17,15");
    ASSERT_OK(first);
    ASSERT_OK(second);
    ASSERT_EQ(first.value(), second.value());
    
    auto bad1 = FieldDescriptor::parse("0,1");
    auto bad2 = FieldDescriptor::parse("0,1");
    ASSERT_EQ(bad1.error().code, bad2.error().code);
    ASSERT_EQ(bad1.error().message, bad2.error().message);
}

void test_to_string() {
    ASSERT_EQ(FieldDescriptor::parse("+1,3")->to_string(), "1,3");
    ASSERT_EQ(FieldDescriptor::parse("34,10,2,x")->to_string(), "34,10,2");
}

void test_parse_tag_integer() {
    ASSERT_EQ(parse_tag_integer("42").value_or(0), 42);
    ASSERT_EQ(parse_tag_integer("-7").value_or(0), -7);
    ASSERT_EQ(parse_tag_integer("+7").value_or(0), 7);
    ASSERT_FALSE(parse_tag_integer("").has_value());
    ASSERT_FALSE(parse_tag_integer("+").has_value());
    ASSERT_FALSE(parse_tag_integer("7 ").has_value());
    ASSERT_FALSE(parse_tag_integer("99999999999999999999").has_value());
}

int main() {
    TestSuite suite("Layout Descriptor Tests");
    
    suite.add_test("Parse position,length", test_parse_position_length);
    suite.add_test("Parse occurrence", test_parse_occurrence);
    suite.add_test("Extra tokens ignored", test_parse_ignores_extra_tokens);
    suite.add_test("Signed tokens", test_parse_signed_tokens);
    suite.add_test("Missing parameters", test_missing_parameters);
    suite.add_test("Invalid position", test_invalid_position);
    suite.add_test("Invalid length", test_invalid_length);
    suite.add_test("Invalid occurrence", test_invalid_occurrence);
    suite.add_test("Addressable extent", test_extent_must_be_addressable);
    suite.add_test("Saturating arithmetic", test_saturating_arithmetic);
    suite.add_test("Deterministic", test_parse_is_deterministic);
    suite.add_test("to_string", test_to_string);
    suite.add_test("parse_tag_integer", test_parse_tag_integer);
    
    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
