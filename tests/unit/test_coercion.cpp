#include "../framework/test_framework.hpp"
#include "fixrec/coercion/coercion.hpp"
#include <limits>

using namespace fixrec;
using namespace fixrec::coercion;
using namespace fixrec::test;

void test_boolean_forms() {
    for (const char* text : {"1", "t", "T", "TRUE", "true", "True"}) {
        auto result = parse_boolean(text);
        ASSERT_OK(result);
        ASSERT_TRUE(result.value());
    }
    for (const char* text : {"0", "f", "F", "FALSE", "false", "False"}) {
        auto result = parse_boolean(text);
        ASSERT_OK(result);
        ASSERT_FALSE(result.value());
    }
}

void test_boolean_rejects() {
    ASSERT_ERROR_CODE(parse_boolean("yes"), ErrorCode::INVALID_BOOLEAN);
    ASSERT_ERROR_CODE(parse_boolean("tRUE"), ErrorCode::INVALID_BOOLEAN);
    ASSERT_ERROR_CODE(parse_boolean(" 1"), ErrorCode::INVALID_BOOLEAN);
    ASSERT_ERROR_CODE(parse_boolean(""), ErrorCode::INVALID_BOOLEAN);
}

void test_signed_parse() {
    ASSERT_EQ(parse_signed("019", 64).value(), 19);
    ASSERT_EQ(parse_signed("-128", 8).value(), -128);
    ASSERT_EQ(parse_signed("+127", 8).value(), 127);
    ASSERT_EQ(parse_signed("-9223372036854775808", 64).value(), std::numeric_limits<Int64>::min());
}

void test_signed_range() {
    ASSERT_ERROR_CODE(parse_signed("128", 8), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_signed("-129", 8), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_signed("32768", 16), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_signed("9223372036854775808", 64), ErrorCode::INVALID_INTEGER);
}

void test_signed_junk() {
    ASSERT_ERROR_CODE(parse_signed("12a", 32), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_signed(" 12", 32), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_signed("", 32), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_signed("+", 32), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_signed("0x10", 32), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_signed("1", 12), ErrorCode::INVALID_ARGUMENT);
}

void test_unsigned_parse() {
    ASSERT_EQ(parse_unsigned("255", 8).value(), 255u);
    ASSERT_EQ(parse_unsigned("18446744073709551615", 64).value(), std::numeric_limits<UInt64>::max());
    ASSERT_ERROR_CODE(parse_unsigned("256", 8), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_unsigned("-1", 32), ErrorCode::INVALID_INTEGER);
    ASSERT_ERROR_CODE(parse_unsigned("+1", 32), ErrorCode::INVALID_INTEGER);
}

void test_float_parse() {
    ASSERT_NEAR(parse_float("3.25", 64).value(), 3.25, 1e-12);
    ASSERT_NEAR(parse_float("-1.5e3", 64).value(), -1500.0, 1e-9);
    ASSERT_NEAR(parse_float("+0.5", 32).value(), 0.5, 1e-7);
    ASSERT_ERROR_CODE(parse_float("1.2.3", 64), ErrorCode::INVALID_FLOAT);
    ASSERT_ERROR_CODE(parse_float("", 64), ErrorCode::INVALID_FLOAT);
    ASSERT_ERROR_CODE(parse_float("1e39", 32), ErrorCode::INVALID_FLOAT);
    ASSERT_ERROR_CODE(parse_float("1e400", 64), ErrorCode::INVALID_FLOAT);
}

void test_error_carries_raw_text() {
    auto result = parse_signed("1\x01", 32);
    ASSERT_TRUE(result.is_error());
    ASSERT_EQ(result.error().component, "coercion");
    ASSERT_EQ(result.error().context_value("raw").value_or(""), "1\\x01");
}

void test_coerce_integral_targets() {
    Int16 small = 0;
    ASSERT_OK(coerce("-300", small));
    ASSERT_EQ(small, -300);
    
    UInt8 byte = 7;
    ASSERT_ERROR_CODE(coerce("300", byte), ErrorCode::INVALID_INTEGER);
    ASSERT_EQ(byte, 7);
}

void test_coerce_native_width() {
    NativeInt wide;
    ASSERT_OK(coerce("40000", wide));
    ASSERT_EQ(wide.value, 40000);
    
    NativeInt narrow;
    ASSERT_ERROR_CODE(coerce("40000", narrow, 16), ErrorCode::INVALID_INTEGER);
    
    NativeUInt unsigned_narrow;
    ASSERT_OK(coerce("65535", unsigned_narrow, 16));
    ASSERT_EQ(unsigned_narrow.value, 65535u);
}

void test_coerce_text() {
    String text = "old";
    ASSERT_OK(coerce(" 12 ", text));
    ASSERT_EQ(text, " 12 ");
    
    FixedString<5> fixed;
    ASSERT_OK(coerce("AB", fixed));
    ASSERT_EQ(fixed.str(), "AB   ");
    ASSERT_EQ(fixed.trimmed(), "AB");
    
    FixedString<3> narrow("XYZ");
    auto too_long = coerce("ABCDEF", narrow);
    ASSERT_ERROR_CODE(too_long, ErrorCode::TEXT_TOO_LONG);
    ASSERT_EQ(too_long.error().context_value("raw").value_or(""), "ABCDEF");
    ASSERT_EQ(narrow.str(), "XYZ");
    
    ASSERT_OK(coerce("ABC", narrow));
    ASSERT_EQ(narrow.str(), "ABC");
}

void test_float32_single_rounding() {
    // Rounds to the largest float even though the decimal exceeds it
    auto largest = parse_float("3.4028235e38", 32);
    ASSERT_OK(largest);
    ASSERT_EQ(static_cast<Float32>(largest.value()), std::numeric_limits<Float32>::max());
    
    auto tenth = parse_float("0.1", 32);
    ASSERT_OK(tenth);
    ASSERT_EQ(tenth.value(), static_cast<Float64>(0.1f));
    
    ASSERT_ERROR_CODE(parse_float("3.5e38", 32), ErrorCode::INVALID_FLOAT);
}

void test_coerce_bool_and_float() {
    bool flag = false;
    ASSERT_OK(coerce("T", flag));
    ASSERT_TRUE(flag);
    
    float f = 0.0f;
    ASSERT_OK(coerce("2.5", f));
    ASSERT_NEAR(f, 2.5f, 1e-6f);
    
    double d = 9.0;
    ASSERT_ERROR_CODE(coerce("abc", d), ErrorCode::INVALID_FLOAT);
    ASSERT_NEAR(d, 9.0, 1e-12);
}

int main() {
    TestSuite suite("Type Coercion Tests");
    
    suite.add_test("Boolean forms", test_boolean_forms);
    suite.add_test("Boolean rejects", test_boolean_rejects);
    suite.add_test("Signed parse", test_signed_parse);
    suite.add_test("Signed range", test_signed_range);
    suite.add_test("Signed junk", test_signed_junk);
    suite.add_test("Unsigned parse", test_unsigned_parse);
    suite.add_test("Float parse", test_float_parse);
    suite.add_test("Float32 rounding", test_float32_single_rounding);
    suite.add_test("Error raw context", test_error_carries_raw_text);
    suite.add_test("coerce integral", test_coerce_integral_targets);
    suite.add_test("coerce native width", test_coerce_native_width);
    suite.add_test("coerce text", test_coerce_text);
    suite.add_test("coerce bool/float", test_coerce_bool_and_float);
    
    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
