// =============================================================================
// fixrec - Demo Account Layout
// Version: 1.0.0
// =============================================================================
//
//  1   4          14  17             32 34                  54
//  AMY1900-01-01019123 FAKE STREETCA41611122229053334444
//  |  |          |  |              |  |
//  |  OpenDate   |  Address        |  PhoneNumbers (2 x 10)
//  Name          Age               CountryCode
// =============================================================================

#ifndef FIXREC_APPS_ACCOUNT_HPP
#define FIXREC_APPS_ACCOUNT_HPP

#include <fixrec/decoder/record_schema.hpp>
#include <fixrec/coercion/coercion.hpp>

namespace fixrec::dump {

struct Account {
    String name;
    String open_date;
    coercion::NativeInt age;
    String address;
    String country_code;
    Vector<String> phone_numbers;
    String source;      // not part of the record text
};

} // namespace fixrec::dump

namespace fixrec {

template<>
struct RecordLayout<dump::Account> {
    static constexpr const char* name = "Account";
    static void define(SchemaBuilder<dump::Account>& s) {
        s.field("Name", &dump::Account::name, "1,3")
         .field("OpenDate", &dump::Account::open_date, "4,10")
         .field("Age", &dump::Account::age, "14,3")
         .field("Address", &dump::Account::address, "17,15")
         .field("CountryCode", &dump::Account::country_code, "32,2")
         .field("PhoneNumbers", &dump::Account::phone_numbers, "34,10,2")
         .field("Source", &dump::Account::source);
    }
};

} // namespace fixrec

#endif // FIXREC_APPS_ACCOUNT_HPP
