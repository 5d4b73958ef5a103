// =============================================================================
// fixrec - Hello fixrec Example
// Decoding one fixed-width record into a struct
// =============================================================================

#include "fixrec/decoder/decoder.hpp"
#include <iostream>

struct Customer {
    std::string name;
    std::string open_date;
    fixrec::Int32 age = 0;
    std::string address;
    std::string country_code;
    std::vector<std::string> phone_numbers;
};

namespace fixrec {

template<>
struct RecordLayout<Customer> {
    static constexpr const char* name = "Customer";
    static void define(SchemaBuilder<Customer>& s) {
        s.field("Name", &Customer::name, "1,3")
         .field("OpenDate", &Customer::open_date, "4,10")
         .field("Age", &Customer::age, "14,3")
         .field("Address", &Customer::address, "17,15")
         .field("CountryCode", &Customer::country_code, "32,2")
         .field("PhoneNumbers", &Customer::phone_numbers, "34,10,2");
    }
};

} // namespace fixrec

int main() {
    const std::string line = "AMY1900-01-01019123 FAKE STREETCA41611122229053334444";
    
    auto customer = fixrec::decode_record<Customer>(line);
    if (customer.is_error()) {
        std::cerr << customer.error().to_string() << "\n";
        return 1;
    }
    
    std::cout << "Name:        " << customer->name << "\n";
    std::cout << "Open date:   " << customer->open_date << "\n";
    std::cout << "Age:         " << customer->age << "\n";
    std::cout << "Address:     " << customer->address << "\n";
    std::cout << "Country:     " << customer->country_code << "\n";
    for (const auto& phone : customer->phone_numbers) {
        std::cout << "Phone:       " << phone << "\n";
    }
    
    // A layout mistake is reported against the field that carries it
    Customer partial;
    auto result = fixrec::decode("AMY1900-01-01X19", &partial);
    if (result.is_error()) {
        std::cout << "\nExpected failure: " << result.error().to_string() << "\n";
    }
    
    return 0;
}
