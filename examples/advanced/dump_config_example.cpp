// =============================================================================
// fixrec - Configured Decoding Example
// Config-driven options, nested records and truncated input
// =============================================================================

#include "fixrec/config/config.hpp"
#include "fixrec/decoder/decoder.hpp"
#include "fixrec/schema/inspector.hpp"
#include <iostream>

using namespace fixrec;

struct Header {
    String kind;
    UInt16 sequence = 0;
};

struct Message {
    UniquePtr<Header> header;
    coercion::NativeInt amount;
    String note;
};

namespace fixrec {

template<>
struct RecordLayout<Header> {
    static constexpr const char* name = "Header";
    static void define(SchemaBuilder<Header>& s) {
        s.field("Kind", &Header::kind, "1,2")
         .field("Sequence", &Header::sequence, "3,4");
    }
};

template<>
struct RecordLayout<Message> {
    static constexpr const char* name = "Message";
    static void define(SchemaBuilder<Message>& s) {
        s.field("Header", &Message::header, "1,6")
         .field("Amount", &Message::amount, "7,6")
         .field("Note", &Message::note, "13,10");
    }
};

} // namespace fixrec

namespace {

constexpr StringView SETTINGS = R"(
[DECODE]
native_int_bits = 16
truncation = clip

[LOGGING]
level = info
)";

void show(const Message& msg) {
    std::cout << "  kind=" << msg.header->kind
              << " seq=" << msg.header->sequence
              << " amount=" << msg.amount.value
              << " note=\"" << msg.note << "\"\n";
}

} // anonymous namespace

int main() {
    auto settings = config::parse_config(SETTINGS);
    if (settings.is_error()) {
        std::cerr << settings.error().to_string() << "\n";
        return 1;
    }
    if (auto applied = config::apply_logging(settings.value()); applied.is_error()) {
        std::cerr << applied.error().to_string() << "\n";
        return 1;
    }
    auto options = config::load_decode_options(settings.value());
    if (options.is_error()) {
        std::cerr << options.error().to_string() << "\n";
        return 1;
    }
    
    auto schema = build_schema<Message>(options.value());
    schema::print_schema(std::cout, *schema);
    
    std::cout << "\nComplete record:\n";
    auto full = decode_record("PA0042012345PAID      ", *schema);
    if (full.is_success()) show(full.value());
    
    // The note is cut short; with truncation = clip the present bytes are kept
    std::cout << "\nTruncated record:\n";
    auto clipped = decode_record("PA0043000100PART", *schema);
    if (clipped.is_success()) show(clipped.value());
    
    // 16-bit native integers reject values past 32767
    std::cout << "\nOut of range amount:\n";
    auto overflow = decode_record("PA0044070000", *schema);
    if (overflow.is_error()) {
        std::cout << overflow.error().format_full() << "\n";
    }
    
    return 0;
}
