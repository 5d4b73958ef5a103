// =============================================================================
// fixrec - Chunked Decoding Example
// Decoding a record that arrives a few bytes at a time
// =============================================================================

#include "fixrec/decoder/chunked_decoder.hpp"
#include <iostream>

struct Trade {
    std::string symbol;
    fixrec::UInt32 quantity = 0;
    double price = 0.0;
    bool buy = false;
    std::array<fixrec::Int32, 3> fills{};
};

namespace fixrec {

template<>
struct RecordLayout<Trade> {
    static constexpr const char* name = "Trade";
    static void define(SchemaBuilder<Trade>& s) {
        s.field("Symbol", &Trade::symbol, "1,4")
         .field("Quantity", &Trade::quantity, "5,6")
         .field("Price", &Trade::price, "11,8")
         .field("Buy", &Trade::buy, "19,1")
         .field("Fills", &Trade::fills, "20,4");
    }
};

} // namespace fixrec

int main() {
    const std::string wire = "ACME00015000101.25T010000400010";
    
    // How much of a partial buffer is usable right now?
    auto fit = fixrec::estimate<Trade>(std::string_view(wire).substr(0, 12));
    if (fit.is_success()) {
        std::cout << "First 12 bytes complete " << fit->count << " field(s), "
                  << fit->consumed << " bytes consumed\n\n";
    }
    
    Trade trade;
    fixrec::ChunkedDecoder<Trade> decoder(fixrec::schema_of<Trade>(), trade);
    
    for (std::size_t offset = 0; offset < wire.size(); offset += 5) {
        auto chunk = std::string_view(wire).substr(offset, 5);
        auto decoded = decoder.feed(chunk);
        if (decoded.is_error()) {
            std::cerr << decoded.error().to_string() << "\n";
            return 1;
        }
        std::cout << "chunk \"" << chunk << "\" -> " << decoded.value()
                  << " field(s), next field " << decoder.next_field() << "\n";
    }
    
    auto finished = decoder.finish();
    if (finished.is_error()) {
        std::cerr << finished.error().to_string() << "\n";
        return 1;
    }
    
    std::cout << "\n" << trade.symbol << " " << (trade.buy ? "BUY " : "SELL ")
              << trade.quantity << " @ " << trade.price << "\n";
    std::cout << "fills: " << trade.fills[0] << ", " << trade.fills[1] << ", " << trade.fills[2] << "\n";
    return 0;
}
