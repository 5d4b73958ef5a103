// =============================================================================
// fixrec - Record Dump Tool
// Version: 1.0.0
// =============================================================================
// Decodes each line of a fixed-width file as an Account record and prints
// the decoded fields.
//
//   fixrec-dump accounts.dat
//   fixrec-dump --chunk 8 --config fixrec.ini accounts.dat
//   fixrec-dump --describe -
// =============================================================================

#include <iostream>
#include <fstream>
#include <string>

#include "fixrec/common/cli.hpp"
#include "fixrec/common/logging.hpp"
#include "fixrec/config/config.hpp"
#include "fixrec/decoder/chunked_decoder.hpp"
#include "fixrec/schema/inspector.hpp"
#include "account.hpp"

using namespace fixrec;
using fixrec::dump::Account;

namespace {

struct DumpSettings {
    DecodeOptions options;
    Size chunk_size = 0;
    bool describe = false;
};

void print_account(std::ostream& out, Size line_number, const Account& account) {
    out << "record " << line_number << " (" << account.source << ")\n";
    out << "  Name         = \"" << account.name << "\"\n";
    out << "  OpenDate     = \"" << account.open_date << "\"\n";
    out << "  Age          = " << account.age.value << "\n";
    out << "  Address      = \"" << account.address << "\"\n";
    out << "  CountryCode  = \"" << account.country_code << "\"\n";
    out << "  PhoneNumbers = [";
    for (Size i = 0; i < account.phone_numbers.size(); ++i) {
        out << (i > 0 ? ", " : "") << "\"" << account.phone_numbers[i] << "\"";
    }
    out << "]\n";
}

Result<void> decode_line(const RecordSchema<Account>& schema, const String& line,
                         Size chunk_size, Account& account) {
    if (chunk_size == 0) {
        return decode(line, schema, &account);
    }
    
    ChunkedDecoder<Account> decoder(schema, account);
    BufferView text(line);
    for (Size offset = 0; offset < text.size(); offset += chunk_size) {
        auto fed = decoder.feed(text.subview(offset, chunk_size));
        if (fed.is_error()) return std::move(fed.error());
    }
    return decoder.finish();
}

Result<DumpSettings> load_settings(const cli::ArgParser& args) {
    DumpSettings settings;
    settings.options = default_decode_options();
    settings.describe = args.flag("describe");
    
    if (auto path = args.get("config")) {
        auto config = config::load_config(*path);
        if (config.is_error()) return std::move(config.error());
        
        FIXREC_TRY(config::apply_logging(config.value()));
        
        auto options = config::load_decode_options(config.value());
        if (options.is_error()) return std::move(options.error());
        settings.options = options.value();
    }
    
    // Overrides [LOGGING] from the config file
    if (args.flag("verbose")) {
        logging::LogManager::instance().configure_default(logging::LogLevel::DBG);
    }
    
    if (args.get("chunk")) {
        auto chunk = args.get_int("chunk");
        if (!chunk || *chunk < 1) {
            return make_error<DumpSettings>(ErrorCode::INVALID_ARGUMENT,
                "--chunk needs a positive byte count, got '" + args.get("chunk").value_or("") + "'");
        }
        settings.chunk_size = static_cast<Size>(*chunk);
    }
    
    return settings;
}

int dump_stream(std::istream& in, const String& source, const RecordSchema<Account>& schema,
                Size chunk_size) {
    auto logger = logging::LogManager::instance().get_logger("fixrec.dump");
    logging::ScopedTimer timer(logger, "dump " + source);
    
    String line;
    Size line_number = 0;
    Size failures = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        
        Account account;
        account.source = std::format("{}:{}", source, line_number);
        
        auto result = decode_line(schema, line, chunk_size, account);
        if (result.is_error()) {
            ++failures;
            std::cerr << account.source << ": " << result.error().to_string() << "\n";
            logger->debug("{}", result.error().format_full());
            continue;
        }
        print_account(std::cout, line_number, account);
    }
    
    logger->info("{}: {} lines, {} failed", source, line_number, failures);
    return failures == 0 ? 0 : 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    cli::ArgParser args("fixrec-dump", "Decode fixed-width Account records, one per line");
    args.add_option("config", 'c', "INI file with [DECODE] and [LOGGING] settings")
        .add_option("chunk", 'n', "Feed each line to the decoder in chunks of N bytes")
        .add_flag("describe", 'd', "Print the Account layout before decoding")
        .add_flag("verbose", 'v', "Log decoder diagnostics to the console")
        .add_positional("file", "Input file, or - for standard input");
    
    if (!args.parse(argc, argv)) {
        if (args.help_requested()) {
            args.show_help();
            return 0;
        }
        std::cerr << "fixrec-dump: " << args.error() << "\n\n";
        args.show_help(std::cerr);
        return 2;
    }
    
    auto settings = load_settings(args);
    if (settings.is_error()) {
        std::cerr << "fixrec-dump: " << settings.error().to_string() << "\n";
        return 2;
    }
    
    auto schema = build_schema<Account>(settings->options);
    if (settings->describe) {
        schema::print_schema(std::cout, *schema);
        std::cout << "\n";
    }
    
    const String file = args.positional(0).value_or("-");
    if (file == "-") {
        return dump_stream(std::cin, "stdin", *schema, settings->chunk_size);
    }
    
    std::ifstream in(file);
    if (!in) {
        std::cerr << "fixrec-dump: " << ErrorInfo(ErrorCode::FILE_NOT_FOUND,
            "Cannot open input file: " + file).to_string() << "\n";
        return 2;
    }
    return dump_stream(in, file, *schema, settings->chunk_size);
}
