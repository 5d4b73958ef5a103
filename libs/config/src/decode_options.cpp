#include <fixrec/config/decode_options.hpp>

namespace fixrec {

namespace {

std::mutex& options_mutex() {
    static std::mutex mutex;
    return mutex;
}

DecodeOptions& options_storage() {
    static DecodeOptions options;
    return options;
}

} // anonymous namespace

DecodeOptions default_decode_options() {
    std::lock_guard<std::mutex> lock(options_mutex());
    return options_storage();
}

void set_default_decode_options(const DecodeOptions& options) {
    std::lock_guard<std::mutex> lock(options_mutex());
    options_storage() = options;
}

} // namespace fixrec
