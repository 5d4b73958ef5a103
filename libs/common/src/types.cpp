#include "fixrec/common/types.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace fixrec {

String to_upper(StringView str) {
    String result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

String to_lower(StringView str) {
    String result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

String trim(StringView str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == StringView::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return String(str.substr(start, end - start + 1));
}

std::vector<String> split(StringView str, char delimiter) {
    std::vector<String> result;
    Size start = 0, end = 0;
    while ((end = str.find(delimiter, start)) != StringView::npos) {
        result.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }
    result.emplace_back(str.substr(start));
    return result;
}

String join(const std::vector<String>& strings, StringView delimiter) {
    if (strings.empty()) return "";
    String result = strings[0];
    for (Size i = 1; i < strings.size(); ++i) {
        result += delimiter;
        result += strings[i];
    }
    return result;
}

String pad_right(StringView str, Size width, char pad) {
    if (str.size() >= width) return String(str);
    return String(str) + String(width - str.size(), pad);
}

String printable(StringView raw, Size max_length) {
    std::ostringstream oss;
    Size shown = std::min(raw.size(), max_length);
    for (Size i = 0; i < shown; ++i) {
        auto c = static_cast<unsigned char>(raw[i]);
        if (std::isprint(c)) {
            oss << static_cast<char>(c);
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::dec;
        }
    }
    if (raw.size() > shown) {
        oss << "...(" << raw.size() << " bytes)";
    }
    return oss.str();
}

} // namespace fixrec
