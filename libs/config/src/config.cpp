// =============================================================================
// fixrec - Configuration File Parser Implementation
// Version: 1.0.0
// =============================================================================

#include <fixrec/config/config.hpp>
#include <fixrec/common/logging.hpp>
#include <fstream>
#include <sstream>
#include <charconv>
#include <cstdlib>

namespace fixrec::config {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

bool is_true_value(StringView sv) {
    String lower = to_lower(sv);
    return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

bool is_false_value(StringView sv) {
    String lower = to_lower(sv);
    return lower == "false" || lower == "no" || lower == "off" || lower == "0";
}

template<typename T>
Result<T> parse_number(const String& text) {
    if (text.empty()) {
        return make_error<T>(ErrorCode::INVALID_CONFIG_VALUE, "Empty value");
    }
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return make_error<T>(ErrorCode::INVALID_CONFIG_VALUE, "Invalid integer format: " + text);
    }
    return value;
}

} // anonymous namespace

// =============================================================================
// ConfigValue Implementation
// =============================================================================

Result<Int64> ConfigValue::to_int() const {
    return parse_number<Int64>(value_);
}

Result<UInt64> ConfigValue::to_uint() const {
    return parse_number<UInt64>(value_);
}

Result<bool> ConfigValue::to_bool() const {
    if (is_true_value(value_)) return true;
    if (is_false_value(value_)) return false;
    return make_error<bool>(ErrorCode::INVALID_CONFIG_VALUE, "Cannot parse boolean: " + value_);
}

Int64 ConfigValue::to_int_or(Int64 default_val) const {
    auto result = to_int();
    return result.is_success() ? result.value() : default_val;
}

bool ConfigValue::to_bool_or(bool default_val) const {
    auto result = to_bool();
    return result.is_success() ? result.value() : default_val;
}

String ConfigValue::to_string_or(StringView default_val) const {
    return value_.empty() ? String(default_val) : value_;
}

// =============================================================================
// ConfigSection Implementation
// =============================================================================

static const ConfigValue EMPTY_VALUE;

bool ConfigSection::has(StringView key) const {
    return values_.find(key) != values_.end();
}

const ConfigValue& ConfigSection::get(StringView key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : EMPTY_VALUE;
}

String ConfigSection::get_string(StringView key, StringView default_val) const {
    return get(key).to_string_or(default_val);
}

Int64 ConfigSection::get_int(StringView key, Int64 default_val) const {
    return get(key).to_int_or(default_val);
}

bool ConfigSection::get_bool(StringView key, bool default_val) const {
    return get(key).to_bool_or(default_val);
}

void ConfigSection::set(StringView key, StringView value) {
    values_[String(key)] = ConfigValue(String(value));
}

void ConfigSection::remove(StringView key) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        values_.erase(it);
    }
}

Vector<String> ConfigSection::keys() const {
    Vector<String> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigFile Implementation
// =============================================================================

ConfigFile::ConfigFile() {
    add_section(default_section_name_);
}

void ConfigFile::parse_line(StringView line, String& current_section) {
    String trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return;
    }
    
    // [section]
    if (trimmed[0] == '[' && trimmed.back() == ']') {
        current_section = trim(StringView(trimmed).substr(1, trimmed.size() - 2));
        if (!has_section(current_section)) {
            add_section(current_section);
        }
        return;
    }
    
    // key=value or key:value, with an optional trailing "; comment"
    size_t sep_pos = std::min(trimmed.find('='), trimmed.find(':'));
    if (sep_pos == String::npos) {
        return;
    }
    
    String key = trim(StringView(trimmed).substr(0, sep_pos));
    String value = trim(StringView(trimmed).substr(sep_pos + 1));
    
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    } else {
        auto comment = value.find(" ;");
        if (comment != String::npos) {
            value = trim(StringView(value).substr(0, comment));
        }
    }
    
    section(current_section).set(key, value);
}

Result<void> ConfigFile::load(const Path& path) {
    std::ifstream file(path);
    if (!file) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, 
            "Cannot open config file: " + path.string());
    }
    
    std::ostringstream content;
    content << file.rdbuf();
    
    filepath_ = path;
    sections_.clear();
    add_section(default_section_name_);
    parse(content.str());
    return {};
}

void ConfigFile::parse(StringView content) {
    String current_section = default_section_name_;
    String text{content};
    std::istringstream iss{text};
    String line;
    while (std::getline(iss, line)) {
        parse_line(line, current_section);
    }
}

bool ConfigFile::has_section(StringView name) const {
    return sections_.find(name) != sections_.end();
}

static const ConfigSection EMPTY_SECTION;

ConfigSection& ConfigFile::section(StringView name) {
    auto it = sections_.find(name);
    if (it == sections_.end()) {
        return add_section(name);
    }
    return it->second;
}

const ConfigSection& ConfigFile::section(StringView name) const {
    auto it = sections_.find(name);
    return it != sections_.end() ? it->second : EMPTY_SECTION;
}

const ConfigSection& ConfigFile::default_section() const {
    return section(default_section_name_);
}

bool ConfigFile::has(StringView section_name, StringView key) const {
    return section(section_name).has(key);
}

String ConfigFile::get_string(StringView section_name, StringView key, StringView default_val) const {
    return section(section_name).get_string(key, default_val);
}

Int64 ConfigFile::get_int(StringView section_name, StringView key, Int64 default_val) const {
    return section(section_name).get_int(key, default_val);
}

bool ConfigFile::get_bool(StringView section_name, StringView key, bool default_val) const {
    return section(section_name).get_bool(key, default_val);
}

void ConfigFile::set(StringView section_name, StringView key, StringView value) {
    section(section_name).set(key, value);
}

ConfigSection& ConfigFile::add_section(StringView name) {
    auto [it, _] = sections_.emplace(String(name), ConfigSection(String(name)));
    return it->second;
}

Vector<String> ConfigFile::section_names() const {
    Vector<String> result;
    result.reserve(sections_.size());
    for (const auto& [name, _] : sections_) {
        result.push_back(name);
    }
    return result;
}

String ConfigFile::to_string() const {
    std::ostringstream oss;
    
    const auto& def = default_section();
    for (const auto& [key, value] : def) {
        oss << key << " = " << value.str() << "\n";
    }
    if (!def.empty()) oss << "\n";
    
    for (const auto& [name, sec] : sections_) {
        if (name == default_section_name_ || sec.empty()) continue;
        oss << "[" << name << "]\n";
        for (const auto& [key, value] : sec) {
            oss << key << " = " << value.str() << "\n";
        }
        oss << "\n";
    }
    
    return oss.str();
}

// =============================================================================
// Environment Variable Support
// =============================================================================

Optional<String> get_env(StringView name) {
    const char* value = std::getenv(String(name).c_str());
    if (value) {
        return String(value);
    }
    return nullopt;
}

String expand_env(StringView str) {
    String result;
    result.reserve(str.size());
    
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '$' && i + 1 < str.size() && str[i + 1] == '{') {
            size_t end = str.find('}', i + 2);
            if (end != StringView::npos) {
                if (auto value = get_env(str.substr(i + 2, end - i - 2))) {
                    result += *value;
                }
                i = end;
                continue;
            }
        }
        result += str[i];
    }
    
    return result;
}

// =============================================================================
// Factory Functions
// =============================================================================

Result<ConfigFile> load_config(const Path& path) {
    ConfigFile config;
    auto result = config.load(path);
    if (result.is_error()) {
        return result.error();
    }
    return config;
}

Result<ConfigFile> parse_config(StringView content) {
    ConfigFile config;
    config.parse(content);
    return config;
}

// =============================================================================
// fixrec Settings
// =============================================================================

Result<DecodeOptions> load_decode_options(const ConfigFile& config) {
    DecodeOptions options = default_decode_options();
    const auto& decode = config.section(sections::DECODE);
    
    if (decode.has(keys::NATIVE_INT_BITS)) {
        auto bits = decode.get(keys::NATIVE_INT_BITS).to_uint();
        if (bits.is_error()) {
            return bits.error().with_context("key", String(keys::NATIVE_INT_BITS));
        }
        if (!is_valid_int_width(bits.value())) {
            return make_error<DecodeOptions>(ErrorCode::INVALID_CONFIG_VALUE,
                std::format("native_int_bits must be 8, 16, 32 or 64, got {}", bits.value()));
        }
        options.native_int_bits = static_cast<UInt8>(bits.value());
    }
    
    if (decode.has(keys::TRUNCATION)) {
        String policy = to_lower(decode.get_string(keys::TRUNCATION));
        if (policy == "reject") {
            options.truncation = TruncationPolicy::REJECT;
        } else if (policy == "clip") {
            options.truncation = TruncationPolicy::CLIP;
        } else {
            return make_error<DecodeOptions>(ErrorCode::INVALID_CONFIG_VALUE,
                "truncation must be 'reject' or 'clip', got '" + policy + "'");
        }
    }
    
    logging::LogManager::instance().get_logger("fixrec.config")->debug(
        "decode options: native_int_bits={} truncation={}", options.native_int_bits,
        options.truncation == TruncationPolicy::CLIP ? "clip" : "reject");
    return options;
}

Result<void> apply_logging(const ConfigFile& config) {
    using logging::LogLevel;
    const auto& section = config.section(sections::LOGGING);
    
    auto level_or = [&](StringView key, LogLevel fallback) -> Result<LogLevel> {
        if (!section.has(key)) return fallback;
        auto level = logging::parse_level(section.get_string(key));
        if (!level) {
            return make_error<LogLevel>(ErrorCode::INVALID_CONFIG_VALUE,
                std::format("Unknown log level '{}' for {}", section.get_string(key), key));
        }
        return *level;
    };
    
    auto console_level = level_or(keys::LEVEL, LogLevel::INFO);
    if (console_level.is_error()) return console_level.error();
    auto file_level = level_or(keys::FILE_LEVEL, LogLevel::DBG);
    if (file_level.is_error()) return file_level.error();
    
    Optional<Path> log_file;
    String file = expand_env(section.get_string(keys::FILE));
    if (!file.empty()) {
        log_file = Path(file);
    }
    
    logging::LogManager::instance().configure_default(*console_level, log_file, *file_level);
    return {};
}

} // namespace fixrec::config
