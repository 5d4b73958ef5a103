#pragma once
// =============================================================================
// fixrec - Configuration File Parser
// Version: 1.0.0
// INI file support for decode and logging settings
// =============================================================================

#include "fixrec/common/types.hpp"
#include "fixrec/common/error.hpp"
#include "fixrec/config/decode_options.hpp"
#include <map>

namespace fixrec::config {

// =============================================================================
// Configuration Value
// =============================================================================

class ConfigValue {
private:
    String value_;
    
public:
    ConfigValue() = default;
    explicit ConfigValue(String value) : value_(std::move(value)) {}
    
    [[nodiscard]] const String& str() const { return value_; }
    [[nodiscard]] bool empty() const { return value_.empty(); }
    
    // Type conversions
    [[nodiscard]] Result<Int64> to_int() const;
    [[nodiscard]] Result<UInt64> to_uint() const;
    [[nodiscard]] Result<bool> to_bool() const;
    
    // With defaults
    [[nodiscard]] Int64 to_int_or(Int64 default_val) const;
    [[nodiscard]] bool to_bool_or(bool default_val) const;
    [[nodiscard]] String to_string_or(StringView default_val) const;
};

// =============================================================================
// Configuration Section
// =============================================================================

class ConfigSection {
private:
    String name_;
    std::map<String, ConfigValue, std::less<>> values_;
    
public:
    ConfigSection() = default;
    explicit ConfigSection(String name) : name_(std::move(name)) {}
    
    [[nodiscard]] const String& name() const { return name_; }
    
    [[nodiscard]] bool has(StringView key) const;
    [[nodiscard]] const ConfigValue& get(StringView key) const;
    
    [[nodiscard]] String get_string(StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView key, bool default_val = false) const;
    
    void set(StringView key, StringView value);
    void remove(StringView key);
    
    [[nodiscard]] Vector<String> keys() const;
    [[nodiscard]] Size size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }
    
    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }
};

// =============================================================================
// Configuration File
// =============================================================================

class ConfigFile {
private:
    Path filepath_;
    String default_section_name_ = "default";
    std::map<String, ConfigSection, std::less<>> sections_;
    
    void parse_line(StringView line, String& current_section);
    
public:
    ConfigFile();
    
    [[nodiscard]] Result<void> load(const Path& path);
    void parse(StringView content);
    
    [[nodiscard]] const Path& path() const { return filepath_; }
    [[nodiscard]] bool is_loaded() const { return !filepath_.empty(); }
    
    [[nodiscard]] bool has_section(StringView name) const;
    [[nodiscard]] ConfigSection& section(StringView name);
    [[nodiscard]] const ConfigSection& section(StringView name) const;
    [[nodiscard]] const ConfigSection& default_section() const;
    
    [[nodiscard]] bool has(StringView section, StringView key) const;
    [[nodiscard]] String get_string(StringView section, StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView section, StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView section, StringView key, bool default_val = false) const;
    
    void set(StringView section, StringView key, StringView value);
    ConfigSection& add_section(StringView name);
    
    [[nodiscard]] Vector<String> section_names() const;
    [[nodiscard]] Size section_count() const { return sections_.size(); }
    
    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Environment Variable Support
// =============================================================================

[[nodiscard]] Optional<String> get_env(StringView name);

// Expand ${VAR} references; unknown variables expand to nothing
[[nodiscard]] String expand_env(StringView str);

// =============================================================================
// Factory Functions
// =============================================================================

[[nodiscard]] Result<ConfigFile> load_config(const Path& path);
[[nodiscard]] Result<ConfigFile> parse_config(StringView content);

// =============================================================================
// fixrec Settings
// =============================================================================

namespace sections {
    constexpr StringView DECODE = "DECODE";
    constexpr StringView LOGGING = "LOGGING";
}

namespace keys {
    constexpr StringView NATIVE_INT_BITS = "native_int_bits";
    constexpr StringView TRUNCATION = "truncation";
    constexpr StringView LEVEL = "level";
    constexpr StringView FILE = "file";
    constexpr StringView FILE_LEVEL = "file_level";
}

// [DECODE] native_int_bits (8|16|32|64), truncation (reject|clip)
[[nodiscard]] Result<DecodeOptions> load_decode_options(const ConfigFile& config);

// [LOGGING] level, file, file_level -> LogManager::configure_default
[[nodiscard]] Result<void> apply_logging(const ConfigFile& config);

} // namespace fixrec::config
