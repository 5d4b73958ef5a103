// =============================================================================
// fixrec - Command Line Argument Parser
// Version: 1.0.0
// =============================================================================

#pragma once

#include "fixrec/common/types.hpp"
#include <map>
#include <charconv>
#include <iostream>
#include <iomanip>

namespace fixrec::cli {

/**
 * @brief Command-line argument parser
 * 
 * Supports long options (--name, --name=value), short options (-n value),
 * boolean flags and positional arguments, and prints generated help.
 */
class ArgParser {
public:
    struct Option {
        String long_name;
        char short_name = 0;
        String description;
        String default_value;
        bool is_flag = false;
    };

    explicit ArgParser(String program_name = "", String description = "")
        : program_name_(std::move(program_name)), description_(std::move(description)) {}

    ArgParser& add_option(const String& long_name,
                          char short_name = 0,
                          const String& description = "",
                          const String& default_value = "") {
        options_.push_back(Option{long_name, short_name, description, default_value, false});
        return *this;
    }

    ArgParser& add_flag(const String& long_name,
                        char short_name = 0,
                        const String& description = "") {
        options_.push_back(Option{long_name, short_name, description, "", true});
        return *this;
    }

    ArgParser& add_positional(const String& name, const String& description = "") {
        positional_names_.push_back(name);
        positional_descriptions_.push_back(description);
        return *this;
    }

    /**
     * @brief Parse command-line arguments
     * @return false on error or when help was requested (see help_requested())
     */
    bool parse(int argc, char* argv[]) {
        if (argc > 0 && program_name_.empty()) {
            program_name_ = argv[0];
        }

        for (const auto& opt : options_) {
            if (!opt.default_value.empty()) {
                values_[opt.long_name] = opt.default_value;
            }
        }

        for (int i = 1; i < argc; ++i) {
            String arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                help_requested_ = true;
                return false;
            }

            if (arg.starts_with("--")) {
                String name;
                Optional<String> value;
                auto eq_pos = arg.find('=');
                if (eq_pos != String::npos) {
                    name = arg.substr(2, eq_pos - 2);
                    value = arg.substr(eq_pos + 1);
                } else {
                    name = arg.substr(2);
                }

                const Option* opt = find_option(name);
                if (!opt) {
                    error_ = "Unknown option: --" + name;
                    return false;
                }
                if (opt->is_flag) {
                    flags_[opt->long_name] = true;
                    continue;
                }
                if (!value) {
                    if (i + 1 >= argc) {
                        error_ = "Option --" + name + " requires a value";
                        return false;
                    }
                    value = String(argv[++i]);
                }
                values_[opt->long_name] = *value;
            } else if (arg.starts_with("-") && arg.length() > 1) {
                for (Size j = 1; j < arg.length(); ++j) {
                    const Option* opt = find_option(arg[j]);
                    if (!opt) {
                        error_ = String("Unknown option: -") + arg[j];
                        return false;
                    }
                    if (opt->is_flag) {
                        flags_[opt->long_name] = true;
                        continue;
                    }
                    if (j + 1 < arg.length()) {
                        values_[opt->long_name] = arg.substr(j + 1);
                    } else if (i + 1 < argc) {
                        values_[opt->long_name] = argv[++i];
                    } else {
                        error_ = String("Option -") + arg[j] + " requires a value";
                        return false;
                    }
                    break;
                }
            } else {
                positional_values_.push_back(arg);
            }
        }

        if (positional_values_.size() < positional_names_.size()) {
            error_ = "Required argument missing: " + positional_names_[positional_values_.size()];
            return false;
        }
        return true;
    }

    [[nodiscard]] Optional<String> get(const String& name) const {
        auto it = values_.find(name);
        if (it != values_.end()) {
            return it->second;
        }
        return nullopt;
    }

    [[nodiscard]] Optional<Int64> get_int(const String& name) const {
        auto str = get(name);
        if (!str) return nullopt;
        Int64 value = 0;
        auto [ptr, ec] = std::from_chars(str->data(), str->data() + str->size(), value);
        if (ec != std::errc() || ptr != str->data() + str->size()) return nullopt;
        return value;
    }

    [[nodiscard]] bool flag(const String& name) const {
        auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    [[nodiscard]] Optional<String> positional(Size index) const {
        if (index < positional_values_.size()) {
            return positional_values_[index];
        }
        return nullopt;
    }

    [[nodiscard]] bool help_requested() const { return help_requested_; }
    [[nodiscard]] const String& error() const { return error_; }

    void show_help(std::ostream& out = std::cout) const {
        out << "Usage: " << program_name_;
        for (const auto& opt : options_) {
            if (opt.is_flag) {
                out << " [--" << opt.long_name << "]";
            } else {
                out << " [--" << opt.long_name << "=<value>]";
            }
        }
        for (const auto& name : positional_names_) {
            out << " <" << name << ">";
        }
        out << "\n\n";
        
        if (!description_.empty()) {
            out << description_ << "\n\n";
        }

        if (!options_.empty()) {
            out << "Options:\n";
            for (const auto& opt : options_) {
                out << "  ";
                if (opt.short_name) {
                    out << "-" << opt.short_name << ", ";
                } else {
                    out << "    ";
                }
                out << "--" << std::left << std::setw(20) << opt.long_name << opt.description;
                if (!opt.default_value.empty()) {
                    out << " [default: " << opt.default_value << "]";
                }
                out << "\n";
            }
        }

        if (!positional_names_.empty()) {
            out << "\nArguments:\n";
            for (Size i = 0; i < positional_names_.size(); ++i) {
                out << "  " << std::left << std::setw(22) << positional_names_[i]
                    << positional_descriptions_[i] << "\n";
            }
        }

        out << "\n  -h, --help                Show this help message\n";
    }

private:
    const Option* find_option(const String& name) const {
        for (const auto& opt : options_) {
            if (opt.long_name == name) return &opt;
        }
        return nullptr;
    }

    const Option* find_option(char short_name) const {
        for (const auto& opt : options_) {
            if (opt.short_name == short_name) return &opt;
        }
        return nullptr;
    }

    String program_name_;
    String description_;
    std::vector<Option> options_;
    std::vector<String> positional_names_;
    std::vector<String> positional_descriptions_;
    
    std::map<String, String> values_;
    std::map<String, bool> flags_;
    std::vector<String> positional_values_;
    String error_;
    bool help_requested_ = false;
};

} // namespace fixrec::cli
