//! # Manifest TOML Parser
//!
//! `SimpleTomlParser` handles the subset of TOML used by `relpack.toml`:
//!
//! - Sections: `[section]`, dotted names such as `[tool.appimagetool]`
//! - Key-value pairs: `key = "value"`
//! - Integers: `key = 123`
//! - Booleans: `key = true`
//! - Arrays of strings or integers: `key = ["a", "b"]`, `key = [1, 2]`
//! - `#` comments, both full-line and trailing
//!
//! Integers inside arrays are stored as their decimal text.

#ifndef RELPACK_CONFIG_TOML_HPP
#define RELPACK_CONFIG_TOML_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relpack::config {

using TomlValue = std::variant<std::string, int64_t, bool, std::vector<std::string>>;
using TomlTable = std::map<std::string, TomlValue>;

/// Parsed manifest: section name -> key -> value. Keys before the first
/// section header live in the "" section.
struct TomlDocument {
    std::map<std::string, TomlTable> sections;

    const TomlValue* find(const std::string& section, const std::string& key) const;

    std::optional<std::string> get_string(const std::string& section, const std::string& key) const;
    std::optional<int64_t> get_int(const std::string& section, const std::string& key) const;
    std::optional<bool> get_bool(const std::string& section, const std::string& key) const;
    std::optional<std::vector<std::string>> get_strings(const std::string& section,
                                                        const std::string& key) const;

    /// Names of sections starting with `prefix`, with the prefix removed.
    std::vector<std::string> subsections(const std::string& prefix) const;
};

class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    std::optional<TomlDocument> parse();

    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_comment();
    bool skip_line_end();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::string parse_identifier();
    std::optional<std::string> parse_string();
    std::optional<int64_t> parse_number();
    std::optional<bool> parse_boolean();
    std::optional<std::vector<std::string>> parse_array();
    std::optional<TomlValue> parse_value();

    void set_error(const std::string& message);
};

} // namespace relpack::config

#endif // RELPACK_CONFIG_TOML_HPP
