//! # Manifest TOML Parser
//!
//! Hand-written recursive descent over the manifest subset described in
//! `config/toml.hpp`. Errors carry the 1-based line number.

#include "config/toml.hpp"

#include <cctype>

namespace relpack::config {

// ============================================================================
// TomlDocument
// ============================================================================

const TomlValue* TomlDocument::find(const std::string& section, const std::string& key) const {
    auto sec = sections.find(section);
    if (sec == sections.end())
        return nullptr;
    auto it = sec->second.find(key);
    if (it == sec->second.end())
        return nullptr;
    return &it->second;
}

std::optional<std::string> TomlDocument::get_string(const std::string& section,
                                                    const std::string& key) const {
    const TomlValue* value = find(section, key);
    if (value && std::holds_alternative<std::string>(*value))
        return std::get<std::string>(*value);
    return std::nullopt;
}

std::optional<int64_t> TomlDocument::get_int(const std::string& section,
                                             const std::string& key) const {
    const TomlValue* value = find(section, key);
    if (value && std::holds_alternative<int64_t>(*value))
        return std::get<int64_t>(*value);
    return std::nullopt;
}

std::optional<bool> TomlDocument::get_bool(const std::string& section,
                                           const std::string& key) const {
    const TomlValue* value = find(section, key);
    if (value && std::holds_alternative<bool>(*value))
        return std::get<bool>(*value);
    return std::nullopt;
}

std::optional<std::vector<std::string>> TomlDocument::get_strings(const std::string& section,
                                                                  const std::string& key) const {
    const TomlValue* value = find(section, key);
    if (value && std::holds_alternative<std::vector<std::string>>(*value))
        return std::get<std::vector<std::string>>(*value);
    return std::nullopt;
}

std::vector<std::string> TomlDocument::subsections(const std::string& prefix) const {
    std::vector<std::string> names;
    for (const auto& [name, _] : sections) {
        if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
            names.push_back(name.substr(prefix.size()));
        }
    }
    return names;
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(const std::string& content) : content_(content) {}

char SimpleTomlParser::advance() {
    char c = content_[pos_++];
    if (c == '\n')
        ++line_;
    return c;
}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

/// Consumes trailing whitespace, an optional comment and the newline.
/// Returns false if anything else follows a value.
bool SimpleTomlParser::skip_line_end() {
    skip_whitespace();
    skip_comment();
    if (is_eof())
        return true;
    if (peek() == '\n') {
        advance();
        return true;
    }
    return false;
}

void SimpleTomlParser::set_error(const std::string& message) {
    if (error_message_.empty()) {
        error_message_ = "line " + std::to_string(line_) + ": " + message;
    }
}

std::string SimpleTomlParser::parse_identifier() {
    std::string ident;
    while (!is_eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.') {
            ident += advance();
        } else {
            break;
        }
    }
    return ident;
}

std::optional<std::string> SimpleTomlParser::parse_string() {
    advance(); // opening quote
    std::string value;
    while (!is_eof() && peek() != '"') {
        char c = advance();
        if (c == '\n') {
            set_error("unterminated string");
            return std::nullopt;
        }
        if (c == '\\' && !is_eof()) {
            char esc = advance();
            switch (esc) {
            case 'n':
                value += '\n';
                break;
            case 't':
                value += '\t';
                break;
            case '"':
                value += '"';
                break;
            case '\\':
                value += '\\';
                break;
            default:
                set_error(std::string("unsupported escape \\") + esc);
                return std::nullopt;
            }
        } else {
            value += c;
        }
    }
    if (is_eof()) {
        set_error("unterminated string");
        return std::nullopt;
    }
    advance(); // closing quote
    return value;
}

std::optional<int64_t> SimpleTomlParser::parse_number() {
    std::string digits;
    if (peek() == '-' || peek() == '+') {
        digits += advance();
    }
    while (!is_eof() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
        char c = advance();
        if (c != '_')
            digits += c;
    }
    if (digits.empty() || digits == "-" || digits == "+") {
        set_error("expected a number");
        return std::nullopt;
    }
    try {
        return std::stoll(digits);
    } catch (const std::exception&) {
        set_error("number out of range: " + digits);
        return std::nullopt;
    }
}

std::optional<bool> SimpleTomlParser::parse_boolean() {
    std::string word = parse_identifier();
    if (word == "true")
        return true;
    if (word == "false")
        return false;
    set_error("expected a value, found '" + word + "'");
    return std::nullopt;
}

std::optional<std::vector<std::string>> SimpleTomlParser::parse_array() {
    advance(); // '['
    std::vector<std::string> items;

    while (true) {
        // Arrays may span lines.
        while (!is_eof() && (std::isspace(static_cast<unsigned char>(peek())) || peek() == '#')) {
            if (peek() == '#')
                skip_comment();
            else
                advance();
        }
        if (is_eof()) {
            set_error("unterminated array");
            return std::nullopt;
        }
        if (peek() == ']') {
            advance();
            return items;
        }

        if (peek() == '"') {
            auto s = parse_string();
            if (!s)
                return std::nullopt;
            items.push_back(*s);
        } else if (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '-') {
            auto n = parse_number();
            if (!n)
                return std::nullopt;
            items.push_back(std::to_string(*n));
        } else {
            set_error("arrays may only contain strings or integers");
            return std::nullopt;
        }

        while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        }
        if (peek() == ',') {
            advance();
        } else if (peek() != ']') {
            set_error("expected ',' or ']' in array");
            return std::nullopt;
        }
    }
}

std::optional<TomlValue> SimpleTomlParser::parse_value() {
    char c = peek();
    if (c == '"') {
        auto s = parse_string();
        if (!s)
            return std::nullopt;
        return TomlValue{*s};
    }
    if (c == '[') {
        auto arr = parse_array();
        if (!arr)
            return std::nullopt;
        return TomlValue{*arr};
    }
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+') {
        auto n = parse_number();
        if (!n)
            return std::nullopt;
        return TomlValue{*n};
    }
    auto b = parse_boolean();
    if (!b)
        return std::nullopt;
    return TomlValue{*b};
}

std::optional<TomlDocument> SimpleTomlParser::parse() {
    TomlDocument doc;
    std::string section;
    doc.sections[section];

    while (!is_eof()) {
        skip_whitespace();
        skip_comment();
        if (is_eof())
            break;
        if (peek() == '\n') {
            advance();
            continue;
        }

        if (peek() == '[') {
            advance();
            skip_whitespace();
            section = parse_identifier();
            skip_whitespace();
            if (section.empty() || peek() != ']') {
                set_error("malformed section header");
                return std::nullopt;
            }
            advance();
            doc.sections[section];
            if (!skip_line_end()) {
                set_error("unexpected text after section header");
                return std::nullopt;
            }
            continue;
        }

        std::string key = parse_identifier();
        if (key.empty()) {
            set_error(std::string("unexpected character '") + peek() + "'");
            return std::nullopt;
        }
        skip_whitespace();
        if (peek() != '=') {
            set_error("expected '=' after key '" + key + "'");
            return std::nullopt;
        }
        advance();
        skip_whitespace();

        auto value = parse_value();
        if (!value)
            return std::nullopt;

        auto& table = doc.sections[section];
        if (table.count(key)) {
            set_error("duplicate key '" + key + "'");
            return std::nullopt;
        }
        table[key] = std::move(*value);

        if (!skip_line_end()) {
            set_error("unexpected text after value of '" + key + "'");
            return std::nullopt;
        }
    }

    return doc;
}

} // namespace relpack::config
