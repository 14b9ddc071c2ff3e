#include "bundle/info_plist.hpp"

#include "common/fs_utils.hpp"

#include <cctype>

namespace relpack::bundle {

namespace {

constexpr const char* PLIST_HEADER =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
    "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
    "<plist version=\"1.0\">\n";

/// Cursor over the XML text of a plist.
class PlistReader {
public:
    explicit PlistReader(std::string_view xml) : xml_(xml) {}

    bool parse(std::vector<std::pair<std::string, PlistValue>>& entries) {
        size_t plist = xml_.find("<plist");
        if (plist == std::string_view::npos)
            return fail("missing <plist> element");
        pos_ = plist;
        size_t dict = xml_.find("<dict", pos_);
        if (dict == std::string_view::npos)
            return fail("missing top-level <dict>");
        pos_ = dict;

        std::string name;
        bool self_closing = false;
        if (!read_open_tag(name, self_closing) || name != "dict")
            return fail("malformed top-level <dict>");
        if (self_closing)
            return true;

        while (true) {
            skip_space_and_comments();
            if (at_end())
                return fail("unterminated <dict>");
            if (starts_with("</dict>"))
                return true;

            if (!starts_with("<key>"))
                return fail("expected <key>");
            pos_ += 5;
            size_t close = xml_.find("</key>", pos_);
            if (close == std::string_view::npos)
                return fail("unterminated <key>");
            std::string key = xml_unescape(xml_.substr(pos_, close - pos_));
            pos_ = close + 6;

            skip_space_and_comments();
            PlistValue value;
            if (!read_value(value))
                return false;
            entries.emplace_back(std::move(key), std::move(value));
        }
    }

    const std::string& error() const {
        return error_;
    }

private:
    std::string_view xml_;
    size_t pos_ = 0;
    std::string error_;

    bool fail(const std::string& message) {
        error_ = message + " at offset " + std::to_string(pos_);
        return false;
    }

    bool at_end() const {
        return pos_ >= xml_.size();
    }

    bool starts_with(std::string_view prefix) const {
        return xml_.substr(pos_, prefix.size()) == prefix;
    }

    void skip_space_and_comments() {
        while (!at_end()) {
            if (std::isspace(static_cast<unsigned char>(xml_[pos_]))) {
                ++pos_;
            } else if (starts_with("<!--")) {
                size_t end = xml_.find("-->", pos_);
                pos_ = end == std::string_view::npos ? xml_.size() : end + 3;
            } else {
                break;
            }
        }
    }

    /// Reads `<name ...>` or `<name/>` at the cursor.
    bool read_open_tag(std::string& name, bool& self_closing) {
        if (at_end() || xml_[pos_] != '<')
            return false;
        size_t p = pos_ + 1;
        size_t start = p;
        while (p < xml_.size() && std::isalnum(static_cast<unsigned char>(xml_[p])))
            ++p;
        name = std::string(xml_.substr(start, p - start));
        size_t gt = xml_.find('>', p);
        if (name.empty() || gt == std::string_view::npos)
            return false;
        self_closing = xml_[gt - 1] == '/';
        pos_ = gt + 1;
        return true;
    }

    /// Finds the `</name>` matching an already consumed `<name>`, honouring nesting.
    size_t find_matching_close(const std::string& name) const {
        std::string open = "<" + name;
        std::string close = "</" + name + ">";
        int depth = 1;
        size_t p = pos_;
        while (p < xml_.size()) {
            size_t next_open = xml_.find(open, p);
            size_t next_close = xml_.find(close, p);
            if (next_close == std::string_view::npos)
                return std::string_view::npos;
            if (next_open != std::string_view::npos && next_open < next_close) {
                size_t after = next_open + open.size();
                size_t gt = xml_.find('>', after);
                char follow = after < xml_.size() ? xml_[after] : '\0';
                bool same_tag = follow == '>' || follow == '/' ||
                                std::isspace(static_cast<unsigned char>(follow));
                if (same_tag && gt != std::string_view::npos && xml_[gt - 1] != '/')
                    ++depth;
                p = after;
                continue;
            }
            if (--depth == 0)
                return next_close;
            p = next_close + close.size();
        }
        return std::string_view::npos;
    }

    bool read_value(PlistValue& value) {
        size_t tag_start = pos_;
        std::string name;
        bool self_closing = false;
        if (!read_open_tag(name, self_closing))
            return fail("expected a value element");

        if (self_closing) {
            if (name == "true" || name == "false") {
                value.kind = PlistValue::Kind::Boolean;
                value.text = name;
            } else if (name == "string") {
                value.kind = PlistValue::Kind::String;
                value.text.clear();
            } else {
                value.kind = PlistValue::Kind::Raw;
                value.text = std::string(xml_.substr(tag_start, pos_ - tag_start));
            }
            return true;
        }

        if (name == "array" || name == "dict") {
            size_t close = find_matching_close(name);
            if (close == std::string_view::npos)
                return fail("unterminated <" + name + ">");
            size_t end = close + name.size() + 3;
            value.kind = PlistValue::Kind::Raw;
            value.text = std::string(xml_.substr(tag_start, end - tag_start));
            pos_ = end;
            return true;
        }

        std::string close_tag = "</" + name + ">";
        size_t close = xml_.find(close_tag, pos_);
        if (close == std::string_view::npos)
            return fail("unterminated <" + name + ">");
        std::string_view content = xml_.substr(pos_, close - pos_);
        size_t end = close + close_tag.size();

        if (name == "string") {
            value.kind = PlistValue::Kind::String;
            value.text = xml_unescape(content);
        } else if (name == "integer") {
            value.kind = PlistValue::Kind::Integer;
            value.text = std::string(content);
        } else if (name == "real") {
            value.kind = PlistValue::Kind::Real;
            value.text = std::string(content);
        } else {
            value.kind = PlistValue::Kind::Raw;
            value.text = std::string(xml_.substr(tag_start, end - tag_start));
        }
        pos_ = end;
        return true;
    }
};

} // namespace

// ============================================================================
// Escaping
// ============================================================================

std::string xml_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&apos;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

std::string xml_unescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }
        size_t semi = text.find(';', i);
        if (semi == std::string_view::npos) {
            out += text[i++];
            continue;
        }
        std::string_view entity = text.substr(i + 1, semi - i - 1);
        if (entity == "amp") {
            out += '&';
        } else if (entity == "lt") {
            out += '<';
        } else if (entity == "gt") {
            out += '>';
        } else if (entity == "quot") {
            out += '"';
        } else if (entity == "apos") {
            out += '\'';
        } else if (!entity.empty() && entity[0] == '#') {
            bool hex = entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X');
            unsigned long code = 0;
            try {
                code = std::stoul(std::string(entity.substr(hex ? 2 : 1)), nullptr, hex ? 16 : 10);
            } catch (const std::exception&) {
                out.append(text.substr(i, semi - i + 1));
                i = semi + 1;
                continue;
            }
            // Encode as UTF-8.
            if (code < 0x80) {
                out += static_cast<char>(code);
            } else if (code < 0x800) {
                out += static_cast<char>(0xc0 | (code >> 6));
                out += static_cast<char>(0x80 | (code & 0x3f));
            } else if (code < 0x10000) {
                out += static_cast<char>(0xe0 | (code >> 12));
                out += static_cast<char>(0x80 | ((code >> 6) & 0x3f));
                out += static_cast<char>(0x80 | (code & 0x3f));
            } else {
                out += static_cast<char>(0xf0 | (code >> 18));
                out += static_cast<char>(0x80 | ((code >> 12) & 0x3f));
                out += static_cast<char>(0x80 | ((code >> 6) & 0x3f));
                out += static_cast<char>(0x80 | (code & 0x3f));
            }
        } else {
            out.append(text.substr(i, semi - i + 1));
        }
        i = semi + 1;
    }
    return out;
}

// ============================================================================
// InfoPlist
// ============================================================================

std::optional<InfoPlist> InfoPlist::parse(std::string_view xml, std::string* error) {
    InfoPlist plist;
    PlistReader reader(xml);
    if (!reader.parse(plist.entries_)) {
        if (error)
            *error = reader.error();
        return std::nullopt;
    }
    return plist;
}

std::optional<InfoPlist> InfoPlist::load(const fs::path& path, std::string* error) {
    auto content = read_file(path);
    if (!content) {
        if (error)
            *error = "cannot read " + path.string();
        return std::nullopt;
    }
    return parse(*content, error);
}

std::string InfoPlist::serialize() const {
    std::string out = PLIST_HEADER;
    out += "<dict>\n";
    for (const auto& [key, value] : entries_) {
        out += "\t<key>" + xml_escape(key) + "</key>\n\t";
        switch (value.kind) {
        case PlistValue::Kind::String:
            out += "<string>" + xml_escape(value.text) + "</string>";
            break;
        case PlistValue::Kind::Integer:
            out += "<integer>" + value.text + "</integer>";
            break;
        case PlistValue::Kind::Real:
            out += "<real>" + value.text + "</real>";
            break;
        case PlistValue::Kind::Boolean:
            out += value.text == "true" ? "<true/>" : "<false/>";
            break;
        case PlistValue::Kind::Raw:
            out += value.text;
            break;
        }
        out += "\n";
    }
    out += "</dict>\n</plist>\n";
    return out;
}

bool InfoPlist::save(const fs::path& path) const {
    return write_file(path, serialize());
}

const PlistValue* InfoPlist::find(const std::string& key) const {
    for (const auto& [k, v] : entries_) {
        if (k == key)
            return &v;
    }
    return nullptr;
}

bool InfoPlist::contains(const std::string& key) const {
    return find(key) != nullptr;
}

std::optional<std::string> InfoPlist::get_string(const std::string& key) const {
    const PlistValue* value = find(key);
    if (!value || value->kind == PlistValue::Kind::Raw || value->kind == PlistValue::Kind::Boolean)
        return std::nullopt;
    return value->text;
}

std::optional<bool> InfoPlist::get_bool(const std::string& key) const {
    const PlistValue* value = find(key);
    if (!value || value->kind != PlistValue::Kind::Boolean)
        return std::nullopt;
    return value->text == "true";
}

void InfoPlist::set(const std::string& key, PlistValue value) {
    for (auto& [k, v] : entries_) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    entries_.emplace_back(key, std::move(value));
}

void InfoPlist::set_string(const std::string& key, const std::string& value) {
    set(key, PlistValue{PlistValue::Kind::String, value});
}

void InfoPlist::set_bool(const std::string& key, bool value) {
    set(key, PlistValue{PlistValue::Kind::Boolean, value ? "true" : "false"});
}

void InfoPlist::erase(const std::string& key) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) {
            entries_.erase(it);
            return;
        }
    }
}

std::vector<std::string> InfoPlist::keys() const {
    std::vector<std::string> result;
    for (const auto& [k, _] : entries_) {
        result.push_back(k);
    }
    return result;
}

} // namespace relpack::bundle
