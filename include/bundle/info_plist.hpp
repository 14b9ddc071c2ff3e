//! # Info.plist
//!
//! Reader and writer for the XML property lists that describe application
//! bundles. Only the top-level dictionary is modelled; nested arrays and
//! dictionaries are kept as raw XML so that rewriting a file preserves them.

#ifndef RELPACK_BUNDLE_INFO_PLIST_HPP
#define RELPACK_BUNDLE_INFO_PLIST_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::bundle {

struct PlistValue {
    enum class Kind { String, Integer, Real, Boolean, Raw };

    Kind kind = Kind::String;
    std::string text; ///< Decoded text; "true"/"false" for booleans; XML for Raw
};

class InfoPlist {
public:
    /// Parses an XML plist. On failure returns nullopt and fills `error`.
    static std::optional<InfoPlist> parse(std::string_view xml, std::string* error = nullptr);

    static std::optional<InfoPlist> load(const fs::path& path, std::string* error = nullptr);

    std::string serialize() const;
    bool save(const fs::path& path) const;

    bool contains(const std::string& key) const;
    const PlistValue* find(const std::string& key) const;

    /// String value of `key` (also returns integer and real values as text).
    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    /// Sets or replaces a value, keeping the original position of existing keys.
    void set_string(const std::string& key, const std::string& value);
    void set_bool(const std::string& key, bool value);
    void set(const std::string& key, PlistValue value);

    void erase(const std::string& key);

    std::vector<std::string> keys() const;

    size_t size() const {
        return entries_.size();
    }

private:
    std::vector<std::pair<std::string, PlistValue>> entries_;
};

/// Escapes `&`, `<`, `>`, `"` and `'` for XML text.
std::string xml_escape(std::string_view text);

/// Inverse of `xml_escape()`, also handling numeric character references.
std::string xml_unescape(std::string_view text);

} // namespace relpack::bundle

#endif // RELPACK_BUNDLE_INFO_PLIST_HPP
