#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace vectorlink::config {

// One "[name]" block of the robot configuration file.
//
// Keys keep their file order. Comment and blank lines inside the section are
// carried through untouched so a hand-edited file survives a rewrite.
class IniSection {
public:
    explicit IniSection(std::string name);

    const std::string& name() const noexcept { return _name; }

    bool contains(std::string_view key) const;

    // Value of `key`, or nullptr when the key is absent.
    const std::string* find(std::string_view key) const;

    // Rewrites an existing key in place, otherwise appends it.
    void set(std::string_view key, std::string value);

    // Returns true if the key was present.
    bool remove(std::string_view key);

    // Keys in file order.
    std::vector<std::string> keys() const;

private:
    friend class IniDocument;

    struct Line {
        bool        isEntry{false};
        std::string key;     // entries only
        std::string value;   // entries only
        std::string raw;     // comments / blank lines only
    };

    std::string       _name;
    std::vector<Line> _lines;
};

// Ordered list of sections, parsed from and rendered back to text.
//
// Grammar (a deliberately small subset):
//   [section]          header, name trimmed
//   key=value          split at the first '=', both sides trimmed
//   ; text / # text    comment
// Anything else, a key outside a section, or a repeated section or key is
// rejected with ConfigurationLoadError.
class IniDocument {
public:
    static IniDocument parse(std::string_view text);

    // "key=value" lines, '\n' endings, one blank line between sections.
    std::string serialize() const;

    const std::vector<IniSection>& sections() const noexcept { return _sections; }
    std::size_t size() const noexcept { return _sections.size(); }
    bool empty() const noexcept { return _sections.empty(); }

    IniSection*       find(std::string_view name);
    const IniSection* find(std::string_view name) const;

    // Existing section, or a new one appended at the end.
    IniSection& get_or_add(std::string_view name);

    // Returns true if the section existed.
    bool remove(std::string_view name);

    // Drops every section whose name is not in `keep`; returns how many went.
    std::size_t retain_only(const std::vector<std::string>& keep);

private:
    std::vector<std::string> _preamble; // comments before the first header
    std::vector<IniSection>  _sections;
};

} // namespace vectorlink::config
