#include "vectorlink/config/ini_document.h"
#include "vectorlink/config/config_errors.h"

#include <algorithm>
#include <cctype>

namespace vectorlink::config {

// ---------- tiny helpers ----------

static std::string_view trim_ws(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

static bool is_comment(std::string_view trimmed)
{
    return !trimmed.empty() && (trimmed.front() == ';' || trimmed.front() == '#');
}

[[noreturn]] static void fail(std::size_t lineNo, const std::string& what)
{
    throw ConfigurationLoadError("line " + std::to_string(lineNo) + ": " + what);
}

// ---------- IniSection ----------

IniSection::IniSection(std::string name)
    : _name(std::move(name))
{
}

bool IniSection::contains(std::string_view key) const
{
    return find(key) != nullptr;
}

const std::string* IniSection::find(std::string_view key) const
{
    for (const auto& l : _lines) {
        if (l.isEntry && l.key == key) {
            return &l.value;
        }
    }
    return nullptr;
}

void IniSection::set(std::string_view key, std::string value)
{
    for (auto& l : _lines) {
        if (l.isEntry && l.key == key) {
            l.value = std::move(value);
            return;
        }
    }

    // Append after the last entry so trailing comments stay at the bottom.
    auto pos = _lines.end();
    for (auto it = _lines.rbegin(); it != _lines.rend(); ++it) {
        if (it->isEntry) {
            pos = it.base();
            break;
        }
    }

    Line l;
    l.isEntry = true;
    l.key     = std::string(key);
    l.value   = std::move(value);
    _lines.insert(pos, std::move(l));
}

bool IniSection::remove(std::string_view key)
{
    for (auto it = _lines.begin(); it != _lines.end(); ++it) {
        if (it->isEntry && it->key == key) {
            _lines.erase(it);
            return true;
        }
    }
    return false;
}

std::vector<std::string> IniSection::keys() const
{
    std::vector<std::string> out;
    for (const auto& l : _lines) {
        if (l.isEntry) out.push_back(l.key);
    }
    return out;
}

// ---------- IniDocument ----------

IniDocument IniDocument::parse(std::string_view text)
{
    IniDocument doc;
    IniSection* current = nullptr;
    std::size_t lineNo  = 0;

    while (!text.empty()) {
        const std::size_t eol = text.find('\n');
        std::string_view rawLine = text.substr(0, eol);
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);
        ++lineNo;

        if (!rawLine.empty() && rawLine.back() == '\r') {
            rawLine.remove_suffix(1);
        }
        const std::string_view line = trim_ws(rawLine);

        if (line.empty() || is_comment(line)) {
            if (current) {
                IniSection::Line l;
                l.raw = std::string(line);
                current->_lines.push_back(std::move(l));
            } else if (!line.empty()) {
                doc._preamble.emplace_back(line);
            }
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                fail(lineNo, "unterminated section header");
            }
            const std::string_view name = trim_ws(line.substr(1, line.size() - 2));
            if (name.empty()) {
                fail(lineNo, "empty section name");
            }
            if (doc.find(name)) {
                fail(lineNo, "duplicate section '" + std::string(name) + "'");
            }
            doc._sections.emplace_back(std::string(name));
            current = &doc._sections.back();
            continue;
        }

        const std::size_t eq = line.find('=');
        if (eq == std::string_view::npos) {
            fail(lineNo, "expected key=value");
        }
        if (!current) {
            fail(lineNo, "key outside of any section");
        }

        const std::string_view key = trim_ws(line.substr(0, eq));
        if (key.empty()) {
            fail(lineNo, "empty key");
        }
        if (current->contains(key)) {
            fail(lineNo, "duplicate key '" + std::string(key) + "' in section '" + current->name() + "'");
        }

        IniSection::Line l;
        l.isEntry = true;
        l.key     = std::string(key);
        l.value   = std::string(trim_ws(line.substr(eq + 1)));
        current->_lines.push_back(std::move(l));
    }

    // Blank lines between sections are regenerated by serialize().
    for (auto& s : doc._sections) {
        while (!s._lines.empty() && !s._lines.back().isEntry && s._lines.back().raw.empty()) {
            s._lines.pop_back();
        }
    }

    return doc;
}

std::string IniDocument::serialize() const
{
    std::string out;

    for (const auto& p : _preamble) {
        out += p;
        out += '\n';
    }
    if (!_preamble.empty() && !_sections.empty()) {
        out += '\n';
    }

    for (std::size_t i = 0; i < _sections.size(); ++i) {
        const auto& s = _sections[i];
        if (i > 0) {
            out += '\n';
        }
        out += '[';
        out += s.name();
        out += "]\n";
        for (const auto& l : s._lines) {
            if (l.isEntry) {
                out += l.key;
                out += '=';
                out += l.value;
            } else {
                out += l.raw;
            }
            out += '\n';
        }
    }

    return out;
}

IniSection* IniDocument::find(std::string_view name)
{
    for (auto& s : _sections) {
        if (s.name() == name) return &s;
    }
    return nullptr;
}

const IniSection* IniDocument::find(std::string_view name) const
{
    for (const auto& s : _sections) {
        if (s.name() == name) return &s;
    }
    return nullptr;
}

IniSection& IniDocument::get_or_add(std::string_view name)
{
    if (auto* s = find(name)) {
        return *s;
    }
    _sections.emplace_back(std::string(name));
    return _sections.back();
}

bool IniDocument::remove(std::string_view name)
{
    for (auto it = _sections.begin(); it != _sections.end(); ++it) {
        if (it->name() == name) {
            _sections.erase(it);
            return true;
        }
    }
    return false;
}

std::size_t IniDocument::retain_only(const std::vector<std::string>& keep)
{
    const auto before = _sections.size();
    _sections.erase(
        std::remove_if(_sections.begin(), _sections.end(),
                       [&](const IniSection& s) {
                           return std::find(keep.begin(), keep.end(), s.name()) == keep.end();
                       }),
        _sections.end());
    return before - _sections.size();
}

} // namespace vectorlink::config
