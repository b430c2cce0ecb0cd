#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

#include "vectorlink/config/ini_document.h"
#include "vectorlink/config/robot_configuration.h"

namespace vectorlink::config {

/**
 * Lazy, finite, restartable view of the entries in a configuration file.
 *
 * Nothing is read until begin() is called. Every begin() reads the file again,
 * so iterating twice sees changes made in between. Sections are decoded one
 * at a time as the iterator advances; a section that fails to decode throws
 * from begin() or operator++ and ends the iteration.
 */
class RobotConfigurationSequence {
public:
    // Returns the parsed file, or nullptr when there is no file yet.
    using Reader  = std::function<std::shared_ptr<const IniDocument>()>;
    using Decoder = std::function<RobotConfiguration(const IniSection&)>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = RobotConfiguration;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const RobotConfiguration*;
        using reference         = const RobotConfiguration&;

        iterator() = default;

        reference operator*() const { return *_current; }
        pointer   operator->() const { return &*_current; }

        iterator& operator++();

        bool operator==(const iterator& other) const { return at_end() == other.at_end(); }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class RobotConfigurationSequence;

        iterator(std::shared_ptr<const IniDocument> doc,
                 std::shared_ptr<const Decoder>     decoder);

        bool at_end() const { return !_doc || _index >= _doc->size(); }
        void decode_current();

        std::shared_ptr<const IniDocument> _doc;
        std::shared_ptr<const Decoder>     _decoder;
        std::size_t                        _index{0};
        std::optional<RobotConfiguration>  _current;
    };

    RobotConfigurationSequence(Reader reader, Decoder decoder);

    iterator begin() const;
    iterator end() const { return iterator(); }

    // Reads and decodes everything in one go.
    std::vector<RobotConfiguration> to_vector() const;

private:
    Reader                         _reader;
    std::shared_ptr<const Decoder> _decoder;
};

// Abstract storage interface.
class RobotConfigStore {
public:
    virtual ~RobotConfigStore() = default;

    // Every entry in file order. A missing file yields an empty sequence.
    virtual RobotConfigurationSequence load_all() = 0;

    // First entry, if any.
    virtual std::optional<RobotConfiguration> load_default() = 0;

    // Updates the entry's section, or appends one. Other sections are kept.
    virtual void add_or_update(const RobotConfiguration& robot) = 0;

    // Writes `robots` and removes every section not among them.
    virtual void save(const std::vector<RobotConfiguration>& robots) = 0;
};

} // namespace vectorlink::config
