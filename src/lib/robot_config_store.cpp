#include "vectorlink/config/robot_config_store.h"

#include <utility>

namespace vectorlink::config {

// ---------- iterator ----------

RobotConfigurationSequence::iterator::iterator(std::shared_ptr<const IniDocument> doc,
                                               std::shared_ptr<const Decoder>     decoder)
    : _doc(std::move(doc))
    , _decoder(std::move(decoder))
{
    decode_current();
}

RobotConfigurationSequence::iterator& RobotConfigurationSequence::iterator::operator++()
{
    ++_index;
    decode_current();
    return *this;
}

void RobotConfigurationSequence::iterator::decode_current()
{
    _current.reset();
    if (at_end()) {
        return;
    }
    try {
        _current.emplace((*_decoder)(_doc->sections()[_index]));
    } catch (...) {
        // A failed section ends the sequence; the error goes to the caller.
        _doc.reset();
        throw;
    }
}

// ---------- sequence ----------

RobotConfigurationSequence::RobotConfigurationSequence(Reader reader, Decoder decoder)
    : _reader(std::move(reader))
    , _decoder(std::make_shared<const Decoder>(std::move(decoder)))
{
}

RobotConfigurationSequence::iterator RobotConfigurationSequence::begin() const
{
    return iterator(_reader(), _decoder);
}

std::vector<RobotConfiguration> RobotConfigurationSequence::to_vector() const
{
    std::vector<RobotConfiguration> out;
    for (auto it = begin(); it != end(); ++it) {
        out.push_back(*it);
    }
    return out;
}

} // namespace vectorlink::config
