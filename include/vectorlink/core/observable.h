#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "vectorlink/core/event_stream.h"

namespace vectorlink::core {

struct PropertyChangedEvent {
    std::string property; // e.g. "ip_address", "has_remote_host"
};

/**
 * Base for objects whose mutable fields notify on change.
 *
 * Subclasses route setters through set_property() and call raise_changed()
 * for derived values that have no backing field of their own.
 *
 * Copies start with no subscribers; moves take them along.
 */
class ObservableObject {
public:
    ObservableObject() = default;
    virtual ~ObservableObject() = default;

    ObservableObject(const ObservableObject&) {}
    ObservableObject& operator=(const ObservableObject&) { return *this; }

    ObservableObject(ObservableObject&&) noexcept = default;
    ObservableObject& operator=(ObservableObject&&) noexcept = default;

    EventStream<PropertyChangedEvent>&       property_changed() noexcept { return _changed; }
    const EventStream<PropertyChangedEvent>& property_changed() const noexcept { return _changed; }

protected:
    // Assigns value to field and publishes `name` if the two differ.
    // Returns true when the field changed.
    template <typename T>
    bool set_property(T& field, T value, std::string_view name)
    {
        if (field == value) {
            return false;
        }
        field = std::move(value);
        raise_changed(name);
        return true;
    }

    void raise_changed(std::string_view name) const
    {
        _changed.publish(PropertyChangedEvent{std::string(name)});
    }

private:
    EventStream<PropertyChangedEvent> _changed;
};

} // namespace vectorlink::core
