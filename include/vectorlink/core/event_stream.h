#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace vectorlink::core {

/**
 * Minimal synchronous pub/sub stream.
 *
 * Callbacks run inline on the publishing thread, before publish() returns.
 * There is no locking: a stream belongs to one thread at a time.
 * publish() iterates a snapshot, so a callback may subscribe or
 * unsubscribe (itself included) without disturbing the current delivery.
 */
template <typename EventT>
class EventStream {
public:
    using Callback = std::function<void(const EventT&)>;

    struct Subscription {
        std::uint32_t id{0};
    };

    Subscription subscribe(Callback cb)
    {
        const std::uint32_t id = ++_nextId;
        _subs.push_back({id, std::move(cb)});
        return Subscription{id};
    }

    void unsubscribe(Subscription sub)
    {
        for (auto it = _subs.begin(); it != _subs.end(); ++it) {
            if (it->id == sub.id) {
                _subs.erase(it);
                return;
            }
        }
    }

    void publish(const EventT& ev) const
    {
        const std::vector<Subscriber> snap = _subs;
        for (const auto& s : snap) {
            if (s.cb) s.cb(ev);
        }
    }

    std::size_t subscriber_count() const noexcept { return _subs.size(); }

    void clear() noexcept { _subs.clear(); }

private:
    struct Subscriber {
        std::uint32_t id;
        Callback cb;
    };

    std::uint32_t _nextId{0};
    std::vector<Subscriber> _subs;
};

} // namespace vectorlink::core
