#pragma once
// include/skywatch/engine/ChangeNotifier.hpp
//
// "State changed, re-read and refresh" signal for the presentation layer.
// Payload-free: subscribers query the engine for current state.

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace skywatch::engine {

class ChangeNotifier {
public:
    using SubscriptionId = std::uint64_t;
    using Callback       = std::function<void()>;

    [[nodiscard]] SubscriptionId Subscribe(Callback cb)
    {
        const SubscriptionId id = ++m_lastId;
        m_subscribers.push_back({id, std::move(cb)});
        return id;
    }

    // Returns false when `id` was not subscribed.
    bool Unsubscribe(SubscriptionId id) noexcept
    {
        for (auto it = m_subscribers.begin(); it != m_subscribers.end(); ++it)
        {
            if (it->id == id)
            {
                m_subscribers.erase(it);
                return true;
            }
        }
        return false;
    }

    // Subscribers may unsubscribe (themselves or others) from inside the callback. One
    // removed during this Notify() is not called afterwards; one added is not called
    // until the next Notify().
    void Notify() const
    {
        const auto snapshot = m_subscribers;
        for (const auto& s : snapshot)
        {
            if (s.callback && IsSubscribed(s.id))
                s.callback();
        }
    }

    [[nodiscard]] std::size_t SubscriberCount() const noexcept { return m_subscribers.size(); }

private:
    [[nodiscard]] bool IsSubscribed(SubscriptionId id) const noexcept
    {
        for (const auto& s : m_subscribers)
        {
            if (s.id == id)
                return true;
        }
        return false;
    }

    struct Subscriber {
        SubscriptionId id = 0;
        Callback       callback;
    };

    std::vector<Subscriber> m_subscribers;
    SubscriptionId          m_lastId = 0;
};

} // namespace skywatch::engine
