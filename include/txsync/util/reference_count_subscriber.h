#ifndef TXSYNC_REFERENCE_COUNT_SUBSCRIBER_H
#define TXSYNC_REFERENCE_COUNT_SUBSCRIBER_H

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace txsync {
    /**
     * Tracks subscribers with a reference count, so a subscriber registered twice must un-subscribe twice
     * before it stops receiving notifications.
     */
    template<typename T>
    class ReferenceCountSubscriber {
    public:
        void subscribe(T subscriber);

        void un_subscribe(T subscriber);

        [[nodiscard]] bool empty() const { return m_subscriptions.empty(); }

        [[nodiscard]] std::size_t size() const { return m_subscriptions.size(); }

        [[nodiscard]] std::size_t count(T subscriber) const {
            auto it{m_subscriptions.find(subscriber)};
            return it == m_subscriptions.end() ? 0 : it->second;
        }

        void clear() { m_subscriptions.clear(); }

        // Snapshot of the current subscribers, safe to iterate while the set is modified
        [[nodiscard]] std::vector<T> subscribers() const {
            std::vector<T> result;
            result.reserve(m_subscriptions.size());
            for (const auto &[k, _]: m_subscriptions) { result.push_back(k); }
            return result;
        }

        template<typename Op>
        void apply(Op op) {
            for (const auto &[k, _]: m_subscriptions) { op(k); }
        }

    private:
        std::unordered_map<T, std::size_t> m_subscriptions{};
    };

    template<typename T>
    void ReferenceCountSubscriber<T>::subscribe(T subscriber) {
        auto [it, success] = m_subscriptions.insert({subscriber, 1});
        if (!success) { ++(it->second); }
    }

    template<typename T>
    void ReferenceCountSubscriber<T>::un_subscribe(T subscriber) {
        auto it{m_subscriptions.find(subscriber)};
        if (it != m_subscriptions.end()) {
            if (--(it->second) == 0) { m_subscriptions.erase(it); }
        }
    }
} // namespace txsync
#endif  // TXSYNC_REFERENCE_COUNT_SUBSCRIBER_H
