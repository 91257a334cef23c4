#ifndef TXSYNC_MUTATION_POLL_REGISTRY_H
#define TXSYNC_MUTATION_POLL_REGISTRY_H

#include <txsync/polling/polling_types.h>
#include <txsync/runtime/evaluation_clock.h>
#include <txsync/runtime/observers/reconciliation_observer.h>
#include <txsync/util/reference_count_subscriber.h>

#include <mutex>
#include <unordered_map>

namespace txsync {
    // Safety ceiling on how long an entity may remain "awaiting update"
    inline constexpr millis_t POST_MUTATION_POLL_WINDOW{30'000};
    inline constexpr millis_t POST_MUTATION_POLL_INTERVAL{5'000};
    // Repeated notifications for the same entity within this window are coalesced
    inline constexpr millis_t MUTATION_DEDUP_WINDOW{1'000};

    struct TXSYNC_EXPORT MutationPollingConfig {
        millis_t poll_window{POST_MUTATION_POLL_WINDOW};
        millis_t poll_interval{POST_MUTATION_POLL_INTERVAL};
        millis_t dedup_window{MUTATION_DEDUP_WINDOW};

        void validate() const;
    };

    struct MutationPollState {
        engine_time_t timestamp;
        std::optional<MutationPreview> preview;
        std::unordered_map<std::string, data_ref_t> snapshots;
    };

    /**
     * Notified whenever a poll state is created, refreshed or retired, so a host can re-render the pending preview.
     */
    struct TXSYNC_EXPORT MutationPollStateListener {
        using ptr = MutationPollStateListener *;

        virtual ~MutationPollStateListener() = default;

        virtual void on_poll_state_changed(const EntityKey &key) = 0;
    };

    /**
     * Per-entity bookkeeping of recent writes. Recording a mutation opens a bounded window during which every read
     * query of the entity keeps polling until one of them observes new data (or the window elapses).
     *
     * All mutations and decisions are serialised under a single mutex, listeners and observers are called once it
     * has been released.
     */
    class TXSYNC_EXPORT MutationPollRegistry {
    public:
        using ptr = MutationPollRegistry *;
        using s_ptr = std::shared_ptr<MutationPollRegistry>;

        explicit MutationPollRegistry(EvaluationClock::s_ptr clock, MutationPollingConfig config = {},
                                      ObserverHub::s_ptr observers = {});

        /**
         * Marks the entity as awaiting an update. A repeat within the dedup window is a no-op (the first writer's
         * timestamp and preview win); after the window the timestamp is refreshed, the preview replaced when one is
         * given, and snapshots are kept.
         */
        void record_mutation(const EntityKey &key, std::optional<MutationPreview> preview = std::nullopt);

        /**
         * The post-mutation poll decision for one fetch of one query.
         *
         * @return the poll interval while the entity is still awaiting fresh data, std::nullopt when there is
         *         nothing to wait for. The state is retired when the window elapses or when any of the entity's
         *         queries returns a reference different from its first post-write snapshot.
         */
        [[nodiscard]] poll_interval_t post_mutation_interval(const EntityKey &key, std::string_view query_name,
                                                             const data_ref_t &current_data,
                                                             engine_time_t data_updated_at);

        [[nodiscard]] std::optional<MutationPreview> preview(const EntityKey &key) const;

        [[nodiscard]] bool is_awaiting_update(const EntityKey &key) const;

        [[nodiscard]] std::optional<MutationPollState> poll_state(const EntityKey &key) const;

        [[nodiscard]] std::size_t size() const;

        void clear(const EntityKey &key);

        void clear_all();

        void subscribe(MutationPollStateListener::ptr listener);

        void un_subscribe(MutationPollStateListener::ptr listener);

        [[nodiscard]] const MutationPollingConfig &config() const { return _config; }

        [[nodiscard]] const EvaluationClock::s_ptr &clock() const { return _clock; }

        [[nodiscard]] const ObserverHub::s_ptr &observers() const { return _observers; }

    private:
        void _notify_listeners(const EntityKey &key) const;

        EvaluationClock::s_ptr _clock;
        MutationPollingConfig _config;
        ObserverHub::s_ptr _observers;

        mutable std::mutex _mutex;
        std::unordered_map<EntityKey, MutationPollState> _states;

        mutable std::mutex _listener_mutex;
        ReferenceCountSubscriber<MutationPollStateListener::ptr> _listeners;
    };
} // namespace txsync

#endif  // TXSYNC_MUTATION_POLL_REGISTRY_H
