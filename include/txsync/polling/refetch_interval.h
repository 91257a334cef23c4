#ifndef TXSYNC_REFETCH_INTERVAL_H
#define TXSYNC_REFETCH_INTERVAL_H

#include <txsync/polling/mutation_poll_registry.h>

#include <vector>

namespace txsync {
    inline constexpr millis_t COUNTDOWN_OVERDUE_POLL_INTERVAL{5'000};
    inline constexpr millis_t COUNTDOWN_IMMINENT_POLL_INTERVAL{15'000};
    inline constexpr millis_t COUNTDOWN_DISTANT_POLL_INTERVAL{60'000};
    inline constexpr millis_t COUNTDOWN_IMMINENT_THRESHOLD{120'000};

    /**
     * Poll cadence while counting down to a known future ledger event: quick once it is due, moderate when it is
     * within two minutes, slow otherwise.
     */
    TXSYNC_EXPORT millis_t countdown_poll_interval(engine_time_t effect_at, engine_time_t now);

    /**
     * Picks the next poll interval for one read query of type T, evaluating layers in priority order:
     *
     * 1. The post-mutation decision of the registry, when it yields an interval.
     * 2. Countdown layers, in registration order; the first one reporting an effect time wins.
     * 3. Otherwise std::nullopt, nothing is pending.
     */
    template<typename T>
    class RefetchIntervalResolver {
    public:
        using data_ptr = std::shared_ptr<const T>;
        using effect_time_fn = std::function<std::optional<engine_time_t>(const T &)>;

        struct CountdownLayer {
            std::string name;
            effect_time_fn effect_time;
        };

        RefetchIntervalResolver(MutationPollRegistry::s_ptr registry, std::string query_name)
            : _registry{std::move(registry)}, _query_name{std::move(query_name)} {
            if (!_registry) { throw_error<std::invalid_argument>("RefetchIntervalResolver requires a registry"); }
        }

        RefetchIntervalResolver &add_countdown_layer(std::string name, effect_time_fn effect_time) {
            _layers.push_back({std::move(name), std::move(effect_time)});
            return *this;
        }

        [[nodiscard]] poll_interval_t compute(const data_ptr &data, const EntityKey &key,
                                              engine_time_t data_updated_at) const {
            if (auto interval = _registry->post_mutation_interval(key, _query_name, data, data_updated_at)) {
                return interval;
            }
            if (!data) { return std::nullopt; }
            for (const auto &layer: _layers) {
                if (auto effect_at = layer.effect_time(*data)) {
                    return countdown_poll_interval(*effect_at, _registry->clock()->now());
                }
            }
            return std::nullopt;
        }

        [[nodiscard]] const std::string &query_name() const { return _query_name; }

        [[nodiscard]] const std::vector<CountdownLayer> &layers() const { return _layers; }

    private:
        MutationPollRegistry::s_ptr _registry;
        std::string _query_name;
        std::vector<CountdownLayer> _layers;
    };

    /**
     * A resolver with only the post-mutation layer, used by queries with no schedulable pending state (roles,
     * ownership).
     */
    template<typename T>
    RefetchIntervalResolver<T> make_post_mutation_resolver(MutationPollRegistry::s_ptr registry,
                                                           std::string_view query_name) {
        return RefetchIntervalResolver<T>(std::move(registry), std::string{query_name});
    }
} // namespace txsync

#endif  // TXSYNC_REFETCH_INTERVAL_H
