#ifndef TXSYNC_LIFECYCLE_H
#define TXSYNC_LIFECYCLE_H

#include <txsync/txsync_export.h>

namespace txsync {
    struct ComponentLifeCycle;

    void TXSYNC_EXPORT initialise_component(ComponentLifeCycle &component);

    void TXSYNC_EXPORT start_component(ComponentLifeCycle &component);

    void TXSYNC_EXPORT stop_component(ComponentLifeCycle &component);

    void TXSYNC_EXPORT dispose_component(ComponentLifeCycle &component);

    struct TransitionGuard;

    /**
     * This will intialise the component in the constructor and dispose in the destructor.
     */
    struct TXSYNC_EXPORT InitialiseDisposeContext {
        explicit InitialiseDisposeContext(ComponentLifeCycle &component);

        ~InitialiseDisposeContext() noexcept;

    private:
        ComponentLifeCycle &_component;
    };

    /**
     * This will start the component in the constructor and stop in the destructor.
     */
    struct TXSYNC_EXPORT StartStopContext {
        explicit StartStopContext(ComponentLifeCycle &component);

        ~StartStopContext() noexcept; // Never throws - call stop_component explicitly if you need the exception

    private:
        ComponentLifeCycle &_component;
    };

    /**
     * The Life-cycle and associated method calls are as follows:
     *
     * * The component is constructed, collaborators (clock, adapters, observers) are supplied at this point.
     *
     * * initialise is called once, before the first start.
     *
     * * start is called when a consumer becomes interested in the component's output, for example the block-time
     *   calibrator starts when a contract is selected. This is where polling alarms get scheduled.
     *
     * * stop is called when the consumer loses interest. Any alarms scheduled by the component must be cancelled
     *   here so no late callbacks fire on stale state.
     *
     * * dispose is called once the component is no longer required.
     *
     * NOTE: start and stop can be called numerous times during the life-time of the component. The component must
     *       be able to start again cleanly after stop has been called. Stop is not dispose.
     */
    struct TXSYNC_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        [[nodiscard]] bool is_initialised() const;

        /**
         * The componented is started (true) or stopped (false).
         * By default, this is stopped.
         */
        [[nodiscard]] bool is_started() const;

        [[nodiscard]] bool is_starting() const;

        [[nodiscard]] bool is_stopping() const;

    protected:
        virtual void initialise() = 0;

        virtual void start() = 0;

        virtual void stop() = 0;

        virtual void dispose() = 0;

    private:
        bool _initialised{false};
        bool _started{false};
        bool _transitioning{false};

        friend TransitionGuard;

        friend void initialise_component(ComponentLifeCycle &component);

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);

        friend void dispose_component(ComponentLifeCycle &component);
    };
} // namespace txsync

#endif  // TXSYNC_LIFECYCLE_H
