#include <txsync/util/lifecycle.h>

#include <cstdio>
#include <exception>

namespace txsync {
    bool ComponentLifeCycle::is_initialised() const { return _initialised; }

    bool ComponentLifeCycle::is_started() const { return _started; }

    bool ComponentLifeCycle::is_starting() const { return _transitioning && !_started; }

    bool ComponentLifeCycle::is_stopping() const { return _transitioning && _started; }

    struct TransitionGuard {
        explicit TransitionGuard(ComponentLifeCycle &component) : _component{component} {
            _component._transitioning = true;
        }

        ~TransitionGuard() { _component._transitioning = false; }

    private:
        ComponentLifeCycle &_component;
    };

    /*
     * NOTE the LifeCycle methods are expected to be called on a single thread, so the simple guard clauses
     * used here are sufficient to ensure we don't accidentally start/stop more than once.
     */

    void initialise_component(ComponentLifeCycle &component) {
        if (component._initialised) { return; }
        component.initialise();
        component._initialised = true;
    }

    void start_component(ComponentLifeCycle &component) {
        if (component.is_started() || component.is_starting()) { return; }
        if (!component.is_initialised()) { initialise_component(component); }
        TransitionGuard guard{component};
        component.start();
        // If start throws, the started flag stays false; the guard still clears the transitioning flag.
        component._started = true;
    }

    void stop_component(ComponentLifeCycle &component) {
        if (!component.is_started() || component.is_stopping()) { return; }
        TransitionGuard guard{component};
        component.stop();
        component._started = false;
    }

    void dispose_component(ComponentLifeCycle &component) {
        if (!component._initialised) { return; }
        if (component.is_started()) { stop_component(component); }
        component.dispose();
        component._initialised = false;
    }

    InitialiseDisposeContext::InitialiseDisposeContext(ComponentLifeCycle &component) : _component{component} {
        initialise_component(component);
    }

    InitialiseDisposeContext::~InitialiseDisposeContext() noexcept {
        try {
            dispose_component(_component);
        } catch (const std::exception &e) {
            fprintf(stderr, "Warning: exception during dispose_component: %s\n", e.what());
        } catch (...) {
            fprintf(stderr, "Warning: unknown exception during dispose_component\n");
        }
    }

    StartStopContext::StartStopContext(ComponentLifeCycle &component) : _component{component} {
        start_component(_component);
    }

    StartStopContext::~StartStopContext() noexcept {
        try {
            stop_component(_component);
        } catch (const std::exception &e) {
            fprintf(stderr, "Warning: exception during stop_component: %s\n", e.what());
        } catch (...) {
            fprintf(stderr, "Warning: unknown exception during stop_component\n");
        }
    }
} // namespace txsync
