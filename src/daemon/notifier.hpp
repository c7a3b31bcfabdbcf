#pragma once

#include "daemon/service_types.hpp"

#include <functional>
#include <mutex>
#include <vector>

/// Fan-out of service events to any number of listeners.
/// Listeners are invoked synchronously on the emitting thread.
class Notifier {
public:
    using Listener = std::function<void(const ServiceEvent&)>;

    void subscribe(Listener listener);
    void emit(const ServiceEvent& event);

private:
    std::mutex mutex_;
    std::vector<Listener> listeners_;
};
