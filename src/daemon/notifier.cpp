#include "daemon/notifier.hpp"

#include <spdlog/spdlog.h>

void Notifier::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void Notifier::emit(const ServiceEvent& event) {
    // Copy so a listener may subscribe without deadlocking
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }

    if (event.message.empty()) {
        spdlog::debug("[Notifier] {}", event.name());
    } else {
        spdlog::debug("[Notifier] {}: {}", event.name(), event.message);
    }

    for (const auto& listener : listeners) {
        listener(event);
    }
}
