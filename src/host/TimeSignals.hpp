#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace deaddrop {

/// In-game time boundaries delivered by the host
enum class TimeSignal {
    DayPassed,
    WeekPassed,
    SleepStart
};

inline const char* timeSignalToString(TimeSignal signal) {
    switch (signal) {
        case TimeSignal::DayPassed:  return "day_passed";
        case TimeSignal::WeekPassed: return "week_passed";
        case TimeSignal::SleepStart: return "sleep_start";
    }
    return "unknown";
}

/// Handler ID for unsubscribing
using SignalHandlerId = uint64_t;

using SignalHandler = std::function<void()>;

/// Synchronous dispatcher for time signals.  Handlers run on the caller's
/// thread, lowest priority first; there is no queueing.
class TimeSignalBus {
public:
    TimeSignalBus() = default;

    SignalHandlerId on(TimeSignal signal, SignalHandler handler, int priority = 0) {
        SignalHandlerId id = m_nextId++;
        auto& handlers = m_handlers[signal];
        handlers.push_back({id, priority, std::move(handler)});
        std::stable_sort(handlers.begin(), handlers.end(),
            [](const HandlerEntry& a, const HandlerEntry& b) {
                return a.priority < b.priority;
            });
        return id;
    }

    bool off(SignalHandlerId id) {
        for (auto& [signal, handlers] : m_handlers) {
            auto it = std::find_if(handlers.begin(), handlers.end(),
                [id](const HandlerEntry& entry) { return entry.id == id; });
            if (it != handlers.end()) {
                handlers.erase(it);
                return true;
            }
        }
        return false;
    }

    void emit(TimeSignal signal) {
        auto it = m_handlers.find(signal);
        if (it == m_handlers.end()) return;

        // Copy so handlers may subscribe or unsubscribe while dispatching
        auto handlers = it->second;
        for (const auto& handler : handlers) {
            handler.callback();
        }
    }

    size_t handlerCount(TimeSignal signal) const {
        auto it = m_handlers.find(signal);
        return it != m_handlers.end() ? it->second.size() : 0;
    }

    void clear() { m_handlers.clear(); }

private:
    struct HandlerEntry {
        SignalHandlerId id;
        int priority;
        SignalHandler callback;
    };

    std::unordered_map<TimeSignal, std::vector<HandlerEntry>> m_handlers;
    SignalHandlerId m_nextId = 1;
};

} // namespace deaddrop
