#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include "connection_channel.h"
#include "session_events.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

/**
 * @brief EventLoop - Single-threaded dispatcher for one SessionCoordinator
 *
 * Every session state change happens on the thread that runs the loop.
 * Three sources feed the handler, in this order per round:
 * - the internal event queue (pushEvent, safe from any thread)
 * - attached connection channels (transport threads push, the loop drains)
 * - scheduled events whose due time has passed (timeouts, sender resume)
 *
 * run() blocks in poll() on a wake-up pipe until work arrives or the next
 * scheduled event is due. Tests drive the loop with runOnce()/runUntilIdle()
 * and a manual clock instead.
 */
class EventLoop {
public:
    using EventHandler = std::function<void(const SessionEvent&)>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void setEventHandler(EventHandler handler);
    // Replaces steady_clock::now (tests). Set before the loop runs.
    void setClock(Clock clock);
    std::chrono::steady_clock::time_point now() const;

    // Lifecycle
    void run();
    void stop();
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }

    // One dispatch round. Returns the number of events handled.
    size_t runOnce();
    // Rounds until nothing is left to handle (bounded by max_rounds).
    size_t runUntilIdle(size_t max_rounds = 10000);

    // Event queue (for internal events like user commands)
    void pushEvent(SessionEvent event);

    // Timer management. Adding an id that exists replaces it.
    void addScheduledEvent(const std::string& id, SessionEvent event,
                           std::chrono::steady_clock::time_point due_time);
    void removeScheduledEvent(const std::string& id);
    bool hasScheduledEvent(const std::string& id) const;
    void clearScheduledEvents();
    std::optional<std::chrono::steady_clock::time_point> nextDueTime() const;

    // Connection channels
    void attachChannel(std::shared_ptr<ConnectionChannel> channel);
    void detachChannel(uint64_t connection_id);

    // Wake up the event loop (e.g., when new events are pushed)
    void wakeup();

private:
    size_t processPendingEvents();
    size_t processChannels();
    size_t processTimers();
    int calculateNextTimeout() const;
    void dispatch(const SessionEvent& event);

    // Scheduled event structure
    struct ScheduledEvent {
        std::string id;
        SessionEvent event;
        std::chrono::steady_clock::time_point due_time;
    };

    static constexpr size_t kMaxEventsPerChannel = 64;
    static constexpr int kMaxPollTimeoutMs = 1000;

    // State
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};

    // Wake-up pipe for cross-thread signaling
    int m_wakeup_pipe[2]{-1, -1};

    // Event queue
    std::queue<SessionEvent> m_event_queue;
    std::mutex m_event_mutex;

    // Scheduled events (sorted by due time)
    std::vector<ScheduledEvent> m_scheduled_events;
    mutable std::mutex m_scheduled_mutex;

    // Attached channels by connection id
    std::map<uint64_t, std::shared_ptr<ConnectionChannel>> m_channels;
    std::mutex m_channels_mutex;

    Clock m_clock;
    EventHandler m_event_handler;
};

#endif // EVENT_LOOP_H
