#include "event_loop.h"
#include "logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

EventLoop::EventLoop() {
    // Create wake-up pipe for cross-thread signaling
    if (pipe(m_wakeup_pipe) < 0) {
        LOG_ERROR(std::string("EL: Failed to create wake-up pipe: ") + std::strerror(errno));
        m_wakeup_pipe[0] = m_wakeup_pipe[1] = -1;
    } else {
        fcntl(m_wakeup_pipe[0], F_SETFL, O_NONBLOCK);
        fcntl(m_wakeup_pipe[1], F_SETFL, O_NONBLOCK);
    }

    m_clock = [] { return std::chrono::steady_clock::now(); };
    LOG_DEBUG("EL: Initialized");
}

EventLoop::~EventLoop() {
    stop();

    if (m_wakeup_pipe[0] >= 0) close(m_wakeup_pipe[0]);
    if (m_wakeup_pipe[1] >= 0) close(m_wakeup_pipe[1]);

    std::lock_guard<std::mutex> lock(m_channels_mutex);
    for (auto& entry : m_channels) {
        entry.second->setNotifier(nullptr);
    }
    m_channels.clear();
}

void EventLoop::setEventHandler(EventHandler handler) {
    m_event_handler = std::move(handler);
}

void EventLoop::setClock(Clock clock) {
    if (clock) {
        m_clock = std::move(clock);
    }
}

std::chrono::steady_clock::time_point EventLoop::now() const {
    return m_clock();
}

void EventLoop::run() {
    if (m_running.exchange(true, std::memory_order_acq_rel)) {
        LOG_WARN("EL: Already running");
        return;
    }
    // A stop() that raced ahead of run() still ends the loop.
    LOG_INFO("EL: Entering main loop");

    while (!m_stopping.load(std::memory_order_acquire)) {
        const int timeout_ms = calculateNextTimeout();

        if (m_wakeup_pipe[0] >= 0) {
            struct pollfd pfd{m_wakeup_pipe[0], POLLIN, 0};
            int nfds = poll(&pfd, 1, timeout_ms);
            if (nfds < 0 && errno != EINTR) {
                LOG_WARN(std::string("EL: poll error: ") + std::strerror(errno));
            }
            if (nfds > 0 && (pfd.revents & POLLIN)) {
                char buf[256];
                while (read(m_wakeup_pipe[0], buf, sizeof(buf)) > 0) {}
            }
        } else {
            // No pipe: fall back to short sleeps.
            ::usleep(static_cast<useconds_t>(std::min(timeout_ms, 10)) * 1000);
        }

        runOnce();
    }

    m_running.store(false, std::memory_order_release);
    LOG_INFO("EL: Exited main loop");
}

void EventLoop::stop() {
    m_stopping.store(true, std::memory_order_release);
    wakeup();
}

size_t EventLoop::runOnce() {
    size_t handled = processPendingEvents();
    handled += processChannels();
    handled += processTimers();
    return handled;
}

size_t EventLoop::runUntilIdle(size_t max_rounds) {
    size_t total = 0;
    for (size_t round = 0; round < max_rounds; ++round) {
        const size_t handled = runOnce();
        if (handled == 0) {
            break;
        }
        total += handled;
    }
    return total;
}

void EventLoop::pushEvent(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_event_mutex);
        m_event_queue.push(std::move(event));
    }
    wakeup();
}

void EventLoop::addScheduledEvent(const std::string& id, SessionEvent event,
                                  std::chrono::steady_clock::time_point due_time) {
    {
        std::lock_guard<std::mutex> lock(m_scheduled_mutex);

        // Remove existing event with same ID
        m_scheduled_events.erase(
            std::remove_if(m_scheduled_events.begin(), m_scheduled_events.end(),
                           [&id](const ScheduledEvent& e) { return e.id == id; }),
            m_scheduled_events.end()
        );

        m_scheduled_events.push_back({id, std::move(event), due_time});

        // Sort by due time (stable keeps insertion order for equal deadlines)
        std::stable_sort(m_scheduled_events.begin(), m_scheduled_events.end(),
                         [](const ScheduledEvent& a, const ScheduledEvent& b) {
                             return a.due_time < b.due_time;
                         });
    }

    LOG_DEBUG("EL: Scheduled event added, id=" + id);
    wakeup();
}

void EventLoop::removeScheduledEvent(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    m_scheduled_events.erase(
        std::remove_if(m_scheduled_events.begin(), m_scheduled_events.end(),
                       [&id](const ScheduledEvent& e) { return e.id == id; }),
        m_scheduled_events.end()
    );
}

bool EventLoop::hasScheduledEvent(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    return std::any_of(m_scheduled_events.begin(), m_scheduled_events.end(),
                       [&id](const ScheduledEvent& e) { return e.id == id; });
}

void EventLoop::clearScheduledEvents() {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    m_scheduled_events.clear();
}

std::optional<std::chrono::steady_clock::time_point> EventLoop::nextDueTime() const {
    std::lock_guard<std::mutex> lock(m_scheduled_mutex);
    if (m_scheduled_events.empty()) {
        return std::nullopt;
    }
    return m_scheduled_events.front().due_time;
}

void EventLoop::attachChannel(std::shared_ptr<ConnectionChannel> channel) {
    if (!channel) {
        return;
    }
    channel->setNotifier([this] { wakeup(); });
    {
        std::lock_guard<std::mutex> lock(m_channels_mutex);
        m_channels[channel->id()] = std::move(channel);
    }
    wakeup();
}

void EventLoop::detachChannel(uint64_t connection_id) {
    std::shared_ptr<ConnectionChannel> channel;
    {
        std::lock_guard<std::mutex> lock(m_channels_mutex);
        auto it = m_channels.find(connection_id);
        if (it == m_channels.end()) {
            return;
        }
        channel = std::move(it->second);
        m_channels.erase(it);
    }
    channel->setNotifier(nullptr);
}

void EventLoop::wakeup() {
    if (m_wakeup_pipe[1] < 0) {
        return;
    }
    char c = 1;
    ssize_t n = write(m_wakeup_pipe[1], &c, 1);
    (void)n; // A full pipe already guarantees a wake-up
}

size_t EventLoop::processPendingEvents() {
    std::queue<SessionEvent> events_to_process;
    {
        std::lock_guard<std::mutex> lock(m_event_mutex);
        std::swap(events_to_process, m_event_queue);
    }

    size_t handled = 0;
    while (!events_to_process.empty()) {
        dispatch(events_to_process.front());
        events_to_process.pop();
        ++handled;
    }
    return handled;
}

size_t EventLoop::processChannels() {
    std::vector<std::shared_ptr<ConnectionChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(m_channels_mutex);
        channels.reserve(m_channels.size());
        for (const auto& entry : m_channels) {
            channels.push_back(entry.second);
        }
    }

    size_t handled = 0;
    for (const auto& channel : channels) {
        // Bounded per round so one busy connection cannot starve timers.
        for (size_t i = 0; i < kMaxEventsPerChannel; ++i) {
            // The handler may close the channel while we drain it.
            if (channel->isClosed()) {
                break;
            }
            TransportEvent event;
            if (!channel->pop(event)) {
                break;
            }
            dispatch(ChannelEvent{channel->id(), std::move(event)});
            ++handled;
        }
    }
    return handled;
}

size_t EventLoop::processTimers() {
    const auto current = now();

    // Never call the handler while holding m_scheduled_mutex: it may schedule again.
    std::vector<ScheduledEvent> due;
    {
        std::lock_guard<std::mutex> lock(m_scheduled_mutex);
        auto split = std::find_if(m_scheduled_events.begin(), m_scheduled_events.end(),
                                  [&current](const ScheduledEvent& e) { return e.due_time > current; });
        due.assign(std::make_move_iterator(m_scheduled_events.begin()),
                   std::make_move_iterator(split));
        m_scheduled_events.erase(m_scheduled_events.begin(), split);
    }

    for (const auto& scheduled : due) {
        LOG_DEBUG("EL: Scheduled event due, id=" + scheduled.id);
        dispatch(scheduled.event);
    }
    return due.size();
}

int EventLoop::calculateNextTimeout() const {
    int timeout = kMaxPollTimeoutMs;

    auto next_due = nextDueTime();
    if (next_due) {
        auto ms_until = std::chrono::duration_cast<std::chrono::milliseconds>(*next_due - now()).count();
        if (ms_until <= 0) {
            timeout = 0;  // Process immediately
        } else if (ms_until < timeout) {
            timeout = static_cast<int>(ms_until);
        }
    }
    return timeout;
}

void EventLoop::dispatch(const SessionEvent& event) {
    if (m_event_handler) {
        m_event_handler(event);
    }
}
