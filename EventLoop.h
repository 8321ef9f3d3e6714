#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>
#include <vector>

class Clock;

// Single-threaded cooperative scheduler. Everything in the pipeline runs
// from run_once(): posted tasks, due timers, then pollers (HTTP transfers).
class EventLoop
{
public:
    typedef std::function<void()> Task;

    // Returns true while it still has outstanding work
    typedef std::function<bool()> Poller;

    explicit EventLoop(const Clock& clock);
    ~EventLoop();

    void post(Task task);

    // Returns a timer id usable with cancel()
    uint64_t schedule_after(int64_t delay_ms, Task task);
    bool cancel(uint64_t timer_id);

    void add_poller(Poller poller);

    // One pass. Returns true if anything ran or a poller is still busy.
    bool run_once();

    // Runs passes until nothing is ready. Timers that are not yet due do
    // not keep the loop busy.
    int run_until_idle(int max_passes = 100000);

    // Main loop for the daemon; sleeps idle_sleep_ms when a pass did nothing
    void run(const std::atomic<bool>& running, int idle_sleep_ms);

    size_t pending_timers() const { return timers.size(); }
    bool has_posted_tasks() const { return !posted.empty(); }
    int64_t now_ms() const;
    const Clock& get_clock() const { return clock; }

    // Delay until the earliest timer, -1 when there are none
    int64_t ms_until_next_timer() const;

private:
    const Clock& clock;
    std::vector<Task> posted;

    // (due time, id) keeps timers with equal due times in scheduling order
    std::map<std::pair<int64_t, uint64_t>, Task> timers;
    std::map<uint64_t, int64_t> timer_due;   // id -> due time, for cancel()
    std::vector<Poller> pollers;
    uint64_t next_timer_id;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
};

#endif // EVENT_LOOP_H
