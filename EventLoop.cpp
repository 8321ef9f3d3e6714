#include "EventLoop.h"
#include "Clock.h"
#include "logger.h"

#include <chrono>
#include <thread>

EventLoop::EventLoop(const Clock& clk)
    : clock(clk),
      next_timer_id(1)
{
}

EventLoop::~EventLoop()
{
}

int64_t EventLoop::now_ms() const
{
    return clock.now_ms();
}

void EventLoop::post(Task task)
{
    posted.push_back(std::move(task));
}

uint64_t EventLoop::schedule_after(int64_t delay_ms, Task task)
{
    if (delay_ms < 0) {
        delay_ms = 0;
    }
    uint64_t id = next_timer_id++;
    int64_t due = clock.now_ms() + delay_ms;
    timers[std::make_pair(due, id)] = std::move(task);
    timer_due[id] = due;
    return id;
}

bool EventLoop::cancel(uint64_t timer_id)
{
    auto it = timer_due.find(timer_id);
    if (it == timer_due.end()) {
        return false;
    }
    timers.erase(std::make_pair(it->second, timer_id));
    timer_due.erase(it);
    return true;
}

void EventLoop::add_poller(Poller poller)
{
    pollers.push_back(std::move(poller));
}

int64_t EventLoop::ms_until_next_timer() const
{
    if (timers.empty()) {
        return -1;
    }
    int64_t delta = timers.begin()->first.first - clock.now_ms();
    return delta > 0 ? delta : 0;
}

bool EventLoop::run_once()
{
    bool busy = false;

    // Tasks posted while these run go to the next pass
    std::vector<Task> tasks;
    tasks.swap(posted);
    for (size_t i = 0; i < tasks.size(); i++) {
        tasks[i]();
        busy = true;
    }

    // Timers due now. Keys are collected first so a timer scheduling another
    // zero-delay timer cannot starve the pollers; each is looked up again
    // before it runs since an earlier one may have cancelled it.
    int64_t now = clock.now_ms();
    std::vector<std::pair<int64_t, uint64_t>> due;
    for (auto it = timers.begin(); it != timers.end() && it->first.first <= now; ++it) {
        due.push_back(it->first);
    }
    for (size_t i = 0; i < due.size(); i++) {
        auto it = timers.find(due[i]);
        if (it == timers.end()) {
            continue;
        }
        Task task = std::move(it->second);
        timer_due.erase(it->first.second);
        timers.erase(it);
        task();
        busy = true;
    }

    for (size_t i = 0; i < pollers.size(); i++) {
        if (pollers[i]()) {
            busy = true;
        }
    }

    return busy || !posted.empty();
}

int EventLoop::run_until_idle(int max_passes)
{
    int passes = 0;
    while (passes < max_passes) {
        passes++;
        if (!run_once()) {
            break;
        }
    }
    if (passes >= max_passes) {
        LOG_WARN_CTX("event_loop", "run_until_idle stopped after %d passes", passes);
    }
    return passes;
}

void EventLoop::run(const std::atomic<bool>& running, int idle_sleep_ms)
{
    while (running.load()) {
        if (!run_once()) {
            int64_t wait = ms_until_next_timer();
            if (wait < 0 || wait > idle_sleep_ms) {
                wait = idle_sleep_ms;
            }
            if (wait > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(wait));
            }
        }
    }
}
