#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>
#include <cstdint>

// Wall-clock milliseconds since the epoch. Record timestamps, retry due
// times and breaker timers all read time through this interface.
class Clock {
public:
    virtual ~Clock() {}
    virtual int64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

#endif // CLOCK_H
