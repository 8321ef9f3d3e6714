#ifndef CONNECTIVITY_MONITOR_H
#define CONNECTIVITY_MONITOR_H

#include <functional>
#include <vector>

class EnvironmentProbe;

// Online/offline flag for the pipeline. Listeners run on every
// offline -> online transition.
class ConnectivityMonitor
{
public:
    typedef std::function<void()> Listener;

    // probe may be null; set_online() then drives the state
    explicit ConnectivityMonitor(EnvironmentProbe* probe = nullptr, bool initially_online = true);
    ~ConnectivityMonitor();

    bool is_online() const { return online; }
    void set_online(bool now_online);

    // Re-reads link state from the probe. Returns the current state.
    bool refresh();

    void on_restored(Listener listener);

    int get_restore_count() const { return restore_count; }

private:
    EnvironmentProbe* probe;
    bool online;
    int restore_count;
    std::vector<Listener> listeners;
};

#endif // CONNECTIVITY_MONITOR_H
