#include "ConnectivityMonitor.h"
#include "EnvironmentProbe.h"
#include "StateLogger.h"
#include "logger.h"

ConnectivityMonitor::ConnectivityMonitor(EnvironmentProbe* link_probe, bool initially_online)
    : probe(link_probe),
      online(initially_online),
      restore_count(0)
{
}

ConnectivityMonitor::~ConnectivityMonitor()
{
}

void ConnectivityMonitor::set_online(bool now_online)
{
    if (now_online == online) {
        return;
    }
    online = now_online;

    LOG_INFO_CTX("connectivity", "Link is %s", online ? "up" : "down");
    LOG_STATE("CONNECTIVITY: %s", online ? "ONLINE" : "OFFLINE");

    if (online) {
        restore_count++;
        // Copy: a listener may register another one
        std::vector<Listener> snapshot = listeners;
        for (const Listener& listener : snapshot) {
            listener();
        }
    }
}

bool ConnectivityMonitor::refresh()
{
    if (probe) {
        set_online(probe->link_is_up());
    }
    return online;
}

void ConnectivityMonitor::on_restored(Listener listener)
{
    listeners.push_back(listener);
}
