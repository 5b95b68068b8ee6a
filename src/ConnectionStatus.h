#pragma once
#include "Observer.h"
#include "configuration.h"

namespace eezpad
{

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    DISCONNECTING,
};

inline const char *connectionStateName(ConnectionState state)
{
    switch (state) {
    case ConnectionState::DISCONNECTED:
        return "disconnected";
    case ConnectionState::CONNECTING:
        return "connecting";
    case ConnectionState::CONNECTED:
        return "connected";
    case ConnectionState::DISCONNECTING:
        return "disconnecting";
    }
    return "unknown";
}

/**
 * Describes the state of the serial link to the device.
 *
 * ConnectionManager owns one of these and pushes every transition into it through observe()/updateStatus().
 * Observers of onNewStatus (the CLI, tests) see each distinct state exactly once.
 */
class ConnectionStatus
{
  private:
    CallbackObserver<ConnectionStatus, const ConnectionStatus *> statusObserver =
        CallbackObserver<ConnectionStatus, const ConnectionStatus *>(this, &ConnectionStatus::updateStatus);

    ConnectionState state = ConnectionState::DISCONNECTED;
    bool initialized = false;

  public:
    /// Fired after the state changed
    Observable<const ConnectionStatus *> onNewStatus;

    ConnectionStatus() {}
    explicit ConnectionStatus(ConnectionState s) : state(s) {}

    // Prevent object copy/move
    ConnectionStatus(const ConnectionStatus &) = delete;
    ConnectionStatus &operator=(const ConnectionStatus &) = delete;

    ConnectionState getConnectionState() const { return state; }

    /// False until the first state was pushed in
    bool isInitialized() const { return initialized; }

    // Start observing a source of state changes
    void observe(Observable<const ConnectionStatus *> *source) { statusObserver.observe(source); }

    bool matches(const ConnectionStatus *newStatus) const { return state == newStatus->getConnectionState(); }

    int updateStatus(const ConnectionStatus *newStatus)
    {
        if (initialized && matches(newStatus))
            return 0;

        ConnectionState previous = state;
        state = newStatus->getConnectionState();
        if (initialized)
            LOG_DEBUG("Connection %s -> %s", connectionStateName(previous), connectionStateName(state));
        initialized = true;

        onNewStatus.notifyObservers(this);
        return 0;
    }
};

} // namespace eezpad
