#pragma once

#include "ConnectionStatus.h"
#include "Observer.h"
#include "concurrency/Lock.h"
#include "concurrency/PeriodicTask.h"
#include "configuration.h"
#include "error.h"
#include "protocol/MessageCodec.h"
#include "protocol/ResponseParser.h"
#include "serial/Transport.h"
#include <memory>
#include <string>

/**
 * Owns the link to one macro pad.
 *
 * State machine: DISCONNECTED -connect()-> CONNECTING -> CONNECTED (or back to DISCONNECTED if the port would not open).
 * CONNECTED -disconnect(), EOF or an IO error-> DISCONNECTING -> DISCONNECTED once the port is closed.
 *
 * The read loop is this PeriodicTask: each run does one non-blocking read, feeds the bytes to the ResponseParser and
 * picks its next poll interval. Writes happen directly from send() under the write lock, one whole frame at a time.
 */
class ConnectionManager : private concurrency::PeriodicTask
{
    std::unique_ptr<Transport> transport;
    uint32_t baud;

    /// Held for the duration of one frame write
    concurrency::Lock writeLock;

    /// Set by disconnect() or a failed write, acted on by the read loop between chunks
    bool stopRequested = false;

    uint32_t lastRxMsec = 0;
    uint32_t recentRxMsec = READ_RECENT_RX_MS;
    int32_t lastVersion = -1;

    ResponseParser parser;

    eezpad::ConnectionStatus status;
    Observable<const eezpad::ConnectionStatus *> newStatus;

    CallbackObserver<ConnectionManager, const DeviceBanner *> bannerObserver =
        CallbackObserver<ConnectionManager, const DeviceBanner *>(this, &ConnectionManager::handleBanner);

  public:
    ConnectionManager(std::unique_ptr<Transport> transport, uint32_t baud = EEZPAD_SERIAL_BAUD);
    ~ConnectionManager();

    /**
     * Open the transport and ask the device for its version.
     *
     * Returns ALREADY_CONNECTED (and does nothing) unless we are DISCONNECTED, TRANSPORT_OPEN if the port could not be
     * opened. There is no automatic retry.
     */
    ErrorCode connect();

    /// Begin an orderly shutdown, the read loop completes it. A no-op unless CONNECTED.
    void disconnect();

    /// Encode and send one message. NOT_CONNECTED unless CONNECTED, FRAME_TOO_LONG if it does not fit a frame.
    ErrorCode send(const ConfigMessage &msg);

    /// Send an already encoded frame
    ErrorCode send(const std::string &frame);

    /**
     * One iteration of the read loop. Returns how many msecs until it wants to run again, 0 once it has nothing left to
     * do (DISCONNECTED).
     */
    int32_t runOnce();

    /// How long after the last received byte the read loop keeps polling at READ_POLL_ACTIVE_MS
    void setRecentRxWindow(uint32_t msec) { recentRxMsec = msec; }

    eezpad::ConnectionState getState() const { return status.getConnectionState(); }
    bool isConnected() const { return getState() == eezpad::ConnectionState::CONNECTED; }

    /// Observers of getStatus().onNewStatus see every state transition
    eezpad::ConnectionStatus &getStatus() { return status; }

    /// Fired for every banner the device prints
    Observable<const DeviceBanner *> &onBanner() { return parser.onBanner; }

    /// Firmware version from the last APP-VER banner, -1 until one arrived on this connection
    int32_t getVersion() const { return lastVersion; }

    const char *describe() const { return transport->describe(); }

  protected:
    virtual void doTask() override;

  private:
    void setState(eezpad::ConnectionState s);

    /// Start tearing the link down, from any state but DISCONNECTED
    void beginDisconnect();

    /// Close the transport and return to DISCONNECTED
    void finishDisconnect();

    int handleBanner(const DeviceBanner *banner);
};
