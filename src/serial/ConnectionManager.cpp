#include "ConnectionManager.h"
#include "concurrency/LockGuard.h"
#include "configuration.h"
#include "timing.h"

using eezpad::ConnectionState;

ConnectionManager::ConnectionManager(std::unique_ptr<Transport> _transport, uint32_t _baud)
    : concurrency::PeriodicTask("ConnectionManager", 0), transport(std::move(_transport)), baud(_baud)
{
    status.observe(&newStatus);
    bannerObserver.observe(&parser.onBanner);
    setState(ConnectionState::DISCONNECTED);
}

ConnectionManager::~ConnectionManager()
{
    if (transport->isOpen())
        transport->close();
}

void ConnectionManager::setState(ConnectionState s)
{
    eezpad::ConnectionStatus next(s);
    newStatus.notifyObservers(&next);
}

ErrorCode ConnectionManager::connect()
{
    if (getState() != ConnectionState::DISCONNECTED) {
        LOG_WARN("connect() while %s, ignored", eezpad::connectionStateName(getState()));
        RECORD_ERROR(ErrorCode::ALREADY_CONNECTED);
        return ErrorCode::ALREADY_CONNECTED;
    }

    setState(ConnectionState::CONNECTING);
    if (!transport->open(baud)) {
        LOG_ERROR("Could not open %s", transport->describe());
        RECORD_ERROR(ErrorCode::TRANSPORT_OPEN);
        setState(ConnectionState::DISCONNECTED);
        return ErrorCode::TRANSPORT_OPEN;
    }

    LOG_INFO("Connected to %s at %u baud", transport->describe(), baud);
    stopRequested = false;
    lastVersion = -1;
    lastRxMsec = timing::millis();
    parser.reset();
    setState(ConnectionState::CONNECTED);

    // Start the read loop before the query goes out, so the answer can not be missed
    setup();
    setPeriod(READ_POLL_ACTIVE_MS);

    return send(codec::makeVersionQuery());
}

void ConnectionManager::disconnect()
{
    if (getState() != ConnectionState::CONNECTED)
        return;
    LOG_INFO("Disconnecting from %s", transport->describe());
    beginDisconnect();
}

void ConnectionManager::beginDisconnect()
{
    stopRequested = true;
    if (getState() != ConnectionState::DISCONNECTING)
        setState(ConnectionState::DISCONNECTING);
    // Make sure the read loop gets to finish the job promptly
    setPeriod(READ_POLL_ACTIVE_MS);
}

void ConnectionManager::finishDisconnect()
{
    transport->close();
    stopRequested = false;
    parser.reset();
    disable();
    setState(ConnectionState::DISCONNECTED);
    LOG_INFO("Disconnected");
}

ErrorCode ConnectionManager::send(const ConfigMessage &msg)
{
    if (!isConnected()) {
        LOG_ERROR("Can not send %s, not connected", codec::kindName(msg.kind));
        RECORD_ERROR(ErrorCode::NOT_CONNECTED);
        return ErrorCode::NOT_CONNECTED;
    }

    std::string frame;
    if (!codec::encode(msg, frame)) {
        LOG_ERROR("%s does not fit in one frame", codec::kindName(msg.kind));
        RECORD_ERROR(ErrorCode::FRAME_TOO_LONG);
        return ErrorCode::FRAME_TOO_LONG;
    }

    LOG_DEBUG("Send %s, %u bytes", codec::kindName(msg.kind), (unsigned)frame.size());
    return send(frame);
}

ErrorCode ConnectionManager::send(const std::string &frame)
{
    {
        concurrency::LockGuard guard(&writeLock);

        // Checked again under the lock, a writer ahead of us may have failed and started teardown
        if (!isConnected() || stopRequested) {
            LOG_ERROR("Can not send, not connected");
            RECORD_ERROR(ErrorCode::NOT_CONNECTED);
            return ErrorCode::NOT_CONNECTED;
        }

        if (transport->write((const uint8_t *)frame.data(), frame.size()))
            return ErrorCode::NONE;

        LOG_ERROR("Write to %s failed, closing", transport->describe());
        RECORD_ERROR(ErrorCode::TRANSPORT_IO);
        // Later writers must see the teardown before we let go of the lock
        stopRequested = true;
    }

    // Status observers run from here and may call send() themselves, so writeLock must already be released
    beginDisconnect();
    return ErrorCode::TRANSPORT_IO;
}

int32_t ConnectionManager::runOnce()
{
    ConnectionState s = getState();
    if (s == ConnectionState::DISCONNECTED)
        return 0;

    if (stopRequested) {
        finishDisconnect();
        return 0;
    }

    uint8_t buf[MAX_RX_CHUNK];
    int n = transport->read(buf, sizeof(buf));
    uint32_t now = timing::millis();

    if (n == TRANSPORT_READ_EOF || n == TRANSPORT_READ_ERROR) {
        if (n == TRANSPORT_READ_EOF) {
            LOG_WARN("%s closed by the device", transport->describe());
        } else {
            LOG_ERROR("Read from %s failed, closing", transport->describe());
            RECORD_ERROR(ErrorCode::TRANSPORT_IO);
        }
        beginDisconnect();
        finishDisconnect();
        return 0;
    }

    if (n == 0) {
        // Nothing this time, if the device has talked to us recently poll often, otherwise back off
        bool recentRx = (now - lastRxMsec) < recentRxMsec;
        return recentRx ? READ_POLL_ACTIVE_MS : READ_POLL_IDLE_MS;
    }

    lastRxMsec = now;
    LOG_TRACE("Rx %d bytes", n);
    parser.feed(buf, (size_t)n);

    if (parser.pending() > MAX_UNMATCHED_RX) {
        LOG_WARN("%u bytes from the device without a banner, dropping all but the tail", (unsigned)parser.pending());
        parser.trimTo(ResponseParser::maxMarkerLength());
    }

    // There may be more waiting, come back right away
    return READ_POLL_ACTIVE_MS;
}

void ConnectionManager::doTask()
{
    int32_t next = runOnce();
    if (next > 0)
        setPeriod(next);
}

int ConnectionManager::handleBanner(const DeviceBanner *banner)
{
    if (banner->kind == BannerKind::VERSION) {
        lastVersion = banner->value;
        LOG_INFO("Device firmware version %d", banner->value);
    }
    return 0;
}
