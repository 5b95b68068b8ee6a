#include "PosixSerialTransport.h"
#include "UsbSerialFinder.h"
#include "configuration.h"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

/// Map a numeric rate to its termios constant, B0 if termios has none
static speed_t toSpeed(uint32_t baud)
{
    switch (baud) {
    case 9600:
        return B9600;
    case 19200:
        return B19200;
    case 38400:
        return B38400;
    case 57600:
        return B57600;
    case 115200:
        return B115200;
    case 230400:
        return B230400;
    case 460800:
        return B460800;
    case 921600:
        return B921600;
    default:
        return B0;
    }
}

PosixSerialTransport::PosixSerialTransport(const std::string &path, uint16_t _vid, uint16_t _pid)
    : portPath(path), vid(_vid), pid(_pid)
{
}

PosixSerialTransport::~PosixSerialTransport()
{
    close();
}

bool PosixSerialTransport::open(uint32_t baud)
{
    if (fd >= 0)
        return true;

    std::string path = portPath;
    if (path.empty()) {
        path = findUsbSerialPort(vid, pid);
        if (path.empty()) {
            LOG_ERROR("No device with USB id %04x:%04x found", vid, pid);
            return false;
        }
        LOG_INFO("Found device %04x:%04x at %s", vid, pid, path.c_str());
    }

    fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        LOG_ERROR("Open %s failed: %s", path.c_str(), strerror(errno));
        return false;
    }
    openedPath = path;

    if (!configure(baud)) {
        close();
        return false;
    }

    // Drop whatever the device printed before we were listening, it can not contain an answer to us
    tcflush(fd, TCIOFLUSH);
    return true;
}

bool PosixSerialTransport::configure(uint32_t baud)
{
    speed_t speed = toSpeed(baud);
    if (speed == B0) {
        LOG_ERROR("Unsupported baud rate %u", baud);
        return false;
    }

    struct termios tio;
    if (tcgetattr(fd, &tio) != 0) {
        LOG_ERROR("tcgetattr %s failed: %s", openedPath.c_str(), strerror(errno));
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(CSTOPB | CRTSCTS | PARENB);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        LOG_ERROR("tcsetattr %s failed: %s", openedPath.c_str(), strerror(errno));
        return false;
    }
    return true;
}

int PosixSerialTransport::read(uint8_t *buf, size_t maxLen)
{
    if (fd < 0)
        return TRANSPORT_READ_ERROR;

    struct pollfd pfd = {fd, POLLIN, 0};
    int r = poll(&pfd, 1, 0);
    if (r < 0) {
        if (errno == EINTR)
            return 0;
        LOG_ERROR("poll %s failed: %s", openedPath.c_str(), strerror(errno));
        return TRANSPORT_READ_ERROR;
    }
    if (r == 0)
        return 0;

    // A USB CDC device that was unplugged reports hangup, or readable with zero bytes
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        if (!(pfd.revents & POLLIN))
            return TRANSPORT_READ_EOF;
    }

    ssize_t n = ::read(fd, buf, maxLen);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return 0;
        LOG_ERROR("read %s failed: %s", openedPath.c_str(), strerror(errno));
        return TRANSPORT_READ_ERROR;
    }
    if (n == 0)
        return TRANSPORT_READ_EOF;
    return (int)n;
}

bool PosixSerialTransport::write(const uint8_t *buf, size_t len)
{
    if (fd < 0)
        return false;

    size_t done = 0;
    while (done < len) {
        ssize_t n = ::write(fd, buf + done, len - done);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Output queue full, wait for the driver rather than splitting the frame
                struct pollfd pfd = {fd, POLLOUT, 0};
                if (poll(&pfd, 1, -1) < 0 && errno != EINTR) {
                    LOG_ERROR("poll %s failed: %s", openedPath.c_str(), strerror(errno));
                    return false;
                }
                continue;
            }
            LOG_ERROR("write %s failed: %s", openedPath.c_str(), strerror(errno));
            return false;
        }
        done += (size_t)n;
    }

    if (tcdrain(fd) != 0) {
        LOG_ERROR("tcdrain %s failed: %s", openedPath.c_str(), strerror(errno));
        return false;
    }
    return true;
}

void PosixSerialTransport::close()
{
    if (fd < 0)
        return;
    if (::close(fd) != 0)
        LOG_WARN("close %s failed: %s", openedPath.c_str(), strerror(errno));
    fd = -1;
}

const char *PosixSerialTransport::describe() const
{
    if (!openedPath.empty())
        return openedPath.c_str();
    return portPath.empty() ? "(usb search)" : portPath.c_str();
}
