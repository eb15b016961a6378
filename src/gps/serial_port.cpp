// src/gps/serial_port.cpp
#include "serial_port.h"
#include "common/log.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kermit {

using api::Error;
using api::ErrorCode;
using api::Result;

// ============================================================================
// Discovery
// ============================================================================

bool SerialPortInfo::looks_like_gps() const {
    return product.find("gps") != std::string::npos ||
           product.find("GPS") != std::string::npos;
}

static std::string read_sysfs_line(const fs::path& path) {
    std::ifstream in(path);
    std::string line;
    if (in) std::getline(in, line);
    return line;
}

std::vector<SerialPortInfo> enumerate_serial_ports() {
    std::vector<SerialPortInfo> ports;

    const fs::path tty_root("/sys/class/tty");
    std::error_code ec;
    if (!fs::exists(tty_root, ec)) {
        return ports;
    }

    for (const auto& entry : fs::directory_iterator(tty_root, ec)) {
        const std::string name = entry.path().filename().string();

        // Only ports backed by a real device (skips the virtual consoles)
        fs::path device_link = entry.path() / "device";
        if (!fs::exists(device_link, ec)) continue;

        // Legacy 8250 ports always exist; keep them only if they have a driver
        // other than the platform placeholder
        if (name.rfind("ttyS", 0) == 0) {
            fs::path driver = fs::canonical(device_link / "driver", ec);
            if (ec || driver.filename() == "serial8250") {
                ec.clear();
                continue;
            }
        }

        SerialPortInfo info;
        info.device = "/dev/" + name;

        // USB serial: product lives on the USB device, a couple of levels up
        fs::path dev = fs::canonical(device_link, ec);
        if (!ec) {
            for (int up = 0; up < 4 && !dev.empty(); up++) {
                fs::path product = dev / "product";
                if (fs::exists(product, ec)) {
                    info.product = read_sysfs_line(product);
                    break;
                }
                dev = dev.parent_path();
            }
        }
        ec.clear();
        ports.push_back(info);
    }

    std::sort(ports.begin(), ports.end(),
              [](const SerialPortInfo& a, const SerialPortInfo& b) { return a.device < b.device; });

    std::string names;
    for (const auto& p : ports) {
        names += (names.empty() ? "" : ", ") + p.device;
    }
    log::debug("GPS", "Candidate GPS devices: [" + names + "]");
    return ports;
}

std::optional<std::string> select_gps_port(const std::vector<SerialPortInfo>& ports,
                                           const PortChooser& chooser) {
    for (const auto& p : ports) {
        if (p.looks_like_gps()) {
            return p.device;
        }
    }

    if (ports.size() > 1) {
        if (!chooser) return std::nullopt;
        std::string answer = chooser(ports);
        for (const auto& p : ports) {
            if (p.device == answer) {
                return p.device;
            }
        }
        log::warn("GPS", "'" + answer + "' is not one of the candidate ports");
        return std::nullopt;
    }

    if (ports.size() == 1) {
        return ports.front().device;
    }

    return std::nullopt;
}

std::string prompt_for_port(const std::vector<SerialPortInfo>& ports) {
    std::cout << "Which port corresponds to your GPS? Options:\n";
    for (const auto& p : ports) {
        std::cout << "\t" << p.device;
        if (!p.product.empty()) std::cout << "  (" << p.product << ")";
        std::cout << "\n";
    }
    std::cout << " $ " << std::flush;

    std::string answer;
    std::getline(std::cin, answer);
    while (!answer.empty() && (answer.back() == ' ' || answer.back() == '\r')) {
        answer.pop_back();
    }
    return answer;
}

// ============================================================================
// SerialLineSource
// ============================================================================

static speed_t baud_constant(int baud) {
    switch (baud) {
        case 4800: return B4800;
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        default: return 0;
    }
}

Result<std::unique_ptr<SerialLineSource>> SerialLineSource::open(const std::string& device,
                                                                 int baud,
                                                                 int timeout_ms) {
    speed_t speed = baud_constant(baud);
    if (speed == 0) {
        return Error(ErrorCode::INVALID_CONFIG,
                     "Unsupported baud rate " + std::to_string(baud));
    }

    int fd = ::open(device.c_str(), O_RDONLY | O_NOCTTY);
    if (fd < 0) {
        return Error(ErrorCode::SERIAL_OPEN_FAILED,
                     "Cannot open " + device + ": " + std::strerror(errno));
    }

    termios tty{};
    if (tcgetattr(fd, &tty) != 0) {
        std::string why = std::strerror(errno);
        ::close(fd);
        return Error(ErrorCode::SERIAL_OPEN_FAILED, "tcgetattr on " + device + ": " + why);
    }

    cfmakeraw(&tty);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE);
    tty.c_cflag |= CS8;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    if (tcsetattr(fd, TCSANOW, &tty) != 0) {
        std::string why = std::strerror(errno);
        ::close(fd);
        return Error(ErrorCode::SERIAL_OPEN_FAILED, "tcsetattr on " + device + ": " + why);
    }
    tcflush(fd, TCIFLUSH);

    return std::unique_ptr<SerialLineSource>(new SerialLineSource(device, fd, timeout_ms));
}

SerialLineSource::~SerialLineSource() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<std::string> SerialLineSource::read_line() {
    char buf[256];

    while (true) {
        size_t nl = pending_.find('\n');
        if (nl != std::string::npos) {
            std::string line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, timeout_ms_);
        if (rc == 0) {
            return Error(ErrorCode::SERIAL_READ_FAILED, device_ + ": timeout waiting for data");
        }
        if (rc < 0) {
            if (errno == EINTR) continue;
            return Error(ErrorCode::SERIAL_READ_FAILED, device_ + ": " + std::strerror(errno));
        }

        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return Error(ErrorCode::SERIAL_READ_FAILED, device_ + ": " + std::strerror(errno));
        }
        if (n == 0) {
            return Error(ErrorCode::SERIAL_READ_FAILED, device_ + ": device closed");
        }
        pending_.append(buf, static_cast<size_t>(n));

        // A receiver spewing garbage without newlines must not grow us forever
        if (pending_.size() > 4096) {
            pending_.erase(0, pending_.size() - 1024);
        }
    }
}

} // namespace kermit
