/**
 * @file serial_port.h
 * @brief Serial port discovery, GPS port selection and a POSIX line reader
 */

#ifndef KERMIT_SERIAL_PORT_H
#define KERMIT_SERIAL_PORT_H

#include "line_source.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kermit {

struct SerialPortInfo {
    std::string device;     // e.g. /dev/ttyUSB0
    std::string product;    // USB product string, may be empty

    bool looks_like_gps() const;
};

/// Enumerate device-backed serial ports (Linux sysfs)
std::vector<SerialPortInfo> enumerate_serial_ports();

/**
 * Asked to pick a port when several exist and none self-identifies.
 * Returns the device path typed by the operator.
 */
using PortChooser = std::function<std::string(const std::vector<SerialPortInfo>&)>;

/**
 * Choose the GPS port.
 *
 * - a port whose product names itself a GPS wins outright
 * - several candidates: ask the chooser; an answer not in the list is no port
 * - exactly one candidate: use it
 * - none: no port
 */
std::optional<std::string> select_gps_port(const std::vector<SerialPortInfo>& ports,
                                           const PortChooser& chooser);

/// Prompt on stdin/stdout
std::string prompt_for_port(const std::vector<SerialPortInfo>& ports);

/**
 * Raw 8N1 serial port read one line at a time.
 */
class SerialLineSource : public LineSource {
public:
    static api::Result<std::unique_ptr<SerialLineSource>> open(const std::string& device,
                                                               int baud,
                                                               int timeout_ms);
    ~SerialLineSource() override;

    SerialLineSource(const SerialLineSource&) = delete;
    SerialLineSource& operator=(const SerialLineSource&) = delete;

    api::Result<std::string> read_line() override;
    std::string describe() const override { return device_; }

private:
    SerialLineSource(std::string device, int fd, int timeout_ms)
        : device_(std::move(device)), fd_(fd), timeout_ms_(timeout_ms) {}

    std::string device_;
    int fd_;
    int timeout_ms_;
    std::string pending_;
};

} // namespace kermit

#endif
