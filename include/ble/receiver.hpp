#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace ble {

struct BlePacket {
    std::string mac;
    std::optional<std::string> device_name;
    int16_t signal_strength = 0;
};

using listener_callback = void(BlePacket const&);

class scan_error: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Source of BLE advertisement events
 * run() blocks and delivers packets to the callback until stop() is called.
 * Failures of the underlying transport are thrown as scan_error.
 */
class AdvertisementSource {
public:
    virtual ~AdvertisementSource() = default;

    virtual void run(std::function<listener_callback> cb) = 0;
    virtual void stop() noexcept = 0;
};

class BleListener: public AdvertisementSource {
public:
    explicit BleListener(std::string const& nm = "hci0");
    ~BleListener() override;

    void run(std::function<listener_callback> cb) override;
    void stop() noexcept override;

private:
    class Impl;
    const std::unique_ptr<Impl> impl;
};

}  // namespace ble
