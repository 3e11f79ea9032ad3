#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ble {

struct BlePacket {
    std::string mac;
    std::string device_name;
    uint16_t manufacturer_id = 0;
    std::vector<uint8_t> manufacturer_data;
    int16_t signal_strength = 0;
    std::chrono::system_clock::time_point received_at;
};

using manufacturer_data_map = std::map<uint16_t, std::vector<uint8_t>>;

/**
 * @brief select_manufacturer_data Stores the entry of preferred in p, or the one with the
 * lowest company id when preferred isn't advertised
 * @return false if data is empty, p is left untouched then
 */
bool select_manufacturer_data(BlePacket& p, manufacturer_data_map const& data, uint16_t preferred);

using listener_callback = void(BlePacket const&);

class BleListener {
public:
    /**
     * @brief BleListener Scans on the given BlueZ adapter, f is called from the D-Bus event
     * loop thread for every manufacturer data advertisement. Devices advertising several
     * company ids are reported with the data of preferred_manufacturer.
     */
    BleListener(std::function<listener_callback> f, uint16_t preferred_manufacturer,
                std::string const& adapter = "hci0");
    ~BleListener();

    void start();
    void stop() noexcept;
    void blacklist(std::string const& mac);
    std::vector<std::string> get_blacklist() const;

private:
    class Impl;
    const std::unique_ptr<Impl> impl;
};

}  // namespace ble
