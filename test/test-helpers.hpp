#pragma once

#include <ble/address.hpp>
#include <ble/receiver.hpp>
#include <ruuvi/ruuvi.hpp>

#include <cassert>
#include <cmath>
#include <string>
#include <vector>

namespace test_helpers {

inline std::vector<uint8_t> to_raw_data(std::string const& s) {
    assert(s.size() % 2 == 0);
    std::vector<uint8_t> r;
    for (size_t i = 0; i < s.size(); i += 2) {
        auto ch = s.substr(i, 2);
        r.push_back(static_cast<uint8_t>(std::stoi(ch, nullptr, 16)));
    }
    return r;
}

inline ble::BlePacket default_packet() {
    ble::BlePacket r;
    r.mac             = "CB:B8:33:4C:88:4F";
    r.manufacturer_id = 0x0499;
    r.device_name     = "";
    r.signal_strength = 40;
    return r;
}

inline ble::BlePacket default_packet5() {
    auto r = default_packet();
    r.manufacturer_data =
        to_raw_data("0512FC5394C37C0004FFFC040CAC364200CDCBB8334C884F");
    return r;
}
inline ble::BlePacket max_packet5() {
    auto r = default_packet();
    r.manufacturer_data =
        to_raw_data("057FFF9C40FFFE7FFF7FFF7FFFFFDEFEFFFECBB8334C884F");
    return r;
}
inline ble::BlePacket invalid_packet5() {
    auto r = default_packet();
    r.manufacturer_data =
        to_raw_data("058000FFFFFFFF800080008000FFFFFFFFFFFFFFFFFFFFFF");
    return r;
}
inline ble::BlePacket default_packet3() {
    auto r              = default_packet();
    r.manufacturer_data = to_raw_data("03291A1ECE1EFC18F94202CA0B53");
    return r;
}
// 19.63 C, 19.5 %, 101481 Pa, (-0.055, -0.032, 0.998) g, 3.007 V
inline ble::BlePacket example_packet3() {
    auto r              = default_packet();
    r.mac               = "F7:2A:60:0D:6E:1E";
    r.manufacturer_data = to_raw_data("0327133FC919FFC9FFE003E60BBF");
    return r;
}
inline ble::BlePacket broken_data() {
    auto r              = default_packet();
    r.manufacturer_data = to_raw_data("09291A1ECE1EFC18F94202CA0B53");
    return r;
}

/**
 * Inverse of ruuvi::convert_data_format_5, nullopt fields become sentinels
 */
inline std::vector<uint8_t> encode_format_5(ruuvi::ruuvi_data_format_5 const& d) {
    std::vector<uint8_t> r(ruuvi::ruuvi_data_format_5::size, 0);
    r[0] = 0x05;

    auto put16 = [&r](size_t at, uint16_t v) {
        r[at]     = static_cast<uint8_t>(v >> 8u);
        r[at + 1] = static_cast<uint8_t>(v & 0xFFu);
    };
    auto i16 = [](std::optional<double> const& v, double scale) -> uint16_t {
        if (!v) return 0x8000;
        return static_cast<uint16_t>(static_cast<int16_t>(std::lround(*v * scale)));
    };

    put16(1, i16(d.temperature, 200));
    put16(3, d.humidity ? static_cast<uint16_t>(std::lround(*d.humidity * 400)) : 0xFFFF);
    put16(5, d.pressure ? static_cast<uint16_t>(*d.pressure - 50'000) : 0xFFFF);
    put16(7, i16(d.acceleration[0], 1000));
    put16(9, i16(d.acceleration[1], 1000));
    put16(11, i16(d.acceleration[2], 1000));

    uint16_t battery =
        d.battery_voltage ? static_cast<uint16_t>(std::lround(*d.battery_voltage * 1000) - 1600)
                          : 2047;
    uint16_t tx = d.tx_power ? static_cast<uint16_t>((*d.tx_power + 40) / 2) : 31;
    put16(13, static_cast<uint16_t>((battery << 5u) | tx));

    r[15] = d.movement_counter ? *d.movement_counter : 0xFF;
    put16(16, d.measurement_sequence ? *d.measurement_sequence : 0xFFFF);

    ble::address_bytes mac;
    mac.fill(0xFF);
    if (d.mac) {
        auto parsed = ble::parse_address(*d.mac);
        if (parsed) mac = *parsed;
    }
    std::copy(mac.begin(), mac.end(), r.begin() + 18);
    return r;
}

}  // namespace test_helpers
