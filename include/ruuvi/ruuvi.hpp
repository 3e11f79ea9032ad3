#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <ble/receiver.hpp>
#include <ruuvi/errors.hpp>

namespace ruuvi {

inline constexpr uint16_t manufacturer_id = 0x0499;

/**
 * RAWv1. Fixed layout without sentinels, every field is always present.
 */
struct ruuvi_data_format_3 {
    static constexpr int format = 3;
    static constexpr size_t size = 14;

    double humidity    = 0;
    double temperature = 0;
    uint32_t pressure  = 0;  // Pa
    std::array<double, 3> acceleration{0, 0, 0};
    double battery_voltage = 0;
};

/**
 * RAWv2. Fields whose raw bits equal the documented sentinel are nullopt.
 */
struct ruuvi_data_format_5 {
    static constexpr int format = 5;
    static constexpr size_t size = 24;

    std::optional<double> temperature;
    std::optional<double> humidity;
    std::optional<uint32_t> pressure;  // Pa
    std::array<std::optional<double>, 3> acceleration;
    std::optional<double> battery_voltage;
    std::optional<int8_t> tx_power;
    std::optional<uint8_t> movement_counter;
    std::optional<uint16_t> measurement_sequence;
    std::optional<std::string> mac;
};

using measurement = std::variant<ruuvi_data_format_3, ruuvi_data_format_5>;

inline constexpr int unknown_format = -1;
inline constexpr int not_ruuvitag   = -2;
int identify_format(ble::BlePacket const& p);

/**
 * @brief decode Dispatches on the format byte of Ruuvi manufacturer data
 * @throws decode_error on empty, truncated, unsupported or out of range payloads
 */
measurement decode(std::vector<uint8_t> const& data);

/**
 * @brief decode Like decode(data), but rejects packets from other manufacturers first
 * with decode_error::reason::foreign_manufacturer
 */
measurement decode(ble::BlePacket const& p);

ruuvi_data_format_5 convert_data_format_5(std::vector<uint8_t> const& data);
ruuvi_data_format_3 convert_data_format_3(std::vector<uint8_t> const& data);

int format_of(measurement const& m);

}  // namespace ruuvi
