#include "ruuvi.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>

#include "ble/address.hpp"

using namespace ble;
using namespace ruuvi;

using reason = decode_error::reason;

namespace {

/**
 * Conversion of one raw field: value = (raw * multiplier + offset) / divisor,
 * nullopt for the sentinel, decode_error above max.
 */
template<class Raw> struct field_rule {
    char const* name;
    Raw sentinel;
    int64_t multiplier;
    int64_t offset;
    int64_t divisor;
    Raw max = std::numeric_limits<Raw>::max();
};

template<class Out, class Raw> std::optional<Out> convert_field(field_rule<Raw> const& rule, Raw raw) {
    if (raw == rule.sentinel) return std::nullopt;
    if (raw > rule.max) {
        throw decode_error(reason::out_of_range, std::string(rule.name) + " " +
                                                     std::to_string(raw) + " out of range");
    }
    int64_t scaled = static_cast<int64_t>(raw) * rule.multiplier + rule.offset;
    if constexpr (std::is_floating_point_v<Out>)
        return static_cast<Out>(scaled) / static_cast<Out>(rule.divisor);
    else
        return static_cast<Out>(scaled / rule.divisor);
}

namespace df5 {
constexpr field_rule<int16_t> temperature{"Temperature", std::numeric_limits<int16_t>::min(), 1, 0, 200};
constexpr field_rule<uint16_t> humidity{"Humidity", 0xFFFF, 1, 0, 400, 40'000};
constexpr field_rule<uint16_t> pressure{"Pressure", 0xFFFF, 1, 50'000, 1};
constexpr field_rule<int16_t> acceleration{"Acceleration", std::numeric_limits<int16_t>::min(), 1, 0, 1000};
constexpr field_rule<uint16_t> battery_voltage{"Battery voltage", 2047, 1, 1600, 1000};
constexpr field_rule<uint8_t> tx_power{"Tx power", 31, 2, -40, 1};
constexpr field_rule<uint8_t> movement_counter{"Movement counter", 255, 1, 0, 1};
constexpr field_rule<uint16_t> measurement_sequence{"Measurement sequence", 0xFFFF, 1, 0, 1};
}  // namespace df5

uint16_t read_u16(std::vector<uint8_t> const& data, size_t at) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[at]) << 8u) | data[at + 1]);
}

int16_t read_i16(std::vector<uint8_t> const& data, size_t at) {
    return static_cast<int16_t>(read_u16(data, at));
}

void check_header(std::vector<uint8_t> const& data, int format, size_t size) {
    if (data.empty()) throw decode_error(reason::empty_payload, "Empty manufacturer data");
    if (data[0] != format) {
        throw decode_error(reason::unsupported_format, "Expected data format " +
                                                           std::to_string(format) + ", got " +
                                                           std::to_string(data[0]));
    }
    if (data.size() < size) {
        throw decode_error(reason::truncated, "Data format " + std::to_string(format) +
                                                  " expects " + std::to_string(size) +
                                                  " bytes, got " + std::to_string(data.size()));
    }
}

}  // namespace

char const* ruuvi::to_string(decode_error::reason r) noexcept {
    switch (r) {
        case reason::foreign_manufacturer: return "foreign_manufacturer";
        case reason::empty_payload: return "empty_payload";
        case reason::unsupported_format: return "unsupported_format";
        case reason::truncated: return "truncated";
        case reason::out_of_range: return "out_of_range";
    }
    return "unknown";
}

int ruuvi::identify_format(BlePacket const& p) {
    if (p.manufacturer_id != manufacturer_id) return not_ruuvitag;
    if (p.manufacturer_data.empty()) return unknown_format;
    switch (p.manufacturer_data[0]) {
        case ruuvi_data_format_3::format: return ruuvi_data_format_3::format;
        case ruuvi_data_format_5::format: return ruuvi_data_format_5::format;
        default: return unknown_format;
    }
}

measurement ruuvi::decode(std::vector<uint8_t> const& data) {
    if (data.empty()) throw decode_error(reason::empty_payload, "Empty manufacturer data");
    switch (data[0]) {
        case ruuvi_data_format_3::format: return convert_data_format_3(data);
        case ruuvi_data_format_5::format: return convert_data_format_5(data);
        default:
            throw decode_error(reason::unsupported_format,
                               "Unsupported data format " + std::to_string(data[0]));
    }
}

measurement ruuvi::decode(BlePacket const& p) {
    if (p.manufacturer_id != manufacturer_id) {
        throw decode_error(reason::foreign_manufacturer,
                           "Manufacturer id " + std::to_string(p.manufacturer_id) +
                               " is not Ruuvi Innovations");
    }
    return decode(p.manufacturer_data);
}

int ruuvi::format_of(measurement const& m) {
    return std::visit([](auto const& d) { return std::decay_t<decltype(d)>::format; }, m);
}

ruuvi_data_format_5 ruuvi::convert_data_format_5(std::vector<uint8_t> const& data) {
    check_header(data, ruuvi_data_format_5::format, ruuvi_data_format_5::size);
    ruuvi_data_format_5 result;

    // Battery voltage and tx power share bytes 13-14: 11 + 5 bits
    uint16_t power_info = read_u16(data, 13);

    result.temperature     = convert_field<double>(df5::temperature, read_i16(data, 1));
    result.humidity        = convert_field<double>(df5::humidity, read_u16(data, 3));
    result.pressure        = convert_field<uint32_t>(df5::pressure, read_u16(data, 5));
    result.acceleration[0] = convert_field<double>(df5::acceleration, read_i16(data, 7));
    result.acceleration[1] = convert_field<double>(df5::acceleration, read_i16(data, 9));
    result.acceleration[2] = convert_field<double>(df5::acceleration, read_i16(data, 11));
    result.battery_voltage = convert_field<double>(df5::battery_voltage, static_cast<uint16_t>(power_info >> 5u));
    result.tx_power        = convert_field<int8_t>(df5::tx_power, static_cast<uint8_t>(power_info & 0b1'1111u));
    result.movement_counter     = convert_field<uint8_t>(df5::movement_counter, data[15]);
    result.measurement_sequence = convert_field<uint16_t>(df5::measurement_sequence, read_u16(data, 16));

    address_bytes mac;
    std::copy(data.begin() + 18, data.begin() + 24, mac.begin());
    bool mac_invalid = std::all_of(mac.begin(), mac.end(), [](uint8_t b) { return b == 0xFF; });
    if (!mac_invalid) result.mac = ble::to_string(mac);

    return result;
}

ruuvi_data_format_3 ruuvi::convert_data_format_3(std::vector<uint8_t> const& data) {
    check_header(data, ruuvi_data_format_3::format, ruuvi_data_format_3::size);
    ruuvi_data_format_3 result;

    uint8_t humidity = data[1];
    if (humidity > 200)
        throw decode_error(reason::out_of_range, "Humidity " + std::to_string(humidity) + " > 200 (100%)");
    result.humidity = humidity / 2.0;

    // Sign and magnitude, not two's complement
    bool negative    = (data[2] & 0b1000'0000u) != 0;
    int whole        = data[2] & 0b0111'1111u;
    int hundredths   = data[3];
    if (hundredths > 99)
        throw decode_error(reason::out_of_range,
                           "Temperature fraction " + std::to_string(hundredths) + " > 99");
    int centidegrees   = whole * 100 + hundredths;
    result.temperature = (negative ? -centidegrees : centidegrees) / 100.0;

    result.pressure = read_u16(data, 4) + 50'000u;

    result.acceleration[0] = read_i16(data, 6) / 1000.0;
    result.acceleration[1] = read_i16(data, 8) / 1000.0;
    result.acceleration[2] = read_i16(data, 10) / 1000.0;

    result.battery_voltage = read_u16(data, 12) / 1000.0;

    return result;
}
