#include "gauges.hpp"

#include <variant>

using namespace ruuvi;
using line_protocol::field_id;

std::vector<gauge_info> const& ruuvi::gauge_infos() {
    static std::vector<gauge_info> const infos{
        { field_id::acceleration_x, "ruuvi_acceleration_gs", "Ruuvitag acceleration in Gs", { { "axis", "x" } } },
        { field_id::acceleration_y, "ruuvi_acceleration_gs", "Ruuvitag acceleration in Gs", { { "axis", "y" } } },
        { field_id::acceleration_z, "ruuvi_acceleration_gs", "Ruuvitag acceleration in Gs", { { "axis", "z" } } },
        { field_id::battery_potential, "ruuvi_battery_volts", "Ruuvitag battery voltage", {} },
        { field_id::humidity, "ruuvi_relative_humidity_ratio", "Ruuvitag relative humidity 0-100%", {} },
        // Records carry kPa
        { field_id::pressure, "ruuvi_pressure_pascals", "Ruuvitag pressure in Pascal", {}, 1000.0 },
        { field_id::temperature, "ruuvi_temperature_celsius", "Ruuvitag temperature in Celsius", {} },
        { field_id::tx_power, "ruuvi_tx_power_dbm", "Ruuvitag transmit power", {} },
        { field_id::movement_counter, "ruuvi_movement_count", "Ruuvitag movement counter", {} },
        { field_id::measurement_sequence_number, "ruuvi_measurement_count",
          "Ruuvitag packet measurement sequence number [0-65534]", {} },
    };
    return infos;
}

std::vector<gauge_sample> ruuvi::gauge_samples(line_protocol::line_record const& record) {
    std::vector<gauge_sample> r;
    r.reserve(record.fields.size());
    for (auto const& f : record.fields) {
        for (auto const& info : gauge_infos()) {
            if (info.id != f.id) continue;
            auto labels = info.labels;
            labels.emplace("name", record.name);
            double v = std::visit([](auto x) { return static_cast<double>(x); }, f.value);
            r.push_back({ info.name, std::move(labels), v * info.scale });
            break;
        }
    }
    return r;
}
