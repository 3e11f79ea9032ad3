#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <ruuvi/ruuvi.hpp>

namespace line_protocol {

// Declaration order is the order fields appear in a line
enum class field_id {
    acceleration_x,
    acceleration_y,
    acceleration_z,
    battery_potential,
    humidity,
    pressure,
    temperature,
    tx_power,
    movement_counter,
    measurement_sequence_number,
};

inline constexpr size_t field_count = 10;

struct field_descriptor {
    field_id id;
    char const* key;
    int decimals;  // Negative for integer fields
};

inline constexpr std::array<field_descriptor, field_count> fields{ {
    { field_id::acceleration_x, "acceleration_x", 3 },
    { field_id::acceleration_y, "acceleration_y", 3 },
    { field_id::acceleration_z, "acceleration_z", 3 },
    { field_id::battery_potential, "battery_potential", 3 },
    { field_id::humidity, "humidity", 4 },
    { field_id::pressure, "pressure", 3 },  // kPa
    { field_id::temperature, "temperature", 3 },
    { field_id::tx_power, "tx_power", -1 },
    { field_id::movement_counter, "movement_counter", -1 },
    { field_id::measurement_sequence_number, "measurement_sequence_number", -1 },
} };

constexpr field_descriptor const& describe(field_id id) { return fields[static_cast<size_t>(id)]; }

using field_value = std::variant<double, int64_t>;

struct field {
    field_id id;
    field_value value;
};

using field_slots = std::array<std::optional<field_value>, field_count>;

/**
 * @brief line_record One InfluxDB line protocol point with a single "name" tag
 */
struct line_record {
    std::string series;
    std::string name;
    std::vector<field> fields;  // Canonical order, unavailable values left out
    int64_t timestamp = 0;      // ns since the Unix epoch
};

/**
 * @brief collect_fields Places each available value of m into the slot of its field
 */
field_slots collect_fields(ruuvi::measurement const& m);

line_record to_line_record(std::string const& series, std::string const& name,
                           ruuvi::measurement const& m, int64_t timestamp);

int64_t to_timestamp(std::chrono::system_clock::time_point t);

// Escapes commas, spaces and equals signs
std::string escape_tag_value(std::string_view s);

/**
 * @brief format_value Integers without decimal point, floats in fixed notation with
 * trailing zeros removed, keeping at least one fractional digit
 */
std::string format_value(field const& f);

/**
 * @brief is_valid_series_name Non-empty and free of characters that would need escaping
 */
bool is_valid_series_name(std::string_view s);

// Without trailing newline
std::string to_string(line_record const& r);
std::ostream& operator<<(std::ostream& os, line_record const& r);

}  // namespace line_protocol
