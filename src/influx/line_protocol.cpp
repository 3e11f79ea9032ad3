#include "line_protocol.hpp"

#include <algorithm>
#include <ostream>
#include <type_traits>

#include <spdlog/fmt/fmt.h>

using namespace line_protocol;

namespace {

template<class... Fs> struct overloaded: Fs... {
    using Fs::operator()...;
};
template<class... Fs> overloaded(Fs...) -> overloaded<Fs...>;

void put(field_slots& slots, field_id id, double v) {
    slots[static_cast<size_t>(id)] = field_value(v);
}

template<class T> void put(field_slots& slots, field_id id, std::optional<T> const& v) {
    if (!v) return;
    if constexpr (std::is_floating_point_v<T>)
        slots[static_cast<size_t>(id)] = field_value(static_cast<double>(*v));
    else
        slots[static_cast<size_t>(id)] = field_value(static_cast<int64_t>(*v));
}

std::optional<double> to_kilopascals(std::optional<uint32_t> pa) {
    if (!pa) return std::nullopt;
    return *pa / 1000.0;
}

std::string format_float(double v, int decimals) {
    auto s = fmt::format("{:.{}f}", v, decimals);
    auto dot = s.find('.');
    if (dot == std::string::npos) return s + ".0";
    auto last = s.find_last_not_of('0');
    s.erase(std::max(last, dot + 1) + 1);
    if (s == "-0.0") return "0.0";
    return s;
}

}  // namespace

field_slots line_protocol::collect_fields(ruuvi::measurement const& m) {
    field_slots slots;
    std::visit(overloaded{
                   [&slots](ruuvi::ruuvi_data_format_3 const& d) {
                       put(slots, field_id::acceleration_x, d.acceleration[0]);
                       put(slots, field_id::acceleration_y, d.acceleration[1]);
                       put(slots, field_id::acceleration_z, d.acceleration[2]);
                       put(slots, field_id::battery_potential, d.battery_voltage);
                       put(slots, field_id::humidity, d.humidity);
                       put(slots, field_id::pressure, d.pressure / 1000.0);
                       put(slots, field_id::temperature, d.temperature);
                   },
                   [&slots](ruuvi::ruuvi_data_format_5 const& d) {
                       put(slots, field_id::acceleration_x, d.acceleration[0]);
                       put(slots, field_id::acceleration_y, d.acceleration[1]);
                       put(slots, field_id::acceleration_z, d.acceleration[2]);
                       put(slots, field_id::battery_potential, d.battery_voltage);
                       put(slots, field_id::humidity, d.humidity);
                       put(slots, field_id::pressure, to_kilopascals(d.pressure));
                       put(slots, field_id::temperature, d.temperature);
                       put(slots, field_id::tx_power, d.tx_power);
                       put(slots, field_id::movement_counter, d.movement_counter);
                       put(slots, field_id::measurement_sequence_number, d.measurement_sequence);
                   },
               },
               m);
    return slots;
}

line_record line_protocol::to_line_record(std::string const& series, std::string const& name,
                                          ruuvi::measurement const& m, int64_t timestamp) {
    line_record r;
    r.series    = series;
    r.name      = name;
    r.timestamp = timestamp;

    auto slots = collect_fields(m);
    r.fields.reserve(field_count);
    for (auto const& d : fields) {
        auto& v = slots[static_cast<size_t>(d.id)];
        if (v) r.fields.push_back({ d.id, *v });
    }
    return r;
}

int64_t line_protocol::to_timestamp(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

std::string line_protocol::escape_tag_value(std::string_view s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s) {
        if (c == ',' || c == ' ' || c == '=') r.push_back('\\');
        r.push_back(c);
    }
    return r;
}

std::string line_protocol::format_value(field const& f) {
    int decimals = describe(f.id).decimals;
    return std::visit(overloaded{
                          [decimals](double v) {
                              if (decimals < 0) return fmt::format("{}", static_cast<int64_t>(v));
                              return format_float(v, decimals);
                          },
                          [decimals](int64_t v) {
                              if (decimals < 0) return fmt::format("{}", v);
                              return format_float(static_cast<double>(v), decimals);
                          },
                      },
                      f.value);
}

bool line_protocol::is_valid_series_name(std::string_view s) {
    if (s.empty()) return false;
    return std::none_of(s.begin(), s.end(), [](char c) {
        return c == ',' || c == ' ' || c == '"' || c == '\\' ||
               static_cast<unsigned char>(c) < 0x20 || c == 0x7F;
    });
}

std::string line_protocol::to_string(line_record const& r) {
    std::string line = r.series;
    line += ",name=";
    line += escape_tag_value(r.name);

    char sep = ' ';
    for (auto const& f : r.fields) {
        line.push_back(sep);
        line += describe(f.id).key;
        line.push_back('=');
        line += format_value(f);
        sep = ',';
    }

    line.push_back(' ');
    line += std::to_string(r.timestamp);
    return line;
}

std::ostream& line_protocol::operator<<(std::ostream& os, line_record const& r) {
    return os << to_string(r);
}
