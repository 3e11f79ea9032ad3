#include <chrono>
#include <gtest/gtest.h>
#include <influx/line_protocol.hpp>
#include <sstream>

#include "test-helpers.hpp"

using namespace test_helpers;
using namespace line_protocol;

namespace {

std::vector<std::string> keys_of(line_record const& r) {
    std::vector<std::string> keys;
    for (auto const& f : r.fields) keys.emplace_back(describe(f.id).key);
    return keys;
}

}  // namespace

TEST(LineProtocolTest, FormatsExampleRecord) {
    auto m = ruuvi::decode(example_packet3());
    auto r = to_line_record("ruuvi_measurement", "F7:2A:60:0D:6E:1E", m, 1546681652675044272);
    EXPECT_EQ(to_string(r),
              "ruuvi_measurement,name=F7:2A:60:0D:6E:1E "
              "acceleration_x=-0.055,acceleration_y=-0.032,acceleration_z=0.998,"
              "battery_potential=3.007,humidity=19.5,pressure=101.481,temperature=19.63 "
              "1546681652675044272");
}

TEST(LineProtocolTest, FormatsFormat5Record) {
    auto m = ruuvi::decode(default_packet5());
    auto r = to_line_record("ruuvi_measurements", "CB:B8:33:4C:88:4F", m, 1);
    EXPECT_EQ(to_string(r),
              "ruuvi_measurements,name=CB:B8:33:4C:88:4F "
              "acceleration_x=0.004,acceleration_y=-0.004,acceleration_z=1.036,"
              "battery_potential=2.977,humidity=53.49,pressure=100.044,temperature=24.3,"
              "tx_power=4,movement_counter=66,measurement_sequence_number=205 1");
}

TEST(LineProtocolTest, FormatsExtremes) {
    auto r = to_line_record("s", "n", ruuvi::decode(max_packet5()), 0);
    EXPECT_EQ(to_string(r),
              "s,name=n acceleration_x=32.767,acceleration_y=32.767,acceleration_z=32.767,"
              "battery_potential=3.646,humidity=100.0,pressure=115.534,temperature=163.835,"
              "tx_power=20,movement_counter=254,measurement_sequence_number=65534 0");
}

TEST(LineProtocolTest, StreamOperatorMatchesToString) {
    auto r = to_line_record("s", "n", ruuvi::decode(default_packet3()), 42);
    std::ostringstream os;
    os << r;
    EXPECT_EQ(os.str(), to_string(r));
}

TEST(LineProtocolTest, EscapesTagValue) {
    EXPECT_EQ(escape_tag_value("Sauna"), "Sauna");
    EXPECT_EQ(escape_tag_value("Living room"), "Living\\ room");
    EXPECT_EQ(escape_tag_value("a,b=c"), "a\\,b\\=c");
    EXPECT_EQ(escape_tag_value(""), "");

    auto r = to_line_record("s", "Living room,1", ruuvi::decode(default_packet3()), 0);
    EXPECT_EQ(to_string(r).rfind("s,name=Living\\ room\\,1 acceleration_x=", 0), 0u) << to_string(r);
}

TEST(LineProtocolTest, FormatsValues) {
    EXPECT_EQ(format_value({ field_id::temperature, 24.0 }), "24.0");
    EXPECT_EQ(format_value({ field_id::temperature, 0.0 }), "0.0");
    EXPECT_EQ(format_value({ field_id::temperature, -0.0 }), "0.0");
    EXPECT_EQ(format_value({ field_id::temperature, -0.005 }), "-0.005");
    EXPECT_EQ(format_value({ field_id::temperature, 1963 / 100.0 }), "19.63");
    EXPECT_EQ(format_value({ field_id::humidity, 1 / 400.0 }), "0.0025");
    EXPECT_EQ(format_value({ field_id::humidity, 100.0 }), "100.0");
    EXPECT_EQ(format_value({ field_id::pressure, 115534 / 1000.0 }), "115.534");
    EXPECT_EQ(format_value({ field_id::pressure, 100000 / 1000.0 }), "100.0");
    EXPECT_EQ(format_value({ field_id::acceleration_x, -32.767 }), "-32.767");
    EXPECT_EQ(format_value({ field_id::battery_potential, 1.6 }), "1.6");
    EXPECT_EQ(format_value({ field_id::tx_power, int64_t(-40) }), "-40");
    EXPECT_EQ(format_value({ field_id::movement_counter, int64_t(0) }), "0");
    EXPECT_EQ(format_value({ field_id::measurement_sequence_number, int64_t(65534) }), "65534");
    // Integer valued floats keep a fractional digit, integer fields never get one
    EXPECT_EQ(format_value({ field_id::temperature, int64_t(3) }), "3.0");
    EXPECT_EQ(format_value({ field_id::movement_counter, 7.0 }), "7");
}

TEST(LineProtocolTest, NoScientificNotation) {
    EXPECT_EQ(format_value({ field_id::acceleration_x, 0.001 }), "0.001");
    EXPECT_EQ(format_value({ field_id::humidity, 0.0001 }), "0.0001");
    EXPECT_EQ(format_value({ field_id::measurement_sequence_number, int64_t(1) << 40 }),
              "1099511627776");
}

// Every combination of available fields keeps the canonical order
TEST(LineProtocolTest, OmitsUnavailableFieldsInCanonicalOrder) {
    for (unsigned mask = 1; mask < (1u << field_count); ++mask) {
        auto has = [mask](field_id id) { return (mask & (1u << static_cast<unsigned>(id))) != 0; };

        ruuvi::ruuvi_data_format_5 d;
        if (has(field_id::acceleration_x)) d.acceleration[0] = 0.1;
        if (has(field_id::acceleration_y)) d.acceleration[1] = 0.2;
        if (has(field_id::acceleration_z)) d.acceleration[2] = 0.3;
        if (has(field_id::battery_potential)) d.battery_voltage = 3.0;
        if (has(field_id::humidity)) d.humidity = 40.0;
        if (has(field_id::pressure)) d.pressure = 100000;
        if (has(field_id::temperature)) d.temperature = 20.0;
        if (has(field_id::tx_power)) d.tx_power = 4;
        if (has(field_id::movement_counter)) d.movement_counter = 1;
        if (has(field_id::measurement_sequence_number)) d.measurement_sequence = 2;

        std::vector<std::string> expected;
        for (auto const& desc : fields) {
            if (has(desc.id)) expected.emplace_back(desc.key);
        }

        auto r = to_line_record("s", "n", d, 0);
        EXPECT_EQ(keys_of(r), expected) << "mask " << mask;
        EXPECT_EQ(to_string(r).find("nan"), std::string::npos);
    }
}

TEST(LineProtocolTest, Format3HasNoOptionalFields) {
    auto r = to_line_record("s", "n", ruuvi::decode(default_packet3()), 0);
    std::vector<std::string> expected{ "acceleration_x", "acceleration_y", "acceleration_z",
                                       "battery_potential", "humidity", "pressure",
                                       "temperature" };
    EXPECT_EQ(keys_of(r), expected);
}

TEST(LineProtocolTest, TimestampOnlyDifference) {
    auto m  = ruuvi::decode(default_packet5());
    auto r1 = to_string(to_line_record("s", "n", m, 1546681652675044272));
    auto r2 = to_string(to_line_record("s", "n", m, 1546681652675044999));

    auto body = [](std::string const& s) { return s.substr(0, s.rfind(' ')); };
    EXPECT_EQ(body(r1), body(r2));
    EXPECT_NE(r1, r2);
    EXPECT_EQ(r2.substr(r2.rfind(' ') + 1), "1546681652675044999");
}

TEST(LineProtocolTest, ConvertsTimestamp) {
    using namespace std::chrono;
    system_clock::time_point t(duration_cast<system_clock::duration>(nanoseconds(1546681652675044272)));
    EXPECT_EQ(to_timestamp(t), 1546681652675044272);
    EXPECT_EQ(to_timestamp(system_clock::time_point{}), 0);
}

TEST(LineProtocolTest, ValidatesSeriesName) {
    EXPECT_TRUE(is_valid_series_name("ruuvi_measurements"));
    EXPECT_TRUE(is_valid_series_name("ruuvi-measurement.v2"));
    EXPECT_FALSE(is_valid_series_name(""));
    EXPECT_FALSE(is_valid_series_name("ruuvi measurements"));
    EXPECT_FALSE(is_valid_series_name("ruuvi,measurements"));
    EXPECT_FALSE(is_valid_series_name("ruuvi\nmeasurements"));
    EXPECT_FALSE(is_valid_series_name("ruuvi\\"));
}
