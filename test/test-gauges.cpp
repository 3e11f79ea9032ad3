#include <algorithm>
#include <gtest/gtest.h>
#include <ruuvi/gauges.hpp>

#include "test-helpers.hpp"

using namespace test_helpers;
using ruuvi::gauge_sample;

namespace {

gauge_sample const* find(std::vector<gauge_sample> const& samples, std::string const& name,
                         std::string const& axis = "") {
    auto it = std::find_if(samples.begin(), samples.end(), [&](gauge_sample const& s) {
        if (s.name != name) return false;
        auto a = s.labels.find("axis");
        return axis.empty() ? a == s.labels.end() : a != s.labels.end() && a->second == axis;
    });
    return it == samples.end() ? nullptr : &*it;
}

}  // namespace

TEST(GaugeTest, MapsExampleRecord) {
    auto r = line_protocol::to_line_record("ruuvi_measurement", "Balcony",
                                           ruuvi::decode(example_packet3()), 0);
    auto samples = ruuvi::gauge_samples(r);
    ASSERT_EQ(samples.size(), r.fields.size());

    for (auto const& s : samples) EXPECT_EQ(s.labels.at("name"), "Balcony") << s.name;

    auto pressure = find(samples, "ruuvi_pressure_pascals");
    ASSERT_NE(pressure, nullptr);
    EXPECT_NEAR(pressure->value, 101481, 1e-6);

    auto temperature = find(samples, "ruuvi_temperature_celsius");
    ASSERT_NE(temperature, nullptr);
    EXPECT_DOUBLE_EQ(temperature->value, 19.63);

    auto x = find(samples, "ruuvi_acceleration_gs", "x");
    auto y = find(samples, "ruuvi_acceleration_gs", "y");
    auto z = find(samples, "ruuvi_acceleration_gs", "z");
    ASSERT_TRUE(x && y && z);
    EXPECT_DOUBLE_EQ(x->value, -0.055);
    EXPECT_DOUBLE_EQ(y->value, -0.032);
    EXPECT_DOUBLE_EQ(z->value, 0.998);

    EXPECT_EQ(find(samples, "ruuvi_tx_power_dbm"), nullptr);
}

TEST(GaugeTest, IntegerFields) {
    auto r = line_protocol::to_line_record("s", "n", ruuvi::decode(max_packet5()), 0);
    auto samples = ruuvi::gauge_samples(r);

    auto tx = find(samples, "ruuvi_tx_power_dbm");
    ASSERT_NE(tx, nullptr);
    EXPECT_DOUBLE_EQ(tx->value, 20);
    auto seq = find(samples, "ruuvi_measurement_count");
    ASSERT_NE(seq, nullptr);
    EXPECT_DOUBLE_EQ(seq->value, 65534);
    EXPECT_NEAR(find(samples, "ruuvi_pressure_pascals")->value, 115534, 1e-6);
}

TEST(GaugeTest, AbsentFieldsHaveNoSample) {
    ruuvi::ruuvi_data_format_5 d;
    d.temperature = 21.5;
    auto samples  = ruuvi::gauge_samples(line_protocol::to_line_record("s", "n", d, 0));
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_EQ(samples[0].name, "ruuvi_temperature_celsius");
    EXPECT_DOUBLE_EQ(samples[0].value, 21.5);

    auto none = line_protocol::to_line_record("s", "n", ruuvi::decode(invalid_packet5()), 0);
    EXPECT_TRUE(ruuvi::gauge_samples(none).empty());
}

TEST(GaugeTest, EveryFieldHasAGauge) {
    for (auto const& f : line_protocol::fields) {
        auto const& infos = ruuvi::gauge_infos();
        auto n = std::count_if(infos.begin(), infos.end(),
                               [&](ruuvi::gauge_info const& i) { return i.id == f.id; });
        EXPECT_EQ(n, 1) << f.key;
    }
}
