#pragma once

#include <map>
#include <string>
#include <vector>

#include <influx/line_protocol.hpp>

namespace ruuvi {

struct gauge_info {
    line_protocol::field_id id;
    char const* name;
    char const* help;
    std::map<std::string, std::string> labels;
    double scale = 1.0;  // Record unit to gauge unit
};

// One entry per line protocol field, gauges may share a name and differ by label
std::vector<gauge_info> const& gauge_infos();

struct gauge_sample {
    std::string name;
    std::map<std::string, std::string> labels;  // Includes the record's name tag
    double value;
};

/**
 * @brief gauge_samples Prometheus gauge values of record, in field order.
 * Fields absent from record have no sample.
 */
std::vector<gauge_sample> gauge_samples(line_protocol::line_record const& record);

}  // namespace ruuvi
