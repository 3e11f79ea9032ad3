#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <ble/receiver.hpp>
#include <influx/line_protocol.hpp>
#include <ruuvi/aliases.hpp>
#include <ruuvi/errors.hpp>

namespace ruuvi {

/**
 * @brief The RecordSink class Destination of formatted lines. write() is called once per
 * record and throws sink_error on failure; retrying is up to the implementation.
 */
class RecordSink {
public:
    virtual ~RecordSink() = default;
    virtual void write(std::string const& line) = 0;
};

/**
 * @brief The StreamSink class Writes newline terminated lines to an ostream, flushing each.
 * Concurrent writers never interleave.
 */
class StreamSink: public RecordSink {
public:
    explicit StreamSink(std::ostream& os): os(os) {}

    void write(std::string const& line) override;

private:
    std::ostream& os;
    std::mutex mtx;
};

class Pipeline {
public:
    struct options {
        std::string series_name = "ruuvi_measurements";
        std::set<int> data_formats;  // Empty accepts every supported format
        bool verbose = false;
    };

    enum class outcome {
        emitted,
        not_ruuvitag,
        filtered,
        decode_failed,
        no_fields,
        sink_failed,
    };

    struct result {
        outcome status;
        std::optional<line_protocol::line_record> record;
        std::vector<RecordSink const*> failed_sinks;  // Set with outcome::sink_failed
    };

    /**
     * @throws config_error if the series name is invalid or there are no sinks
     */
    Pipeline(options opts, alias_table aliases, std::vector<std::shared_ptr<RecordSink>> sinks);

    /**
     * @brief process Decodes p and writes one record to every sink.
     * Never throws on bad payloads or failing sinks, see the returned outcome.
     */
    result process(ble::BlePacket const& p) const;

private:
    const options opts;
    const alias_table aliases;
    const std::vector<std::shared_ptr<RecordSink>> sinks;

    std::string display_name(ble::BlePacket const& p, measurement const& m) const;
};

char const* to_string(Pipeline::outcome o) noexcept;

/**
 * @brief parse_data_formats Parses a comma separated list like "3,5", empty items are skipped
 * @throws config_error on items that are not plain decimal integers
 */
std::set<int> parse_data_formats(std::string_view csv);

}  // namespace ruuvi
