#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <ruuvi/pipeline.hpp>

namespace ruuvi {

/**
 * Where and how to write. Setting bucket selects the 2.x API (/api/v2/write with org and a
 * token), otherwise database selects the 1.x API (/write with optional basic auth).
 */
struct influx_options {
    std::string url;  // e.g. http://localhost:8086
    std::string database;
    std::string retention_policy;
    std::string org;
    std::string bucket;
    std::string token;
    std::string username;
    std::string password;
    std::chrono::milliseconds timeout{ 5000 };
};

/**
 * @brief The InfluxSink class POSTs every record to an InfluxDB write endpoint, one request
 * per record with nanosecond precision. No retries.
 */
class InfluxSink: public RecordSink {
public:
    /**
     * @throws config_error if url isn't http(s) or neither database nor bucket is set
     */
    explicit InfluxSink(influx_options const& opts);
    ~InfluxSink() override;

    /**
     * @throws sink_error on transport failures and on non 2xx responses
     */
    void write(std::string const& line) override;

    // Full write url including the query string
    std::string const& endpoint() const;

private:
    class Impl;
    const std::unique_ptr<Impl> impl;
};

}  // namespace ruuvi
