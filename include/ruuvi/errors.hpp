#pragma once

#include <stdexcept>
#include <string>

namespace ruuvi {

class decode_error: public std::runtime_error {
public:
    enum class reason {
        foreign_manufacturer,
        empty_payload,
        unsupported_format,
        truncated,
        out_of_range,
    };

    decode_error(reason r, std::string const& what): std::runtime_error(what), why(r) {}

    reason cause() const noexcept { return why; }

private:
    reason why;
};

char const* to_string(decode_error::reason r) noexcept;

/**
 * @brief Invalid startup configuration (aliases, series name). Always fatal.
 */
class config_error: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Thrown by a RecordSink when a record could not be written
 */
class sink_error: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace ruuvi
