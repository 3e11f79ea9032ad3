#pragma once

#include "pipeline.hpp"

#include <memory>
#include <string>

namespace ruuvi {

/**
 * @brief The RuuviExposer class Serves the latest value of every record field and the
 * pipeline outcome counts over http, in prometheus text format
 */
class RuuviExposer {
public:
    ~RuuviExposer();
    explicit RuuviExposer(std::string const& addr);

    /**
     * @brief update Updates prometheus with values from record, with respect to its name tag
     * This is done in thread-safe manner
     * @param record
     */
    void update(line_protocol::line_record const& record);

    void count(Pipeline::outcome o);

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

}  // namespace ruuvi
