#include "ruuvi_prometheus_exposer.hpp"
#include "gauges.hpp"

#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <map>
#include <mutex>

using namespace ruuvi;
using namespace prometheus;

class RuuviExposer::Impl {
public:
    Impl(std::string const& addr): exposer(addr), registry(std::make_shared<Registry>()) {
        for (auto const& info : gauge_infos()) {
            auto& family = gauges[info.name];
            if (family == nullptr)
                family = &BuildGauge().Name(info.name).Help(info.help).Register(*registry);
        }

        advertisements_total = &BuildCounter()
                                    .Name("ruuvi_advertisements_total")
                                    .Help("Received advertisements by pipeline outcome")
                                    .Register(*registry);

        measurements_total = &BuildCounter()
                                  .Name("ruuvi_received_measurements_total")
                                  .Help("Total count of records written per device")
                                  .Register(*registry);

        exposer.RegisterCollectable(registry);
    }

    void update_data(line_protocol::line_record const& record) {
        std::lock_guard grd(mtx);
        for (auto const& sample : gauge_samples(record)) {
            gauges.at(sample.name)->Add(sample.labels).Set(sample.value);
        }
        measurements_total->Add({ { "name", record.name } }).Increment();
    }

    void count(Pipeline::outcome o) {
        std::lock_guard grd(mtx);
        advertisements_total->Add({ { "outcome", to_string(o) } }).Increment();
    }

private:
    Exposer exposer;
    const std::shared_ptr<Registry> registry;
    std::map<std::string, Family<Gauge>*> gauges;
    Family<Counter>* advertisements_total;
    Family<Counter>* measurements_total;
    std::mutex mtx;
};

RuuviExposer::RuuviExposer(std::string const& addr): impl(std::make_unique<Impl>(addr)) {}

RuuviExposer::~RuuviExposer() = default;

void RuuviExposer::update(line_protocol::line_record const& record) {
    impl->update_data(record);
}

void RuuviExposer::count(Pipeline::outcome o) {
    impl->count(o);
}
