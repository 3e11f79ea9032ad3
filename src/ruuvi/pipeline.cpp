#include "pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>

#include <spdlog/spdlog.h>

#include "ble/address.hpp"

using namespace ruuvi;
using namespace line_protocol;

void StreamSink::write(std::string const& line) {
    std::lock_guard g(mtx);
    os << line << '\n';
    os.flush();
    if (!os) {
        os.clear();
        throw sink_error("Failed to write record to output stream");
    }
}

Pipeline::Pipeline(options o, alias_table a, std::vector<std::shared_ptr<RecordSink>> s)
    : opts(std::move(o)), aliases(std::move(a)), sinks(std::move(s)) {
    if (!is_valid_series_name(opts.series_name))
        throw config_error("Invalid measurement name '" + opts.series_name + "'");
    if (sinks.empty()) throw config_error("Pipeline needs at least one sink");
    for (auto const& sink : sinks) {
        if (!sink) throw config_error("Pipeline sink is null");
    }
    for (int f : opts.data_formats) {
        if (f != ruuvi_data_format_3::format && f != ruuvi_data_format_5::format)
            throw config_error("Unsupported Ruuvi data format " + std::to_string(f));
    }
}

std::string Pipeline::display_name(ble::BlePacket const& p, measurement const& m) const {
    auto const* df5 = std::get_if<ruuvi_data_format_5>(&m);
    if (df5 == nullptr || !df5->mac) return aliases.resolve(p.mac);

    auto receiver_mac = ble::canonical_address(p.mac);
    if (!receiver_mac || *receiver_mac != *df5->mac) {
        spdlog::warn("Receiver and packet MAC addresses differ: {} vs {}", p.mac, *df5->mac);
    }
    return aliases.resolve(*df5->mac);
}

Pipeline::result Pipeline::process(ble::BlePacket const& p) const {
    int format = identify_format(p);
    if (format == not_ruuvitag) return { outcome::not_ruuvitag, std::nullopt };
    if (format != unknown_format && !opts.data_formats.empty() &&
        opts.data_formats.count(format) == 0) {
        spdlog::trace("Ignoring data format {} from {}", format, p.mac);
        return { outcome::filtered, std::nullopt };
    }

    std::optional<measurement> m;
    try {
        m = decode(p);
    } catch (decode_error const& e) {
        auto lvl = opts.verbose ? spdlog::level::info : spdlog::level::debug;
        spdlog::log(lvl, "Ruuvitag message errors from {}: {} ({})", p.mac, e.what(),
                    to_string(e.cause()));
        return { outcome::decode_failed, std::nullopt };
    }

    auto record = to_line_record(opts.series_name, display_name(p, *m), *m,
                                 to_timestamp(p.received_at));
    if (record.fields.empty()) {
        spdlog::debug("No available values in packet from {}", p.mac);
        return { outcome::no_fields, std::nullopt };
    }

    auto line = line_protocol::to_string(record);
    std::vector<RecordSink const*> failed;
    for (auto const& sink : sinks) {
        try {
            sink->write(line);
        } catch (sink_error const& e) {
            spdlog::error("Writing record from {} failed: {}", record.name, e.what());
            failed.push_back(sink.get());
        }
    }
    auto status = failed.empty() ? outcome::emitted : outcome::sink_failed;
    return { status, std::move(record), std::move(failed) };
}

char const* ruuvi::to_string(Pipeline::outcome o) noexcept {
    switch (o) {
        case Pipeline::outcome::emitted: return "emitted";
        case Pipeline::outcome::not_ruuvitag: return "not_ruuvitag";
        case Pipeline::outcome::filtered: return "filtered";
        case Pipeline::outcome::decode_failed: return "decode_failed";
        case Pipeline::outcome::no_fields: return "no_fields";
        case Pipeline::outcome::sink_failed: return "sink_failed";
    }
    return "unknown";
}

std::set<int> ruuvi::parse_data_formats(std::string_view csv) {
    std::set<int> r;
    for (size_t begin = 0; begin <= csv.size();) {
        auto end  = std::min(csv.find(',', begin), csv.size());
        auto item = std::string(csv.substr(begin, end - begin));
        begin     = end + 1;
        if (item.empty()) continue;

        bool digits = std::all_of(item.begin(), item.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
        size_t used = 0;
        try {
            if (digits) r.insert(std::stoi(item, &used));
        } catch (std::out_of_range const&) {
            used = 0;
        }
        if (used != item.size()) throw config_error("Invalid data format version '" + item + "'");
    }
    return r;
}
