#include <ble/receiver.hpp>
#include <ruuvi/aliases.hpp>
#include <ruuvi/influx_sink.hpp>
#include <ruuvi/pipeline.hpp>
#include <ruuvi/ruuvi.hpp>
#include <ruuvi/ruuvi_prometheus_exposer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include <args.hxx>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/systemd_sink.h>
#include <spdlog/spdlog.h>

namespace {
std::atomic_flag stop_all           = ATOMIC_FLAG_INIT;
std::atomic_bool stopped_with_error = false;
std::atomic_flag debug_print        = ATOMIC_FLAG_INIT;
}  // namespace

class RuuviInflux {
public:
    RuuviInflux(ruuvi::Pipeline p, ruuvi::RecordSink const* stdout_sink, uint16_t port,
                std::string const& interface)
        : pipeline(std::move(p)),
          stdout_sink(stdout_sink),
          listener(std::bind(&RuuviInflux::ble_callback, this, std::placeholders::_1),
                   ruuvi::manufacturer_id, interface) {
        if (port != 0) {
            rvexposer = std::make_unique<ruuvi::RuuviExposer>("[::]:" + std::to_string(port) + "," +
                                                              std::to_string(port));
            spdlog::debug("Exposer listening on port {}", port);
        }
    }
    RuuviInflux(RuuviInflux const&)            = delete;
    RuuviInflux& operator=(RuuviInflux const&) = delete;

    void start() {
        spdlog::info("Starting ble listener");
        listener.start();
    }
    void stop() {
        spdlog::info("Stopping ble listener");
        listener.stop();
    }

    void ble_callback(ble::BlePacket const& p) {
        auto result = pipeline.process(p);
        if (rvexposer) {
            rvexposer->count(result.status);
            if (result.record) rvexposer->update(*result.record);
        }

        switch (result.status) {
            case ruuvi::Pipeline::outcome::not_ruuvitag:
                listener.blacklist(p.mac);
                break;
            case ruuvi::Pipeline::outcome::sink_failed: {
                // Remote failures drop the record, a broken stdout ends the program
                auto const& f = result.failed_sinks;
                if (std::find(f.begin(), f.end(), stdout_sink) != f.end()) {
                    stopped_with_error = true;
                    stop_all.clear();
                }
                break;
            }
            default:
                break;
        }
    }

    void print_debug() const {
        auto blist = listener.get_blacklist();
        spdlog::info("Blacklisted macs ({}): ", blist.size());
        for (auto const& mac: blist) { spdlog::info(mac); }
    }

private:
    const ruuvi::Pipeline pipeline;
    ruuvi::RecordSink const* const stdout_sink;
    ble::BleListener listener;
    std::unique_ptr<ruuvi::RuuviExposer> rvexposer;
};

extern "C" void stop_handler(int) {
    //
    stop_all.clear();
}

extern "C" void sigusr_handler(int) {
    debug_print.clear(std::memory_order_relaxed);
}

void config_logger(bool systemd, bool debug, bool trace) {
    spdlog::flush_on(spdlog::level::err);
    // stdout carries the records
    if (systemd) {
        static auto logger = spdlog::systemd_logger_mt("ruuvi-influx");
        spdlog::set_default_logger(logger);
    } else {
        static auto logger = spdlog::stderr_color_mt("ruuvi-influx");
        spdlog::set_default_logger(logger);
    }
    spdlog::set_level(spdlog::level::info);
    if (trace)
        spdlog::set_level(spdlog::level::trace);
    else if (debug)
        spdlog::set_level(spdlog::level::debug);
}

int main(int argc, char** argv) {
    args::ArgumentParser p("Ruuvitag Bluetooth Low Energy listener printing InfluxDB line protocol");
    args::HelpFlag help(p, "help", "Display this help menu", {'h', "help"});
    args::CompletionFlag complete(p, {"complete"});
    args::ValueFlag<std::string> measurement(
        p, "name", "The name of the measurement in InfluxDB line protocol (default ruuvi_measurements)",
        {"influxdb-measurement"}, "ruuvi_measurements"
    );
    args::ValueFlagList<std::string> aliases(
        p, "alias", "Human-readable alias for a RuuviTag address, e.g. --alias DE:AD:BE:EF:00:00=Sauna",
        {"alias"}
    );
    args::ValueFlag<std::string> formats(
        p, "versions", "Comma separated list of Ruuvi data formats to handle, all if empty",
        {"ruuvi-data-format-versions"}, ""
    );
    args::Group influx(p, "InfluxDB output, in addition to stdout:");
    args::ValueFlag<std::string> influx_url(
        influx, "url", "InfluxDB base url, e.g. http://localhost:8086", {"influxdb-url"}
    );
    args::ValueFlag<std::string> influx_db(influx, "database", "Database (InfluxDB 1.x)", {"influxdb-database"});
    args::ValueFlag<std::string> influx_rp(
        influx, "policy", "Retention policy (InfluxDB 1.x)", {"influxdb-retention-policy"}
    );
    args::ValueFlag<std::string> influx_org(influx, "org", "Organization (InfluxDB 2.x)", {"influxdb-org"});
    args::ValueFlag<std::string> influx_bucket(influx, "bucket", "Bucket (InfluxDB 2.x)", {"influxdb-bucket"});
    args::ValueFlag<std::string> influx_token(influx, "token", "API token (InfluxDB 2.x)", {"influxdb-token"});
    args::ValueFlag<std::string> influx_user(influx, "user", "User name (InfluxDB 1.x)", {"influxdb-username"});
    args::ValueFlag<std::string> influx_password(
        influx, "password", "Password (InfluxDB 1.x)", {"influxdb-password"}
    );
    args::ValueFlag<long> influx_timeout(
        influx, "ms", "Timeout of a single write in milliseconds (5000)", {"influxdb-timeout"}, 5000
    );
    args::Flag verbose(p, "verbose", "Log parse errors for unrecognized data", {'v', "verbose"});
    args::Flag systemd(p, "log-to-systemd", "Send log output to systemd-journald", {"systemd"});
    args::ValueFlag<uint16_t> port(
        p, "port", "Port on which the prometheus exposer is started (disabled by default)", {'p', "port"}, 0
    );
    args::Flag debug(p, "debug", "Enable debug logs", {"debug"});
    args::Flag trace(p, "trace", "Enable trace logs", {"trace"});
    args::ValueFlag<std::string> interface(p, "interface", "Bluetooth interface to listen on (hci0)", {"interface", 'i'}, "hci0");

    try {
        p.ParseCLI(argc, argv);
    } catch (args::Completion const& e) {
        std::cout << e.what();
        return EXIT_SUCCESS;
    } catch (args::Help const&) {
        std::cout << p;
        return EXIT_SUCCESS;
    } catch (args::Error const& e) {
        std::cerr << e.what() << "\n" << p;
        return EXIT_FAILURE;
    }

    try {
        config_logger(systemd, debug, trace);

        ruuvi::Pipeline::options opts;
        opts.series_name  = measurement.Get();
        opts.verbose      = verbose;
        opts.data_formats = ruuvi::parse_data_formats(formats.Get());

        std::vector<ruuvi::alias> alias_list;
        for (auto const& a : args::get(aliases)) { alias_list.push_back(ruuvi::parse_alias(a)); }

        auto stdout_sink = std::make_shared<ruuvi::StreamSink>(std::cout);
        std::vector<std::shared_ptr<ruuvi::RecordSink>> sinks{ stdout_sink };
        if (influx_url) {
            ruuvi::influx_options io;
            io.url              = influx_url.Get();
            io.database         = influx_db.Get();
            io.retention_policy = influx_rp.Get();
            io.org              = influx_org.Get();
            io.bucket           = influx_bucket.Get();
            io.token            = influx_token.Get();
            io.username         = influx_user.Get();
            io.password         = influx_password.Get();
            io.timeout          = std::chrono::milliseconds(influx_timeout.Get());
            sinks.push_back(std::make_shared<ruuvi::InfluxSink>(io));
        }
        ruuvi::Pipeline pipeline(std::move(opts), ruuvi::alias_table(alias_list), std::move(sinks));
        spdlog::debug("{} aliases configured", alias_list.size());

        RuuviInflux rv(std::move(pipeline), stdout_sink.get(), port.Get(), interface.Get());
        stop_all.test_and_set();
        debug_print.test_and_set();

        std::thread runner([&rv]() {
            try {
                rv.start();
            } catch (std::exception const& e) {
                // Stop
                stop_all.clear();
                stopped_with_error = true;
                spdlog::error("Runner thread exited with error {}", e.what());
            }
        });

        std::thread stopper([&rv]() {
            while (stop_all.test_and_set()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
                if (debug_print.test_and_set(std::memory_order_relaxed) == false) {
                    try {
                        rv.print_debug();
                    } catch (std::exception const& e) {
                        spdlog::warn("Debug print failed: {}", e.what());
                    }
                }
            }
            spdlog::info("Stopping...");
            rv.stop();
        });

        std::signal(SIGTERM, stop_handler);
        std::signal(SIGINT, stop_handler);
        std::signal(SIGUSR1, sigusr_handler);

        stopper.join();
        runner.join();
    } catch (ruuvi::config_error const& e) {
        spdlog::critical("Configuration error: {}", e.what());
        stopped_with_error = true;
    } catch (std::exception const& e) {
        spdlog::error("Uncaught exception: {}", e.what());
        stopped_with_error = true;
    } catch (...) {
        spdlog::error("Uncaught exception of unknown type in main()");
        stopped_with_error = true;
    }
    return stopped_with_error ? EXIT_FAILURE : EXIT_SUCCESS;
}
