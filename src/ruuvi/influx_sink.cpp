#include "influx_sink.hpp"

#include <mutex>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

using namespace ruuvi;

namespace {

std::once_flag curl_init;

struct curl_deleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

bool starts_with(std::string const& s, char const* prefix) {
    return s.rfind(prefix, 0) == 0;
}

}  // namespace

class InfluxSink::Impl {
public:
    explicit Impl(influx_options const& o) {
        if (!starts_with(o.url, "http://") && !starts_with(o.url, "https://"))
            throw config_error("InfluxDB url must start with http:// or https://, got '" + o.url + "'");
        if (o.bucket.empty() && o.database.empty())
            throw config_error("InfluxDB output needs a database or a bucket");

        std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        handle.reset(curl_easy_init());
        if (!handle) throw config_error("Failed to initialize libcurl");

        std::string base = o.url;
        while (!base.empty() && base.back() == '/') base.pop_back();
        if (!o.bucket.empty()) {
            url = base + "/api/v2/write?org=" + escape(o.org) + "&bucket=" + escape(o.bucket);
        } else {
            url = base + "/write?db=" + escape(o.database);
            if (!o.retention_policy.empty()) url += "&rp=" + escape(o.retention_policy);
        }
        url += "&precision=ns";

        curl_slist* h = curl_slist_append(nullptr, "Content-Type: text/plain; charset=utf-8");
        if (!o.token.empty()) h = curl_slist_append(h, ("Authorization: Token " + o.token).c_str());
        headers.reset(h);

        CURL* c = handle.get();
        curl_easy_setopt(c, CURLOPT_URL, url.c_str());
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(o.timeout.count()));
        curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, collect_body);
        curl_easy_setopt(c, CURLOPT_WRITEDATA, &response);
        if (!o.username.empty()) {
            curl_easy_setopt(c, CURLOPT_USERNAME, o.username.c_str());
            curl_easy_setopt(c, CURLOPT_PASSWORD, o.password.c_str());
        }
        spdlog::debug("Writing records to {}", url);
    }

    void write(std::string const& line) {
        std::lock_guard g(mtx);
        CURL* c = handle.get();
        response.clear();
        errbuf[0] = '\0';
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, line.data());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(line.size()));

        CURLcode res = curl_easy_perform(c);
        if (res != CURLE_OK) {
            throw sink_error("InfluxDB write failed: " +
                             std::string(errbuf[0] != '\0' ? errbuf : curl_easy_strerror(res)));
        }

        long status = 0;
        curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
        if (status < 200 || status >= 300) {
            throw sink_error("InfluxDB write failed with HTTP " + std::to_string(status) +
                             (response.empty() ? "" : ": " + response));
        }
        spdlog::trace("InfluxDB accepted record, HTTP {}", status);
    }

    std::string url;

private:
    // handle is cleaned up before the header list it references
    std::unique_ptr<curl_slist, curl_deleter> headers;
    std::unique_ptr<CURL, curl_deleter> handle;
    std::string response;
    char errbuf[CURL_ERROR_SIZE] = {};
    std::mutex mtx;

    std::string escape(std::string const& s) const {
        char* e = curl_easy_escape(handle.get(), s.c_str(), static_cast<int>(s.size()));
        if (e == nullptr) throw config_error("Failed to escape '" + s + "'");
        std::string r(e);
        curl_free(e);
        return r;
    }
};

InfluxSink::InfluxSink(influx_options const& opts): impl(std::make_unique<Impl>(opts)) {}

InfluxSink::~InfluxSink() = default;

void InfluxSink::write(std::string const& line) { impl->write(line); }

std::string const& InfluxSink::endpoint() const { return impl->url; }
