#include "influx_sink.hpp"
#include "line_protocol.hpp"
#include "logging.hpp"

#include <curl/curl.h>

#include <algorithm>

namespace {
constexpr const char* kTag = "INFLUX";
constexpr std::size_t kMaxErrorBody = 512;

std::size_t collect_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    const std::size_t n = size * nmemb;
    if (body->size() < kMaxErrorBody) {
        body->append(ptr, std::min(n, kMaxErrorBody - body->size()));
    }
    return n;
}

CURL* easy(void* handle) {
    return static_cast<CURL*>(handle);
}

std::string url_escape(CURL* curl, const std::string& text) {
    char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
    if (escaped == nullptr) {
        return text;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}
} // namespace

bool init_http_client() {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        log_error(kTag, "curl_global_init failed: %s", curl_easy_strerror(rc));
        return false;
    }
    return true;
}

void shutdown_http_client() {
    curl_global_cleanup();
}

InfluxSink::InfluxSink(const SinkConfig& cfg) : cfg_(cfg), curl_(curl_easy_init()) {
    while (!cfg_.host.empty() && cfg_.host.back() == '/') {
        cfg_.host.pop_back();
    }
    if (curl_ == nullptr) {
        log_error(kTag, "curl_easy_init failed; every write will fail");
    }
}

InfluxSink::~InfluxSink() {
    if (curl_ != nullptr) {
        curl_easy_cleanup(easy(curl_));
    }
}

std::string InfluxSink::write_url(const std::string& bucket) const {
    std::string url = cfg_.host + "/api/v2/write?org=";
    if (curl_ != nullptr) {
        url += url_escape(easy(curl_), cfg_.org) + "&bucket=" + url_escape(easy(curl_), bucket);
    } else {
        url += cfg_.org + "&bucket=" + bucket;
    }
    url += "&precision=ns";
    return url;
}

SinkError InfluxSink::write(const std::string& bucket, const std::vector<WritePoint>& points) {
    if (curl_ == nullptr) {
        return SinkError::WriteFailed;
    }
    const std::string body = encode_lines(points);
    const std::string url = write_url(bucket);
    const std::string auth = "Authorization: Token " + cfg_.token;
    std::string response;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, auth.c_str());
    headers = curl_slist_append(headers, "Content-Type: text/plain; charset=utf-8");
    headers = curl_slist_append(headers, "Accept: application/json");

    CURL* curl = easy(curl_);
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg_.write_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    const CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);

    if (rc != CURLE_OK) {
        log_error(kTag, "write of %zu points failed: %s", points.size(), curl_easy_strerror(rc));
        return SinkError::WriteFailed;
    }
    if (status < 200 || status >= 300) {
        log_error(kTag, "write of %zu points rejected: HTTP %ld %s", points.size(), status, response.c_str());
        return SinkError::WriteFailed;
    }
    log_debug(kTag, "HTTP %ld for %zu points", status, points.size());
    return SinkError::None;
}
