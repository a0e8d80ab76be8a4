#pragma once

#include "config.hpp"
#include "sink.hpp"
#include <string>
#include <vector>

// InfluxDB v2 HTTP write API client. Not thread-safe; the poll loop is the
// only writer.
class InfluxSink : public TimeSeriesSink {
public:
    explicit InfluxSink(const SinkConfig& cfg);
    ~InfluxSink() override;

    InfluxSink(const InfluxSink&) = delete;
    InfluxSink& operator=(const InfluxSink&) = delete;

    SinkError write(const std::string& bucket, const std::vector<WritePoint>& points) override;

    std::string write_url(const std::string& bucket) const;

private:
    SinkConfig cfg_;
    void* curl_; // libcurl easy handle, owned
};

// Process-wide libcurl setup; call once from main before any sink is built.
bool init_http_client();
void shutdown_http_client();
