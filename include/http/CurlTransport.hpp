#pragma once

#include "http/Transport.hpp"

#include <string>

namespace loft::http {

struct CurlOptions {
    long connect_timeout_seconds = 15;
    std::string user_agent = "loft/1.0";
    bool verbose = false;
};

class CurlTransport final : public Transport {
public:
    CurlTransport();
    explicit CurlTransport(CurlOptions opts);
    ~CurlTransport() override = default;

    Response perform(const Request& req, const CancelToken& cancel) override;
    Response stream(const Request& req, const Sink& sink, const CancelToken& cancel) override;

private:
    CurlOptions opts_;
};

}
