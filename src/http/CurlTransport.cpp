#include "http/CurlTransport.hpp"
#include "http/errors.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>

namespace loft::http {

using namespace util;

namespace {

struct Transfer {
    CURL* handle = nullptr;
    const Sink* sink = nullptr;
    const CancelToken* cancel = nullptr;
    std::string buffer{};
    bool sinkStopped = false;
};

size_t onWrite(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const size_t n = size * nmemb;

    if (!t->sink) {
        t->buffer.append(ptr, n);
        return n;
    }

    long status = 0;
    curl_easy_getinfo(t->handle, CURLINFO_RESPONSE_CODE, &status);
    if (status / 100 != 2) {
        t->buffer.append(ptr, n);
        return n;
    }

    if (!(*t->sink)(ptr, n)) {
        t->sinkStopped = true;
        return 0; // CURLE_WRITE_ERROR
    }
    return n;
}

int onProgress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* t = static_cast<Transfer*>(userdata);
    return t->cancel->stopRequested() ? 1 : 0;
}

void applyForm(CURL* h, Mime& mime, const Request& req) {
    for (const auto& part : req.form) {
        curl_mimepart* p = mime.addPart();
        curl_mime_name(p, part.name.c_str());
        curl_mime_data(p, part.value.data(), part.value.size());
        if (part.filename) curl_mime_filename(p, part.filename->c_str());
        if (part.content_type) curl_mime_type(p, part.content_type->c_str());
    }
    curl_easy_setopt(h, CURLOPT_MIMEPOST, mime.get());
}

Response run(const CurlOptions& opts, const Request& req, const Sink* sink, const CancelToken& cancel) {
    ensureCurlGlobalInit();

    const auto method = to_string(req.method);

    if (cancel.stopRequested())
        throw Cancelled(fmt::format("{} {} cancelled before start", method, req.url), CURLE_ABORTED_BY_CALLBACK);

    CurlEasy h;
    Transfer t{.handle = h, .sink = sink, .cancel = &cancel};

    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_USERAGENT, opts.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_seconds);
    curl_easy_setopt(h, CURLOPT_VERBOSE, opts.verbose ? 1L : 0L);

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, onWrite);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onProgress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &t);

    if (const auto left = cancel.remaining())
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<long long>(left->count(), 1)));

    SList headers;
    for (const auto& [k, v] : req.headers) headers.add(k + ": " + v);

    Mime mime(h);

    switch (req.method) {
        case Method::Get:
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Post:
            if (req.isMultipart()) applyForm(h, mime, req);
            else {
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
            }
            break;
        default:
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.data());
            if (req.isMultipart()) applyForm(h, mime, req);
            else if (!req.body.empty()) {
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, req.body.data());
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
            }
            break;
    }

    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

    const CURLcode rc = curl_easy_perform(h);

    Response resp;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body.swap(t.buffer);

    if (rc == CURLE_OK) return resp;

    if (rc == CURLE_ABORTED_BY_CALLBACK || rc == CURLE_OPERATION_TIMEDOUT || t.sinkStopped) {
        const char* why = t.sinkStopped ? "reader stopped" : cancel.cancelled() ? "cancelled" : "deadline exceeded";
        log::Registry::http()->debug("[CurlTransport] {} {} aborted: {}", method, req.url, why);
        throw Cancelled(fmt::format("{} {} aborted: {}", method, req.url, why), rc);
    }

    log::Registry::http()->error("[CurlTransport] {} {} failed: CURL={} ({})",
                                       method, req.url, static_cast<int>(rc), curl_easy_strerror(rc));
    throw TransportError(fmt::format("{} {} failed: {}", method, req.url, curl_easy_strerror(rc)), rc);
}

}

CurlTransport::CurlTransport() : CurlTransport(CurlOptions{}) {}

CurlTransport::CurlTransport(CurlOptions opts) : opts_(std::move(opts)) { ensureCurlGlobalInit(); }

Response CurlTransport::perform(const Request& req, const CancelToken& cancel) {
    return run(opts_, req, nullptr, cancel);
}

Response CurlTransport::stream(const Request& req, const Sink& sink, const CancelToken& cancel) {
    return run(opts_, req, &sink, cancel);
}

}
