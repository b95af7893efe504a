#pragma once

#include "syncqueue/sync_action.hpp"
#include <chrono>
#include <string>

namespace syncqueue {

// Remote handler that POSTs an action to `endpoint` as an
// application/x-www-form-urlencoded body. Any 2xx status is success.
class CurlSubmitter {
public:
    explicit CurlSubmitter(std::string endpoint,
                           std::chrono::milliseconds timeout = std::chrono::seconds(10));

    HandlerResult operator()(const SyncAction& action) const;

    // "type=<tag>&<key>=<value>..." with every component escaped.
    static std::string encode_form_body(const SyncAction& action);

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
    std::chrono::milliseconds timeout_;
};

// Connectivity probe for ConnectivityMonitor::start_polling: HEAD request,
// reachable when the transfer completes with any HTTP status.
class CurlConnectivityProbe {
public:
    explicit CurlConnectivityProbe(std::string url,
                                   std::chrono::milliseconds timeout = std::chrono::seconds(5));

    bool operator()() const;

private:
    std::string url_;
    std::chrono::milliseconds timeout_;
};

} // namespace syncqueue
