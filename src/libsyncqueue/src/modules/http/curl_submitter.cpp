#include "syncqueue/http_submitter.hpp"
#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace syncqueue {

namespace {

std::once_flag curl_global_flag;

void ensure_curl_global() {
    std::call_once(curl_global_flag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize curl");
        }
    });
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

CurlHandle make_handle() {
    ensure_curl_global();
    CurlHandle handle(curl_easy_init());
    if (!handle) {
        throw std::runtime_error("Failed to initialize curl handle");
    }
    return handle;
}

// Discards the response body; only the status code matters.
size_t curl_discard_callback(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

std::string escape(CURL* handle, const std::string& s) {
    char* escaped = curl_easy_escape(handle, s.c_str(), static_cast<int>(s.size()));
    if (!escaped) {
        throw std::runtime_error("curl_easy_escape failed");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

} // namespace

CurlSubmitter::CurlSubmitter(std::string endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {
    if (endpoint_.empty()) {
        throw std::invalid_argument("CurlSubmitter: endpoint must not be empty");
    }
}

std::string CurlSubmitter::encode_form_body(const SyncAction& action) {
    CurlHandle handle = make_handle();

    std::string body = "type=" + escape(handle.get(), action.type);
    for (const auto& entry : action.payload) {
        body += "&";
        body += escape(handle.get(), entry.first);
        body += "=";
        body += escape(handle.get(), payload_value_to_string(entry.second));
    }
    return body;
}

HandlerResult CurlSubmitter::operator()(const SyncAction& action) const {
    CurlHandle handle = make_handle();
    std::string body = encode_form_body(action);

    curl_easy_setopt(handle.get(), CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, curl_discard_callback);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(handle.get());
    if (res != CURLE_OK) {
        std::cerr << "[CurlSubmitter] POST " << endpoint_ << " failed: "
                  << curl_easy_strerror(res) << std::endl;
        return HandlerResult::failure(curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
        return HandlerResult::failure("HTTP " + std::to_string(http_code));
    }

    std::cout << "[CurlSubmitter] Delivered " << action.type << " to " << endpoint_ << std::endl;
    return HandlerResult::ok();
}

CurlConnectivityProbe::CurlConnectivityProbe(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
    if (url_.empty()) {
        throw std::invalid_argument("CurlConnectivityProbe: url must not be empty");
    }
}

bool CurlConnectivityProbe::operator()() const {
    CurlHandle handle = make_handle();

    curl_easy_setopt(handle.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);

    return curl_easy_perform(handle.get()) == CURLE_OK;
}

} // namespace syncqueue
