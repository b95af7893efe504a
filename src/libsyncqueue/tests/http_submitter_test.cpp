#include "syncqueue/http_submitter.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace syncqueue;

void test_form_body_encoding() {
    std::cout << "Test: actions encode as escaped form bodies... ";

    SyncAction action;
    action.type = kActionFormSubmit;
    action.payload["name"] = std::string("Ada & Co");
    action.payload["age"] = static_cast<int64_t>(36);
    action.payload["agree"] = true;

    // std::map orders keys: age, agree, name
    std::string body = CurlSubmitter::encode_form_body(action);
    assert(body == "type=FORM_SUBMIT&age=36&agree=true&name=Ada%20%26%20Co");

    SyncAction bare{"PING", {}};
    assert(CurlSubmitter::encode_form_body(bare) == "type=PING");

    std::cout << "✓" << std::endl;
}

void test_unreachable_endpoint_is_a_failure() {
    std::cout << "Test: unreachable endpoint reports failure without throwing... ";

    // nothing listens on port 1
    CurlSubmitter submitter("http://127.0.0.1:1/submit", std::chrono::milliseconds(2000));
    auto result = submitter(SyncAction{"PING", {}});
    assert(!result.success);
    assert(result.error.has_value() && !result.error->empty());

    CurlConnectivityProbe probe("http://127.0.0.1:1/", std::chrono::milliseconds(2000));
    assert(!probe());

    std::cout << "✓" << std::endl;
}

void test_empty_endpoint_rejected() {
    std::cout << "Test: empty endpoints are rejected... ";

    bool threw = false;
    try {
        CurlSubmitter submitter("");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        CurlConnectivityProbe probe("");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  HTTP Submitter Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    try {
        test_form_body_encoding();
        test_unreachable_endpoint_is_a_failure();
        test_empty_endpoint_rejected();

        std::cout << std::endl << "  ✓ All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cout << std::endl << "  ✗ Test suite failed: " << e.what() << std::endl;
        return 1;
    }
}
