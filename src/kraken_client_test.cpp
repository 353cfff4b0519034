// =============================================================================
// src/kraken_client_test.cpp - Kraken REST client tests
// =============================================================================
// Scripted transport + virtual clock. No network, no real sleeping.
// =============================================================================

#include <cmath>
#include <iostream>
#include <iomanip>
#include <string>

#include "core/StrikeError.hpp"
#include "exchange/kraken/KrakenAuth.hpp"
#include "exchange/kraken/KrakenRestClient.hpp"
#include "testing/TestFakes.hpp"

using namespace strikebox;
using namespace strikebox::testing;

static const char* SECRET =
    "kQH5HW/8p1uGOVjbgWA7FunAmGO8lsSUXNsu3eow76sz84Q18fWxnyRzBHCd3pd5nE9qa99HAZtuZuj6F1huXg==";
static const char* BASE = "https://api.kraken.test";
static const char* ADD_OK =
    R"({"error":[],"result":{"descr":{"order":"buy 0.0005 XBTUSD @ market"},"txid":["OUF4EM-FRGI2-MQMWZD"]}})";

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

static std::string nonce_of(const std::string& body) {
    size_t amp = body.find('&');
    return body.substr(6, amp == std::string::npos ? std::string::npos : amp - 6);
}

class KrakenClientTest {
public:
    int run_all_tests() {
        std::cout << "\n=== KRAKEN REST CLIENT - UNIT TESTS ===\n\n";

        test_pair_mapping();
        test_form_encode();
        test_add_order();
        test_invalid_size();
        test_rejection_not_retried();
        test_retry_exhausted();
        test_retry_recovers();
        test_missing_result();
        test_query_order();
        test_cancel_order();
        test_headers_and_secrecy();

        print_summary();
        return tests_failed_;
    }

private:
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    void test_pass(const char* name) {
        std::cout << "  [PASS] " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const char* name, const std::string& reason) {
        std::cout << "  [FAIL] " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void check(bool ok, const char* name, const std::string& reason) {
        if (ok) test_pass(name);
        else    test_fail(name, reason);
    }

    // =========================================================================
    // TESTS
    // =========================================================================

    void test_pair_mapping() {
        std::cout << "Testing pair mapping...\n";
        check(kraken_pair("WBTC/USDC") == "XBTUSD", "WBTC maps to XBTUSD", kraken_pair("WBTC/USDC"));
        check(kraken_pair("WETH/USDC") == "ETHUSD", "WETH maps to ETHUSD", kraken_pair("WETH/USDC"));
        check(kraken_pair("DOGE/USDC").empty(), "unknown symbol has no pair", kraken_pair("DOGE/USDC"));
        std::cout << "\n";
    }

    void test_form_encode() {
        std::cout << "Testing form encoding...\n";
        check(form_encode("a b/c") == "a+b%2Fc", "space and slash encoded", form_encode("a b/c"));
        check(form_encode("OUF4EM-FRGI2") == "OUF4EM-FRGI2", "txid untouched", form_encode("OUF4EM-FRGI2"));
        std::cout << "\n";
    }

    void test_add_order() {
        std::cout << "Testing AddOrder...\n";
        KrakenAuth auth("mykey", SECRET);
        FakeTransport http;
        FakeClock clock;
        KrakenRestClient client(BASE, auth, http, clock);

        http.push_response(200, ADD_OK);
        std::string txid = client.place_order("XBTUSD", Side::Buy, 25.0, 50000.0);

        check(txid == "OUF4EM-FRGI2-MQMWZD", "txid parsed", txid);
        check(http.requests().size() == 1, "one request sent",
              std::to_string(http.requests().size()));
        const RecordedRequest& req = http.requests().front();
        check(req.url == std::string(BASE) + "/0/private/AddOrder", "AddOrder URL", req.url);
        check(req.body.rfind("nonce=", 0) == 0, "body starts with nonce", req.body);
        check(contains(req.body, "&pair=XBTUSD&type=buy&ordertype=market&volume=0.00050000"),
              "market order fields and volume", req.body);
        check(clock.slept().count() == 0, "no backoff on success",
              std::to_string(clock.slept().count()));
        std::cout << "\n";
    }

    void test_invalid_size() {
        std::cout << "Testing size validation...\n";
        KrakenAuth auth("mykey", SECRET);
        FakeTransport http;
        FakeClock clock;
        KrakenRestClient client(BASE, auth, http, clock);

        try {
            client.place_order("XBTUSD", Side::Buy, 0.0, 50000.0);
            test_fail("zero notional rejected", "no exception");
        } catch (const StrikeError& e) {
            check(e.code() == ErrorCode::InvalidSize, "zero notional is InvalidSize", to_string(e.code()));
        }
        try {
            client.place_exit("XBTUSD", -1.0);
            test_fail("negative exit volume rejected", "no exception");
        } catch (const StrikeError& e) {
            check(e.code() == ErrorCode::InvalidSize, "negative volume is InvalidSize", to_string(e.code()));
        }
        check(http.requests().empty(), "nothing reached the wire",
              std::to_string(http.requests().size()) + " requests");
        std::cout << "\n";
    }

    void test_rejection_not_retried() {
        std::cout << "Testing exchange rejection...\n";
        KrakenAuth auth("mykey", SECRET);
        FakeTransport http;
        FakeClock clock;
        KrakenRestClient client(BASE, auth, http, clock);

        http.push_response(200, R"({"error":["EOrder:Insufficient funds"]})");
        try {
            client.place_order("XBTUSD", Side::Buy, 25.0, 50000.0);
            test_fail("rejection surfaces", "no exception");
        } catch (const StrikeError& e) {
            check(e.code() == ErrorCode::ExchangeRejected, "rejection is ExchangeRejected",
                  to_string(e.code()));
            check(contains(e.what(), "Insufficient funds"), "rejection text kept", e.what());
        }
        check(http.requests().size() == 1, "rejection sent exactly once",
              std::to_string(http.requests().size()));
        check(clock.slept().count() == 0, "no backoff after rejection",
              std::to_string(clock.slept().count()));
        std::cout << "\n";
    }

    void test_retry_exhausted() {
        std::cout << "Testing retry budget...\n";
        KrakenAuth auth("mykey", SECRET);
        FakeTransport http;
        FakeClock clock;
        KrakenRestClient client(BASE, auth, http, clock);

        http.push_failure();
        http.push_response(502, "<html>bad gateway</html>");
        http.push_response(200, "not json");
        try {
            client.place_order("XBTUSD", Side::Buy, 25.0, 50000.0);
            test_fail("exhausted retries surface", "no exception");
        } catch (const StrikeError& e) {
            check(e.code() == ErrorCode::TransportError, "final error is TransportError",
                  to_string(e.code()));
        }
        check(http.requests().size() == 3, "three attempts",
              std::to_string(http.requests().size()));
        check(clock.sleep_calls() == 2, "backoff only between attempts",
              std::to_string(clock.sleep_calls()) + " sleeps");
        check(clock.slept().count() == 1500, "backoff 500ms then 1000ms",
              std::to_string(clock.slept().count()) + "ms");
        std::cout << "\n";
    }

    void test_retry_recovers() {
        std::cout << "Testing recovery after transient failures...\n";
        KrakenAuth auth("mykey", SECRET);
        FakeTransport http;
        FakeClock clock;
        KrakenRestClient client(BASE, auth, http, clock);

        http.push_failure();
        http.push_failure();
        http.push_response(200, ADD_OK);
        std::string txid;
        try {
            txid = client.place_order("XBTUSD", Side::Buy, 25.0, 50000.0);
        } catch (const StrikeError& e) {
            test_fail("third attempt succeeds", e.what());
            return;
        }
        check(txid == "OUF4EM-FRGI2-MQMWZD", "third attempt succeeds", txid);

        const auto& reqs = http.requests();
        bool fresh = reqs.size() == 3 &&
                     nonce_of(reqs[0].body) != nonce_of(reqs[1].body) &&
                     nonce_of(reqs[1].body) != nonce_of(reqs[2].body);
        check(fresh, "each attempt carries a fresh nonce", "nonce reused");
        std::cout << "\n";
    }

    void test_missing_result() {
        std::cout << "Testing missing result...\n";
        KrakenAuth auth("mykey", SECRET);
        FakeTransport http;
        FakeClock clock;
        KrakenRestClient client(BASE, auth, http, clock);

        for (int i = 0; i < 3; ++i) http.push_response(200, R"({"error":[]})");
        try {
            client.cancel_order("OUF4EM-FRGI2-MQMWZD");
            test_fail("missing result is an error", "no exception");
        } catch (const StrikeError& e) {
            check(e.retryable(), "missing result is retryable", to_string(e.code()));
        }
        check(http.requests().size() == 3, "missing result retried",
              std::to_string(http.requests().size()));
        std::cout << "\n";
    }

    void test_query_order() {
        std::cout << "Testing QueryOrders...\n";
        KrakenAuth auth("mykey", SECRET);
        FakeTransport http;
        FakeClock clock;
        KrakenRestClient client(BASE, auth, http, clock);

        http.push_response(200,
            R"({"error":[],"result":{"OABC":{"status":"closed","vol_exec":"0.00050000","price":"50010.5"}}})");
        OrderFill f = client.query_order("OABC");
        check(f.volume_executed && std::fabs(*f.volume_executed - 0.0005) < 1e-12,
              "vol_exec string parsed", "missing or wrong");
        check(f.average_price && std::fabs(*f.average_price - 50010.5) < 1e-9,
              "price string parsed", "missing or wrong");
        check(f.status == "closed", "status parsed", f.status);
        check(contains(http.requests().back().body, "&txid=OABC"), "txid in body",
              http.requests().back().body);

        http.push_response(200, R"({"error":[],"result":{"OABC":{"status":"open","vol_exec":"0.00000000","price":"0.00000"}}})");
        OrderFill open = client.query_order("OABC");
        check(!open.volume_executed && !open.average_price, "zero fill reported as empty",
              "fields set");

        http.push_response(200, R"({"error":[],"result":{}})");
        OrderFill none = client.query_order("OABC");
        check(!none.volume_executed && none.status.empty(), "unknown order is empty fill",
              "fields set");
        std::cout << "\n";
    }

    void test_cancel_order() {
        std::cout << "Testing CancelOrder...\n";
        KrakenAuth auth("mykey", SECRET);
        FakeTransport http;
        FakeClock clock;
        KrakenRestClient client(BASE, auth, http, clock);

        http.push_response(200, R"({"error":[],"result":{"count":1}})");
        try {
            client.cancel_order("OUF4EM-FRGI2-MQMWZD");
            test_pass("cancel accepted");
        } catch (const StrikeError& e) {
            test_fail("cancel accepted", e.what());
        }
        check(http.requests().back().url == std::string(BASE) + "/0/private/CancelOrder",
              "CancelOrder URL", http.requests().back().url);
        std::cout << "\n";
    }

    void test_headers_and_secrecy() {
        std::cout << "Testing headers and credential handling...\n";
        KrakenAuth auth("mykey", SECRET);
        FakeTransport http;
        FakeClock clock;
        KrakenRestClient client(BASE, auth, http, clock);

        http.push_response(200, ADD_OK);
        client.place_order("XBTUSD", Side::Buy, 25.0, 50000.0);

        const RecordedRequest& req = http.requests().front();
        bool has_key = false, has_sign = false, has_ct = false, leaks = false;
        for (const auto& h : req.headers) {
            if (h == "API-Key: mykey") has_key = true;
            if (h.rfind("API-Sign: ", 0) == 0 && h.size() == 10 + 88) has_sign = true;
            if (contains(h, "application/x-www-form-urlencoded")) has_ct = true;
            if (contains(h, SECRET)) leaks = true;
        }
        check(has_key, "API-Key header", "missing");
        check(has_sign, "API-Sign header with 64-byte signature", "missing");
        check(has_ct, "form content type", "missing");
        check(!leaks && !contains(req.body, SECRET), "secret never on the wire", "secret found");

        for (int i = 0; i < 3; ++i) http.push_response(500, "oops");
        try {
            client.place_order("XBTUSD", Side::Buy, 25.0, 50000.0);
            test_fail("HTTP 500 surfaces", "no exception");
        } catch (const StrikeError& e) {
            check(!contains(e.what(), SECRET), "secret absent from error text", e.what());
            check(contains(e.what(), "HTTP 500"), "status in error text", e.what());
        }
        std::cout << "\n";
    }

    void print_summary() {
        std::cout << "=== TEST SUMMARY ===\n";
        std::cout << "  Passed: " << std::setw(3) << tests_passed_ << "\n";
        std::cout << "  Failed: " << std::setw(3) << tests_failed_ << "\n";
        std::cout << (tests_failed_ == 0 ? "\nALL TESTS PASSED\n\n" : "\nSOME TESTS FAILED\n\n");
    }
};

int main() {
    KrakenClientTest tester;
    return tester.run_all_tests() == 0 ? 0 : 1;
}
