#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../src/engine/curl_engine.hpp"
#include "../src/engine/curl_transfer.hpp"
#include "test_utils.hpp"

using namespace relay;
using namespace std::chrono;
using relay::engine::CurlEngine;
using relay::testing::LocalHttpServer;

namespace {
    model::Response as_response(const model::ExecutionResult& result) {
        if (const auto* err = std::get_if<error::StructuredError>(&result)) {
            ADD_FAILURE() << "unexpected error " << error::to_string(err->code_) << ": " << err->message_;
        }
        return std::get<model::Response>(result);
    }

    error::ErrorCode code_of(const model::ExecutionResult& result) {
        if (model::is_response(result)) {
            ADD_FAILURE() << "expected an error, got status " << std::get<model::Response>(result).status_code_;
            return error::ErrorCode::UNKNOWN_ERROR;
        }
        return std::get<error::StructuredError>(result).code_;
    }
}  // namespace

// =============================================================================
// Fixture
// =============================================================================

class CurlEngineTest : public ::testing::Test {
   protected:
    LocalHttpServer server_;
    std::unique_ptr<CurlEngine> engine_;

    void SetUp() override { engine_ = start_engine(engine::EngineOptions{}); }

    static std::unique_ptr<CurlEngine> start_engine(engine::EngineOptions options) {
        auto engine = std::make_unique<CurlEngine>(std::move(options));
        const auto failure = engine->init();
        EXPECT_FALSE(failure.has_value()) << (failure ? failure->message_ : "");
        return engine;
    }

    model::Request get(const std::string& path) const { return model::Request{.url_ = server_.url(path)}; }
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST(CurlEngineLifecycleTest, ExecuteBeforeInitIsRefused) {
    CurlEngine engine;
    EXPECT_EQ(code_of(engine.execute_one(model::Request{.url_ = "http://127.0.0.1:1/"})), error::ErrorCode::ENGINE_NOT_INITIALIZED);

    const auto batch = engine.execute_batch({model::Request{.url_ = "http://a/"}, model::Request{.url_ = "http://b/"}});
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(code_of(batch[1]), error::ErrorCode::ENGINE_NOT_INITIALIZED);
}

TEST(CurlEngineLifecycleTest, InitIsIdempotent) {
    CurlEngine engine;
    ASSERT_FALSE(engine.init().has_value());
    CURLM* first = engine.multi_handle();
    ASSERT_NE(first, nullptr);

    EXPECT_FALSE(engine.init().has_value());
    EXPECT_EQ(engine.multi_handle(), first);
}

TEST(CurlEngineLifecycleTest, ShutdownIsFinal) {
    CurlEngine engine;
    ASSERT_FALSE(engine.init().has_value());
    engine.shutdown();
    engine.shutdown();

    EXPECT_EQ(engine.multi_handle(), nullptr);
    EXPECT_EQ(code_of(engine.execute_one(model::Request{.url_ = "http://127.0.0.1:1/"})), error::ErrorCode::ENGINE_SHUTDOWN);

    const auto reinit = engine.init();
    ASSERT_TRUE(reinit.has_value());
    EXPECT_EQ(reinit->code_, error::ErrorCode::ENGINE_SHUTDOWN);
}

TEST(CurlEngineLifecycleTest, EnginesDoNotShareMultiHandles) {
    CurlEngine a;
    CurlEngine b;
    ASSERT_FALSE(a.init().has_value());
    ASSERT_FALSE(b.init().has_value());
    EXPECT_NE(a.multi_handle(), b.multi_handle());
}

// =============================================================================
// Single requests
// =============================================================================

TEST_F(CurlEngineTest, NotFoundIsAResponseNotAnError) {
    const auto& response = as_response(engine_->execute_one(get("/status/404")));

    EXPECT_EQ(response.status_code_, 404);
    EXPECT_EQ(response.body_, R"({"error":"not found"})");
    EXPECT_FALSE(response.is_success());
    EXPECT_EQ(response.version_, "HTTP/1.1");
}

TEST_F(CurlEngineTest, SuccessCarriesMetadata) {
    const auto result = engine_->execute_one(get("/delay/20"));
    const auto& response = as_response(result);

    EXPECT_EQ(response.status_code_, 200);
    EXPECT_GE(response.elapsed_ms_, 20u);
    EXPECT_EQ(response.url_, server_.url("/delay/20"));
    EXPECT_EQ(response.header("Content-Type").value_or(""), "application/json");
    EXPECT_FALSE(response.cache_hit_);
}

TEST_F(CurlEngineTest, RequestHeadersAndUserAgentAreSent) {
    auto request = get("/headers");
    request.headers_["X-Relay-Test"] = "yes";

    const auto echoed = nlohmann::json::parse(as_response(engine_->execute_one(request)).body_);
    EXPECT_EQ(echoed["x-relay-test"], "yes");
    EXPECT_EQ(echoed["user-agent"], constants::DEFAULT_USER_AGENT);
}

TEST_F(CurlEngineTest, BodyAndMethodReachTheServer) {
    model::Request request{.url_ = server_.url("/echo"), .method_ = "PUT", .body_ = "payload-bytes"};

    const auto& response = as_response(engine_->execute_one(request));
    EXPECT_EQ(response.body_, "payload-bytes");
    EXPECT_EQ(response.header("x-echo-method").value_or(""), "PUT");
}

TEST_F(CurlEngineTest, BodylessPostSendsEmptyContent) {
    model::Request request{.url_ = server_.url("/echo"), .method_ = "POST"};

    const auto& response = as_response(engine_->execute_one(request));
    EXPECT_EQ(response.header("x-echo-method").value_or(""), "POST");
    EXPECT_TRUE(response.body_.empty());
}

TEST_F(CurlEngineTest, QueryParametersAreEscaped) {
    auto request = get("/echo");
    request.query_params_["q"] = "a b&c";

    const auto& response = as_response(engine_->execute_one(request));
    EXPECT_EQ(response.header("x-echo-path").value_or(""), "/echo?q=a%20b%26c");
}

TEST_F(CurlEngineTest, RepeatedResponseHeadersAreJoined) {
    const auto& response = as_response(engine_->execute_one(get("/multi-header")));
    EXPECT_EQ(response.header("x-multi").value_or(""), "first, second");
}

TEST_F(CurlEngineTest, InvalidRequestIsRejectedBeforeTheNetwork) {
    EXPECT_EQ(code_of(engine_->execute_one(model::Request{.url_ = "ftp://example.com/"})), error::ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(code_of(engine_->execute_one(model::Request{.url_ = server_.url("/echo"), .method_ = "NOT VALID"})), error::ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(server_.hits("/echo"), 0);
}

TEST_F(CurlEngineTest, ParsedDataIsMinifiedJson) {
    auto request = get("/json");
    request.parse_response_ = true;

    const auto& response = as_response(engine_->execute_one(request));
    EXPECT_EQ(response.parsed_data_.value_or(""), R"({"name":"relay","values":[1,2,3],"nested":{"ok":true}})");

    auto plain = get("/status/200");
    plain.parse_response_ = true;
    EXPECT_FALSE(as_response(engine_->execute_one(plain)).parsed_data_.has_value());
}

// =============================================================================
// Timeouts
// =============================================================================

TEST_F(CurlEngineTest, OverallTimeoutIsATimeoutError) {
    auto request = get("/delay/50");
    request.timeout_ = milliseconds{1};

    EXPECT_EQ(code_of(engine_->execute_one(request)), error::ErrorCode::TIMEOUT_ERROR);
}

TEST_F(CurlEngineTest, ReadStallIsATimeoutErrorWithReadPhase) {
    auto request = get("/delay/1500");
    request.timeout_ = milliseconds{0};
    request.read_timeout_ = milliseconds{200};

    const auto started = steady_clock::now();
    const auto result = engine_->execute_one(request);
    EXPECT_LT(steady_clock::now() - started, milliseconds{1400});

    ASSERT_TRUE(model::is_error(result));
    const auto& err = std::get<error::StructuredError>(result);
    EXPECT_EQ(err.code_, error::ErrorCode::TIMEOUT_ERROR);
    ASSERT_TRUE(err.details_.has_value());
    EXPECT_EQ(nlohmann::json::parse(*err.details_)["phase"], "read");
}

TEST_F(CurlEngineTest, ZeroDisablesTimeouts) {
    auto request = get("/delay/100");
    request.timeout_ = milliseconds{0};
    request.read_timeout_ = milliseconds{0};
    request.write_timeout_ = milliseconds{0};

    EXPECT_EQ(as_response(engine_->execute_one(request)).status_code_, 200);
}

// =============================================================================
// Redirects
// =============================================================================

TEST_F(CurlEngineTest, RedirectsAreFollowed) {
    const auto& response = as_response(engine_->execute_one(get("/redirect/3")));
    EXPECT_EQ(response.status_code_, 200);
    EXPECT_EQ(response.body_, "arrived");
    EXPECT_EQ(response.url_, server_.url("/redirect/0"));
}

TEST_F(CurlEngineTest, TooManyRedirects) {
    auto request = get("/redirect/4");
    request.max_redirects_ = 2;
    EXPECT_EQ(code_of(engine_->execute_one(request)), error::ErrorCode::TOO_MANY_REDIRECTS);
}

TEST_F(CurlEngineTest, RedirectsCanBeDisabled) {
    auto request = get("/redirect/1");
    request.follow_redirects_ = false;

    const auto& response = as_response(engine_->execute_one(request));
    EXPECT_EQ(response.status_code_, 302);
    EXPECT_EQ(response.header("location").value_or(""), "/redirect/0");
}

// =============================================================================
// Batches
// =============================================================================

TEST_F(CurlEngineTest, EmptyBatch) { EXPECT_TRUE(engine_->execute_batch({}).empty()); }

TEST_F(CurlEngineTest, BatchIsPositionalAndConcurrent) {
    std::vector<model::Request> requests = {
        get("/delay/300?n=0"),
        get("/delay/300?n=1"),
        model::Request{.url_ = "http://unresolvable.invalid/"},
        get("/delay/300?n=3"),
        get("/delay/300?n=4"),
    };
    requests[2].connect_timeout_ = milliseconds{5000};

    const auto started = steady_clock::now();
    const auto results = engine_->execute_batch(requests);
    const auto wall = steady_clock::now() - started;

    ASSERT_EQ(results.size(), 5u);
    for (std::size_t i : {0u, 1u, 3u, 4u}) {
        const auto& response = as_response(results[i]);
        EXPECT_EQ(response.status_code_, 200);
        EXPECT_NE(response.url_.find("n=" + std::to_string(i)), std::string::npos);
    }
    EXPECT_EQ(code_of(results[2]), error::ErrorCode::NETWORK_ERROR);

    // The four loopback transfers were in flight together, not one after another.
    EXPECT_EQ(server_.max_concurrent(), 4);
    EXPECT_LT(duration_cast<milliseconds>(wall).count(), 4 * 300);
}

TEST_F(CurlEngineTest, BatchConcurrencyIsBounded) {
    engine::EngineOptions options;
    options.batch_concurrency_ = 2;
    auto engine = start_engine(options);

    std::vector<model::Request> requests;
    for (int i = 0; i < 6; ++i) {
        requests.push_back(get("/delay/100?n=" + std::to_string(i)));
    }

    const auto results = engine->execute_batch(requests);
    for (const auto& result : results) {
        EXPECT_EQ(as_response(result).status_code_, 200);
    }
    EXPECT_LE(server_.max_concurrent(), 2);
}

TEST_F(CurlEngineTest, InvalidEntryOnlyFailsItsPosition) {
    const auto results = engine_->execute_batch({get("/status/200"), model::Request{.url_ = ""}, get("/status/201")});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(as_response(results[0]).status_code_, 200);
    EXPECT_EQ(code_of(results[1]), error::ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(as_response(results[2]).status_code_, 201);
}

TEST_F(CurlEngineTest, ConnectionRefusedIsANetworkError) {
    LocalHttpServer closed;
    const std::string url = closed.url("/");
    closed.stop();

    const auto result = engine_->execute_one(model::Request{.url_ = url});
    ASSERT_TRUE(model::is_error(result));
    EXPECT_EQ(std::get<error::StructuredError>(result).code_, error::ErrorCode::NETWORK_ERROR);
}

// =============================================================================
// Retry and cache
// =============================================================================

TEST_F(CurlEngineTest, RetriesOnlyIdempotentMethods) {
    engine::EngineOptions options;
    options.retry_.max_tries_ = 3;
    options.retry_.base_delay_ = milliseconds{10};
    options.retry_.max_delay_ = milliseconds{20};
    auto engine = start_engine(options);

    EXPECT_EQ(as_response(engine->execute_one(get("/status/503"))).status_code_, 503);
    EXPECT_EQ(server_.hits("/status/503"), 3);

    model::Request post{.url_ = server_.url("/status/502"), .method_ = "POST", .body_ = "x"};
    EXPECT_EQ(as_response(engine->execute_one(post)).status_code_, 502);
    EXPECT_EQ(server_.hits("/status/502"), 1);

    EXPECT_EQ(as_response(engine->execute_one(get("/status/500"))).status_code_, 500);
    EXPECT_EQ(server_.hits("/status/500"), 1);
}

TEST_F(CurlEngineTest, RetryDelayGrowsAndIsCapped) {
    engine::EngineOptions options;
    options.retry_.base_delay_ = milliseconds{100};
    options.retry_.max_delay_ = milliseconds{250};
    CurlEngine engine(options);

    for (std::size_t attempt = 1; attempt <= 5; ++attempt) {
        const auto delay = engine.get_retry_delay(attempt);
        EXPECT_GE(delay.count(), 100);
        EXPECT_LE(delay.count(), 350);
    }
    EXPECT_GE(engine.get_retry_delay(3).count(), 250);
}

TEST_F(CurlEngineTest, CacheServesRepeatedGets) {
    engine::EngineOptions options;
    options.cache_.enable_caching_ = true;
    auto engine = start_engine(options);

    EXPECT_FALSE(as_response(engine->execute_one(get("/json"))).cache_hit_);
    const auto second = engine->execute_one(get("/json"));
    EXPECT_TRUE(as_response(second).cache_hit_);
    EXPECT_EQ(server_.hits("/json"), 1);

    (void)engine->execute_one(get("/no-store"));
    (void)engine->execute_one(get("/no-store"));
    EXPECT_EQ(server_.hits("/no-store"), 2);
}

TEST(CurlTransferTest, ClassifiesCurlCodes) {
    EXPECT_EQ(engine::classify(CURLE_COULDNT_RESOLVE_HOST), error::ErrorCode::NETWORK_ERROR);
    EXPECT_EQ(engine::classify(CURLE_COULDNT_CONNECT), error::ErrorCode::NETWORK_ERROR);
    EXPECT_EQ(engine::classify(CURLE_OPERATION_TIMEDOUT), error::ErrorCode::TIMEOUT_ERROR);
    EXPECT_EQ(engine::classify(CURLE_TOO_MANY_REDIRECTS), error::ErrorCode::TOO_MANY_REDIRECTS);
    EXPECT_EQ(engine::classify(CURLE_WEIRD_SERVER_REPLY), error::ErrorCode::PROTOCOL_ERROR);
    EXPECT_EQ(engine::classify(CURLE_URL_MALFORMAT), error::ErrorCode::INVALID_REQUEST);
    EXPECT_TRUE(engine::is_retryable_http(429));
    EXPECT_FALSE(engine::is_retryable_http(500));
}
