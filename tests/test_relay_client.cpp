#include <gtest/gtest.h>
#include <simdjson.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../src/client/client_options.hpp"
#include "../src/client/direct_client.hpp"
#include "../src/client/pooled_client.hpp"
#include "../src/client/relay_client.hpp"
#include "test_utils.hpp"

using namespace relay;
using namespace relay::client;
using namespace std::chrono;
using relay::testing::FakeEngine;
using relay::testing::FakeTransport;
using relay::testing::LocalHttpServer;
using relay::testing::TransportProbe;

namespace {
    struct Greeting {
        std::string name_;
        int64_t count_ = 0;
    };

    Greeting parse_greeting(std::string_view json) {
        simdjson::dom::parser parser;
        simdjson::dom::element doc = parser.parse(simdjson::padded_string(json));
        Greeting greeting;
        greeting.name_ = std::string(std::string_view(doc["name"]));
        greeting.count_ = static_cast<int64_t>(simdjson::dom::array(doc["values"]).size());
        return greeting;
    }

    error::ErrorCode code_of(const model::ExecutionResult& result) {
        if (model::is_response(result)) {
            ADD_FAILURE() << "expected an error, got status " << std::get<model::Response>(result).status_code_;
            return error::ErrorCode::UNKNOWN_ERROR;
        }
        return std::get<error::StructuredError>(result).code_;
    }

    // Sets an environment variable for the lifetime of the guard.
    class EnvGuard {
       public:
        EnvGuard(const char* key, const char* value) : key_(key) { ::setenv(key, value, 1); }
        ~EnvGuard() { ::unsetenv(key_); }
        EnvGuard(const EnvGuard&) = delete;
        EnvGuard& operator=(const EnvGuard&) = delete;
        EnvGuard(EnvGuard&&) = delete;
        EnvGuard& operator=(EnvGuard&&) = delete;

       private:
        const char* key_;
    };
}  // namespace

// =============================================================================
// Fixture
// =============================================================================

class RelayClientTest : public ::testing::Test {
   protected:
    LocalHttpServer server_;

    static std::unique_ptr<RelayClient> pooled(std::size_t pool_size, transport::Framing framing = transport::Framing::RAW_BUFFER) {
        return RelayClientBuilder().with_pool_size(pool_size).with_framing(framing).build();
    }
};

// =============================================================================
// Pooled dispatch over the linked engine library
// =============================================================================

TEST_F(RelayClientTest, GetReturnsNonSuccessStatuses) {
    auto client = pooled(2);
    const auto response = client->get(server_.url("/status/404"));

    EXPECT_EQ(response.status_code_, 404);
    EXPECT_EQ(response.body_, R"({"error":"not found"})");
    EXPECT_THROW(RelayClient::ensure_success(response), error::HttpStatusError);
}

TEST_F(RelayClientTest, EnsureSuccessCarriesStatusAndPreview) {
    auto client = pooled(1);
    try {
        RelayClient::ensure_success(client->get(server_.url("/status/404")));
        FAIL() << "expected HttpStatusError";
    } catch (const error::HttpStatusError& e) {
        EXPECT_EQ(e.status_, 404);
        EXPECT_EQ(e.body_preview_, R"({"error":"not found"})");
        EXPECT_EQ(e.url_, server_.url("/status/404"));
    }

    EXPECT_NO_THROW(RelayClient::ensure_success(client->get(server_.url("/status/202"))));
}

TEST_F(RelayClientTest, PoolBoundsConcurrentDispatches) {
    auto client = pooled(4);

    std::vector<model::Request> requests;
    for (int i = 0; i < 10; ++i) {
        requests.push_back(client->build_request(server_.url("/delay/500?n=" + std::to_string(i)), "GET", {}));
    }

    const auto started = steady_clock::now();
    const auto results = client->execute_each(requests);
    const auto wall = duration_cast<milliseconds>(steady_clock::now() - started).count();

    ASSERT_EQ(results.size(), 10u);
    for (std::size_t i = 0; i < results.size(); ++i) {
        ASSERT_TRUE(model::is_response(results[i])) << i;
        EXPECT_NE(std::get<model::Response>(results[i]).url_.find("n=" + std::to_string(i)), std::string::npos);
    }

    // Ten half-second requests over four workers take three waves.
    EXPECT_EQ(server_.max_concurrent(), 4);
    EXPECT_GE(wall, 1400);
    EXPECT_LT(wall, 5000);
}

TEST_F(RelayClientTest, BatchGetIsPositionalWithoutEarlyAbort) {
    auto client = pooled(2);
    const auto results = client->batch_get({server_.url("/status/200"), "not-a-url", server_.url("/status/404"), server_.url("/status/201")});

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(std::get<model::Response>(results[0]).status_code_, 200);
    EXPECT_EQ(code_of(results[1]), error::ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(std::get<model::Response>(results[2]).status_code_, 404);
    EXPECT_EQ(std::get<model::Response>(results[3]).status_code_, 201);
}

TEST_F(RelayClientTest, BatchRunsOnOneEngine) {
    auto client = pooled(2);
    std::vector<model::Request> requests;
    for (int i = 0; i < 3; ++i) {
        requests.push_back(client->build_request(server_.url("/delay/200?n=" + std::to_string(i)), "GET", {}));
    }

    const auto results = client->batch(requests);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& result : results) {
        EXPECT_TRUE(model::is_response(result));
    }
    EXPECT_EQ(server_.max_concurrent(), 3);
}

TEST_F(RelayClientTest, BothFramingsDeliverTheSameResponse) {
    auto encoded = pooled(1, transport::Framing::ENCODED);
    auto raw = pooled(1, transport::Framing::RAW_BUFFER);

    const auto a = encoded->get(server_.url("/json"));
    const auto b = raw->get(server_.url("/json"));
    EXPECT_EQ(a.status_code_, b.status_code_);
    EXPECT_EQ(a.body_, b.body_);
    EXPECT_EQ(a.header("cache-control").value_or(""), "max-age=60");
}

TEST_F(RelayClientTest, PostWithJsonBody) {
    auto client = pooled(1);
    RequestOptions options;
    options.json_body({{"id", 7}});

    const auto echoed = nlohmann::json::parse(client->post(server_.url("/headers"), options).body_);
    EXPECT_EQ(echoed["content-type"], "application/json");

    const auto response = client->put(server_.url("/echo"), options);
    EXPECT_EQ(response.body_, R"({"id":7})");
    EXPECT_EQ(response.header("x-echo-method").value_or(""), "PUT");

    EXPECT_EQ(client->del(server_.url("/echo")).header("x-echo-method").value_or(""), "DELETE");
}

TEST_F(RelayClientTest, TransportFailuresAreThrown) {
    auto client = pooled(1);
    RequestOptions options;
    options.timeout_ = milliseconds{1};

    try {
        (void)client->get(server_.url("/delay/100"), options);
        FAIL() << "expected RelayError";
    } catch (const error::RelayError& e) {
        EXPECT_EQ(e.code_, error::ErrorCode::TIMEOUT_ERROR);
    }
}

// =============================================================================
// Typed responses
// =============================================================================

TEST_F(RelayClientTest, RequestAsDecodesParsedData) {
    auto client = pooled(1);
    const auto typed = client->request_as<Greeting>(server_.url("/json"), "GET", {}, parse_greeting);

    ASSERT_TRUE(typed.data_.has_value());
    EXPECT_EQ(typed.data_->name_, "relay");
    EXPECT_EQ(typed.data_->count_, 3);
    EXPECT_TRUE(typed.response_.parsed_data_.has_value());
}

TEST_F(RelayClientTest, RequestAsReportsDecodeFailures) {
    auto client = pooled(1);
    try {
        (void)client->request_as<Greeting>(server_.url("/status/200"), "GET", {}, parse_greeting);
        FAIL() << "expected RelayError";
    } catch (const error::RelayError& e) {
        EXPECT_EQ(e.code_, error::ErrorCode::TRANSPORT_DECODE_ERROR);
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(RelayClientTest, ClosedClientRefusesWork) {
    auto client = pooled(1);
    client->close();
    client->close();

    try {
        (void)client->get(server_.url("/status/200"));
        FAIL() << "expected RelayError";
    } catch (const error::RelayError& e) {
        EXPECT_EQ(e.code_, error::ErrorCode::ENGINE_SHUTDOWN);
    }

    const auto results = client->batch_get({server_.url("/a"), server_.url("/b")});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(code_of(results[0]), error::ErrorCode::ENGINE_SHUTDOWN);
}

TEST_F(RelayClientTest, DirectBackendServesRequests) {
    auto client = RelayClientBuilder().with_backend(Backend::DIRECT).build();
    EXPECT_EQ(client->get(server_.url("/status/200")).status_code_, 200);

    const auto results = client->batch_get({server_.url("/status/201"), server_.url("/status/202")});
    EXPECT_EQ(std::get<model::Response>(results[1]).status_code_, 202);
}

TEST_F(RelayClientTest, DirectClientRejectsFailedEngines) {
    EXPECT_THROW({ DirectHttpClient client(std::make_unique<FakeEngine>(error::make_error(error::ErrorCode::ENGINE_NOT_INITIALIZED, "down"))); }, error::RelayError);
    EXPECT_THROW({ DirectHttpClient client(std::unique_ptr<engine::IHttpEngine>{}); }, error::RelayError);
}

TEST_F(RelayClientTest, EngineLibraryCanBeLoadedAtRuntime) {
    auto client = RelayClientBuilder().with_pool_size(2).with_library(RELAY_NATIVE_LIBRARY).build();
    EXPECT_EQ(client->get(server_.url("/status/200")).status_code_, 200);
}

TEST_F(RelayClientTest, MissingEngineLibraryFailsToBuild) {
    try {
        (void)RelayClientBuilder().with_library("/nonexistent/librelay_native.so").build();
        FAIL() << "expected RelayError";
    } catch (const error::RelayError& e) {
        EXPECT_EQ(e.code_, error::ErrorCode::ENGINE_NOT_INITIALIZED);
    }
}

// =============================================================================
// Builder and configuration
// =============================================================================

TEST(RelayClientBuilderTest, ValidateRejectsBadSettings) {
    EXPECT_THROW(RelayClientBuilder().with_pool_size(0).validate(), error::RelayError);
    EXPECT_THROW(RelayClientBuilder().with_pool_size(constants::MAX_POOL_SIZE + 1).validate(), error::RelayError);
    EXPECT_THROW(RelayClientBuilder().with_default_timeout(milliseconds{-5}).validate(), error::RelayError);
    EXPECT_THROW(RelayClientBuilder().with_backend(Backend::DIRECT).with_library("/tmp/x.so").validate(), error::RelayError);

    engine::EngineOptions no_concurrency;
    no_concurrency.batch_concurrency_ = 0;
    EXPECT_THROW(RelayClientBuilder().with_engine_options(no_concurrency).validate(), error::RelayError);

    EXPECT_NO_THROW(RelayClientBuilder().with_backend(Backend::DIRECT).with_pool_size(0).validate());
}

TEST(RelayClientBuilderTest, CustomTransportFactory) {
    auto probe = std::make_shared<TransportProbe>();
    auto client = RelayClientBuilder()
                      .with_pool_size(3)
                      .with_transport_factory([probe]() -> std::unique_ptr<transport::ITransport> { return std::make_unique<FakeTransport>(probe); })
                      .build();

    EXPECT_EQ(probe->created_.load(), 3);
    const auto response = client->get("http://fake/path");
    EXPECT_EQ(response.body_, "GET http://fake/path");

    client.reset();
    EXPECT_EQ(probe->shutdowns_.load(), 3);
}

TEST(RelayClientBuilderTest, CloseRacingWithRequestsIsOrderly) {
    auto probe = std::make_shared<TransportProbe>();
    auto client = RelayClientBuilder()
                      .with_pool_size(2)
                      .with_transport_factory([probe]() -> std::unique_ptr<transport::ITransport> { return std::make_unique<FakeTransport>(probe); })
                      .build();

    std::atomic<int> served = 0;
    std::atomic<int> refused = 0;
    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                try {
                    (void)client->get("http://fake/sleep/1");
                    ++served;
                } catch (const error::RelayError& e) {
                    EXPECT_EQ(e.code_, error::ErrorCode::ENGINE_SHUTDOWN);
                    ++refused;
                }
            }
        });
    }

    std::this_thread::sleep_for(milliseconds(20));
    std::thread closer([&client] { client->close(); });
    client->close();
    closer.join();
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(served.load() + refused.load(), 200);
    EXPECT_GT(refused.load(), 0);
    EXPECT_EQ(probe->shutdowns_.load(), 2);
}

TEST(RelayClientBuilderTest, DefaultTimeoutReachesRequests) {
    auto probe = std::make_shared<TransportProbe>();
    auto client = RelayClientBuilder()
                      .with_pool_size(1)
                      .with_default_timeout(milliseconds{1234})
                      .with_transport_factory([probe]() -> std::unique_ptr<transport::ITransport> { return std::make_unique<FakeTransport>(probe); })
                      .build();

    EXPECT_EQ(client->build_request("http://x/", "get", {}).timeout_.count(), 1234);
    EXPECT_EQ(client->build_request("http://x/", "get", {}).method_, "GET");

    RequestOptions options;
    options.timeout_ = milliseconds{5};
    EXPECT_EQ(client->build_request("http://x/", "GET", options).timeout_.count(), 5);
}

TEST(ClientOptionsTest, FromEnvironment) {
    EnvGuard pool("RELAY_POOL_SIZE", "3");
    EnvGuard framing("RELAY_FRAMING", "encoded");
    EnvGuard timeout("RELAY_TIMEOUT_MS", "fast");
    EnvGuard concurrency("RELAY_BATCH_CONCURRENCY", "12");

    const auto options = ClientOptions::from_env();
    EXPECT_EQ(options.pool_size_, 3u);
    EXPECT_EQ(options.framing_, transport::Framing::ENCODED);
    EXPECT_EQ(options.default_timeout_.count(), constants::DEFAULT_TIMEOUT_MS);
    EXPECT_EQ(options.engine_options_.batch_concurrency_, 12u);
}

TEST(ClientOptionsTest, OutOfRangeValuesAreIgnored) {
    EnvGuard pool("RELAY_POOL_SIZE", "0");
    EnvGuard framing("RELAY_FRAMING", "carrier-pigeon");

    const auto options = ClientOptions::from_env();
    EXPECT_EQ(options.pool_size_, constants::DEFAULT_POOL_SIZE);
    EXPECT_EQ(options.framing_, transport::Framing::RAW_BUFFER);
}

TEST(ClientOptionsTest, Presets) {
    EXPECT_EQ(ClientOptions::mobile().engine_options_.max_connections_, 50);
    EXPECT_EQ(ClientOptions::shared_mobile().pool_size_, 1u);
    EXPECT_EQ(ClientOptions::shared_mobile().engine_options_.batch_concurrency_, 16u);
}
