#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../src/transport/codec.hpp"

using namespace relay;
using namespace relay::transport;
using json = nlohmann::json;

// =============================================================================
// Requests
// =============================================================================

TEST(CodecRequestTest, MissingFieldsTakeDefaults) {
    const auto request = codec::request_from_json(json{{"url", "http://example.com"}});

    EXPECT_EQ(request.url_, "http://example.com");
    EXPECT_EQ(request.method_, "GET");
    EXPECT_FALSE(request.body_.has_value());
    EXPECT_EQ(request.timeout_.count(), constants::DEFAULT_TIMEOUT_MS);
    EXPECT_EQ(request.max_redirects_, constants::DEFAULT_MAX_REDIRECTS);
    EXPECT_TRUE(request.follow_redirects_);
    EXPECT_EQ(request.priority_, model::Priority::NORMAL);
}

TEST(CodecRequestTest, UnknownFieldsAreIgnored) {
    const auto request = codec::request_from_json(json{{"url", "http://example.com"}, {"retry_budget", 7}, {"trace", {{"id", "abc"}}}});
    EXPECT_EQ(request.url_, "http://example.com");
}

TEST(CodecRequestTest, WrongTypesAreDecodeErrors) {
    EXPECT_THROW((void)codec::request_from_json(json{{"url", 42}}), codec::DecodeError);
    EXPECT_THROW((void)codec::request_from_json(json{{"url", "http://x"}, {"timeout_ms", "fast"}}), codec::DecodeError);
    EXPECT_THROW((void)codec::request_from_json(json{{"url", "http://x"}, {"headers", {{"X-A", 1}}}}), codec::DecodeError);
    EXPECT_THROW((void)codec::request_from_json(json{{"url", "http://x"}, {"priority", "urgent"}}), codec::DecodeError);
    EXPECT_THROW((void)codec::request_from_json(json::array()), codec::DecodeError);
}

TEST(CodecRequestTest, DecodeErrorCarriesTransportCode) {
    try {
        (void)codec::request_from_json(json{{"follow_redirects", "yes"}});
        FAIL() << "expected DecodeError";
    } catch (const error::RelayError& e) {
        EXPECT_EQ(e.code_, error::ErrorCode::TRANSPORT_DECODE_ERROR);
    }
}

TEST(CodecRequestTest, PreservesEveryField) {
    model::Request request{
        .url_ = "https://api.example.com/items",
        .method_ = "PATCH",
        .headers_ = {{"X-Trace", "1"}},
        .body_ = R"({"a":1})",
        .query_params_ = {{"page", "2"}},
        .timeout_ = std::chrono::milliseconds{1500},
        .connect_timeout_ = std::chrono::milliseconds{200},
        .read_timeout_ = std::chrono::milliseconds{0},
        .write_timeout_ = std::chrono::milliseconds{300},
        .follow_redirects_ = false,
        .max_redirects_ = 2,
        .auto_referer_ = false,
        .decompress_ = false,
        .http3_only_ = true,
        .parse_response_ = true,
        .response_type_schema_ = "Item",
        .cache_key_ = "items-2",
        .priority_ = model::Priority::HIGH,
    };

    const auto wire = codec::request_to_json(request);
    EXPECT_EQ(wire["priority"], "high");

    const auto decoded = codec::request_from_json(codec::parse(codec::dump(wire)));
    EXPECT_EQ(decoded.url_, request.url_);
    EXPECT_EQ(decoded.method_, "PATCH");
    EXPECT_EQ(decoded.headers_.at("x-trace"), "1");
    EXPECT_EQ(decoded.body_.value_or(""), R"({"a":1})");
    EXPECT_EQ(decoded.query_params_.at("page"), "2");
    EXPECT_EQ(decoded.timeout_.count(), 1500);
    EXPECT_EQ(decoded.connect_timeout_.count(), 200);
    EXPECT_EQ(decoded.read_timeout_.count(), 0);
    EXPECT_EQ(decoded.write_timeout_.count(), 300);
    EXPECT_FALSE(decoded.follow_redirects_);
    EXPECT_EQ(decoded.max_redirects_, 2);
    EXPECT_FALSE(decoded.auto_referer_);
    EXPECT_FALSE(decoded.decompress_);
    EXPECT_TRUE(decoded.http3_only_);
    EXPECT_TRUE(decoded.parse_response_);
    EXPECT_EQ(decoded.response_type_schema_.value_or(""), "Item");
    EXPECT_EQ(decoded.cache_key_.value_or(""), "items-2");
    EXPECT_EQ(decoded.priority_, model::Priority::HIGH);
}

TEST(CodecRequestTest, BinaryBodiesTravelAsBase64) {
    const std::string binary("\x00\xff\x10\x80", 4);
    model::Request request{.url_ = "http://x", .method_ = "POST", .body_ = binary};

    const auto wire = codec::request_to_json(request);
    EXPECT_EQ(wire["body_encoding"], codec::BASE64_ENCODING);
    EXPECT_EQ(codec::request_from_json(wire).body_.value_or(""), binary);
}

TEST(CodecRequestTest, BadBase64IsADecodeError) {
    json wire{{"url", "http://x"}, {"body", "%%%"}, {"body_encoding", "base64"}};
    EXPECT_THROW((void)codec::request_from_json(wire), codec::DecodeError);

    wire["body_encoding"] = "gzip";
    EXPECT_THROW((void)codec::request_from_json(wire), codec::DecodeError);
}

TEST(CodecRequestTest, BatchMustBeAnArray) {
    EXPECT_THROW((void)codec::batch_from_json(json{{"url", "http://x"}}), codec::DecodeError);
    EXPECT_EQ(codec::batch_from_json(json::array({json{{"url", "http://a"}}, json{{"url", "http://b"}}})).size(), 2u);
}

// =============================================================================
// Responses and errors
// =============================================================================

TEST(CodecResponseTest, ParsedDataIsEmbeddedAsJson) {
    model::Response response;
    response.status_code_ = 200;
    response.body_ = R"({ "a" : [1, 2] })";
    response.parsed_data_ = R"({"a":[1,2]})";
    response.compression_saved_ = 120;

    const auto wire = codec::response_to_json(response);
    ASSERT_TRUE(wire["parsedData"].is_object());
    EXPECT_EQ(wire["parsedData"]["a"][1], 2);

    const auto decoded = codec::response_from_json(wire);
    EXPECT_EQ(decoded.parsed_data_.value_or(""), R"({"a":[1,2]})");
    EXPECT_EQ(decoded.compression_saved_.value_or(0), 120u);
    EXPECT_EQ(decoded.body_, response.body_);
}

TEST(CodecErrorTest, WireShape) {
    const auto wire = codec::error_to_json(error::make_error(error::ErrorCode::TIMEOUT_ERROR, "slow", R"({"phase":"read"})"));

    ASSERT_TRUE(codec::is_error_payload(wire));
    EXPECT_EQ(wire["error"]["code"], "timeout_error");
    EXPECT_EQ(wire["error"]["message"], "slow");
    EXPECT_EQ(wire["error"]["details"]["phase"], "read");

    const auto decoded = codec::error_from_json(wire);
    EXPECT_EQ(decoded.code_, error::ErrorCode::TIMEOUT_ERROR);
    EXPECT_EQ(decoded.details_.value_or(""), R"({"phase":"read"})");
}

TEST(CodecErrorTest, NonJsonDetailsStayOpaque) {
    const auto wire = codec::error_to_json(error::make_error(error::ErrorCode::UNKNOWN_ERROR, "x", "not json"));
    EXPECT_EQ(wire["error"]["details"], "not json");
    EXPECT_EQ(codec::error_from_json(wire).details_.value_or(""), "not json");
}

TEST(CodecErrorTest, UnknownCodesDecodeAsUnknown) {
    const auto decoded = codec::error_from_json(json{{"error", {{"code", "brand_new"}, {"message", "m"}}}});
    EXPECT_EQ(decoded.code_, error::ErrorCode::UNKNOWN_ERROR);
    EXPECT_EQ(decoded.message_, "m");
}

// =============================================================================
// Batch results
// =============================================================================

TEST(CodecBatchTest, WholeBatchErrorIsSpreadOverEveryPosition) {
    const auto wire = codec::error_to_json(error::make_error(error::ErrorCode::ENGINE_SHUTDOWN, "gone"));
    const auto results = codec::batch_results_from_json(wire, 3);

    ASSERT_EQ(results.size(), 3u);
    for (const auto& result : results) {
        ASSERT_TRUE(model::is_error(result));
        EXPECT_EQ(std::get<error::StructuredError>(result).code_, error::ErrorCode::ENGINE_SHUTDOWN);
    }
}

TEST(CodecBatchTest, SizeMismatchIsADecodeError) {
    EXPECT_THROW((void)codec::batch_results_from_json(json::array({json{{"status_code", 200}}}), 2), codec::DecodeError);
}

TEST(CodecBatchTest, BadElementOnlyFailsItsPosition) {
    const json wire = json::array({
        json{{"status_code", 200}, {"body", "ok"}},
        json{{"status_code", "two hundred"}},
        json{{"error", {{"code", "network_error"}, {"message", "refused"}}}},
    });

    const auto results = codec::batch_results_from_json(wire, 3);
    ASSERT_TRUE(model::is_response(results[0]));
    EXPECT_EQ(std::get<model::Response>(results[0]).body_, "ok");
    ASSERT_TRUE(model::is_error(results[1]));
    EXPECT_EQ(std::get<error::StructuredError>(results[1]).code_, error::ErrorCode::TRANSPORT_DECODE_ERROR);
    ASSERT_TRUE(model::is_error(results[2]));
    EXPECT_EQ(std::get<error::StructuredError>(results[2]).code_, error::ErrorCode::NETWORK_ERROR);
}

// =============================================================================
// Options and framing
// =============================================================================

TEST(CodecOptionsTest, PresetThenOverrides) {
    const auto options = codec::options_from_json(json{{"preset", "mobile"}, {"batch_concurrency", 3}, {"retry", {{"max_tries", 2}}}, {"cache", {{"enabled", true}}}});

    EXPECT_EQ(options.max_connections_, 50);
    EXPECT_EQ(options.batch_concurrency_, 3u);
    EXPECT_EQ(options.retry_.max_tries_, 2u);
    EXPECT_TRUE(options.cache_.enable_caching_);
}

TEST(CodecOptionsTest, RejectsNegativeCountsAndUnknownPresets) {
    EXPECT_THROW((void)codec::options_from_json(json{{"batch_concurrency", -1}}), codec::DecodeError);
    EXPECT_THROW((void)codec::options_from_json(json{{"preset", "desktop"}}), codec::DecodeError);
}

TEST(CodecOptionsTest, SerializedOptionsDecodeToTheSameValues) {
    auto options = engine::EngineOptions::shared_mobile();
    options.verify_tls_ = false;

    const auto decoded = codec::options_from_json(codec::options_to_json(options));
    EXPECT_EQ(decoded.max_connections_, options.max_connections_);
    EXPECT_EQ(decoded.batch_concurrency_, options.batch_concurrency_);
    EXPECT_EQ(decoded.max_connection_age_.count(), options.max_connection_age_.count());
    EXPECT_FALSE(decoded.verify_tls_);
}

TEST(CodecParseTest, MalformedPayloads) {
    EXPECT_THROW((void)codec::parse(""), codec::DecodeError);
    EXPECT_THROW((void)codec::parse("{\"url\": "), codec::DecodeError);
    EXPECT_THROW((void)codec::parse(nullptr, 0), codec::DecodeError);
}

TEST(CodecParseTest, DumpReplacesInvalidUtf8) {
    json j{{"text", std::string("ok\xff", 3)}};
    EXPECT_NO_THROW({
        const auto text = codec::dump(j);
        EXPECT_FALSE(text.empty());
    });
}
