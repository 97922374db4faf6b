#ifndef HTTP_RELAY_CURL_TRANSFER_HPP
#define HTTP_RELAY_CURL_TRANSFER_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <string>

#include "../error/relay_error.hpp"
#include "../model/model.hpp"
#include "engine_options.hpp"

namespace relay::engine {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    enum class HttpStatusCode : long {
        TOO_MANY_REQUESTS = 429,
        BAD_GATEWAY = 502,
        SERVICE_UNAVAILABLE = 503,
        GATEWAY_TIMEOUT = 504,
        OK = 200,
    };

    [[nodiscard]] inline bool is_retryable_http(long code) {
        return code == static_cast<long>(HttpStatusCode::TOO_MANY_REQUESTS) || code == static_cast<long>(HttpStatusCode::BAD_GATEWAY) ||
               code == static_cast<long>(HttpStatusCode::SERVICE_UNAVAILABLE) || code == static_cast<long>(HttpStatusCode::GATEWAY_TIMEOUT);
    }

    // Maps a libcurl result code onto the relay error taxonomy.
    [[nodiscard]] error::ErrorCode classify(CURLcode rc);

    // One configured easy handle for one attempt of one request. The handle is
    // tagged with CURLOPT_PRIVATE so the multi loop can find its owner.
    class CurlTransfer {
       public:
        // Throws RelayError when the request cannot be configured.
        CurlTransfer(const model::Request& request, const EngineOptions& options);

        ~CurlTransfer();
        CurlTransfer(const CurlTransfer&) = delete;
        CurlTransfer& operator=(const CurlTransfer&) = delete;
        CurlTransfer(CurlTransfer&&) = delete;
        CurlTransfer& operator=(CurlTransfer&&) = delete;

        [[nodiscard]] CURL* handle() const { return handle_; }
        [[nodiscard]] const std::string& url() const { return url_; }

        // Marks the moment the handle joins the multi handle.
        void start();

        // Builds the result once libcurl reports the transfer as done.
        [[nodiscard]] model::ExecutionResult finish(CURLcode rc);

       private:
        template <typename T>
        void setopt(CURLoption option, T value);

        void release();
        void configure_url(const model::Request& request);
        void configure_method(const model::Request& request);
        void configure_headers(const model::Request& request, const EngineOptions& options);
        void configure_timeouts(const model::Request& request);
        void configure_connection(const model::Request& request, const EngineOptions& options);

        [[nodiscard]] std::string http_version() const;
        [[nodiscard]] error::StructuredError make_transfer_error(CURLcode rc) const;

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static int xferinfo_cb(void* userdata, curl_off_t dl_total, curl_off_t dl_now, curl_off_t ul_total, curl_off_t ul_now);

        CURL* handle_{};
        curl_slist* headers_{};
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};

        std::string url_;
        std::string request_body_;
        std::string response_body_;
        model::HeaderMap response_headers_;

        std::chrono::steady_clock::time_point started_at_;

        // Stall detection, armed once the handshake is over.
        std::chrono::milliseconds read_timeout_{0};
        std::chrono::milliseconds write_timeout_{0};
        std::chrono::steady_clock::time_point last_progress_at_;
        curl_off_t last_dl_now_ = 0;
        curl_off_t last_ul_now_ = 0;
        bool stall_armed_ = false;
        const char* stalled_phase_ = nullptr;
        bool stalled_uploading_ = false;
    };
}  // namespace relay::engine

#endif
