#include "curl_transfer.hpp"

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

using namespace std::chrono;

namespace relay::engine {

    struct CurlDefaults {
        static constexpr long ENABLED = 1L;
        static constexpr long DISABLED = 0L;
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long SSL_VERSION = CURL_SSLVERSION_TLSv1_2;
        static constexpr const char* EMPTY_BODY = "";
    };

    struct TimeoutPhase {
        static constexpr const char* CONNECT = "connect";
        static constexpr const char* OVERALL = "overall";
        static constexpr const char* READ = "read";
        static constexpr const char* WRITE = "write";
        static constexpr const char* TRANSFER = "transfer";
    };

    error::ErrorCode classify(CURLcode rc) {
        switch (rc) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_PEER_FAILED_VERIFICATION:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CIPHER:
            case CURLE_SSL_CACERT_BADFILE:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
                return error::ErrorCode::NETWORK_ERROR;
            case CURLE_OPERATION_TIMEDOUT:
                return error::ErrorCode::TIMEOUT_ERROR;
            case CURLE_TOO_MANY_REDIRECTS:
                return error::ErrorCode::TOO_MANY_REDIRECTS;
            case CURLE_WEIRD_SERVER_REPLY:
            case CURLE_GOT_NOTHING:
            case CURLE_HTTP2:
            case CURLE_HTTP2_STREAM:
            case CURLE_HTTP3:
            case CURLE_BAD_CONTENT_ENCODING:
            case CURLE_PARTIAL_FILE:
            case CURLE_UNSUPPORTED_PROTOCOL:
                return error::ErrorCode::PROTOCOL_ERROR;
            case CURLE_URL_MALFORMAT:
            case CURLE_BAD_FUNCTION_ARGUMENT:
                return error::ErrorCode::INVALID_REQUEST;
            default:
                return error::ErrorCode::UNKNOWN_ERROR;
        }
    }

    CurlTransfer::CurlTransfer(const model::Request& request, const EngineOptions& options)
        : handle_(curl_easy_init()), read_timeout_(request.read_timeout_), write_timeout_(request.write_timeout_) {
        if (handle_ == nullptr) {
            throw error::RelayError(error::ErrorCode::UNKNOWN_ERROR, "Failed to create CURL easy handle", std::nullopt);
        }

        error_buf_[0] = '\0';

        try {
            setopt(CURLOPT_PRIVATE, static_cast<void*>(this));
            setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
            setopt(CURLOPT_NOSIGNAL, CurlDefaults::ENABLED);  // safe in multithreaded apps
            setopt(CURLOPT_WRITEFUNCTION, &string_utils::write_to_string);
            setopt(CURLOPT_WRITEDATA, static_cast<void*>(&response_body_));
            setopt(CURLOPT_HEADERFUNCTION, &CurlTransfer::header_cb);
            setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));

            configure_url(request);
            configure_method(request);
            configure_headers(request, options);
            configure_timeouts(request);
            configure_connection(request, options);
        } catch (const error::RelayError&) {
            release();
            throw;
        }
    }

    CurlTransfer::~CurlTransfer() { release(); }

    void CurlTransfer::release() {
        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
            handle_ = nullptr;
        }

        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
    }

    template <typename T>
    void CurlTransfer::setopt(CURLoption option, T value) {
        const auto rc = curl_easy_setopt(handle_, option, value);

        if (rc != CURLE_OK) {
            throw error::RelayError(classify(rc), std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc),
                                    nlohmann::json{{"curl_code", static_cast<int>(rc)}, {"phase", "setup"}, {"url", url_}}.dump());
        }
    }

    void CurlTransfer::configure_url(const model::Request& request) {
        url_ = request.url_;

        for (const auto& [name, value] : request.query_params_) {
            char* escaped_name = curl_easy_escape(handle_, name.c_str(), static_cast<int>(name.size()));
            char* escaped_value = curl_easy_escape(handle_, value.c_str(), static_cast<int>(value.size()));
            if (escaped_name == nullptr || escaped_value == nullptr) {
                curl_free(escaped_name);
                curl_free(escaped_value);
                throw error::RelayError(error::ErrorCode::INVALID_REQUEST, "Failed to escape query parameter '" + name + "'");
            }

            url_ += (url_.find('?') == std::string::npos) ? '?' : '&';
            url_ += escaped_name;
            url_ += '=';
            url_ += escaped_value;

            curl_free(escaped_name);
            curl_free(escaped_value);
        }

        setopt(CURLOPT_URL, url_.c_str());
    }

    void CurlTransfer::configure_method(const model::Request& request) {
        const std::string method = model::normalize_method(request.method_);

        if (request.body_.has_value()) {
            request_body_ = *request.body_;
        }

        if (method == "GET" && !request.body_.has_value()) {
            setopt(CURLOPT_HTTPGET, CurlDefaults::ENABLED);
            return;
        }

        if (method == "HEAD") {
            setopt(CURLOPT_NOBODY, CurlDefaults::ENABLED);
            return;
        }

        if (request.body_.has_value() || method == "POST") {
            // Methods like POST with no body still send Content-Length: 0.
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request_body_.size()));
            setopt(CURLOPT_POSTFIELDS, request_body_.empty() ? CurlDefaults::EMPTY_BODY : request_body_.c_str());
        }

        if (method != "POST") {
            setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
        }
    }

    void CurlTransfer::configure_headers(const model::Request& request, const EngineOptions& options) {
        for (const auto& [name, value] : request.headers_) {
            const std::string line = value.empty() ? name + ";" : name + ": " + value;
            curl_slist* appended = curl_slist_append(headers_, line.c_str());
            if (appended == nullptr) {
                throw error::RelayError(error::ErrorCode::UNKNOWN_ERROR, "Failed to allocate header list");
            }
            headers_ = appended;
        }

        if (request.body_.has_value() && request.headers_.find("Content-Type") == request.headers_.end()) {
            // Suppress libcurl's form-urlencoded default for opaque bodies.
            curl_slist* appended = curl_slist_append(headers_, "Content-Type: application/octet-stream");
            if (appended == nullptr) {
                throw error::RelayError(error::ErrorCode::UNKNOWN_ERROR, "Failed to allocate header list");
            }
            headers_ = appended;
        }

        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }

        setopt(CURLOPT_USERAGENT, options.user_agent_.c_str());

        if (request.decompress_) {
            // Empty string => accept all supported encodings (gzip/deflate/br)
            setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
        }
    }

    void CurlTransfer::configure_timeouts(const model::Request& request) {
        setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_.count()));
        setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_.count()));

        if (read_timeout_.count() > 0 || write_timeout_.count() > 0) {
            setopt(CURLOPT_XFERINFOFUNCTION, &CurlTransfer::xferinfo_cb);
            setopt(CURLOPT_XFERINFODATA, static_cast<void*>(this));
            setopt(CURLOPT_NOPROGRESS, CurlDefaults::DISABLED);
        } else {
            setopt(CURLOPT_NOPROGRESS, CurlDefaults::ENABLED);
        }

        setopt(CURLOPT_FOLLOWLOCATION, request.follow_redirects_ ? CurlDefaults::ENABLED : CurlDefaults::DISABLED);
        setopt(CURLOPT_MAXREDIRS, request.max_redirects_);
        setopt(CURLOPT_AUTOREFERER, request.auto_referer_ ? CurlDefaults::ENABLED : CurlDefaults::DISABLED);
    }

    void CurlTransfer::configure_connection(const model::Request& request, const EngineOptions& options) {
        setopt(CURLOPT_HTTP_VERSION, request.http3_only_ ? static_cast<long>(CURL_HTTP_VERSION_3ONLY) : static_cast<long>(CURL_HTTP_VERSION_2TLS));
        setopt(CURLOPT_SSLVERSION, CurlDefaults::SSL_VERSION);

        if (!options.verify_tls_) {
            setopt(CURLOPT_SSL_VERIFYPEER, CurlDefaults::DISABLED);
            setopt(CURLOPT_SSL_VERIFYHOST, CurlDefaults::DISABLED);
        }

        if (options.tcp_keepalive_) {
            setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::ENABLED);
            setopt(CURLOPT_TCP_KEEPIDLE, static_cast<long>(options.tcp_keepidle_.count()));
            setopt(CURLOPT_TCP_KEEPINTVL, static_cast<long>(options.tcp_keepintvl_.count()));
        }

        setopt(CURLOPT_TCP_NODELAY, options.tcp_nodelay_ ? CurlDefaults::ENABLED : CurlDefaults::DISABLED);
        setopt(CURLOPT_MAXAGE_CONN, static_cast<long>(options.max_connection_age_.count()));
    }

    void CurlTransfer::start() {
        started_at_ = steady_clock::now();
        last_progress_at_ = started_at_;
    }

    size_t CurlTransfer::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlTransfer*>(userdata);
        const size_t bytes = size * n_items;

        // A new status line starts a new response (redirect hop or 1xx).
        if (string_utils::ieq_prefix(buffer, bytes, "HTTP/")) {
            self->response_headers_.clear();
            return bytes;
        }

        const std::string line(buffer, bytes);
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return bytes;
        }

        std::string name = string_utils::to_lower(string_utils::trim(line.substr(0, colon)));
        std::string value = string_utils::trim(line.substr(colon + 1));
        if (name.empty()) {
            return bytes;
        }

        auto it = self->response_headers_.find(name);
        if (it == self->response_headers_.end()) {
            self->response_headers_.emplace(std::move(name), std::move(value));
        } else {
            it->second += constants::HEADER_VALUE_SEPARATOR;
            it->second += value;
        }

        return bytes;
    }

    int CurlTransfer::xferinfo_cb(void* userdata, curl_off_t dl_total, curl_off_t dl_now, curl_off_t ul_total, curl_off_t ul_now) {
        (void)dl_total;
        auto* self = static_cast<CurlTransfer*>(userdata);
        const auto now = steady_clock::now();

        if (!self->stall_armed_) {
            curl_off_t pretransfer_us = 0;
            if (curl_easy_getinfo(self->handle_, CURLINFO_PRETRANSFER_TIME_T, &pretransfer_us) != CURLE_OK || pretransfer_us <= 0) {
                return 0;
            }
            self->stall_armed_ = true;
            self->last_progress_at_ = now;
            self->last_dl_now_ = dl_now;
            self->last_ul_now_ = ul_now;
            return 0;
        }

        if (dl_now != self->last_dl_now_ || ul_now != self->last_ul_now_) {
            self->last_dl_now_ = dl_now;
            self->last_ul_now_ = ul_now;
            self->last_progress_at_ = now;
            return 0;
        }

        const bool uploading = ul_total > 0 && ul_now < ul_total;
        const milliseconds limit = uploading ? self->write_timeout_ : self->read_timeout_;
        if (limit.count() > 0 && now - self->last_progress_at_ >= limit) {
            self->stalled_phase_ = uploading ? TimeoutPhase::WRITE : TimeoutPhase::READ;
            self->stalled_uploading_ = uploading;
            return 1;  // aborts with CURLE_ABORTED_BY_CALLBACK
        }

        return 0;
    }

    std::string CurlTransfer::http_version() const {
        long version = 0;
        if (curl_easy_getinfo(handle_, CURLINFO_HTTP_VERSION, &version) != CURLE_OK) {
            return "HTTP/1.1";
        }
        switch (version) {
            case CURL_HTTP_VERSION_1_0:
                return "HTTP/1.0";
            case CURL_HTTP_VERSION_2_0:
                return "HTTP/2";
            case CURL_HTTP_VERSION_3:
                return "HTTP/3";
            default:
                return "HTTP/1.1";
        }
    }

    error::StructuredError CurlTransfer::make_transfer_error(CURLcode rc) const {
        error::ErrorCode code = classify(rc);
        const char* phase = TimeoutPhase::TRANSFER;
        const bool stalled = rc == CURLE_ABORTED_BY_CALLBACK && stalled_phase_ != nullptr;

        if (stalled) {
            code = error::ErrorCode::TIMEOUT_ERROR;
            phase = stalled_phase_;
        } else if (rc == CURLE_OPERATION_TIMEDOUT) {
            curl_off_t connect_us = 0;
            const bool connected = curl_easy_getinfo(handle_, CURLINFO_CONNECT_TIME_T, &connect_us) == CURLE_OK && connect_us > 0;
            phase = connected ? TimeoutPhase::OVERALL : TimeoutPhase::CONNECT;
        }

        std::string message;
        if (stalled) {
            message = std::string("No data ") + (stalled_uploading_ ? "sent" : "received") + " within the " + phase + " timeout";
        } else if (error_buf_[0] != '\0') {
            message = error_buf_.data();
        } else {
            message = curl_easy_strerror(rc);
        }

        const nlohmann::json details = {
            {"curl_code", static_cast<int>(rc)},
            {"curl_message", curl_easy_strerror(rc)},
            {"phase", phase},
            {"url", url_},
        };

        return error::make_error(code, std::move(message), details.dump());
    }

    model::ExecutionResult CurlTransfer::finish(CURLcode rc) {
        if (rc != CURLE_OK) {
            return make_transfer_error(rc);
        }

        long code = 0;
        char* eff = nullptr;
        curl_off_t downloaded = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);
        curl_easy_getinfo(handle_, CURLINFO_SIZE_DOWNLOAD_T, &downloaded);

        model::Response r;
        r.status_code_ = code;
        r.elapsed_ms_ = static_cast<std::uint64_t>(duration_cast<milliseconds>(steady_clock::now() - started_at_).count());
        r.version_ = http_version();
        r.url_ = eff != nullptr ? eff : url_;

        const auto encoding = response_headers_.find("content-encoding");
        const bool encoded = encoding != response_headers_.end() && !string_utils::ieq(encoding->second, "identity");
        if (encoded && downloaded >= 0 && response_body_.size() > static_cast<size_t>(downloaded)) {
            r.compression_saved_ = static_cast<std::uint64_t>(response_body_.size() - static_cast<size_t>(downloaded));
        }

        r.body_ = std::move(response_body_);
        r.headers_ = std::move(response_headers_);
        return r;
    }

}  // namespace relay::engine
