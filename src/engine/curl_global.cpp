#include "curl_global.hpp"

#include <curl/curl.h>

#include <mutex>
#include <string>

#include "../error/relay_error.hpp"

namespace relay::engine {
    namespace {
        std::mutex global_mutex;
        long global_refs = 0;
    }  // namespace

    CurlGlobal::CurlGlobal() {
        std::lock_guard<std::mutex> lock(global_mutex);
        if (global_refs == 0) {
            const auto rc = curl_global_init(CURL_GLOBAL_ALL);
            if (rc != CURLE_OK) {
                throw error::RelayError(error::ErrorCode::ENGINE_NOT_INITIALIZED, std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
            }
        }
        ++global_refs;
    }

    CurlGlobal::~CurlGlobal() {
        std::lock_guard<std::mutex> lock(global_mutex);
        if (--global_refs == 0) {
            curl_global_cleanup();
        }
    }

}  // namespace relay::engine
