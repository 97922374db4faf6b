#ifndef HTTP_RELAY_CURL_GLOBAL_HPP
#define HTTP_RELAY_CURL_GLOBAL_HPP

namespace relay::engine {

    // Reference-counted guard around curl_global_init/cleanup; every engine holds one.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace relay::engine

#endif
