#ifndef HTTP_RELAY_LEASES_HPP
#define HTTP_RELAY_LEASES_HPP

#include <string_view>

#include "native_abi.h"

namespace relay::transport {

    // Sole owner of one engine-allocated buffer. Releases it exactly once, on
    // release() or destruction, and refuses reads afterwards.
    class BufferLease {
       public:
        BufferLease() = default;
        BufferLease(RelayBuffer* buffer, RelayFreeBufferFn free_fn);

        ~BufferLease();
        BufferLease(const BufferLease&) = delete;
        BufferLease& operator=(const BufferLease&) = delete;
        BufferLease(BufferLease&& other) noexcept;
        BufferLease& operator=(BufferLease&& other) noexcept;

        // Throws TRANSPORT_DECODE_ERROR when released, NULL, empty or len > capacity.
        [[nodiscard]] std::string_view view() const;
        [[nodiscard]] bool released() const { return buffer_ == nullptr; }
        void release();

       private:
        RelayBuffer* buffer_ = nullptr;
        RelayFreeBufferFn free_fn_ = nullptr;
    };

    // Sole owner of one engine-allocated C string.
    class StringLease {
       public:
        StringLease() = default;
        StringLease(char* str, RelayFreeStringFn free_fn);

        ~StringLease();
        StringLease(const StringLease&) = delete;
        StringLease& operator=(const StringLease&) = delete;
        StringLease(StringLease&& other) noexcept;
        StringLease& operator=(StringLease&& other) noexcept;

        // Throws TRANSPORT_DECODE_ERROR when released, NULL or empty.
        [[nodiscard]] std::string_view view() const;
        [[nodiscard]] bool released() const { return str_ == nullptr; }
        void release();

       private:
        char* str_ = nullptr;
        RelayFreeStringFn free_fn_ = nullptr;
    };

}  // namespace relay::transport

#endif
