#include "leases.hpp"

#include <cstring>
#include <string>
#include <utility>

#include "codec.hpp"

namespace relay::transport {

    //
    // BufferLease implementation
    //

    BufferLease::BufferLease(RelayBuffer* buffer, RelayFreeBufferFn free_fn) : buffer_(buffer), free_fn_(free_fn) {}

    BufferLease::~BufferLease() { release(); }

    BufferLease::BufferLease(BufferLease&& other) noexcept
        : buffer_(std::exchange(other.buffer_, nullptr)), free_fn_(std::exchange(other.free_fn_, nullptr)) {}

    BufferLease& BufferLease::operator=(BufferLease&& other) noexcept {
        if (this != &other) {
            release();
            buffer_ = std::exchange(other.buffer_, nullptr);
            free_fn_ = std::exchange(other.free_fn_, nullptr);
        }
        return *this;
    }

    std::string_view BufferLease::view() const {
        if (buffer_ == nullptr) {
            throw codec::DecodeError("Buffer is NULL or already released");
        }
        if (buffer_->data_ == nullptr) {
            throw codec::DecodeError("Buffer data pointer is NULL");
        }
        if (buffer_->len_ == 0) {
            throw codec::DecodeError("Buffer is empty");
        }
        if (buffer_->len_ > buffer_->capacity_) {
            throw codec::DecodeError("Buffer length " + std::to_string(buffer_->len_) + " exceeds capacity " + std::to_string(buffer_->capacity_));
        }
        return {reinterpret_cast<const char*>(buffer_->data_), buffer_->len_};  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    }

    void BufferLease::release() {
        if (buffer_ != nullptr && free_fn_ != nullptr) {
            free_fn_(buffer_);
        }
        buffer_ = nullptr;
    }

    //
    // StringLease implementation
    //

    StringLease::StringLease(char* str, RelayFreeStringFn free_fn) : str_(str), free_fn_(free_fn) {}

    StringLease::~StringLease() { release(); }

    StringLease::StringLease(StringLease&& other) noexcept : str_(std::exchange(other.str_, nullptr)), free_fn_(std::exchange(other.free_fn_, nullptr)) {}

    StringLease& StringLease::operator=(StringLease&& other) noexcept {
        if (this != &other) {
            release();
            str_ = std::exchange(other.str_, nullptr);
            free_fn_ = std::exchange(other.free_fn_, nullptr);
        }
        return *this;
    }

    std::string_view StringLease::view() const {
        if (str_ == nullptr) {
            throw codec::DecodeError("Result string is NULL or already released");
        }
        const std::size_t len = std::strlen(str_);
        if (len == 0) {
            throw codec::DecodeError("Result string is empty");
        }
        return {str_, len};
    }

    void StringLease::release() {
        if (str_ != nullptr && free_fn_ != nullptr) {
            free_fn_(str_);
        }
        str_ = nullptr;
    }

}  // namespace relay::transport
