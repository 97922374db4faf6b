#ifndef HTTP_RELAY_SHARED_LIBRARY_HPP
#define HTTP_RELAY_SHARED_LIBRARY_HPP

#include <string>

namespace relay::transport {

    // Owns one dlopen handle.
    class SharedLibrary {
       public:
        SharedLibrary() = default;
        ~SharedLibrary();
        SharedLibrary(const SharedLibrary&) = delete;
        SharedLibrary& operator=(const SharedLibrary&) = delete;
        SharedLibrary(SharedLibrary&& other) noexcept;
        SharedLibrary& operator=(SharedLibrary&& other) noexcept;

        // On failure the returned library is closed and err holds the loader message.
        static SharedLibrary open(const std::string& path, std::string& err);

        template <typename Fn>
        Fn sym(const char* name, std::string& err) const {
            return reinterpret_cast<Fn>(raw_sym(name, err));  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
        }

        [[nodiscard]] bool is_open() const { return handle_ != nullptr; }
        void close();

       private:
        void* handle_ = nullptr;

        void* raw_sym(const char* name, std::string& err) const;
    };

}  // namespace relay::transport

#endif
