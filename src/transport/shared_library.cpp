#include "shared_library.hpp"

#include <dlfcn.h>

#include <string>
#include <utility>

namespace relay::transport {

    SharedLibrary::~SharedLibrary() { close(); }

    SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept {
        if (this != &other) {
            close();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    SharedLibrary SharedLibrary::open(const std::string& path, std::string& err) {
        SharedLibrary lib;
        lib.handle_ = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (lib.handle_ == nullptr) {
            const char* msg = dlerror();
            err = msg != nullptr ? msg : "dlopen failed: " + path;
        }
        return lib;
    }

    void* SharedLibrary::raw_sym(const char* name, std::string& err) const {
        if (handle_ == nullptr) {
            err = "library is not open";
            return nullptr;
        }

        dlerror();
        void* symbol = dlsym(handle_, name);
        if (symbol == nullptr) {
            const char* msg = dlerror();
            err = msg != nullptr ? msg : std::string("missing symbol ") + name;
        }
        return symbol;
    }

    void SharedLibrary::close() {
        if (handle_ != nullptr) {
            dlclose(handle_);
            handle_ = nullptr;
        }
    }

}  // namespace relay::transport
