/**
 * @file native_library.cpp
 * @brief Dynamic library loading without link-time dependencies
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "accelbn/loader/native_library.h"

#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace accelbn {
namespace loader {

namespace {

#ifdef _WIN32
std::string last_error_message() {
    DWORD code = GetLastError();
    char buffer[256] = {0};
    DWORD len = FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                               nullptr, code, 0, buffer, sizeof(buffer) - 1, nullptr);
    if (len == 0) {
        return "LoadLibrary failed with error " + std::to_string(code);
    }
    return std::string(buffer, len);
}
#endif

} // anonymous namespace

std::unique_ptr<NativeLibrary> NativeLibrary::open(const std::string& name, std::string* error) {
#ifdef _WIN32
    HMODULE handle = LoadLibraryA(name.c_str());
    if (!handle) {
        if (error) {
            *error = last_error_message();
        }
        return nullptr;
    }
    return std::unique_ptr<NativeLibrary>(new NativeLibrary(reinterpret_cast<void*>(handle), name));
#else
    void* handle = dlopen(name.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        if (error) {
            const char* msg = dlerror();
            *error = msg ? msg : "dlopen failed";
        }
        return nullptr;
    }
    return std::unique_ptr<NativeLibrary>(new NativeLibrary(handle, name));
#endif
}

NativeLibrary::NativeLibrary(void* handle, std::string name)
    : handle_(handle), name_(std::move(name)) {}

NativeLibrary::~NativeLibrary() {
    if (!handle_) {
        return;
    }
#ifdef _WIN32
    FreeLibrary(reinterpret_cast<HMODULE>(handle_));
#else
    dlclose(handle_);
#endif
}

void* NativeLibrary::symbol(const char* name) const {
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(reinterpret_cast<HMODULE>(handle_), name));
#else
    return dlsym(handle_, name);
#endif
}

} // namespace loader
} // namespace accelbn
