/**
 * @file native_library.h
 * @brief RAII handle for a dynamically loaded library
 *
 * Wraps dlopen/dlsym on POSIX and LoadLibraryA/GetProcAddress on Windows.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef ACCELBN_LOADER_NATIVE_LIBRARY_H
#define ACCELBN_LOADER_NATIVE_LIBRARY_H

#include <memory>
#include <string>

namespace accelbn {
namespace loader {

class NativeLibrary {
public:
    /**
     * @brief Load a library
     * @param name Bare name (searched on the system library path) or a path
     * @param error Receives the loader's message on failure, may be null
     * @return The library, or null if it could not be loaded
     */
    static std::unique_ptr<NativeLibrary> open(const std::string& name, std::string* error);

    ~NativeLibrary();

    NativeLibrary(const NativeLibrary&) = delete;
    NativeLibrary& operator=(const NativeLibrary&) = delete;

    /**
     * @brief Address of an exported symbol, or null
     */
    void* symbol(const char* name) const;

    /// Name or path the library was opened with
    const std::string& name() const { return name_; }

private:
    NativeLibrary(void* handle, std::string name);

    void* handle_;
    std::string name_;
};

} // namespace loader
} // namespace accelbn

#endif // ACCELBN_LOADER_NATIVE_LIBRARY_H
