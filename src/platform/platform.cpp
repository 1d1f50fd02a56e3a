#include "scanio/platform.hpp"

#include <cstdlib>
#include <mutex>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace scanio {

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#elif defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__) || defined(__DragonFly__)
    return Platform::BSD;
#elif defined(__sun)
    return Platform::Solaris;
#elif defined(__unix__)
    return Platform::Unix;
#else
    return Platform::Unknown;
#endif
}

const char* to_string(Platform platform) {
    switch (platform) {
        case Platform::Linux: return "linux";
        case Platform::macOS: return "macos";
        case Platform::Windows: return "windows";
        case Platform::BSD: return "bsd";
        case Platform::Solaris: return "solaris";
        case Platform::Unix: return "unix";
        case Platform::Unknown: return "unknown";
    }
    return "unknown";
}

namespace {

std::mutex& provider_mutex() {
    static std::mutex m;
    return m;
}

ThresholdProvider& provider_slot() {
    static ThresholdProvider provider;
    return provider;
}

} // namespace

int64_t default_mapped_read_threshold(Platform platform) {
    switch (platform) {
        case Platform::Windows:
            return -1;
        case Platform::Linux:
        case Platform::macOS:
        case Platform::BSD:
        case Platform::Solaris:
        case Platform::Unix:
        case Platform::Unknown:
            return 16384;
    }
    return 16384;
}

void set_mapped_read_threshold_provider(ThresholdProvider provider) {
    std::lock_guard<std::mutex> lock(provider_mutex());
    provider_slot() = std::move(provider);
}

int64_t mapped_read_threshold() {
    ThresholdProvider provider;
    {
        std::lock_guard<std::mutex> lock(provider_mutex());
        provider = provider_slot();
    }
    if (provider) {
        return provider();
    }
    return default_mapped_read_threshold(get_current_platform());
}

bool should_map_file(int64_t file_size) {
    if (file_size <= 0) {
        return false;
    }
    int64_t threshold = mapped_read_threshold();
    return threshold < 0 || file_size >= threshold;
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

size_t page_size() {
#ifdef _WIN32
    SYSTEM_INFO info;
    GetSystemInfo(&info);
    return static_cast<size_t>(info.dwPageSize);
#else
    long size = sysconf(_SC_PAGESIZE);
    return size > 0 ? static_cast<size_t>(size) : 0;
#endif
}

} // namespace scanio
