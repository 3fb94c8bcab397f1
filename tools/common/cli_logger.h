#pragma once

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace lgtools::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

inline VerbosityLevel verbosity_level() { return current_level; }

inline bool verbose_enabled() { return current_level >= VerbosityLevel::Verbose; }
inline bool debug_enabled() { return current_level >= VerbosityLevel::Debug; }

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "INFO";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    auto& stream = std::cerr;
    stream << '[' << level_name(min_level) << "] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    auto& stream = std::cerr;
    stream << "[WARN] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void error(Args&&... args) {
    auto& stream = std::cerr;
    stream << "[ERROR] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

namespace detail {

inline std::mutex once_mutex;
inline std::unordered_set<uint64_t> once_keys;

inline bool should_log_once(uint64_t key) {
    std::lock_guard<std::mutex> lock(once_mutex);
    return once_keys.insert(key).second;
}

// Basic FNV-1a hash function for strings
constexpr uint64_t fnv1a_hash(const char* str) {
    uint64_t hash = 14695981039346656037ull;
    for (size_t i = 0; str[i] != '\0'; ++i) {
        hash ^= static_cast<uint64_t>(str[i]);
        hash *= 1099511628211ull;
    }
    return hash;
}

} // namespace detail

template <typename... Args> void print(Args&&... args) {
    auto& stream = std::cout;
    if constexpr (sizeof...(Args) > 0) { ((stream << std::forward<Args>(args) << ' '), ...); }
    stream << '\n';
}

} // namespace lgtools::log

namespace lgtools::cli {
    using namespace lgtools::log;
}

// Core Macros
#define LOGI(...) ::lgtools::log::info(__VA_ARGS__)
#define LOGW(...) ::lgtools::log::warn(__VA_ARGS__)
#define LOGE(...) ::lgtools::log::error(__VA_ARGS__)

#define LOGW_ONCE(key, ...) \
    do { \
        if (::lgtools::log::detail::should_log_once(key)) { \
            ::lgtools::log::warn(__VA_ARGS__); \
        } \
    } while (false)

#if LGTOOLS_DEBUG
    #define LOGD(...) ::lgtools::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif
