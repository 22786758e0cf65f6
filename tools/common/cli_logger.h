#pragma once

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>

#if defined(_WIN32)
#include <windows.h>
#include <io.h>
#else
#include <clocale>
#include <langinfo.h>
#include <strings.h>
#include <unistd.h>
#endif

namespace paakit::log {

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
        case VerbosityLevel::Verbose: return "VERBOSE";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "VERBOSE";
}

constexpr const char* level_emoji(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "🔇";
        case VerbosityLevel::Verbose: return "🔈";
        case VerbosityLevel::Debug: return "🐞";
    }
    return "🔈";
}

// supports_utf reports whether stderr is a console that renders UTF-8.
inline bool supports_utf() {
    static const bool value = []() {
#if defined(_WIN32)
        if (!_isatty(_fileno(stderr))) return false;
        HANDLE h = GetStdHandle(STD_ERROR_HANDLE);
        DWORD mode = 0;
        return h != INVALID_HANDLE_VALUE && GetConsoleMode(h, &mode) &&
               GetConsoleOutputCP() == 65001;
#else
        if (!isatty(STDERR_FILENO)) return false;
        std::setlocale(LC_CTYPE, "");
        const char* codeset = nl_langinfo(CODESET);
        if (!codeset || (strcasecmp(codeset, "UTF-8") != 0 && strcasecmp(codeset, "utf8") != 0))
            return false;
        const char* term = std::getenv("TERM");
        return term && term[0] && strcasecmp(term, "dumb") != 0;
#endif
    }();
    return value;
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    auto& stream = std::cerr;
    if (supports_utf())
        stream << '[' << level_emoji(min_level) << "] ";
    else
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
    if (supports_utf())
        stream << "⚠️ ";
    else
        stream << "[WARN] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void error(Args&&... args) {
    auto& stream = std::cerr;
    if (supports_utf())
        stream << "❌ ";
    else
        stream << "[ERROR] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args> void print(Args&&... args) {
    auto& stream = std::cout;
    if constexpr (sizeof...(Args) > 0) { ((stream << std::forward<Args>(args) << ' '), ...); }
    stream << '\n';
}

template <typename... Args> void log_plain(Args&&... args) {
    auto& stream = std::cerr;
    if constexpr (sizeof...(Args) > 0) { ((stream << std::forward<Args>(args) << ' '), ...); }
    stream << '\n';
}

} // namespace paakit::log

namespace paakit::cli {
    using namespace paakit::log;
}

#define LOGI(...) ::paakit::log::info(__VA_ARGS__)
#define LOGW(...) ::paakit::log::warn(__VA_ARGS__)
#define LOGE(...) ::paakit::log::error(__VA_ARGS__)

#if PAAKIT_DEBUG
    #define LOGD(...) ::paakit::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif
