#pragma once

/** \file platform_utils.hpp
 *  \brief Environment access used by the configuration knobs (SHARDMARK_*).
 */

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <cstdlib>

namespace shardmark::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// Boolean knob: unset or empty yields `fallback`; "0", "false", "off" and "no"
// (any case) are false, everything else is true.
inline bool env_flag(const char* name, bool fallback) {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return fallback;
    std::string s = *v;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !(s == "0" || s == "false" || s == "off" || s == "no");
}

} // namespace shardmark::core
