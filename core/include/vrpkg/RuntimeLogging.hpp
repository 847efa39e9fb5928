// Runtime policy helpers for diagnostics. Catalog locators can embed
// credentials (user:pass@host, signed query strings), so they are redacted in
// logs unless sensitive logging is explicitly enabled in a dev environment.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace vrpkg {

inline std::string envLower(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    std::string out(raw);
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), notSpace));
    out.erase(std::find_if(out.rbegin(), out.rend(), notSpace).base(),
              out.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = envLower(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool isDevEnvironment() {
    const std::string env = envLower("VRPKG_ENV");
    return env == "dev" || env == "development" || env == "local" ||
           env == "debug";
}

inline bool sensitiveLoggingEnabled() {
    return isDevEnvironment() && envFlagEnabled("VRPKG_LOG_SENSITIVE");
}

// Drops "user:pass@" and anything after '?' unless sensitive logging is on.
inline std::string locatorForLog(const std::string &locator) {
    if (sensitiveLoggingEnabled())
        return locator;
    std::string out = locator;
    const std::size_t q = out.find('?');
    if (q != std::string::npos)
        out.replace(q, std::string::npos, "?<redacted>");
    const std::size_t scheme = out.find("://");
    const std::size_t hostStart = scheme == std::string::npos ? 0 : scheme + 3;
    const std::size_t at = out.find('@', hostStart);
    const std::size_t slash = out.find('/', hostStart);
    if (at != std::string::npos && (slash == std::string::npos || at < slash))
        out.replace(hostStart, at - hostStart + 1, "<redacted>@");
    return out;
}

} // namespace vrpkg
