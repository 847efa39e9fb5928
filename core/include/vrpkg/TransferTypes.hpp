// Basic types shared by the queue core and the collaborator backends.
// Keep them plain so any transport (HTTP mirror, device bridge, tests) can
// implement the interfaces without pulling in Qt.
#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace vrpkg {

// Byte progress of a single collaborator call. Counts must be monotonic.
using ProgressCB =
    std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;

// Polled at every chunk boundary; returning true aborts the call.
using CancelCB = std::function<bool()>;

// Locators may carry a "file://" scheme; strip it to get a plain path.
inline std::string stripFileScheme(const std::string &locator) {
    static const std::string kScheme = "file://";
    if (locator.compare(0, kScheme.size(), kScheme) == 0)
        return locator.substr(kScheme.size());
    return locator;
}

// Last path component of a locator or path ("" when it ends in '/').
inline std::string locatorBaseName(const std::string &locator) {
    std::string path = stripFileScheme(locator);
    const std::size_t q = path.find_first_of("?#");
    if (q != std::string::npos)
        path.resize(q);
    const std::size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace vrpkg
