#pragma once
#include "TransferTypes.hpp"

namespace vrpkg {

// Unpacks a downloaded archive. The archive format is the backend's choice.
class Extractor {
public:
    virtual ~Extractor() = default;

    // Extract archivePath into destDir (created if missing). On failure or
    // cancellation destDir may hold partial output; the caller deletes it.
    virtual bool extract(const std::string &archivePath,
                         const std::string &destDir, std::string &err,
                         ProgressCB progress = {},
                         CancelCB shouldCancel = {}) = 0;
};

} // namespace vrpkg
