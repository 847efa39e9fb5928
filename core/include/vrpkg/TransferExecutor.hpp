// Abstract byte mover. Concrete backends (local mirror, mocks) must respect
// this API so the queue stays decoupled from the transport.
#pragma once
#include "TransferTypes.hpp"

namespace vrpkg {

class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;

    // Fetch a catalog item into destPath (file is created/truncated).
    virtual bool fetch(const std::string &locator, const std::string &destPath,
                       std::string &err, ProgressCB progress = {},
                       CancelCB shouldCancel = {}) = 0;

    // Push a local file or directory to a device.
    virtual bool push(const std::string &srcPath, const std::string &device,
                      std::string &err, ProgressCB progress = {},
                      CancelCB shouldCancel = {}) = 0;

    // Upload a local file or directory to a catalog destination.
    virtual bool upload(const std::string &srcPath, const std::string &locator,
                        std::string &err, ProgressCB progress = {},
                        CancelCB shouldCancel = {}) = 0;
};

} // namespace vrpkg
