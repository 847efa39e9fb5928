#pragma once
#include "TransferExecutor.hpp"

#include <cstddef>
#include <string>

namespace vrpkg {

// Mirror on local or mounted storage. Relative locators resolve against
// mirrorRoot; each device is a directory under devicesRoot named after its
// serial (e.g. an MTP mount).
class LocalFileTransferExecutor : public TransferExecutor {
public:
    LocalFileTransferExecutor(std::string mirrorRoot, std::string devicesRoot);

    bool fetch(const std::string &locator, const std::string &destPath,
               std::string &err, ProgressCB progress = {},
               CancelCB shouldCancel = {}) override;

    bool push(const std::string &srcPath, const std::string &device,
              std::string &err, ProgressCB progress = {},
              CancelCB shouldCancel = {}) override;

    bool upload(const std::string &srcPath, const std::string &locator,
                std::string &err, ProgressCB progress = {},
                CancelCB shouldCancel = {}) override;

    void setChunkBytes(std::size_t n) { chunkBytes_ = n > 0 ? n : 1; }

private:
    std::string resolveLocator(const std::string &locator) const;
    bool copyTree(const std::string &src, const std::string &dst,
                  std::string &err, const ProgressCB &progress,
                  const CancelCB &shouldCancel);
    bool copyFile(const std::string &src, const std::string &dst,
                  std::uint64_t &done, std::uint64_t total, std::string &err,
                  const ProgressCB &progress, const CancelCB &shouldCancel);

    std::string mirrorRoot_;
    std::string devicesRoot_;
    std::size_t chunkBytes_ = 64 * 1024;
};

} // namespace vrpkg
