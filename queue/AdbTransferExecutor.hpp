// Catalog transfers go to a wrapped executor; pushes go to the device over
// adb, into the OBB directory named after the pushed folder.
#pragma once
#include "vrpkg/TransferExecutor.hpp"

namespace vrpkg {

class AdbDeviceController;

class AdbTransferExecutor : public TransferExecutor {
public:
    // Neither collaborator is owned.
    AdbTransferExecutor(TransferExecutor &catalog, const AdbDeviceController &adb);

    bool fetch(const std::string &locator, const std::string &destPath,
               std::string &err, ProgressCB progress = {},
               CancelCB shouldCancel = {}) override;

    // srcPath is the package's OBB folder; its name is the package name and
    // it lands in /sdcard/Android/obb/<name> on the device.
    bool push(const std::string &srcPath, const std::string &device,
              std::string &err, ProgressCB progress = {},
              CancelCB shouldCancel = {}) override;

    bool upload(const std::string &srcPath, const std::string &locator,
                std::string &err, ProgressCB progress = {},
                CancelCB shouldCancel = {}) override;

private:
    TransferExecutor &catalog_;
    const AdbDeviceController &adb_;
};

} // namespace vrpkg
