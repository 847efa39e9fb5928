#include "AdbTransferExecutor.hpp"
#include "AdbDeviceController.hpp"
#include "ToolProcess.hpp"

#include <QDir>
#include <QFileInfo>
#include <utility>

namespace vrpkg {

AdbTransferExecutor::AdbTransferExecutor(TransferExecutor &catalog,
                                         const AdbDeviceController &adb)
    : catalog_(catalog), adb_(adb) {}

bool AdbTransferExecutor::fetch(const std::string &locator,
                                const std::string &destPath, std::string &err,
                                ProgressCB progress, CancelCB shouldCancel) {
    return catalog_.fetch(locator, destPath, err, std::move(progress),
                          std::move(shouldCancel));
}

bool AdbTransferExecutor::upload(const std::string &srcPath,
                                 const std::string &locator, std::string &err,
                                 ProgressCB progress, CancelCB shouldCancel) {
    return catalog_.upload(srcPath, locator, err, std::move(progress),
                           std::move(shouldCancel));
}

bool AdbTransferExecutor::push(const std::string &srcPath,
                               const std::string &device, std::string &err,
                               ProgressCB progress, CancelCB shouldCancel) {
    const QFileInfo src(QDir::cleanPath(QString::fromStdString(srcPath)));
    const QString packageName = src.fileName();
    if (!AdbDeviceController::isValidPackageName(packageName)) {
        err = "Invalid package name: '" + packageName.toStdString() + "'";
        return false;
    }
    if (!src.isDir()) {
        err = "OBB folder not found: " + srcPath;
        return false;
    }
    const QString remote = AdbDeviceController::obbDirFor(packageName);
    qCInfo(vrpkgTools) << "Pushing OBB data"
                       << "device=" << QString::fromStdString(device)
                       << "remote=" << remote;
    return adb_.pushToDevice(QString::fromStdString(device),
                             src.absoluteFilePath(), remote, err, progress,
                             shouldCancel);
}

} // namespace vrpkg
