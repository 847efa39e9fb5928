#pragma once
#include "vrpkg/DeviceController.hpp"

#include <QString>
#include <QStringList>

namespace vrpkg {

struct ToolResult;

// Device operations through the adb command line tool. Devices are
// addressed by serial ("adb -s <serial> ...").
class AdbDeviceController : public DeviceController {
public:
    explicit AdbDeviceController(QString adbPath);

    // Installs every APK in packagePath (or packagePath itself when it is a
    // file) with "-r -g".
    bool install(const std::string &device, const std::string &packagePath,
                 std::string &err) override;
    bool uninstall(const std::string &device, const std::string &packageName,
                   std::string &err) override;
    // Pulls the base APK as <packageName>.apk and the OBB directory, when the
    // device has one, as <packageName>/.
    bool pull(const std::string &device, const std::string &packageName,
              const std::string &destDir, std::string &err,
              ProgressCB progress = {}, CancelCB shouldCancel = {}) override;
    // Runs the adb lines of an install script: "install" (always with
    // -r -g), "push", "pull" and "shell". A failing install stops the script;
    // other failures are logged and skipped, as are non-adb lines.
    bool runInstallScript(const std::string &device,
                          const std::string &packageDir,
                          const std::string &scriptPath, std::string &err,
                          CancelCB shouldCancel = {}) override;
    bool isUpdateConflict(const std::string &err) const override;

    // Copies localPath to remotePath on the device. A directory is pushed
    // file by file below remotePath so progress counts bytes.
    bool pushToDevice(const QString &device, const QString &localPath,
                      const QString &remotePath, std::string &err,
                      const ProgressCB &progress = {},
                      const CancelCB &shouldCancel = {}) const;

    void setCommandTimeoutMs(int ms) { timeoutMs_ = ms; }

    // Android package names only ([A-Za-z0-9._]+); anything else is refused
    // before it reaches a device shell.
    static bool isValidPackageName(const QString &name);

    // Device directory holding the OBB data of packageName.
    static QString obbDirFor(const QString &packageName);

    // "package:/data/app/.../base.apk" lines of "pm path" -> remote paths.
    static QStringList parsePackagePaths(const QString &pmOutput);

private:
    bool adb(const QString &device, const QStringList &args, ToolResult &out,
             std::string &err, const CancelCB &shouldCancel = {},
             int timeoutMs = -1) const;

    QString adb_;
    int timeoutMs_ = 10 * 60 * 1000;
};

} // namespace vrpkg
