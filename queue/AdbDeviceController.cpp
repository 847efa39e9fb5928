#include "AdbDeviceController.hpp"
#include "ToolProcess.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QPair>
#include <QProcess>
#include <QRegularExpression>
#include <QVector>
#include <utility>

namespace vrpkg {

static const char *kObbRoot = "/sdcard/Android/obb";

static bool installSucceeded(const ToolResult &r) {
    return r.exitCode == 0 && r.output.contains(QLatin1String("Success"));
}

AdbDeviceController::AdbDeviceController(QString adbPath)
    : adb_(std::move(adbPath)) {}

bool AdbDeviceController::adb(const QString &device, const QStringList &args,
                              ToolResult &out, std::string &err,
                              const CancelCB &shouldCancel,
                              int timeoutMs) const {
    QStringList full;
    if (!device.isEmpty())
        full << QStringLiteral("-s") << device;
    full << args;
    QString runErr;
    if (!runTool(adb_, full, out, runErr, shouldCancel,
                 timeoutMs < 0 ? timeoutMs_ : timeoutMs)) {
        err = runErr.toStdString();
        return false;
    }
    return true;
}

bool AdbDeviceController::isValidPackageName(const QString &name) {
    static const QRegularExpression re(QStringLiteral("^[A-Za-z0-9._]+$"));
    return re.match(name).hasMatch();
}

QString AdbDeviceController::obbDirFor(const QString &packageName) {
    return QStringLiteral("%1/%2").arg(QLatin1String(kObbRoot), packageName);
}

QStringList AdbDeviceController::parsePackagePaths(const QString &pmOutput) {
    QStringList paths;
    const QStringList lines =
        pmOutput.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &raw : lines) {
        const QString line = raw.trimmed();
        if (line.startsWith(QLatin1String("package:")))
            paths << line.mid(int(qstrlen("package:")));
    }
    return paths;
}

bool AdbDeviceController::install(const std::string &device,
                                  const std::string &packagePath,
                                  std::string &err) {
    const QString dev = QString::fromStdString(device);
    const QFileInfo target(QString::fromStdString(packagePath));
    QStringList apks;
    if (target.isFile()) {
        apks << target.absoluteFilePath();
    } else if (target.isDir()) {
        const QFileInfoList found =
            QDir(target.absoluteFilePath())
                .entryInfoList({QStringLiteral("*.apk")}, QDir::Files, QDir::Name);
        for (const QFileInfo &fi : found)
            apks << fi.absoluteFilePath();
    }
    if (apks.isEmpty()) {
        err = "No APK files found in " + packagePath;
        return false;
    }
    for (const QString &apk : apks) {
        qCInfo(vrpkgTools) << "adb install" << "device=" << dev << "apk=" << apk;
        ToolResult r;
        if (!adb(dev, {QStringLiteral("install"), QStringLiteral("-r"),
                       QStringLiteral("-g"), apk},
                 r, err))
            return false;
        if (!installSucceeded(r)) {
            err = QStringLiteral("Failed to install %1: %2")
                      .arg(QFileInfo(apk).fileName(), outputTail(r.output))
                      .toStdString();
            return false;
        }
    }
    return true;
}

bool AdbDeviceController::uninstall(const std::string &device,
                                    const std::string &packageName,
                                    std::string &err) {
    if (!isValidPackageName(QString::fromStdString(packageName))) {
        err = "Invalid package name: '" + packageName + "'";
        return false;
    }
    const QString dev = QString::fromStdString(device);
    qCInfo(vrpkgTools) << "adb uninstall" << "device=" << dev
                       << "package=" << QString::fromStdString(packageName);
    ToolResult r;
    if (!adb(dev, {QStringLiteral("uninstall"), QString::fromStdString(packageName)},
             r, err))
        return false;
    if (r.exitCode != 0 || !r.output.contains(QLatin1String("Success"))) {
        err = ("Uninstall failed: " + outputTail(r.output)).toStdString();
        return false;
    }
    return true;
}

bool AdbDeviceController::pull(const std::string &device,
                               const std::string &packageName,
                               const std::string &destDir, std::string &err,
                               ProgressCB progress, CancelCB shouldCancel) {
    const QString dev = QString::fromStdString(device);
    const QString pkg = QString::fromStdString(packageName);
    const QString dest = QString::fromStdString(destDir);
    if (!isValidPackageName(pkg)) {
        err = "Invalid package name: '" + packageName + "'";
        return false;
    }
    if (!QDir().mkpath(dest)) {
        err = "Cannot create " + destDir;
        return false;
    }

    ToolResult r;
    if (!adb(dev, {QStringLiteral("shell"), QStringLiteral("pm path ") + pkg}, r,
             err, shouldCancel, 30000))
        return false;
    const QStringList remote = parsePackagePaths(r.output);
    if (remote.isEmpty()) {
        err = ("Package not installed on device: " + pkg).toStdString();
        return false;
    }
    const QString obbDir = obbDirFor(pkg);
    if (!adb(dev,
             {QStringLiteral("shell"),
              QStringLiteral("[ -d \"%1\" ] && echo EXISTS || echo").arg(obbDir)},
             r, err, shouldCancel, 30000))
        return false;
    const bool hasObb = r.output.contains(QLatin1String("EXISTS"));

    // Steps: base APK, then the OBB directory.
    const std::uint64_t steps = hasObb ? 2 : 1;
    if (progress)
        progress(0, steps);
    const QString localApk = QDir(dest).filePath(pkg + QStringLiteral(".apk"));
    qCInfo(vrpkgTools) << "adb pull" << "device=" << dev << "package=" << pkg;
    if (!adb(dev, {QStringLiteral("pull"), remote.first(), localApk}, r, err,
             shouldCancel))
        return false;
    if (r.exitCode != 0 || !QFileInfo(localApk).isFile()) {
        err = ("Failed to pull APK: " + outputTail(r.output)).toStdString();
        return false;
    }
    if (progress)
        progress(1, steps);
    if (hasObb) {
        if (!adb(dev, {QStringLiteral("pull"), obbDir, dest}, r, err,
                 shouldCancel))
            return false;
        if (r.exitCode != 0) {
            err = ("Failed to pull OBB: " + outputTail(r.output)).toStdString();
            return false;
        }
        if (progress)
            progress(2, steps);
    }
    return true;
}

bool AdbDeviceController::pushToDevice(const QString &device,
                                       const QString &localPath,
                                       const QString &remotePath,
                                       std::string &err,
                                       const ProgressCB &progress,
                                       const CancelCB &shouldCancel) const {
    const QFileInfo src(localPath);
    if (!src.exists()) {
        err = ("Nothing to push at " + localPath).toStdString();
        return false;
    }
    // (local file, remote file) pairs in a stable order.
    QVector<QPair<QString, QString>> files;
    std::uint64_t total = 0;
    if (src.isDir()) {
        const QDir base(src.absoluteFilePath());
        QStringList found;
        QDirIterator it(base.absolutePath(), QDir::Files | QDir::Hidden,
                        QDirIterator::Subdirectories);
        while (it.hasNext())
            found << it.next();
        found.sort();
        for (const QString &path : found) {
            files.append({path, remotePath + QLatin1Char('/') +
                                    base.relativeFilePath(path)});
            total += std::uint64_t(QFileInfo(path).size());
        }
    } else {
        files.append({src.absoluteFilePath(), remotePath});
        total = std::uint64_t(src.size());
    }

    ToolResult r;
    if (src.isDir()) {
        if (!adb(device,
                 {QStringLiteral("shell"),
                  QStringLiteral("mkdir -p \"%1\"").arg(remotePath)},
                 r, err, shouldCancel, 30000))
            return false;
        if (r.exitCode != 0) {
            err = ("Cannot create " + remotePath + " on device: " +
                   outputTail(r.output))
                      .toStdString();
            return false;
        }
    }
    if (progress)
        progress(0, total);
    std::uint64_t done = 0;
    for (const auto &f : files) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            return false;
        }
        qCDebug(vrpkgTools) << "adb push" << "device=" << device
                            << "file=" << f.first << "remote=" << f.second;
        if (!adb(device, {QStringLiteral("push"), f.first, f.second}, r, err,
                 shouldCancel))
            return false;
        if (r.exitCode != 0) {
            err = QStringLiteral("Failed to push %1: %2")
                      .arg(QFileInfo(f.first).fileName(), outputTail(r.output))
                      .toStdString();
            return false;
        }
        done += std::uint64_t(QFileInfo(f.first).size());
        if (progress)
            progress(done, total);
    }
    return true;
}

bool AdbDeviceController::runInstallScript(const std::string &device,
                                           const std::string &packageDir,
                                           const std::string &scriptPath,
                                           std::string &err,
                                           CancelCB shouldCancel) {
    const QString dev = QString::fromStdString(device);
    const QDir pkgDir(QString::fromStdString(packageDir));
    QFile file(QString::fromStdString(scriptPath));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        err = "Cannot read install script " + scriptPath + ": " +
              file.errorString().toStdString();
        return false;
    }
    const QStringList lines = QString::fromUtf8(file.readAll())
                                  .split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &raw : lines) {
        const QString line = raw.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#')))
            continue;
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            return false;
        }
        const QStringList parts = QProcess::splitCommand(line);
        if (parts.size() < 2 ||
            parts.first().compare(QLatin1String("adb"), Qt::CaseInsensitive) != 0) {
            qCWarning(vrpkgTools) << "Install script: skipping non-adb line"
                                  << "line=" << line;
            continue;
        }
        const QString sub = parts.at(1).toLower();
        const QStringList args = parts.mid(2);
        qCInfo(vrpkgTools) << "Install script" << "device=" << dev
                           << "command=" << sub;
        ToolResult r;
        std::string stepErr;
        bool stepOk = false;
        if (sub == QLatin1String("install")) {
            QString apk;
            QStringList flags{QStringLiteral("-r"), QStringLiteral("-g")};
            for (const QString &a : args) {
                if (a.endsWith(QLatin1String(".apk"), Qt::CaseInsensitive))
                    apk = a;
                else if (!flags.contains(a))
                    flags << a;
            }
            const QString apkPath = apk.isEmpty() ? QString() : pkgDir.filePath(apk);
            if (apkPath.isEmpty() || !QFileInfo(apkPath).isFile()) {
                stepErr = apk.isEmpty() ? "missing APK argument"
                                        : ("APK not found: " + apkPath).toStdString();
            } else if (adb(dev, QStringList{QStringLiteral("install")} << flags << apkPath,
                           r, stepErr, shouldCancel)) {
                stepOk = installSucceeded(r);
                if (!stepOk)
                    stepErr = outputTail(r.output).toStdString();
            }
            if (!stepOk) {
                err = ("'" + line + "': ").toStdString() + stepErr;
                return false;
            }
            continue;
        }
        if (sub == QLatin1String("push") && args.size() == 2) {
            const QString local = pkgDir.filePath(args.at(0));
            if (!QFileInfo::exists(local))
                stepErr = ("not found: " + local).toStdString();
            else if (adb(dev, {QStringLiteral("push"), local, args.at(1)}, r,
                         stepErr, shouldCancel))
                stepOk = r.exitCode == 0;
        } else if (sub == QLatin1String("pull") && args.size() == 1) {
            const QString target =
                pkgDir.filePath(QFileInfo(args.at(0)).fileName());
            if (adb(dev, {QStringLiteral("pull"), args.at(0), target}, r, stepErr,
                    shouldCancel))
                stepOk = r.exitCode == 0;
        } else if (sub == QLatin1String("shell") && !args.isEmpty()) {
            if (adb(dev, {QStringLiteral("shell"), args.join(QLatin1Char(' '))}, r,
                    stepErr, shouldCancel, 60000))
                stepOk = r.exitCode == 0;
        } else {
            qCWarning(vrpkgTools) << "Install script: unsupported command"
                                  << "line=" << line;
            continue;
        }
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            return false;
        }
        if (!stepOk)
            qCWarning(vrpkgTools) << "Install script step failed; continuing"
                                  << "line=" << line
                                  << "error=" << QString::fromStdString(stepErr)
                                  << "output=" << outputTail(r.output);
    }
    return true;
}

bool AdbDeviceController::isUpdateConflict(const std::string &err) const {
    return err.find("INSTALL_FAILED_UPDATE_INCOMPATIBLE") != std::string::npos ||
           err.find("INSTALL_FAILED_VERSION_DOWNGRADE") != std::string::npos;
}

} // namespace vrpkg
