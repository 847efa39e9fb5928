// vrpkg-queue: command line host for the package queue. Every invocation
// restores the persisted queue, applies one command and, for commands that
// move data, runs the queue until it is idle.
#include "AdbDeviceController.hpp"
#include "AdbTransferExecutor.hpp"
#include "ProcessExtractor.hpp"
#include "QueueFileLock.hpp"
#include "QueueManager.hpp"
#include "QueueSettings.hpp"
#include "SettingsQueueStore.hpp"
#include "vrpkg/LocalFileTransferExecutor.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>
#include <cstdlib>
#include <memory>
Q_LOGGING_CATEGORY(vrpkgApp, "vrpkg.app")

using namespace vrpkg;

namespace {

QTextStream &out() {
    static QTextStream ts(stdout);
    return ts;
}

QTextStream &errOut() {
    static QTextStream ts(stderr);
    return ts;
}

bool isIdle(const QueueSnapshot &snap) {
    for (const Job &j : snap.jobs) {
        if (j.status == JobStatus::Queued || isActiveStatus(j.status))
            return false;
    }
    return true;
}

void printJobs(const QueueSnapshot &snap) {
    if (snap.jobs.isEmpty()) {
        out() << "Queue is empty" << Qt::endl;
        return;
    }
    for (const Job &j : snap.jobs) {
        out() << j.key << '\t' << jobStatusName(j.status);
        if (isActiveStatus(j.status))
            out() << '\t' << j.progress << '%';
        if (!j.error.isEmpty())
            out() << '\t' << j.error;
        if (j.retryCount > 0)
            out() << "\tretries=" << j.retryCount;
        out() << Qt::endl;
    }
}

int failedCount(const QueueSnapshot &snap, const QStringList &keys) {
    int n = 0;
    for (const Job &j : snap.jobs) {
        if (keys.contains(j.key) &&
            (j.status == JobStatus::Error || j.status == JobStatus::InstallError))
            ++n;
    }
    return n;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("vrpkg"));
    QCoreApplication::setApplicationName(QStringLiteral("vrpkg"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Package transfer queue.\n\n"
        "Commands:\n"
        "  add <key> <locator>       download and extract a package\n"
        "  upload <key> <locator>    pull --package from --device and upload it\n"
        "  install <key>             install a downloaded package on --device\n"
        "  retry <key>               retry a failed or cancelled job\n"
        "  cancel <key>              cancel a queued job\n"
        "  remove <key>              remove a job and its partial files\n"
        "  delete <key>              remove a job and all of its files\n"
        "  clear                     remove completed and installed jobs\n"
        "  list                      print the queue\n"
        "  run                       process queued jobs until idle"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption settingsOpt(
        QStringLiteral("settings"), QStringLiteral("INI file with settings."),
        QStringLiteral("file"));
    const QCommandLineOption dirOpt(
        {QStringLiteral("d"), QStringLiteral("download-dir")},
        QStringLiteral("Download directory (overrides settings)."),
        QStringLiteral("dir"));
    const QCommandLineOption concurrentOpt(
        {QStringLiteral("j"), QStringLiteral("max-concurrent")},
        QStringLiteral("Jobs running at once."), QStringLiteral("n"));
    const QCommandLineOption deviceOpt(QStringLiteral("device"),
                                       QStringLiteral("Device serial."),
                                       QStringLiteral("serial"));
    const QCommandLineOption packageOpt(QStringLiteral("package"),
                                        QStringLiteral("Package name."),
                                        QStringLiteral("name"));
    const QCommandLineOption sizeOpt(QStringLiteral("size"),
                                     QStringLiteral("Expected archive size."),
                                     QStringLiteral("bytes"));
    const QCommandLineOption shaOpt(QStringLiteral("sha256"),
                                    QStringLiteral("Expected archive SHA-256."),
                                    QStringLiteral("hex"));
    const QCommandLineOption passwordOpt(
        QStringLiteral("archive-password"),
        QStringLiteral("Password for encrypted archives."),
        QStringLiteral("password"));
    const QCommandLineOption waitOpt(
        QStringLiteral("wait"),
        QStringLiteral("Seconds to wait for another instance using the queue."),
        QStringLiteral("sec"));
    const QCommandLineOption quietOpt({QStringLiteral("q"), QStringLiteral("quiet")},
                                      QStringLiteral("Do not print progress."));
    parser.addOptions({settingsOpt, dirOpt, concurrentOpt, deviceOpt, packageOpt,
                       sizeOpt, shaOpt, passwordOpt, waitOpt, quietOpt});
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run."));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        errOut() << "Missing command" << Qt::endl;
        parser.showHelp(EXIT_FAILURE);
    }
    const QString command = args.first();
    const QString key = args.value(1);
    static const QStringList keyed{
        QStringLiteral("add"),   QStringLiteral("upload"), QStringLiteral("install"),
        QStringLiteral("retry"), QStringLiteral("cancel"), QStringLiteral("remove"),
        QStringLiteral("delete")};
    if (keyed.contains(command) && key.isEmpty()) {
        errOut() << command << ": missing <key>" << Qt::endl;
        return EXIT_FAILURE;
    }

    std::unique_ptr<QSettings> settingsStore =
        parser.isSet(settingsOpt)
            ? std::make_unique<QSettings>(parser.value(settingsOpt),
                                          QSettings::IniFormat)
            : std::make_unique<QSettings>(QStringLiteral("vrpkg"),
                                          QStringLiteral("vrpkg"));
    QueueSettings settings = QueueSettings::load(*settingsStore);
    if (!settingsStore->contains(QStringLiteral("Transfers/downloadPath"))) {
        // First run: leave an editable settings file behind.
        settings.save(*settingsStore);
        settingsStore->sync();
        qCInfo(vrpkgApp) << "Settings file created"
                         << "file=" << settingsStore->fileName();
    }
    if (parser.isSet(dirOpt))
        settings.downloadPath = QDir(parser.value(dirOpt)).absolutePath();
    if (parser.isSet(concurrentOpt))
        settings.maxConcurrent = qMax(1, parser.value(concurrentOpt).toInt());
    QDir().mkpath(settings.downloadPath);
    QDir().mkpath(QFileInfo(settings.queueFile).absolutePath());
    qCInfo(vrpkgApp) << "Settings loaded"
                     << "file=" << settingsStore->fileName()
                     << "downloadPath=" << settings.downloadPath
                     << "queueFile=" << settings.queueFile;

    // One process owns a queue file at a time.
    QueueFileLock lock(settings.queueFile);
    QString lockErr;
    if (!lock.acquire(lockErr, qMax(0, parser.value(waitOpt).toInt()) * 1000)) {
        errOut() << lockErr << Qt::endl;
        return EXIT_FAILURE;
    }

    LocalFileTransferExecutor catalog(settings.mirrorRoot.toStdString(),
                                      settings.devicesRoot.toStdString());
    ProcessExtractor extractor(settings.sevenZipPath, parser.value(passwordOpt));
    AdbDeviceController devices(settings.adbPath);
    // Device pushes go over adb unless device storage is mounted locally.
    AdbTransferExecutor adbTransfer(catalog, devices);
    TransferExecutor &transfer = settings.devicesRoot.isEmpty()
                                     ? static_cast<TransferExecutor &>(adbTransfer)
                                     : catalog;
    SettingsQueueStore store(settings.queueFile);

    QueueManagerOptions opt;
    opt.maxConcurrent = settings.maxConcurrent;
    opt.downloadPath = settings.downloadPath;
    opt.downloadLimitBytesPerSec = settings.downloadLimitBytesPerSec();
    opt.uploadLimitBytesPerSec = settings.uploadLimitBytesPerSec();
    opt.downloadStallMs = settings.stallTimeoutSec * 1000;
    opt.uploadStallMs = settings.stallTimeoutSec * 1000;

    QueueCollaborators collab;
    collab.transfer = &transfer;
    collab.extractor = &extractor;
    collab.devices = &devices;
    collab.store = &store;
    QueueManager queue(collab, opt);
    if (!queue.restore())
        errOut() << "Warning: could not read " << settings.queueFile
                 << "; starting with an empty queue" << Qt::endl;

    JobPayload payload;
    payload.device = parser.value(deviceOpt);
    payload.packageName = parser.value(packageOpt);
    payload.expectedSize = parser.value(sizeOpt).toULongLong();
    payload.expectedSha256 = parser.value(shaOpt).trimmed();

    bool runQueue = false;
    QStringList watched;
    if (command == QLatin1String("add") || command == QLatin1String("upload")) {
        payload.locator = args.value(2);
        const JobKind kind = command == QLatin1String("add") ? JobKind::Download
                                                              : JobKind::Upload;
        if (!queue.add(key, kind, payload)) {
            errOut() << "Cannot add " << key
                     << ": duplicate key or missing locator/device/package"
                     << Qt::endl;
            return EXIT_FAILURE;
        }
        runQueue = true;
        watched << key;
    } else if (command == QLatin1String("install")) {
        const QueueError e = queue.install(key, payload.device);
        if (e != QueueError::None) {
            errOut() << "Cannot install " << key << ": " << queueErrorName(e)
                     << Qt::endl;
            return EXIT_FAILURE;
        }
        runQueue = true;
        watched << key;
    } else if (command == QLatin1String("retry")) {
        const QueueError e = queue.retry(key);
        if (e != QueueError::None) {
            errOut() << "Cannot retry " << key << ": " << queueErrorName(e)
                     << Qt::endl;
            return EXIT_FAILURE;
        }
        runQueue = true;
        watched << key;
    } else if (command == QLatin1String("cancel")) {
        queue.cancel(key);
    } else if (command == QLatin1String("remove")) {
        queue.remove(key);
    } else if (command == QLatin1String("delete")) {
        if (!queue.deleteFiles(key)) {
            queue.stop();
            errOut() << "Cannot delete the files of " << key << Qt::endl;
            return EXIT_FAILURE;
        }
    } else if (command == QLatin1String("clear")) {
        out() << "Cleared " << queue.clearFinished() << " job(s)" << Qt::endl;
    } else if (command == QLatin1String("list")) {
        printJobs(queue.snapshot());
        return EXIT_SUCCESS;
    } else if (command == QLatin1String("run")) {
        runQueue = true;
        for (const Job &j : queue.snapshot().jobs)
            if (j.status == JobStatus::Queued)
                watched << j.key;
    } else {
        errOut() << "Unknown command: " << command << Qt::endl;
        return EXIT_FAILURE;
    }

    if (!runQueue) {
        queue.stop();
        printJobs(queue.snapshot());
        return EXIT_SUCCESS;
    }

    Subscription progressSub;
    if (!parser.isSet(quietOpt)) {
        progressSub = queue.onJobProgress([](const JobProgress &p) {
            out() << p.key << '\t' << jobStatusName(p.status) << '\t'
                  << p.percent << '%' << Qt::endl;
        });
    }
    // Delivered snapshots may predate the command; judge the live queue.
    Subscription idleSub = queue.onQueueUpdated([&app, &queue](const QueueSnapshot &) {
        if (isIdle(queue.snapshot()))
            app.quit();
    });
    queue.start();
    if (isIdle(queue.snapshot()))
        return EXIT_SUCCESS;
    app.exec();
    queue.stop();

    const QueueSnapshot last = queue.snapshot();
    printJobs(last);
    return failedCount(last, watched) > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}
