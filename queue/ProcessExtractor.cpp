#include "ProcessExtractor.hpp"
#include "ToolProcess.hpp"

#include <QDir>
#include <QRegularExpression>
#include <utility>

namespace vrpkg {

ProcessExtractor::ProcessExtractor(QString sevenZipPath, QString password)
    : sevenZip_(std::move(sevenZipPath)), password_(std::move(password)) {}

std::optional<int> ProcessExtractor::parseProgressLine(const QString &line) {
    static const QRegularExpression re(QStringLiteral("^\\s*(\\d{1,3})%"));
    const QRegularExpressionMatch m = re.match(line);
    if (!m.hasMatch())
        return std::nullopt;
    const int pct = m.captured(1).toInt();
    if (pct > 100)
        return std::nullopt;
    return pct;
}

QString ProcessExtractor::errorForLine(const QString &line) {
    if (line.contains(QLatin1String("Wrong password")))
        return QStringLiteral("Wrong password");
    if (line.contains(QLatin1String("Data Error")) ||
        line.contains(QLatin1String("CRC Failed")))
        return QStringLiteral("Data/CRC error");
    if (line.contains(QLatin1String("Can not open the file as archive")) ||
        line.contains(QLatin1String("Cannot open the file as archive")))
        return QStringLiteral("Not an archive");
    return QString();
}

bool ProcessExtractor::extract(const std::string &archivePath,
                               const std::string &destDir, std::string &err,
                               ProgressCB progress, CancelCB shouldCancel) {
    const QString dest = QString::fromStdString(destDir);
    if (!QDir().mkpath(dest)) {
        err = "Cannot create " + destDir;
        return false;
    }
    QStringList args{QStringLiteral("x"), QString::fromStdString(archivePath),
                     QStringLiteral("-o") + dest, QStringLiteral("-aoa"),
                     QStringLiteral("-bsp1"), QStringLiteral("-y")};
    if (!password_.isEmpty())
        args << QStringLiteral("-p") + password_;

    int lastPct = -1;
    QString fatal;
    ToolResult result;
    QString runErr;
    const bool ran = runTool(
        sevenZip_, args, result, runErr, shouldCancel, 0,
        [&](const QString &line) {
            if (const auto pct = parseProgressLine(line)) {
                if (*pct > lastPct) {
                    lastPct = *pct;
                    if (progress)
                        progress(std::uint64_t(*pct), 100);
                }
                return;
            }
            if (fatal.isEmpty())
                fatal = errorForLine(line);
        });
    if (!ran) {
        err = runErr.toStdString();
        return false;
    }
    if (!fatal.isEmpty()) {
        err = fatal.toStdString();
        qCWarning(vrpkgTools) << "7z reported" << fatal
                              << "archive=" << QString::fromStdString(archivePath);
        return false;
    }
    if (result.exitCode != 0) {
        err = QStringLiteral("7z exited with code %1: %2")
                  .arg(result.exitCode)
                  .arg(outputTail(result.output))
                  .toStdString();
        return false;
    }
    if (progress && lastPct < 100)
        progress(100, 100);
    return true;
}

} // namespace vrpkg
