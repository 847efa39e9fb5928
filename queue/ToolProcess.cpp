#include "ToolProcess.hpp"

#include <QElapsedTimer>
#include <QProcess>
Q_LOGGING_CATEGORY(vrpkgTools, "vrpkg.tools")

namespace vrpkg {

static constexpr int kStartTimeoutMs = 10000;
static constexpr int kPollMs = 50;
static constexpr int kKillWaitMs = 3000;

static void appendOutput(QString &output, const QString &chunk) {
    output += chunk;
    if (output.size() > kToolOutputKeepChars)
        output.remove(0, output.size() - kToolOutputKeepChars);
}

static void drainLines(QString &pending,
                       const std::function<void(const QString &)> &onLine,
                       bool flush) {
    int start = 0;
    for (int i = 0; i < pending.size(); ++i) {
        const QChar c = pending.at(i);
        if (c == QLatin1Char('\n') || c == QLatin1Char('\r') ||
            c == QLatin1Char('\b')) {
            const QString line = pending.mid(start, i - start).trimmed();
            if (!line.isEmpty() && onLine)
                onLine(line);
            start = i + 1;
        }
    }
    pending.remove(0, start);
    if (flush) {
        const QString line = pending.trimmed();
        if (!line.isEmpty() && onLine)
            onLine(line);
        pending.clear();
    }
}

bool runTool(const QString &program, const QStringList &args,
             ToolResult &result, QString &err, const CancelCB &shouldCancel,
             int timeoutMs,
             const std::function<void(const QString &line)> &onLine) {
    result = ToolResult{};
    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(program, args);
    if (!proc.waitForStarted(kStartTimeoutMs)) {
        err = QStringLiteral("Cannot start %1: %2").arg(program, proc.errorString());
        qCWarning(vrpkgTools) << "Tool failed to start"
                              << "program=" << program
                              << "error=" << proc.errorString();
        return false;
    }
    qCDebug(vrpkgTools) << "Tool started"
                        << "program=" << program
                        << "pid=" << proc.processId();

    QElapsedTimer clock;
    clock.start();
    QString pending;
    auto stopProcess = [&proc]() {
        proc.kill();
        proc.waitForFinished(kKillWaitMs);
    };
    while (proc.state() != QProcess::NotRunning) {
        if (shouldCancel && shouldCancel()) {
            stopProcess();
            result.cancelled = true;
            err = QStringLiteral("Cancelled");
            return false;
        }
        if (timeoutMs > 0 && clock.elapsed() > timeoutMs) {
            stopProcess();
            result.timedOut = true;
            err = QStringLiteral("%1 timed out after %2 ms").arg(program).arg(timeoutMs);
            qCWarning(vrpkgTools) << "Tool timed out" << "program=" << program;
            return false;
        }
        proc.waitForReadyRead(kPollMs);
        const QString chunk = QString::fromLocal8Bit(proc.readAll());
        appendOutput(result.output, chunk);
        pending += chunk;
        drainLines(pending, onLine, false);
    }
    const QString rest = QString::fromLocal8Bit(proc.readAll());
    appendOutput(result.output, rest);
    pending += rest;
    drainLines(pending, onLine, true);

    if (proc.exitStatus() != QProcess::NormalExit) {
        err = QStringLiteral("%1 crashed: %2").arg(program, proc.errorString());
        return false;
    }
    result.exitCode = proc.exitCode();
    qCDebug(vrpkgTools) << "Tool finished"
                        << "program=" << program
                        << "exitCode=" << result.exitCode
                        << "elapsedMs=" << clock.elapsed();
    return true;
}

QString outputTail(const QString &output, int maxLines) {
    QStringList lines;
    const QStringList all = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (int i = qMax(0, all.size() - maxLines); i < all.size(); ++i)
        lines << all.at(i).trimmed();
    return lines.join(QStringLiteral(" | "));
}

} // namespace vrpkg
