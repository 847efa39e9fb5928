// Blocking runner for the external command line tools (7z, adb). Safe to
// call from worker threads; no event loop is needed.
#pragma once
#include "vrpkg/TransferTypes.hpp"

#include <QLoggingCategory>
#include <QString>
#include <QStringList>
#include <functional>

Q_DECLARE_LOGGING_CATEGORY(vrpkgTools)

namespace vrpkg {

// Characters of output a ToolResult keeps; older output is dropped.
constexpr int kToolOutputKeepChars = 64 * 1024;

struct ToolResult {
    int exitCode = -1;
    QString output; // stdout and stderr merged, last kToolOutputKeepChars only
    bool cancelled = false;
    bool timedOut = false;
};

// Runs program to completion. onLine receives each output line as it
// arrives ('\r' and '\b' also end a line, as 7z progress uses them).
// timeoutMs <= 0 waits forever. Returns false when the process could not
// start, crashed, was cancelled or timed out; err describes why. A non-zero
// exit code is not a failure here: callers interpret the output.
bool runTool(const QString &program, const QStringList &args,
             ToolResult &result, QString &err, const CancelCB &shouldCancel = {},
             int timeoutMs = 0,
             const std::function<void(const QString &line)> &onLine = {});

// Last few output lines, for error messages.
QString outputTail(const QString &output, int maxLines = 3);

} // namespace vrpkg
