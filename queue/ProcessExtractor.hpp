#pragma once
#include "vrpkg/Extractor.hpp"

#include <QString>
#include <optional>

namespace vrpkg {

// Extracts with the 7-Zip command line tool ("7z x ... -bsp1"), reading
// percent progress from its output. Cancellation kills the process.
class ProcessExtractor : public Extractor {
public:
    explicit ProcessExtractor(QString sevenZipPath,
                              QString password = QString());

    bool extract(const std::string &archivePath, const std::string &destDir,
                 std::string &err, ProgressCB progress = {},
                 CancelCB shouldCancel = {}) override;

    // " 42% 3 - file.bin" -> 42
    static std::optional<int> parseProgressLine(const QString &line);
    // Known fatal 7z diagnostics; empty when the line is not one.
    static QString errorForLine(const QString &line);

private:
    QString sevenZip_;
    QString password_;
};

} // namespace vrpkg
