#pragma once
#include "Extractor.hpp"
#include "MockScript.hpp"

#include <unordered_map>
#include <vector>

namespace vrpkg {

// Scripts are keyed by the archive file name (not the full path, which
// depends on the download directory).
class MockExtractor : public Extractor {
public:
    bool extract(const std::string &archivePath, const std::string &destDir,
                 std::string &err, ProgressCB progress = {},
                 CancelCB shouldCancel = {}) override;

    void setScript(const std::string &archiveName, const MockStepScript &s);
    void setDefaultScript(const MockStepScript &s);
    void release(const std::string &archiveName) { gate_.release(archiveName); }

    // Relative files created under destDir on success.
    void setContentFiles(std::vector<std::string> files);

    int callCount(const std::string &archiveName) const;

private:
    mutable std::mutex mtx_;
    MockStepScript default_;
    std::unordered_map<std::string, MockStepScript> scripts_;
    std::unordered_map<std::string, int> calls_;
    std::vector<std::string> contentFiles_{"package.apk"};
    MockGate gate_;
};

} // namespace vrpkg
