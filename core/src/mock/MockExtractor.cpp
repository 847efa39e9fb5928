#include "vrpkg/MockExtractor.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace vrpkg {

void MockExtractor::setScript(const std::string &archiveName,
                              const MockStepScript &s) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        scripts_[archiveName] = s;
    }
    gate_.reset(archiveName);
}

void MockExtractor::setDefaultScript(const MockStepScript &s) {
    std::lock_guard<std::mutex> lk(mtx_);
    default_ = s;
}

void MockExtractor::setContentFiles(std::vector<std::string> files) {
    std::lock_guard<std::mutex> lk(mtx_);
    contentFiles_ = std::move(files);
}

int MockExtractor::callCount(const std::string &archiveName) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = calls_.find(archiveName);
    return it == calls_.end() ? 0 : it->second;
}

bool MockExtractor::extract(const std::string &archivePath,
                            const std::string &destDir, std::string &err,
                            ProgressCB progress, CancelCB shouldCancel) {
    const std::string name = fs::path(archivePath).filename().string();
    MockStepScript s;
    bool failNow = false;
    std::vector<std::string> files;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        calls_[name] += 1;
        auto it = scripts_.find(name);
        if (it != scripts_.end()) {
            s = it->second;
            if (it->second.failTimes > 0) {
                failNow = true;
                it->second.failTimes -= 1;
            }
        } else {
            s = default_;
            if (default_.failTimes > 0) {
                failNow = true;
                default_.failTimes -= 1;
            }
        }
        files = contentFiles_;
    }

    std::error_code ec;
    if (!fs::is_regular_file(archivePath, ec)) {
        err = "Archive not found: " + archivePath;
        return false;
    }
    fs::create_directories(destDir, ec);
    if (ec) {
        err = "Cannot create " + destDir + ": " + ec.message();
        return false;
    }
    // Partial output first, so cancellation leaves something to clean up.
    {
        std::ofstream marker(fs::path(destDir) / ".partial");
        marker << name;
    }
    if (!runMockSteps(s, failNow, gate_, name, err, progress, shouldCancel))
        return false;

    for (const auto &rel : files) {
        const fs::path target = fs::path(destDir) / rel;
        fs::create_directories(target.parent_path(), ec);
        std::ofstream out(target, std::ios::binary);
        out << "mock:" << rel;
        if (!out) {
            err = "Cannot write " + target.string();
            return false;
        }
    }
    fs::remove(fs::path(destDir) / ".partial", ec);
    return true;
}

} // namespace vrpkg
