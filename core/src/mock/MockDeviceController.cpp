#include "vrpkg/MockDeviceController.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace vrpkg {

// Copies the script for key and consumes one scripted failure.
static MockStepScript
takeScript(std::unordered_map<std::string, MockStepScript> &scripts,
           const std::string &key, bool &failNow) {
    failNow = false;
    auto it = scripts.find(key);
    if (it == scripts.end())
        return MockStepScript{1};
    if (it->second.failTimes > 0) {
        failNow = true;
        it->second.failTimes -= 1;
    }
    return it->second;
}

void MockDeviceController::setInstallScript(const std::string &device,
                                            const MockStepScript &s) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        installScripts_[device] = s;
    }
    gate_.reset("install:" + device);
}

void MockDeviceController::setPullScript(const std::string &device,
                                         const MockStepScript &s) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pullScripts_[device] = s;
    }
    gate_.reset("pull:" + device);
}

void MockDeviceController::setConflicts(const std::string &device, int n) {
    std::lock_guard<std::mutex> lk(mtx_);
    conflicts_[device] = n;
}

bool MockDeviceController::install(const std::string &device,
                                   const std::string &packagePath,
                                   std::string &err) {
    MockStepScript s;
    bool failNow = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        installs_.emplace_back(device, packagePath);
        int &conflicts = conflicts_[device];
        if (conflicts > 0) {
            conflicts -= 1;
            err = kConflictError;
            return false;
        }
        s = takeScript(installScripts_, device, failNow);
    }
    return runMockSteps(s, failNow, gate_, "install:" + device, err, {}, {});
}

bool MockDeviceController::runInstallScript(const std::string &device,
                                            const std::string &packageDir,
                                            const std::string &scriptPath,
                                            std::string &err,
                                            CancelCB shouldCancel) {
    MockStepScript s;
    bool failNow = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        scriptRuns_.emplace_back(device, scriptPath);
        int &conflicts = conflicts_[device];
        if (conflicts > 0) {
            conflicts -= 1;
            err = kConflictError;
            return false;
        }
        s = takeScript(installScripts_, device, failNow);
    }
    std::error_code ec;
    if (!fs::is_regular_file(scriptPath, ec) || !fs::is_directory(packageDir, ec)) {
        err = "Install script not found: " + scriptPath;
        return false;
    }
    return runMockSteps(s, failNow, gate_, "install:" + device, err, {},
                        shouldCancel);
}

bool MockDeviceController::uninstall(const std::string &device,
                                     const std::string &packageName,
                                     std::string &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (packageName.empty()) {
        err = "Missing package name";
        return false;
    }
    uninstalls_.emplace_back(device, packageName);
    return true;
}

bool MockDeviceController::pull(const std::string &device,
                                const std::string &packageName,
                                const std::string &destDir, std::string &err,
                                ProgressCB progress, CancelCB shouldCancel) {
    MockStepScript s;
    bool failNow = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pulls_[device] += 1;
        s = takeScript(pullScripts_, device, failNow);
    }
    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        err = "Cannot create " + destDir + ": " + ec.message();
        return false;
    }
    if (!runMockSteps(s, failNow, gate_, "pull:" + device, err, progress,
                      shouldCancel))
        return false;
    std::ofstream out(fs::path(destDir) / (packageName + ".apk"),
                      std::ios::binary);
    out << "pulled:" << packageName;
    if (!out) {
        err = "Cannot write pulled package";
        return false;
    }
    return true;
}

bool MockDeviceController::isUpdateConflict(const std::string &err) const {
    return err.find("INSTALL_FAILED_UPDATE_INCOMPATIBLE") != std::string::npos;
}

std::vector<std::pair<std::string, std::string>>
MockDeviceController::installs() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return installs_;
}

std::vector<std::pair<std::string, std::string>>
MockDeviceController::uninstalls() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return uninstalls_;
}

std::vector<std::pair<std::string, std::string>>
MockDeviceController::scriptRuns() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return scriptRuns_;
}

int MockDeviceController::pullCount(const std::string &device) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = pulls_.find(device);
    return it == pulls_.end() ? 0 : it->second;
}

} // namespace vrpkg
