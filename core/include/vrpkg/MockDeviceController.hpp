#pragma once
#include "DeviceController.hpp"
#include "MockScript.hpp"

#include <unordered_map>
#include <utility>
#include <vector>

namespace vrpkg {

// Scripts are keyed by device serial. Gate keys are "install:<device>" and
// "pull:<device>".
class MockDeviceController : public DeviceController {
public:
    static constexpr const char *kConflictError =
        "Failure [INSTALL_FAILED_UPDATE_INCOMPATIBLE]";

    bool install(const std::string &device, const std::string &packagePath,
                 std::string &err) override;
    bool uninstall(const std::string &device, const std::string &packageName,
                   std::string &err) override;
    bool pull(const std::string &device, const std::string &packageName,
              const std::string &destDir, std::string &err,
              ProgressCB progress = {}, CancelCB shouldCancel = {}) override;
    // Recorded in scriptRuns(); shares the install scripts and conflicts.
    bool runInstallScript(const std::string &device,
                          const std::string &packageDir,
                          const std::string &scriptPath, std::string &err,
                          CancelCB shouldCancel = {}) override;
    bool isUpdateConflict(const std::string &err) const override;

    void setInstallScript(const std::string &device, const MockStepScript &s);
    void setPullScript(const std::string &device, const MockStepScript &s);
    // The next n installs on device fail with a signature conflict.
    void setConflicts(const std::string &device, int n);
    void release(const std::string &gateKey) { gate_.release(gateKey); }

    std::vector<std::pair<std::string, std::string>> installs() const;
    std::vector<std::pair<std::string, std::string>> uninstalls() const;
    int pullCount(const std::string &device) const;
    // (device, scriptPath) of every runInstallScript call.
    std::vector<std::pair<std::string, std::string>> scriptRuns() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, MockStepScript> installScripts_;
    std::unordered_map<std::string, MockStepScript> pullScripts_;
    std::unordered_map<std::string, int> conflicts_;
    std::unordered_map<std::string, int> pulls_;
    std::vector<std::pair<std::string, std::string>> installs_;
    std::vector<std::pair<std::string, std::string>> uninstalls_;
    std::vector<std::pair<std::string, std::string>> scriptRuns_;
    MockGate gate_;
};

} // namespace vrpkg
