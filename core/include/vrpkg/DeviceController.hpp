// Device-side operations used by the install and prepare phases.
#pragma once
#include "TransferTypes.hpp"

namespace vrpkg {

class DeviceController {
public:
    virtual ~DeviceController() = default;

    // Install the package found at packagePath (file or package directory).
    virtual bool install(const std::string &device,
                         const std::string &packagePath,
                         std::string &err) = 0;

    virtual bool uninstall(const std::string &device,
                           const std::string &packageName,
                           std::string &err) = 0;

    // Copy an installed package from the device into destDir.
    virtual bool pull(const std::string &device,
                      const std::string &packageName,
                      const std::string &destDir, std::string &err,
                      ProgressCB progress = {},
                      CancelCB shouldCancel = {}) = 0;

    // Runs a package's own install script (adb commands, one per line)
    // instead of the standard install. Paths in the script are relative to
    // packageDir.
    virtual bool runInstallScript(const std::string &device,
                                  const std::string &packageDir,
                                  const std::string &scriptPath,
                                  std::string &err,
                                  CancelCB shouldCancel = {}) {
        (void)device;
        (void)packageDir;
        (void)scriptPath;
        (void)shouldCancel;
        err = "Install scripts are not supported by this device controller";
        return false;
    }

    // True when an install error means the installed copy has a different
    // signature and must be uninstalled before the new one fits.
    virtual bool isUpdateConflict(const std::string &err) const {
        (void)err;
        return false;
    }
};

} // namespace vrpkg
