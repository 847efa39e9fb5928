// Local mirror backend: chunked copies with progress and cancellation at every
// chunk boundary.
#include "vrpkg/LocalFileTransferExecutor.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace vrpkg {

LocalFileTransferExecutor::LocalFileTransferExecutor(std::string mirrorRoot,
                                                     std::string devicesRoot)
    : mirrorRoot_(std::move(mirrorRoot)),
      devicesRoot_(std::move(devicesRoot)) {}

std::string
LocalFileTransferExecutor::resolveLocator(const std::string &locator) const {
    const fs::path p(stripFileScheme(locator));
    if (p.is_absolute() || mirrorRoot_.empty())
        return p.string();
    return (fs::path(mirrorRoot_) / p).string();
}

bool LocalFileTransferExecutor::copyFile(const std::string &src,
                                         const std::string &dst,
                                         std::uint64_t &done,
                                         std::uint64_t total, std::string &err,
                                         const ProgressCB &progress,
                                         const CancelCB &shouldCancel) {
    FILE *in = std::fopen(src.c_str(), "rb");
    if (!in) {
        err = "Cannot open source for reading: " + src;
        return false;
    }
    FILE *out = std::fopen(dst.c_str(), "wb");
    if (!out) {
        std::fclose(in);
        err = "Cannot open destination for writing: " + dst;
        return false;
    }

    std::vector<char> buf(chunkBytes_);
    bool ok = true;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            ok = false;
            break;
        }
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), in);
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, n, out) != n) {
                err = "Write failed: " + dst;
                ok = false;
                break;
            }
            done += n;
            if (progress)
                progress(done, total);
        }
        if (n < buf.size()) {
            if (std::ferror(in)) {
                err = "Read failed: " + src;
                ok = false;
            }
            break; // EOF
        }
    }
    std::fclose(in);
    if (std::fclose(out) != 0 && ok) {
        err = "Flush failed: " + dst;
        ok = false;
    }
    return ok;
}

bool LocalFileTransferExecutor::copyTree(const std::string &src,
                                         const std::string &dst,
                                         std::string &err,
                                         const ProgressCB &progress,
                                         const CancelCB &shouldCancel) {
    std::error_code ec;
    const fs::path from(src);
    if (!fs::exists(from, ec)) {
        err = "Source not found: " + src;
        return false;
    }

    // Collect files first so progress has a stable total.
    std::vector<std::pair<fs::path, fs::path>> files;
    std::uint64_t total = 0;
    if (fs::is_directory(from, ec)) {
        fs::create_directories(dst, ec);
        for (fs::recursive_directory_iterator it(from, ec), end;
             !ec && it != end; it.increment(ec)) {
            const fs::path rel = fs::relative(it->path(), from, ec);
            const fs::path target = fs::path(dst) / rel;
            if (it->is_directory(ec)) {
                fs::create_directories(target, ec);
            } else if (it->is_regular_file(ec)) {
                total += it->file_size(ec);
                files.emplace_back(it->path(), target);
            }
        }
        if (ec) {
            err = "Cannot scan " + src + ": " + ec.message();
            return false;
        }
    } else {
        const fs::path parent = fs::path(dst).parent_path();
        if (!parent.empty())
            fs::create_directories(parent, ec);
        total = fs::file_size(from, ec);
        files.emplace_back(from, fs::path(dst));
    }

    std::uint64_t done = 0;
    if (progress)
        progress(0, total);
    for (const auto &f : files) {
        if (!copyFile(f.first.string(), f.second.string(), done, total, err,
                      progress, shouldCancel))
            return false;
    }
    return true;
}

bool LocalFileTransferExecutor::fetch(const std::string &locator,
                                      const std::string &destPath,
                                      std::string &err, ProgressCB progress,
                                      CancelCB shouldCancel) {
    const std::string src = resolveLocator(locator);
    std::error_code ec;
    if (!fs::is_regular_file(src, ec)) {
        err = "Catalog item not found: " + src;
        return false;
    }
    return copyTree(src, destPath, err, progress, shouldCancel);
}

bool LocalFileTransferExecutor::push(const std::string &srcPath,
                                     const std::string &device,
                                     std::string &err, ProgressCB progress,
                                     CancelCB shouldCancel) {
    if (devicesRoot_.empty()) {
        err = "No device storage configured";
        return false;
    }
    const fs::path deviceDir = fs::path(devicesRoot_) / device;
    std::error_code ec;
    if (!fs::is_directory(deviceDir, ec)) {
        err = "Device storage not mounted: " + deviceDir.string();
        return false;
    }
    const fs::path target = deviceDir / fs::path(srcPath).filename();
    return copyTree(srcPath, target.string(), err, progress, shouldCancel);
}

bool LocalFileTransferExecutor::upload(const std::string &srcPath,
                                       const std::string &locator,
                                       std::string &err, ProgressCB progress,
                                       CancelCB shouldCancel) {
    const std::string dst = resolveLocator(locator);
    if (dst.empty()) {
        err = "Empty upload destination";
        return false;
    }
    return copyTree(srcPath, dst, err, progress, shouldCancel);
}

} // namespace vrpkg
