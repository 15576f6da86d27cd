#ifndef EMBIGGEN_FILESYSTEM_H
#define EMBIGGEN_FILESYSTEM_H

#include "block_device.h"
#include "resizer.h"
#include <memory>
#include <string>
#include <utility>

namespace embiggen {

/**
 * A mounted filesystem. Both supported types grow online to fill their
 * device, so a resize is a single tool call and a no-op when the device
 * has not grown.
 */
class Filesystem : public ToolResizer {
public:
    Filesystem(BlockDevice device, std::string mount_point, std::string vfstype,
               ProgressListener& progress);

    std::string describe() const override { return vfstype + " filesystem at " + mount_point; }
    std::string state() override;
    std::shared_ptr<Resizer> dependency() override;

    // Canonical lowercase UUID as reported by blkid
    std::string fsuuid();

    BlockDevice device;
    std::string mount_point;
    std::string vfstype;
};

class ExtFS : public Filesystem {
public:
    ExtFS(BlockDevice device, std::string mount_point, std::string vfstype, ProgressListener& progress)
        : Filesystem(std::move(device), std::move(mount_point), std::move(vfstype), progress) {}

    void resize(bool dry_run) override;
};

class XFS : public Filesystem {
public:
    XFS(BlockDevice device, std::string mount_point, ProgressListener& progress)
        : Filesystem(std::move(device), std::move(mount_point), vfstype_str, progress) {}

    void resize(bool dry_run) override;

    static constexpr const char* vfstype_str = "xfs";
};

bool is_supported_fs(const std::string& vfstype);

std::shared_ptr<Filesystem> make_filesystem(const std::string& vfstype, BlockDevice device,
                                            const std::string& mount_point, ProgressListener& progress);

} // namespace embiggen

#endif // EMBIGGEN_FILESYSTEM_H
