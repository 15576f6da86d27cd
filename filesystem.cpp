#include "filesystem.h"
#include "chain_resolver.h"
#include <cerrno>
#include <cstring>
#include <sys/statvfs.h>
#include <uuid/uuid.h>

namespace embiggen {

Filesystem::Filesystem(BlockDevice device, std::string mount_point, std::string vfstype,
                       ProgressListener& progress)
    : ToolResizer(progress), device(std::move(device)),
      mount_point(std::move(mount_point)), vfstype(std::move(vfstype)) {
}

std::string Filesystem::state() {
    struct statvfs st;
    if (::statvfs(mount_point.c_str(), &st) != 0) {
        throw std::runtime_error("statvfs(" + mount_point + "): " + std::strerror(errno));
    }
    return "size=" + std::to_string(st.f_blocks) + " blocks";
}

std::shared_ptr<Resizer> Filesystem::dependency() {
    return device_resizer(device, progress);
}

std::string Filesystem::fsuuid() {
    BlkidReq::require();
    std::string value = trim(exec_command({"blkid", "-o", "value", "-s", "UUID", "--", device.devpath}, progress));

    uuid_t uuid;
    if (uuid_parse(value.c_str(), uuid) != 0) {
        throw std::runtime_error("blkid reported an invalid UUID for " + device.devpath + ": " + value);
    }
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return uuid_str;
}

void ExtFS::resize(bool dry_run) {
    ExtReq::require();
    // Online growth to the device size; prints "Nothing to do!" when already there
    mutate(dry_run, {"resize2fs", "--", device.devpath});
}

void XFS::resize(bool dry_run) {
    XFSReq::require();
    // xfs only grows while mounted, and is addressed by its mount point
    mutate(dry_run, {"xfs_growfs", "-d", mount_point});
}

bool is_supported_fs(const std::string& vfstype) {
    return vfstype == "ext2" || vfstype == "ext3" || vfstype == "ext4" || vfstype == XFS::vfstype_str;
}

std::shared_ptr<Filesystem> make_filesystem(const std::string& vfstype, BlockDevice device,
                                            const std::string& mount_point, ProgressListener& progress) {
    if (vfstype == "ext2" || vfstype == "ext3" || vfstype == "ext4") {
        return std::make_shared<ExtFS>(std::move(device), mount_point, vfstype, progress);
    } else if (vfstype == XFS::vfstype_str) {
        return std::make_shared<XFS>(std::move(device), mount_point, progress);
    }
    throw UnsupportedLayout("Unsupported filesystem type " + vfstype + " at " + mount_point);
}

} // namespace embiggen
