#include "chain_resolver.h"
#include "filesystem.h"
#include "lvm.h"
#include "partition.h"
#include <filesystem>
#include <fstream>
#include <pcrecpp.h>
#include <sstream>

namespace embiggen {

namespace {

// 36 35 98:0 /mnt1 /mnt2 rw,noatime master:1 - ext3 /dev/root rw,errors=continue
const pcrecpp::RE mountinfo_re(
        "\\d+ \\d+ (\\d+):(\\d+) (\\S+) (\\S+) \\S+(?: \\S+)* - (\\S+) (\\S+) \\S+\\s*");

bool is_octal(char c) {
    return c >= '0' && c <= '7';
}

} // namespace

std::optional<MountEntry> parse_mountinfo_line(const std::string& line) {
    MountEntry entry;
    std::string root, mnt, source;
    if (!mountinfo_re.FullMatch(line, &entry.major, &entry.minor, &root, &mnt, &entry.fstype, &source)) {
        return std::nullopt;
    }
    entry.root = unescape_mount_path(root);
    entry.mount_point = unescape_mount_path(mnt);
    entry.source = unescape_mount_path(source);
    return entry;
}

std::string unescape_mount_path(const std::string& path) {
    std::string result;
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '\\' && i + 3 < path.size() &&
            is_octal(path[i + 1]) && is_octal(path[i + 2]) && is_octal(path[i + 3])) {
            result += static_cast<char>(std::stoi(path.substr(i + 1, 3), nullptr, 8));
            i += 3;
        } else {
            result += path[i];
        }
    }
    return result;
}

std::string normalize_mount_point(const std::string& mount_point) {
    std::string normal = std::filesystem::path(mount_point).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

std::optional<MountEntry> find_mount(const std::string& mountinfo, const std::string& mount_point) {
    std::string wanted = normalize_mount_point(mount_point);
    std::optional<MountEntry> found;

    std::istringstream lines(mountinfo);
    std::string line;
    while (std::getline(lines, line)) {
        auto entry = parse_mountinfo_line(line);
        if (entry && entry->mount_point == wanted) {
            found = entry;
        }
    }
    return found;
}

std::shared_ptr<Resizer> device_resizer(const BlockDevice& device, ProgressListener& progress) {
    if (device.is_lv()) {
        return std::make_shared<LvResizer>(device, progress);
    } else if (device.is_dm()) {
        throw UnsupportedLayout(device.devpath + " is a device-mapper device but not an LVM LV");
    } else if (device.is_partition()) {
        return std::make_shared<PartitionResizer>(device, progress);
    }
    return std::make_shared<BlockDeviceResizer>(device);
}

std::shared_ptr<Resizer> resolve_chain(const std::string& mount_point, const Options& options,
                                       ProgressListener& progress) {
    std::string path = procfs_root() + "/self/mountinfo";
    std::ifstream mountinfo(path);
    if (!mountinfo) {
        throw std::runtime_error("Failed to read " + path + ", embiggen-disk only runs on Linux.");
    }
    std::stringstream content;
    content << mountinfo.rdbuf();

    auto entry = find_mount(content.str(), mount_point);
    if (!entry) {
        throw UnsupportedLayout(mount_point + " is not a mount point");
    }
    if (!is_supported_fs(entry->fstype)) {
        throw UnsupportedLayout("Unsupported filesystem type " + entry->fstype + " at " + entry->mount_point);
    }

    BlockDevice device = BlockDevice::by_devnum(entry->major, entry->minor);
    auto fs = make_filesystem(entry->fstype, device, entry->mount_point, progress);

    progress.debug("resolve_chain(" + mount_point + ") = " + fs->describe() + " on " + device.devpath);
    if (options.verbose) {
        try {
            progress.debug("  filesystem UUID " + fs->fsuuid());
        } catch (const std::exception& e) {
            progress.debug("  filesystem UUID unavailable: " + std::string(e.what()));
        }
    }
    return fs;
}

} // namespace embiggen
