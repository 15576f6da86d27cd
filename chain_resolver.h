#ifndef EMBIGGEN_CHAIN_RESOLVER_H
#define EMBIGGEN_CHAIN_RESOLVER_H

#include "block_device.h"
#include "options.h"
#include "resizer.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace embiggen {

// One line of /proc/self/mountinfo
struct MountEntry {
    int major = 0;
    int minor = 0;
    std::string root;
    std::string mount_point;
    std::string fstype;
    std::string source;
};

std::optional<MountEntry> parse_mountinfo_line(const std::string& line);

// Undo the octal escapes (\040 and friends) the kernel puts in paths
std::string unescape_mount_path(const std::string& path);

// "/mnt/data/" and "/mnt//data" both name "/mnt/data"
std::string normalize_mount_point(const std::string& mount_point);

// The mount visible at mount_point; later entries shadow earlier ones
std::optional<MountEntry> find_mount(const std::string& mountinfo, const std::string& mount_point);

// Resizer for a device a filesystem or PV sits on
std::shared_ptr<Resizer> device_resizer(const BlockDevice& device, ProgressListener& progress);

// Top of the chain for the filesystem mounted at mount_point
std::shared_ptr<Resizer> resolve_chain(const std::string& mount_point, const Options& options,
                                       ProgressListener& progress);

using ChainResolver = std::function<std::shared_ptr<Resizer>(const std::string& mount_point)>;

} // namespace embiggen

#endif // EMBIGGEN_CHAIN_RESOLVER_H
