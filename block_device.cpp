#include "block_device.h"
#include <filesystem>
#include <fstream>
#include <pcrecpp.h>

namespace embiggen {

namespace fs = std::filesystem;

BlockDevice::BlockDevice(const std::string& devpath) {
    // /dev/mapper/ names and /dev/disk/by-* are links to the kernel name
    std::error_code ec;
    fs::path node = fs::canonical(devpath, ec);
    if (ec) {
        node = fs::path(devpath).lexically_normal();
    }

    std::string sd = sysfs_root() + "/class/block/" + node.filename().string();
    if (!fs::exists(sd)) {
        throw std::runtime_error(devpath + " is not a block device known to sysfs");
    }
    this->devpath = devpath;
    this->sysdir = fs::canonical(sd).string();
}

BlockDevice::BlockDevice(std::string devpath, std::string sysdir)
    : devpath(std::move(devpath)), sysdir(std::move(sysdir)) {
}

BlockDevice BlockDevice::by_devnum(int major, int minor) {
    std::string sd = sysfs_root() + "/dev/block/" + std::to_string(major) + ":" + std::to_string(minor);
    if (!fs::exists(sd)) {
        throw std::runtime_error("no block device with number " +
                                 std::to_string(major) + ":" + std::to_string(minor));
    }
    return from_sysdir(sd);
}

BlockDevice BlockDevice::from_sysdir(const std::string& sd) {
    std::string canonical = fs::canonical(sd).string();
    std::string devpath = devpath_from_sysdir(canonical);
    if (devpath.empty()) {
        throw std::runtime_error("no DEVNAME in " + canonical + "/uevent");
    }
    return BlockDevice(devpath, canonical);
}

std::string BlockDevice::read_attr(const std::string& name) const {
    std::ifstream attr(sysdir + "/" + name);
    if (!attr) {
        throw std::runtime_error("Failed to read " + sysdir + "/" + name);
    }
    std::string content;
    std::getline(attr, content);
    return trim(content);
}

uint64_t BlockDevice::read_uint_attr(const std::string& name) const {
    static const pcrecpp::RE uint_re("(\\d+)");
    std::string content = read_attr(name);
    uint64_t value = 0;
    if (!uint_re.FullMatch(content, &value)) {
        throw std::runtime_error("Unexpected content in " + sysdir + "/" + name + ": " + content);
    }
    return value;
}

std::pair<int, int> BlockDevice::devnum() const {
    static const pcrecpp::RE devnum_re("(\\d+):(\\d+)");
    std::string content = read_attr("dev");
    int major = 0, minor = 0;
    if (!devnum_re.FullMatch(content, &major, &minor)) {
        throw std::runtime_error("Unexpected device number for " + devpath + ": " + content);
    }
    return {major, minor};
}

uint64_t BlockDevice::size_sectors() const {
    // sysfs counts 512-byte sectors whatever the logical block size
    return read_uint_attr("size");
}

uint64_t BlockDevice::size() const {
    return size_sectors() * SECTOR_SIZE;
}

bool BlockDevice::is_dm() const {
    return fs::exists(sysdir + "/dm");
}

bool BlockDevice::is_lv() const {
    if (!is_dm()) {
        return false;
    }
    // LVM tags its mappings with a dm uuid of LVM-<vg uuid><lv uuid>
    return read_attr("dm/uuid").rfind("LVM-", 0) == 0;
}

std::string BlockDevice::dm_name() const {
    return read_attr("dm/name");
}

bool BlockDevice::is_partition() const {
    return fs::exists(sysdir + "/partition");
}

int BlockDevice::partition_number() const {
    return static_cast<int>(read_uint_attr("partition"));
}

uint64_t BlockDevice::partition_start() const {
    return read_uint_attr("start");
}

BlockDevice BlockDevice::parent_disk() const {
    if (!is_partition()) {
        throw std::runtime_error(devpath + " is not a partition");
    }
    return from_sysdir(fs::path(sysdir).parent_path().string());
}

std::string devpath_from_sysdir(const std::string& sd) {
    std::ifstream uevent(sd + "/uevent");
    std::string line;
    while (std::getline(uevent, line)) {
        if (line.find("DEVNAME=") == 0) {
            return "/dev/" + aftersep(line, "=");
        }
    }
    return "";
}

std::string BlockDeviceResizer::state() {
    return "size=" + std::to_string(device.size());
}

} // namespace embiggen
