#ifndef EMBIGGEN_BLOCK_DEVICE_H
#define EMBIGGEN_BLOCK_DEVICE_H

#include "embiggen_types.h"
#include "resizer.h"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace embiggen {

/**
 * A kernel block device, looked at through sysfs.
 *
 * Nothing is memoized: every accessor reads the live attribute, so a disk
 * that the hypervisor grew reports its new size on the next call.
 */
class BlockDevice {
public:
    // devpath may be a symlink such as /dev/mapper/vg0-root
    explicit BlockDevice(const std::string& devpath);

    static BlockDevice by_devnum(int major, int minor);
    static BlockDevice from_sysdir(const std::string& sysdir);

    std::string sysfspath() const { return sysdir; }
    std::pair<int, int> devnum() const;

    uint64_t size() const;
    uint64_t size_sectors() const;

    bool is_dm() const;
    bool is_lv() const;
    // The /dev/mapper/ name of a dm device, e.g. vg0-root
    std::string dm_name() const;

    bool is_partition() const;
    int partition_number() const;
    uint64_t partition_start() const;
    BlockDevice parent_disk() const;

    std::string devpath;

private:
    BlockDevice(std::string devpath, std::string sysdir);

    std::string read_attr(const std::string& name) const;
    uint64_t read_uint_attr(const std::string& name) const;

    std::string sysdir;
};

std::string devpath_from_sysdir(const std::string& sd);

/**
 * The raw disk at the bottom of every chain. The hypervisor grows it, so
 * resizing is a no-op and it has no dependency.
 */
class BlockDeviceResizer : public Resizer {
public:
    explicit BlockDeviceResizer(BlockDevice device) : device(std::move(device)) {}

    std::string describe() const override { return "block device " + device.devpath; }
    std::string state() override;
    void resize(bool) override {}
    std::shared_ptr<Resizer> dependency() override { return nullptr; }

    BlockDevice device;
};

} // namespace embiggen

#endif // EMBIGGEN_BLOCK_DEVICE_H
