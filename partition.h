#ifndef EMBIGGEN_PARTITION_H
#define EMBIGGEN_PARTITION_H

#include "block_device.h"
#include "resizer.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace embiggen {

struct SfdiskPartition {
    std::string node;
    uint64_t start = 0;
    uint64_t size = 0;
};

// The parts of `sfdisk --dump` output needed to find free space.
// Positions are in units of sector_size.
struct SfdiskDump {
    std::string label;
    std::string device;
    std::optional<uint64_t> last_lba;
    uint64_t sector_size = SECTOR_SIZE;
    std::vector<SfdiskPartition> partitions;
};

SfdiskDump parse_sfdisk_dump(const std::string& text);

// Last sector a partition may use on a disk of disk_units sectors
uint64_t usable_end(const SfdiskDump& dump, uint64_t disk_units);

// Free sectors directly after the partition starting at part_start
uint64_t room_after(const SfdiskDump& dump, uint64_t part_start, uint64_t disk_units);

class PartitionResizer : public ToolResizer {
public:
    PartitionResizer(BlockDevice device, ProgressListener& progress);

    std::string describe() const override { return "partition " + device.devpath; }
    std::string state() override;
    void resize(bool dry_run) override;
    std::shared_ptr<Resizer> dependency() override;

    BlockDevice device;
};

} // namespace embiggen

#endif // EMBIGGEN_PARTITION_H
