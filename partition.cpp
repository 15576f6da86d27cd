#include "partition.h"
#include <algorithm>
#include <limits>
#include <pcrecpp.h>
#include <sstream>

namespace embiggen {

namespace {

// sfdisk aligns partition ends to 1MiB, growth smaller than that is not possible
constexpr uint64_t PARTITION_GRAIN_BYTES = 1024ULL * 1024ULL;

// 128 entries of 128 bytes, plus the header sector
constexpr uint64_t GPT_ENTRIES_BYTES = 128ULL * 128ULL;

// An MBR entry stores the size in 32 bits
constexpr uint64_t DOS_MAX_SECTORS = std::numeric_limits<uint32_t>::max();

// /dev/sda1 : start=        2048, size=      204800, type=83, bootable
const pcrecpp::RE sfdisk_part_re(
        "(?P<node>/\\S+)\\s*:\\s*start=\\s*(?P<start>\\d+),\\s*size=\\s*(?P<size>\\d+)(?:,.*)?\\s*");

// label: gpt
const pcrecpp::RE sfdisk_header_re("(?P<key>[a-z-]+):\\s*(?P<value>.*?)\\s*");

uint64_t intdiv_up(uint64_t num, uint64_t denom) {
    return (num - 1) / denom + 1;
}

} // namespace

SfdiskDump parse_sfdisk_dump(const std::string& text) {
    static const pcrecpp::RE number_re("(\\d+)");

    SfdiskDump dump;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (trim(line).empty()) {
            continue;
        }

        SfdiskPartition part;
        if (sfdisk_part_re.FullMatch(line, &part.node, &part.start, &part.size)) {
            dump.partitions.push_back(part);
            continue;
        }

        std::string key, value;
        if (!sfdisk_header_re.FullMatch(line, &key, &value)) {
            continue;
        }
        if (key == "label") {
            dump.label = value;
        } else if (key == "device") {
            dump.device = value;
        } else if (key == "last-lba") {
            uint64_t lba = 0;
            if (!number_re.FullMatch(value, &lba)) {
                throw std::runtime_error("Unparsable last-lba in sfdisk dump: " + value);
            }
            dump.last_lba = lba;
        } else if (key == "sector-size") {
            if (!number_re.FullMatch(value, &dump.sector_size) || dump.sector_size == 0) {
                throw std::runtime_error("Unparsable sector-size in sfdisk dump: " + value);
            }
        }
    }

    if (dump.label.empty()) {
        throw std::runtime_error("No partition table label in sfdisk dump");
    }
    return dump;
}

uint64_t usable_end(const SfdiskDump& dump, uint64_t disk_units) {
    if (dump.label == "gpt") {
        // The backup header and entries live at the very end of the disk.
        // The dump's last-lba still points at the old end until sfdisk
        // rewrites the table, so go by the current disk size.
        uint64_t reserved = intdiv_up(GPT_ENTRIES_BYTES, dump.sector_size) + 1;
        return disk_units - 1 - reserved;
    }
    if (dump.label == "dos") {
        return disk_units - 1;
    }
    throw UnsupportedLayout("Unsupported partition table type: " + dump.label);
}

uint64_t room_after(const SfdiskDump& dump, uint64_t part_start, uint64_t disk_units) {
    auto it = std::find_if(dump.partitions.begin(), dump.partitions.end(),
                           [part_start](const SfdiskPartition& p) { return p.start == part_start; });
    if (it == dump.partitions.end()) {
        throw std::runtime_error("No partition starting at sector " + std::to_string(part_start) +
                                 " in the table of " + dump.device);
    }

    uint64_t end = it->start + it->size - 1;
    uint64_t limit = usable_end(dump, disk_units);

    for (const auto& other : dump.partitions) {
        if (other.start > it->start) {
            limit = std::min(limit, other.start - 1);
        }
    }
    if (dump.label == "dos") {
        limit = std::min(limit, it->start + DOS_MAX_SECTORS - 1);
    }

    return limit > end ? limit - end : 0;
}

PartitionResizer::PartitionResizer(BlockDevice device, ProgressListener& progress)
    : ToolResizer(progress), device(std::move(device)) {
}

std::string PartitionResizer::state() {
    return "size=" + std::to_string(device.size_sectors()) + " sectors";
}

void PartitionResizer::resize(bool dry_run) {
    PartitionReq::require();

    BlockDevice disk = device.parent_disk();
    SfdiskDump dump = parse_sfdisk_dump(exec_command({"sfdisk", "--dump", disk.devpath}, progress));

    // sysfs positions are in 512-byte sectors, the dump is in logical sectors
    uint64_t part_start = device.partition_start() * SECTOR_SIZE / dump.sector_size;
    uint64_t disk_units = disk.size() / dump.sector_size;
    uint64_t room = room_after(dump, part_start, disk_units);
    uint64_t grain = PARTITION_GRAIN_BYTES / dump.sector_size;

    if (room < grain) {
        progress.debug("No room to grow " + describe() + " (" + std::to_string(room) + " free sectors)");
        return;
    }

    std::string nr = std::to_string(device.partition_number());
    // The partition is in use, so write the table without a reread and
    // let partx tell the kernel about the one partition that changed.
    mutate(dry_run, {"sfdisk", "--no-reread", "--no-tell-kernel", "-N", nr, disk.devpath}, ", +\n");
    mutate(dry_run, {"partx", "--update", "--nr", nr, disk.devpath});
}

std::shared_ptr<Resizer> PartitionResizer::dependency() {
    return std::make_shared<BlockDeviceResizer>(device.parent_disk());
}

} // namespace embiggen
