#ifndef EMBIGGEN_LVM_H
#define EMBIGGEN_LVM_H

#include "block_device.h"
#include "resizer.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace embiggen {

struct LvInfo {
    std::string vg_name;
    std::string lv_name;
    uint64_t lv_size = 0;
    uint64_t vg_free = 0;
};

struct PvInfo {
    std::string pv_name;
    std::string vg_name;
    uint64_t pv_size = 0;
};

// `lvm lvs --separator , -o vg_name,lv_name,lv_size,vg_free` with byte units
LvInfo parse_lv_report(const std::string& report);

// `lvm pvs --separator , -o pv_name,vg_name,pv_size` with byte units
std::vector<PvInfo> parse_pv_report(const std::string& report);

// The only PV of vg_name; LVs spanning several PVs are not supported
PvInfo single_pv_of(const std::vector<PvInfo>& pvs, const std::string& vg_name);

class LvResizer : public ToolResizer {
public:
    LvResizer(BlockDevice device, ProgressListener& progress);

    std::string describe() const override;
    std::string state() override;
    void resize(bool dry_run) override;
    std::shared_ptr<Resizer> dependency() override;

    BlockDevice device;

private:
    LvInfo info();

    // Names are looked up once, sizes are always re-read
    std::string vg_name;
    std::string lv_name;
};

class PvResizer : public ToolResizer {
public:
    PvResizer(std::string pv_name, ProgressListener& progress);

    std::string describe() const override { return "LVM PV " + pv_name; }
    std::string state() override;
    void resize(bool dry_run) override;
    std::shared_ptr<Resizer> dependency() override;

    std::string pv_name;
};

} // namespace embiggen

#endif // EMBIGGEN_LVM_H
