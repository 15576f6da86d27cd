#include "lvm.h"
#include "chain_resolver.h"
#include <pcrecpp.h>
#include <sstream>

namespace embiggen {

namespace {

//   vg0,root,10737418240,4194304
const pcrecpp::RE lv_report_re("\\s*(?P<vg>[^,\\s]+),(?P<lv>[^,\\s]+),(?P<size>\\d+),(?P<free>\\d+)\\s*");

//   /dev/sda2,vg0,10733223936
// vg_name is empty for a PV that belongs to no VG
const pcrecpp::RE pv_report_re("\\s*(?P<pv>[^,\\s]+),(?P<vg>[^,\\s]*),(?P<size>\\d+)\\s*");

std::vector<std::string> report_cmd(const std::string& report, const std::string& fields) {
    return {"lvm", report, "--noheadings", "--nosuffix", "--units", "b",
            "--separator", ",", "-o", fields};
}

} // namespace

LvInfo parse_lv_report(const std::string& report) {
    std::istringstream lines(report);
    std::string line;
    while (std::getline(lines, line)) {
        if (trim(line).empty()) {
            continue;
        }
        LvInfo info;
        if (!lv_report_re.FullMatch(line, &info.vg_name, &info.lv_name, &info.lv_size, &info.vg_free)) {
            throw std::runtime_error("Unparsable lvs output: " + line);
        }
        return info;
    }
    throw std::runtime_error("Empty lvs output");
}

std::vector<PvInfo> parse_pv_report(const std::string& report) {
    std::vector<PvInfo> pvs;
    std::istringstream lines(report);
    std::string line;
    while (std::getline(lines, line)) {
        if (trim(line).empty()) {
            continue;
        }
        PvInfo pv;
        if (!pv_report_re.FullMatch(line, &pv.pv_name, &pv.vg_name, &pv.pv_size)) {
            throw std::runtime_error("Unparsable pvs output: " + line);
        }
        pvs.push_back(pv);
    }
    return pvs;
}

PvInfo single_pv_of(const std::vector<PvInfo>& pvs, const std::string& vg_name) {
    std::vector<PvInfo> members;
    for (const auto& pv : pvs) {
        if (pv.vg_name == vg_name) {
            members.push_back(pv);
        }
    }
    if (members.empty()) {
        throw UnsupportedLayout("VG " + vg_name + " has no physical volumes");
    }
    if (members.size() > 1) {
        throw UnsupportedLayout("VG " + vg_name + " has " + std::to_string(members.size()) +
                                " physical volumes, only single-PV VGs can be enlarged");
    }
    return members.front();
}

LvResizer::LvResizer(BlockDevice device, ProgressListener& progress)
    : ToolResizer(progress), device(std::move(device)) {
    LVMReq::require();
    LvInfo lv = info();
    vg_name = lv.vg_name;
    lv_name = lv.lv_name;
}

LvInfo LvResizer::info() {
    auto cmd = report_cmd("lvs", "vg_name,lv_name,lv_size,vg_free");
    cmd.push_back("--");
    // lvm reads a bare dm-N as a VG name, so address the LV by its mapper node
    cmd.push_back("/dev/mapper/" + device.dm_name());
    return parse_lv_report(exec_command(cmd, progress));
}

std::string LvResizer::describe() const {
    return "LVM LV " + vg_name + "/" + lv_name;
}

std::string LvResizer::state() {
    return "size=" + std::to_string(info().lv_size);
}

void LvResizer::resize(bool dry_run) {
    // lvextend refuses to extend by zero extents
    if (info().vg_free == 0) {
        progress.debug("No free extents in VG " + vg_name);
        return;
    }
    mutate(dry_run, {"lvm", "lvextend", "-l", "+100%FREE", "--", vg_name + "/" + lv_name});
}

std::shared_ptr<Resizer> LvResizer::dependency() {
    auto pvs = parse_pv_report(exec_command(report_cmd("pvs", "pv_name,vg_name,pv_size"), progress));
    return std::make_shared<PvResizer>(single_pv_of(pvs, vg_name).pv_name, progress);
}

PvResizer::PvResizer(std::string pv_name, ProgressListener& progress)
    : ToolResizer(progress), pv_name(std::move(pv_name)) {
}

std::string PvResizer::state() {
    auto cmd = report_cmd("pvs", "pv_name,vg_name,pv_size");
    cmd.push_back("--");
    cmd.push_back(pv_name);
    auto pvs = parse_pv_report(exec_command(cmd, progress));
    if (pvs.size() != 1) {
        throw std::runtime_error("Expected one report line for PV " + pv_name + ", got " +
                                 std::to_string(pvs.size()));
    }
    return "size=" + std::to_string(pvs.front().pv_size);
}

void PvResizer::resize(bool dry_run) {
    mutate(dry_run, {"lvm", "pvresize", "--", pv_name});
}

std::shared_ptr<Resizer> PvResizer::dependency() {
    return device_resizer(BlockDevice(pv_name), progress);
}

} // namespace embiggen
