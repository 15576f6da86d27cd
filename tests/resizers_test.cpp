#include "chain_resolver.h"
#include "filesystem.h"
#include "lvm.h"
#include "partition.h"
#include "tests/fake_system.h"

#include <filesystem>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>

namespace embiggen {
namespace {

namespace fs = std::filesystem;

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

// 100G GPT layout of sda as written before the disk grew to 150G
const char kSdaDump[] =
        "label: gpt\n"
        "label-id: 5A7B1C2D-3E4F-4A5B-8C6D-7E8F9A0B1C2D\n"
        "device: /dev/sda\n"
        "unit: sectors\n"
        "first-lba: 34\n"
        "last-lba: 209715166\n"
        "sector-size: 512\n"
        "\n"
        "/dev/sda1 : start=        2048, size=   209713119, type=E6D6D379-F507-44C2-A23C-238F2A3DF928\n";

const char kLvsQuery[] =
        "lvm lvs --noheadings --nosuffix --units b --separator , -o vg_name,lv_name,lv_size,vg_free -- "
        "/dev/mapper/vg0-root";

/**
 * ext4 on LV vg0/root (dm-0), on PV sda1, on a 150G sda. The mount point
 * is a real directory so statvfs works on it.
 */
class ResizersTest : public test::FakeSystemTest {
protected:
    void SetUp() override {
        FakeSystemTest::SetUp();

        sda = root / "sys/devices/pci0000:00/block/sda";
        add_device(sda, "sda", "8:0", "314572800");
        fs::path sda1 = sda / "sda1";
        add_device(sda1, "sda1", "8:1", "209713119");
        write(sda1 / "partition", "1");
        write(sda1 / "start", "2048");
        fs::path dm0 = root / "sys/devices/virtual/block/dm-0";
        add_device(dm0, "dm-0", "253:0", "209707008");
        write(dm0 / "dm/uuid", "LVM-Wq3bBc2Xh1fTzPn0yJ6dG4kS8mR7vL5eA9uH2iO3pN4qM5rK6sJ7tI8wE0xD1yC2");
        write(dm0 / "dm/name", "vg0-root");

        mnt = (root / "mnt").string();
        fs::create_directories(mnt);
        set_mountinfo("29 1 253:0 / " + mnt + " rw,relatime shared:1 - ext4 /dev/mapper/vg0-root rw\n");

        write(root / "sda.dump", kSdaDump);
        add_tool("sfdisk", "case \"$1\" in\n"
                           "--dump) cat '" + (root / "sda.dump").string() + "' ;;\n"
                           "*) cat >> '" + log_path() + "' ;;\n"
                           "esac");
        add_tool("partx", "");
        add_tool("resize2fs", "");
        fake_lvm(4194304);
    }

    void fake_lvm(uint64_t vg_free) {
        add_tool("lvm", "case \"$1\" in\n"
                        "lvs) echo \"  vg0,root,107374182400," + std::to_string(vg_free) + "\" ;;\n"
                        "pvs) echo \"  /dev/sda1,vg0,107372085248\" ;;\n"
                        "esac");
    }

    fs::path sda;
    std::string mnt;
    Options options;
};

TEST_F(ResizersTest, AddressesLogicalVolumeByMapperName) {
    auto top = resolve_chain(mnt, options, progress);
    EXPECT_EQ(top->describe(), "ext4 filesystem at " + mnt);

    auto lv = top->dependency();

    ASSERT_NE(std::dynamic_pointer_cast<LvResizer>(lv), nullptr);
    EXPECT_EQ(lv->describe(), "LVM LV vg0/root");
    EXPECT_EQ(lv->state(), "size=107374182400");
    EXPECT_THAT(tool_log(), Contains(kLvsQuery));
    EXPECT_THAT(tool_log(), Not(Contains(HasSubstr("/dev/dm-0"))));
}

TEST_F(ResizersTest, LogicalVolumeRestsOnItsPhysicalVolume) {
    LvResizer lv(BlockDevice::by_devnum(253, 0), progress);

    auto pv = lv.dependency();

    ASSERT_NE(pv, nullptr);
    EXPECT_EQ(pv->describe(), "LVM PV /dev/sda1");
    EXPECT_EQ(pv->state(), "size=107372085248");
    EXPECT_THAT(tool_log(), Contains("lvm pvs --noheadings --nosuffix --units b --separator , "
                                     "-o pv_name,vg_name,pv_size -- /dev/sda1"));

    auto part = pv->dependency();
    ASSERT_NE(part, nullptr);
    EXPECT_EQ(part->describe(), "partition /dev/sda1");
}

TEST_F(ResizersTest, PhysicalVolumeOnWholeDisk) {
    PvResizer pv("/dev/sda", progress);

    auto disk = pv.dependency();

    ASSERT_NE(disk, nullptr);
    EXPECT_EQ(disk->describe(), "block device /dev/sda");
}

TEST_F(ResizersTest, FullVolumeGroupLeavesLogicalVolumeAlone) {
    fake_lvm(0);
    LvResizer lv(BlockDevice::by_devnum(253, 0), progress);

    lv.resize(false);

    EXPECT_THAT(tool_log(), Not(Contains(HasSubstr("lvextend"))));
    EXPECT_THAT(progress.notes, IsEmpty());
}

TEST_F(ResizersTest, ExtendsIntoFreeExtents) {
    LvResizer lv(BlockDevice::by_devnum(253, 0), progress);
    PvResizer pv("/dev/sda1", progress);

    pv.resize(false);
    lv.resize(false);

    EXPECT_THAT(tool_log(), Contains("lvm pvresize -- /dev/sda1"));
    EXPECT_THAT(tool_log(), Contains("lvm lvextend -l +100%FREE -- vg0/root"));
}

TEST_F(ResizersTest, GrowsPartitionIntoFreeSpace) {
    auto part = device_resizer(BlockDevice::by_devnum(8, 1), progress);

    part->resize(false);

    EXPECT_THAT(tool_log(), ElementsAre("sfdisk --dump /dev/sda",
                                        "sfdisk --no-reread --no-tell-kernel -N 1 /dev/sda",
                                        ", +",
                                        "partx --update --nr 1 /dev/sda"));
}

TEST_F(ResizersTest, FullPartitionIsLeftAlone) {
    // The disk has not grown past what the table already covers
    write(sda / "size", "209715200");
    auto part = device_resizer(BlockDevice::by_devnum(8, 1), progress);

    part->resize(false);

    EXPECT_THAT(tool_log(), ElementsAre("sfdisk --dump /dev/sda"));
}

TEST_F(ResizersTest, DryRunReportsEveryMutationInChainOrder) {
    auto top = resolve_chain(mnt, options, progress);

    ResizeOutcome outcome = resize_chain(*top, true, progress);

    EXPECT_TRUE(outcome.ok());
    EXPECT_THAT(outcome.changes, IsEmpty());
    EXPECT_THAT(progress.notes, ElementsAre(
            "dry-run: would run sfdisk --no-reread --no-tell-kernel -N 1 /dev/sda",
            "dry-run: would run partx --update --nr 1 /dev/sda",
            "dry-run: would run lvm pvresize -- /dev/sda1",
            "dry-run: would run lvm lvextend -l +100%FREE -- vg0/root",
            "dry-run: would run resize2fs -- /dev/dm-0"));
    for (const auto& line : tool_log()) {
        EXPECT_THAT(line, Not(HasSubstr("--no-tell-kernel")));
        EXPECT_THAT(line, Not(HasSubstr("partx")));
        EXPECT_THAT(line, Not(HasSubstr("pvresize")));
        EXPECT_THAT(line, Not(HasSubstr("lvextend")));
        EXPECT_THAT(line, Not(HasSubstr("resize2fs")));
    }
}

TEST_F(ResizersTest, FilesystemUuidIsCanonicalised) {
    add_tool("blkid", "echo 0B8F2A4E-1C2D-4E5F-8A9B-0C1D2E3F4A5B");
    auto top = std::dynamic_pointer_cast<Filesystem>(resolve_chain(mnt, options, progress));
    ASSERT_NE(top, nullptr);

    EXPECT_EQ(top->fsuuid(), "0b8f2a4e-1c2d-4e5f-8a9b-0c1d2e3f4a5b");
    EXPECT_THAT(tool_log(), Contains("blkid -o value -s UUID -- /dev/dm-0"));
}

TEST_F(ResizersTest, FilesystemUuidNeedsBlkid) {
    auto top = std::dynamic_pointer_cast<Filesystem>(resolve_chain(mnt, options, progress));
    ASSERT_NE(top, nullptr);
    setenv("PATH", (root / "bin").c_str(), 1);

    EXPECT_THROW(top->fsuuid(), MissingRequirement);
}

} // namespace
} // namespace embiggen
