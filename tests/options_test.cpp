#include "options.h"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace embiggen {
namespace {

Options parse(std::vector<std::string> args) {
    args.insert(args.begin(), "embiggen-disk");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return parse_options(static_cast<int>(args.size()), argv.data());
}

TEST(OptionsTest, Defaults) {
    Options options = parse({"/"});

    EXPECT_EQ(options.target, "/");
    EXPECT_FALSE(options.dry_run);
    EXPECT_FALSE(options.verbose);
    EXPECT_FALSE(options.daemon);
    EXPECT_EQ(options.restart_unit, "kubelet");
    EXPECT_EQ(options.interval, std::chrono::seconds(10));
}

TEST(OptionsTest, SingleDashFlags) {
    Options options = parse({"-verbose", "-daemon", "-dry-run", "/"});

    EXPECT_TRUE(options.verbose);
    EXPECT_TRUE(options.daemon);
    EXPECT_TRUE(options.dry_run);
    EXPECT_EQ(options.target, "/");
}

TEST(OptionsTest, DoubleDashFlags) {
    Options options = parse({"--dry-run", "--restart-unit", "", "/var/lib/data"});

    EXPECT_TRUE(options.dry_run);
    EXPECT_EQ(options.restart_unit, "");
    EXPECT_EQ(options.target, "/var/lib/data");
}

TEST(OptionsTest, RestartUnitWithEquals) {
    Options options = parse({"-restart-unit=containerd", "/"});

    EXPECT_EQ(options.restart_unit, "containerd");
}

TEST(OptionsTest, SystemdTarget) {
    EXPECT_EQ(parse({"systemd"}).target, SYSTEMD_TARGET);
}

TEST(OptionsTest, NeedsExactlyOnePositional) {
    EXPECT_THROW(parse({}), UsageError);
    EXPECT_THROW(parse({"-verbose"}), UsageError);
    EXPECT_THROW(parse({"/", "/srv"}), UsageError);
}

TEST(OptionsTest, FlagsAfterTheMountPointAreNotFlags) {
    EXPECT_THROW(parse({"/", "-verbose"}), UsageError);
}

TEST(OptionsTest, RejectsUnknownFlags) {
    EXPECT_THROW(parse({"-shrink", "/"}), UsageError);
    EXPECT_THROW(parse({"--restart-unit"}), UsageError);
}

TEST(OptionsTest, HelpIsAUsageError) {
    EXPECT_THROW(parse({"-help"}), UsageError);
}

TEST(OptionsTest, UsageNamesEveryFlag) {
    std::ostringstream usage;
    print_help(usage);

    EXPECT_NE(usage.str().find("embiggen-disk [flags] <mount-point-to-enlarge>"), std::string::npos);
    EXPECT_NE(usage.str().find("-dry-run"), std::string::npos);
    EXPECT_NE(usage.str().find("-verbose"), std::string::npos);
    EXPECT_NE(usage.str().find("-daemon"), std::string::npos);
    EXPECT_NE(usage.str().find("-restart-unit"), std::string::npos);
}

} // namespace
} // namespace embiggen
