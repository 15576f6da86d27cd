#ifndef EMBIGGEN_TESTS_FAKE_SYSTEM_H
#define EMBIGGEN_TESTS_FAKE_SYSTEM_H

#include "tests/test_util.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>
#include <vector>

namespace embiggen {
namespace test {

/**
 * A throwaway sysfs, procfs and PATH under a temp directory.
 *
 * Tools added with add_tool are shell scripts that append their command
 * line to tools.log before running their body, so a test can read back
 * exactly what was executed.
 */
class FakeSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() / ("embiggen_test_system_" + std::to_string(::getpid()));
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "bin");
        std::filesystem::create_directories(root / "sys/dev/block");
        std::filesystem::create_directories(root / "sys/class/block");

        const char* path = std::getenv("PATH");
        saved_path = path ? path : "/usr/sbin:/usr/bin:/sbin:/bin";

        setenv("EMBIGGEN_SYSFS_ROOT", (root / "sys").c_str(), 1);
        setenv("EMBIGGEN_PROC_ROOT", (root / "proc").c_str(), 1);
        setenv("PATH", ((root / "bin").string() + ":" + saved_path).c_str(), 1);
    }

    void TearDown() override {
        unsetenv("EMBIGGEN_SYSFS_ROOT");
        unsetenv("EMBIGGEN_PROC_ROOT");
        setenv("PATH", saved_path.c_str(), 1);
        std::filesystem::remove_all(root);
    }

    void add_device(const std::filesystem::path& dir, const std::string& name, const std::string& devnum,
                    const std::string& sectors) {
        write(dir / "dev", devnum);
        write(dir / "size", sectors);
        write(dir / "uevent", "MAJOR=x\nMINOR=y\nDEVNAME=" + name + "\n");
        std::filesystem::create_directory_symlink(dir, root / "sys/dev/block" / devnum);
        std::filesystem::create_directory_symlink(dir, root / "sys/class/block" / name);
    }

    void add_tool(const std::string& name, const std::string& body) {
        std::filesystem::path tool = root / "bin" / name;
        write(tool, "#!/bin/sh\n"
                    "echo \"" + name + " $*\" >> '" + log_path() + "'\n" + body);
        using std::filesystem::perms;
        std::filesystem::permissions(tool, perms::owner_all | perms::group_read | perms::group_exec |
                                                   perms::others_read | perms::others_exec);
    }

    void set_mountinfo(const std::string& mountinfo) {
        write(root / "proc/self/mountinfo", mountinfo);
    }

    std::string log_path() const {
        return (root / "tools.log").string();
    }

    std::vector<std::string> tool_log() const {
        std::vector<std::string> lines;
        std::ifstream log(log_path());
        std::string line;
        while (std::getline(log, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    static void write(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << content << "\n";
    }

    std::filesystem::path root;
    std::string saved_path;
    RecordingProgress progress;
};

} // namespace test
} // namespace embiggen

#endif // EMBIGGEN_TESTS_FAKE_SYSTEM_H
