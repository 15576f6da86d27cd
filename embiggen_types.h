#ifndef EMBIGGEN_TYPES_H
#define EMBIGGEN_TYPES_H

#include <array>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace embiggen {

// Characters that never need quoting on a shell command line
const std::string SHELL_SAFE_CHARS =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789.,_-+=:/%@";

constexpr uint64_t SECTOR_SIZE = 512;

class UnsupportedLayout : public std::runtime_error {
public:
    explicit UnsupportedLayout(const std::string& what)
        : std::runtime_error(what) {}
};

class MissingRequirement : public std::runtime_error {
public:
    explicit MissingRequirement(const std::string& what)
        : std::runtime_error(what) {}
};

class CommandError : public std::runtime_error {
public:
    CommandError(const std::string& command, int status, const std::string& output = "")
        : std::runtime_error(format(command, status, output)),
          command(command), status(status), output(output) {}

    std::string command;
    int status;
    std::string output;

private:
    static std::string format(const std::string& command, int status, const std::string& output) {
        std::string message = "command `" + command + "` failed";
        if (status >= 0) {
            message += " with status " + std::to_string(status);
        }
        if (!output.empty()) {
            message += ": " + output;
            if (message.back() == '\n') {
                message.pop_back();
            }
        }
        return message;
    }
};

class ProgressListener {
public:
    virtual void notify(const std::string& msg) = 0;
    virtual void debug(const std::string& msg) = 0;
    virtual void warn(const std::string& msg) = 0;
    [[noreturn]] virtual void bail(const std::string& msg, const std::exception& err) = 0;
    virtual ~ProgressListener() = default;
};

class DefaultProgressHandler : public ProgressListener {
public:
    explicit DefaultProgressHandler(bool verbose = false) : verbose(verbose) {}

    void notify(const std::string& msg) override {
        std::cout << "[INFO] " << msg << std::endl;
    }

    void debug(const std::string& msg) override {
        if (verbose) {
            std::cerr << "[DEBUG] " << msg << std::endl;
        }
    }

    void warn(const std::string& msg) override {
        std::cerr << "[WARN] " << msg << std::endl;
    }

    [[noreturn]] void bail(const std::string& msg, const std::exception& err) override {
        std::cerr << "[ERROR] " << msg << std::endl;
        throw std::runtime_error(msg + ": " + err.what());
    }

private:
    bool verbose;
};

class CLIProgressHandler : public ProgressListener {
public:
    explicit CLIProgressHandler(bool verbose = false) : verbose(verbose) {}

    void notify(const std::string& msg) override {
        std::cout << msg << std::endl;
    }

    void debug(const std::string& msg) override {
        if (verbose) {
            std::cerr << msg << std::endl;
        }
    }

    void warn(const std::string& msg) override {
        std::cerr << msg << std::endl;
    }

    [[noreturn]] void bail(const std::string& msg, const std::exception& err) override {
        std::cerr << msg << std::endl;
        if (verbose) {
            std::cerr << "(" << err.what() << ")" << std::endl;
        }
        std::exit(1);
    }

private:
    bool verbose;
};

inline std::string shell_quote(const std::string& arg) {
    if (!arg.empty() && arg.find_first_not_of(SHELL_SAFE_CHARS) == std::string::npos) {
        return arg;
    }
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

inline std::string join_cmd(const std::vector<std::string>& cmd) {
    std::string result;
    for (size_t i = 0; i < cmd.size(); ++i) {
        result += shell_quote(cmd[i]);
        if (i < cmd.size() - 1) result += " ";
    }
    return result;
}

inline int exit_status(int status) {
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

// Runs cmd and returns its standard output. Throws CommandError unless it exits 0.
inline std::string exec_command(const std::vector<std::string>& cmd, ProgressListener& progress) {
    std::string full_cmd = join_cmd(cmd);
    progress.debug("Executing: " + full_cmd);

    std::array<char, 256> buffer;
    std::string result;
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) {
        throw CommandError(full_cmd, -1, "popen failed");
    }
    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result += buffer.data();
    }

    int status = exit_status(pclose(pipe));
    if (status != 0) {
        throw CommandError(full_cmd, status, result);
    }
    return result;
}

// Runs cmd with input on its standard input, output goes to ours.
inline void quiet_call(const std::vector<std::string>& cmd, ProgressListener& progress,
                       const std::string& input = "") {
    std::string full_cmd = join_cmd(cmd);
    progress.debug("Executing: " + full_cmd);
    if (!input.empty()) progress.debug("Input:\n" + input);

    FILE* pipe = popen(full_cmd.c_str(), "w");
    if (!pipe) {
        throw CommandError(full_cmd, -1, "popen failed");
    }

    if (!input.empty()) {
        if (fputs(input.c_str(), pipe) == EOF) {
            pclose(pipe);
            throw CommandError(full_cmd, -1, "failed to write input");
        }
    }

    int status = exit_status(pclose(pipe));
    if (status != 0) {
        throw CommandError(full_cmd, status);
    }
}

inline std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(first, last - first + 1);
}

inline std::string aftersep(const std::string& line, const std::string& sep) {
    size_t pos = line.find(sep);
    if (pos == std::string::npos) {
        return "";
    }
    std::string result = line.substr(pos + sep.length());
    if (!result.empty() && result.back() == '\n') {
        result.pop_back();
    }
    return result;
}

// Overridable for tests, like the kernel's view of a chroot
inline std::string sysfs_root() {
    const char* root = std::getenv("EMBIGGEN_SYSFS_ROOT");
    return root && *root ? root : "/sys";
}

inline std::string procfs_root() {
    const char* root = std::getenv("EMBIGGEN_PROC_ROOT");
    return root && *root ? root : "/proc";
}

class Requirement {
public:
    static void require(const char* cmd, const char* pkg) {
        if (std::string(cmd).find('/') != std::string::npos) {
            throw MissingRequirement("Command '" + std::string(cmd) + "' should not contain a slash");
        }

        std::string check_cmd = "command -v " + std::string(cmd) + " > /dev/null 2>&1";
        int result = std::system(check_cmd.c_str());
        if (result != 0) {
            throw MissingRequirement("Command '" + std::string(cmd) +
                                     "' not found, please install the " + std::string(pkg) + " package");
        }
    }
};

class LVMReq : public Requirement {
public:
    static constexpr const char* cmd = "lvm";
    static constexpr const char* pkg = "lvm2";

    static void require() {
        Requirement::require(cmd, pkg);
    }
};

class ExtReq : public Requirement {
public:
    static constexpr const char* cmd = "resize2fs";
    static constexpr const char* pkg = "e2fsprogs";

    static void require() {
        Requirement::require(cmd, pkg);
    }
};

class XFSReq : public Requirement {
public:
    static constexpr const char* cmd = "xfs_growfs";
    static constexpr const char* pkg = "xfsprogs";

    static void require() {
        Requirement::require(cmd, pkg);
    }
};

class BlkidReq : public Requirement {
public:
    static constexpr const char* cmd = "blkid";
    static constexpr const char* pkg = "util-linux";

    static void require() {
        Requirement::require(cmd, pkg);
    }
};

class PartitionReq : public Requirement {
public:
    static void require() {
        Requirement::require("sfdisk", "util-linux");
        Requirement::require("partx", "util-linux");
    }
};

} // namespace embiggen

#endif // EMBIGGEN_TYPES_H
