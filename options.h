#ifndef EMBIGGEN_OPTIONS_H
#define EMBIGGEN_OPTIONS_H

#include <chrono>
#include <iosfwd>
#include <stdexcept>
#include <string>

namespace embiggen {

// Positional argument that installs the service instead of resizing
constexpr const char* SYSTEMD_TARGET = "systemd";

constexpr std::chrono::seconds DAEMON_INTERVAL{10};

struct Options {
    // Mount point to enlarge, or SYSTEMD_TARGET
    std::string target;
    bool dry_run = false;
    bool verbose = false;
    bool daemon = false;
    // Unit restarted after changes, empty for none
    std::string restart_unit = "kubelet";
    std::chrono::milliseconds interval = DAEMON_INTERVAL;
};

class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

void print_help(std::ostream& os);

// Throws UsageError for anything but exactly one positional argument and known flags
Options parse_options(int argc, char* argv[]);

} // namespace embiggen

#endif // EMBIGGEN_OPTIONS_H
