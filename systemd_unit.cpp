#include "systemd_unit.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

namespace embiggen {

std::string unit_file_text(const std::string& bindir) {
    return "[Unit]\n"
           "Description=embiggen-disk\n"
           "\n"
           "[Service]\n"
           "ExecStart=" + bindir + "/embiggen-disk -verbose -daemon /\n"
           "\n"
           "[Install]\n"
           "WantedBy=multi-user.target";
}

void install_service(const Options& options, ProgressListener& progress, const std::string& unit_path) {
    std::string unit = unit_file_text();
    std::vector<std::vector<std::string>> setup = {
            {"systemctl", "daemon-reload"},
            {"systemctl", "enable", SERVICE_NAME},
            {"systemctl", "start", SERVICE_NAME},
    };

    if (options.dry_run) {
        progress.notify("dry-run: would write " + unit_path + ":\n" + unit);
        for (const auto& cmd : setup) {
            progress.notify("dry-run: would run " + join_cmd(cmd));
        }
        return;
    }

    {
        std::ofstream out(unit_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to open " + unit_path + ": " + std::strerror(errno));
        }
        out << unit;
        if (!out.flush()) {
            throw std::runtime_error("Failed to write " + unit_path);
        }
    }
    if (::chmod(unit_path.c_str(), 0644) != 0) {
        throw std::runtime_error("Failed to chmod " + unit_path + ": " + std::strerror(errno));
    }

    for (const auto& cmd : setup) {
        quiet_call(cmd, progress);
    }

    try {
        progress.notify(exec_command({"systemctl", "status", SERVICE_NAME}, progress));
    } catch (const CommandError& e) {
        progress.warn("unable to systemctl status " + std::string(SERVICE_NAME) + ": " + e.what());
    }
    progress.notify("Successfully setup " + std::string(SERVICE_NAME));
}

} // namespace embiggen
