#ifndef EMBIGGEN_SYSTEMD_UNIT_H
#define EMBIGGEN_SYSTEMD_UNIT_H

#include "embiggen_types.h"
#include "options.h"
#include <string>

#ifndef EMBIGGEN_INSTALL_BINDIR
#define EMBIGGEN_INSTALL_BINDIR "/usr/local/sbin"
#endif

namespace embiggen {

constexpr const char* SERVICE_NAME = "embiggen-disk.service";
constexpr const char* UNIT_PATH = "/etc/systemd/system/embiggen-disk.service";

// Unit that runs `embiggen-disk -verbose -daemon /` from bindir
std::string unit_file_text(const std::string& bindir = EMBIGGEN_INSTALL_BINDIR);

/**
 * Write the unit file, then enable and start the service.
 *
 * Throws CommandError when systemctl fails to reload, enable or start it;
 * a failing status query is only reported.
 */
void install_service(const Options& options, ProgressListener& progress,
                     const std::string& unit_path = UNIT_PATH);

} // namespace embiggen

#endif // EMBIGGEN_SYSTEMD_UNIT_H
