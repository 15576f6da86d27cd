#include <iostream>
#include <string>

#include "chain_resolver.h"
#include "daemon.h"
#include "embiggen_types.h"
#include "options.h"
#include "resizer.h"
#include "systemd_unit.h"

#ifndef __linux__
#error "embiggen-disk only runs on Linux."
#endif

namespace embiggen {

    int main(int argc, char* argv[]) {
        Options options;
        try {
            options = parse_options(argc, argv);
        } catch (const UsageError& e) {
            if (*e.what()) {
                std::cerr << e.what() << std::endl;
            }
            print_help(std::cerr);
            return 1;
        }

        CLIProgressHandler progress(options.verbose);

        if (options.target == SYSTEMD_TARGET) {
            try {
                install_service(options, progress);
            } catch (const std::exception& e) {
                progress.bail("error installing " + std::string(SERVICE_NAME) + ": " + e.what(), e);
            }
            return 0;
        }

        ChainResolver resolver = [&options, &progress](const std::string& mount_point) {
            return resolve_chain(mount_point, options, progress);
        };
        RestartAction restart;
        if (!options.restart_unit.empty()) {
            restart = systemctl_restart(options.restart_unit, options.dry_run, progress);
        }

        DaemonLoop loop(options, resolver, restart, progress);
        try {
            loop.run();
        } catch (const ResolveError& e) {
            progress.bail(e.what(), e);
        } catch (const ChainError& e) {
            progress.bail("error: " + std::string(e.what()), e);
        }
        return 0;
    }

} // namespace embiggen

int main(int argc, char* argv[]) {
    return embiggen::main(argc, argv);
}
