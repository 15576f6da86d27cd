#include "options.h"
#include <getopt.h>
#include <ostream>

namespace embiggen {

void print_help(std::ostream& os) {
    os << "Usage of embiggen-disk:" << std::endl;
    os << std::endl;
    os << "# embiggen-disk [flags] <mount-point-to-enlarge>" << std::endl;
    os << std::endl;
    os << "# embiggen-disk systemd - installs systemd unit file, enables, and starts service in daemon mode"
       << std::endl;
    os << std::endl;
    os << "  -daemon" << std::endl;
    os << "        daemon mode" << std::endl;
    os << "  -dry-run" << std::endl;
    os << "        don't make changes" << std::endl;
    os << "  -restart-unit string" << std::endl;
    os << "        systemd unit to restart after changes, empty for none (default \"kubelet\")" << std::endl;
    os << "  -verbose" << std::endl;
    os << "        verbose output" << std::endl;
}

Options parse_options(int argc, char* argv[]) {
    Options options;
    int option_index = 0;
    int c;

    static struct option long_options[] = {
            {"dry-run", no_argument, 0, 'n'},
            {"verbose", no_argument, 0, 'v'},
            {"daemon", no_argument, 0, 'd'},
            {"restart-unit", required_argument, 0, 'r'},
            {"help", no_argument, 0, 'h'},
            {0, 0, 0, 0}
    };

    // getopt keeps its position in globals, start over on every call
    optind = 0;
    opterr = 0;
    // Flags take one dash or two
    while ((c = getopt_long_only(argc, argv, "+:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'n':
                options.dry_run = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'd':
                options.daemon = true;
                break;
            case 'r':
                options.restart_unit = optarg;
                break;
            case 'h':
                throw UsageError("");
            case ':':
                throw UsageError("flag needs an argument: " + std::string(argv[optind - 1]));
            default:
                throw UsageError("flag provided but not defined: " + std::string(argv[optind - 1]));
        }
    }

    if (argc - optind != 1) {
        throw UsageError("");
    }
    options.target = argv[optind];
    return options;
}

} // namespace embiggen
