#ifndef EMBIGGEN_DAEMON_H
#define EMBIGGEN_DAEMON_H

#include "chain_resolver.h"
#include "embiggen_types.h"
#include "options.h"
#include "resizer.h"
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>

namespace embiggen {

// Chain resolution failed before anything was resized
class ResolveError : public std::runtime_error {
public:
    ResolveError(const std::string& mount_point, const std::string& cause)
        : std::runtime_error("error preparing to enlarge " + mount_point + ": " + cause) {}
};

using RestartAction = std::function<void()>;

// `systemctl restart <unit>`, reported through progress
RestartAction systemctl_restart(const std::string& unit, bool dry_run, ProgressListener& progress);

/**
 * Re-applies the resize chain of one mount point, once or on a timer.
 *
 * Every tick resolves a fresh chain, resizes it, reports the changes and
 * restarts the dependent service when something changed. Any error ends
 * run(): the process is expected to exit and be restarted by its
 * supervisor, which is safe since resizing is idempotent.
 */
class DaemonLoop {
public:
    DaemonLoop(Options options, ChainResolver resolver, RestartAction restart_action,
               ProgressListener& progress);

    // Resolve, resize and report once. Throws ResolveError; resize errors
    // are reported in the outcome after the changes were.
    ResizeOutcome tick();

    // Throws ResolveError or the ChainError that stopped the loop.
    void run();

    // Safe from any thread. A tick in progress finishes first.
    void stop();

    bool stopped();

private:
    void run_tick();

    Options options;
    ChainResolver resolver;
    RestartAction restart_action;
    ProgressListener& progress;

    std::mutex mutex;
    std::condition_variable wake;
    bool stop_requested = false;
};

} // namespace embiggen

#endif // EMBIGGEN_DAEMON_H
