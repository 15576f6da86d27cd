#include "daemon.h"
#include <utility>

namespace embiggen {

RestartAction systemctl_restart(const std::string& unit, bool dry_run, ProgressListener& progress) {
    return [unit, dry_run, &progress]() {
        std::vector<std::string> cmd = {"systemctl", "restart", unit};
        if (dry_run) {
            progress.notify("dry-run: would run " + join_cmd(cmd));
            return;
        }
        quiet_call(cmd, progress);
        progress.notify("Restarted " + unit + ".");
    };
}

DaemonLoop::DaemonLoop(Options options, ChainResolver resolver, RestartAction restart_action,
                       ProgressListener& progress)
    : options(std::move(options)), resolver(std::move(resolver)),
      restart_action(std::move(restart_action)), progress(progress) {
}

ResizeOutcome DaemonLoop::tick() {
    std::shared_ptr<Resizer> top;
    try {
        top = resolver(options.target);
    } catch (const std::exception& e) {
        throw ResolveError(options.target, e.what());
    }
    if (!top) {
        throw ResolveError(options.target, "no resizer for this mount point");
    }

    ResizeOutcome outcome = resize_chain(*top, options.dry_run, progress);

    if (!outcome.changes.empty()) {
        progress.notify("Changes made:");
        for (const auto& change : outcome.changes) {
            progress.notify("  * " + change.str());
        }
        if (restart_action) {
            try {
                restart_action();
            } catch (const std::exception& e) {
                progress.warn("unable to restart dependent service: " + std::string(e.what()));
            }
        }
    } else if (outcome.ok()) {
        progress.notify("No changes made.");
    }

    if (!outcome.ok()) {
        progress.debug(std::string("failed at ") + stage_name(outcome.error->stage) +
                       " of " + outcome.error->resizer);
    }
    return outcome;
}

void DaemonLoop::run_tick() {
    ResizeOutcome outcome = tick();
    if (!outcome.ok()) {
        outcome.error->raise();
    }
}

void DaemonLoop::run() {
    if (!options.daemon) {
        run_tick();
        return;
    }

    std::unique_lock<std::mutex> lock(mutex);
    while (!stop_requested) {
        if (wake.wait_for(lock, options.interval, [this] { return stop_requested; })) {
            break;
        }
        lock.unlock();
        run_tick();
        lock.lock();
    }
}

void DaemonLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop_requested = true;
    }
    wake.notify_all();
}

bool DaemonLoop::stopped() {
    std::lock_guard<std::mutex> lock(mutex);
    return stop_requested;
}

} // namespace embiggen
