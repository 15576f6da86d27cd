#include "resizer.h"

namespace embiggen {

void ToolResizer::mutate(bool dry_run, const std::vector<std::string>& cmd, const std::string& input) {
    if (dry_run) {
        progress.notify("dry-run: would run " + join_cmd(cmd));
        return;
    }
    quiet_call(cmd, progress, input);
}

std::string ChangeRecord::str() const {
    return description + ": before: " + before + ", after: " + after;
}

bool operator==(const ChangeRecord& a, const ChangeRecord& b) {
    return a.description == b.description && a.before == b.before && a.after == b.after;
}

std::ostream& operator<<(std::ostream& os, const ChangeRecord& change) {
    return os << change.str();
}

const char* stage_name(ChainStage stage) {
    switch (stage) {
        case ChainStage::StateRead:
            return "state read";
        case ChainStage::DependencyResolution:
            return "dependency resolution";
        case ChainStage::Resize:
            return "resize";
        case ChainStage::PostResizeConfirmation:
            return "post-resize confirmation";
    }
    return "unknown stage";
}

ChainError::ChainError(ChainStage stage, const std::string& resizer, const std::string& cause)
    : ChainError(stage, resizer, cause,
                 std::string(stage_name(stage)) + " of " + resizer + " failed: " + cause) {
}

ChainError::ChainError(ChainStage stage, const std::string& resizer, const std::string& cause,
                       const std::string& what)
    : std::runtime_error(what), stage(stage), resizer(resizer), cause(cause) {
}

void ChainError::raise() const {
    throw *this;
}

namespace {

std::shared_ptr<const ChainError> resize_level(Resizer& resizer, bool dry_run,
                                               ProgressListener& progress,
                                               std::vector<ChangeRecord>& changes) {
    const std::string name = resizer.describe();

    std::string s0;
    try {
        s0 = resizer.state();
    } catch (const std::exception& e) {
        return std::make_shared<StateError>(name, e.what());
    }

    std::shared_ptr<Resizer> dep;
    try {
        dep = resizer.dependency();
    } catch (const std::exception& e) {
        return std::make_shared<DependencyResolutionError>(name, e.what());
    }

    if (dep) {
        progress.debug(name + " depends on " + dep->describe());
        if (auto err = resize_level(*dep, dry_run, progress, changes)) {
            return err;
        }
    }

    progress.debug("Resizing " + name + " (" + s0 + ")");
    try {
        resizer.resize(dry_run);
    } catch (const std::exception& e) {
        return std::make_shared<ResizeExecutionError>(name, e.what());
    }

    std::string s1;
    try {
        s1 = resizer.state();
    } catch (const std::exception& e) {
        return std::make_shared<PostResizeStateError>(name, e.what());
    }

    if (s0 != s1) {
        changes.push_back(ChangeRecord{name, s0, s1});
    }
    return nullptr;
}

} // namespace

ResizeOutcome resize_chain(Resizer& top, bool dry_run, ProgressListener& progress) {
    ResizeOutcome outcome;
    outcome.error = resize_level(top, dry_run, progress, outcome.changes);
    return outcome;
}

} // namespace embiggen
