#ifndef EMBIGGEN_RESIZER_H
#define EMBIGGEN_RESIZER_H

#include "embiggen_types.h"
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace embiggen {

/**
 * One resizable layer of a storage stack: a filesystem, an LVM LV or PV,
 * a partition, or the raw disk underneath them.
 *
 * A Resizer may depend on another Resizer that has to grow first (the
 * layer one step closer to the physical device). Instances are built
 * fresh for every attempt and never cache state.
 */
class Resizer {
public:
    virtual ~Resizer() = default;

    // "ext4 filesystem at /", "LVM PV /dev/sda2". Must not fail.
    virtual std::string describe() const = 0;

    // Current size snapshot, e.g. "size=534 blocks". Re-read on every call.
    virtual std::string state() = 0;

    // Grow to whatever the dependency now permits. A no-op when nothing can
    // grow. With dry_run set, report the mutating commands instead of running them.
    virtual void resize(bool dry_run) = 0;

    // The layer below, or nullptr when this one rests on nothing resizable.
    virtual std::shared_ptr<Resizer> dependency() = 0;
};

/**
 * Base for resizers whose mutations are external commands.
 */
class ToolResizer : public Resizer {
public:
    explicit ToolResizer(ProgressListener& progress) : progress(progress) {}

protected:
    void mutate(bool dry_run, const std::vector<std::string>& cmd, const std::string& input = "");

    ProgressListener& progress;
};

struct ChangeRecord {
    std::string description;
    std::string before;
    std::string after;

    std::string str() const;
};

bool operator==(const ChangeRecord& a, const ChangeRecord& b);
std::ostream& operator<<(std::ostream& os, const ChangeRecord& change);

enum class ChainStage {
    StateRead,
    DependencyResolution,
    Resize,
    PostResizeConfirmation,
};

const char* stage_name(ChainStage stage);

class ChainError : public std::runtime_error {
public:
    ChainError(ChainStage stage, const std::string& resizer, const std::string& cause);
    ~ChainError() override = default;

    // Throws *this with its dynamic type intact.
    [[noreturn]] virtual void raise() const;

    ChainStage stage;
    std::string resizer;
    std::string cause;

protected:
    ChainError(ChainStage stage, const std::string& resizer, const std::string& cause,
               const std::string& what);
};

class StateError : public ChainError {
public:
    StateError(const std::string& resizer, const std::string& cause)
        : ChainError(ChainStage::StateRead, resizer, cause) {}
    [[noreturn]] void raise() const override { throw *this; }
};

class DependencyResolutionError : public ChainError {
public:
    DependencyResolutionError(const std::string& resizer, const std::string& cause)
        : ChainError(ChainStage::DependencyResolution, resizer, cause) {}
    [[noreturn]] void raise() const override { throw *this; }
};

class ResizeExecutionError : public ChainError {
public:
    ResizeExecutionError(const std::string& resizer, const std::string& cause)
        : ChainError(ChainStage::Resize, resizer, cause) {}
    [[noreturn]] void raise() const override { throw *this; }
};

class PostResizeStateError : public ChainError {
public:
    PostResizeStateError(const std::string& resizer, const std::string& cause)
        : ChainError(ChainStage::PostResizeConfirmation, resizer, cause,
                     "error after successful resize of " + resizer + ": " + cause) {}
    [[noreturn]] void raise() const override { throw *this; }
};

struct ResizeOutcome {
    // Dependency-first: the layer nearest the device comes first.
    std::vector<ChangeRecord> changes;
    std::shared_ptr<const ChainError> error;

    bool ok() const { return error == nullptr; }
};

/**
 * Resize top's dependencies, deepest first, and then top itself.
 *
 * Never throws. The first failure stops the walk; the outcome then holds
 * the changes confirmed below the failing layer along with the error.
 */
ResizeOutcome resize_chain(Resizer& top, bool dry_run, ProgressListener& progress);

} // namespace embiggen

#endif // EMBIGGEN_RESIZER_H
