#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace volmap {

// ---------------------------------------------------------------------------
// SyncOutcome
// ---------------------------------------------------------------------------

/// Result of syncing the override file from its template.
enum class SyncOutcome : uint8_t {
    Copied,                 ///< Template copied over (or into) the override.
    SkippedNewer,           ///< Override is newer than the template.
    SkippedMissingTemplate, ///< No template; custom volumes not configured.
    SkippedDisabled,        ///< Custom volumes switched off.
};

inline const char* to_string(SyncOutcome o) {
    switch (o) {
        case SyncOutcome::Copied:                 return "copied";
        case SyncOutcome::SkippedNewer:           return "skipped-newer";
        case SyncOutcome::SkippedMissingTemplate: return "skipped-missing-template";
        case SyncOutcome::SkippedDisabled:        return "skipped-disabled";
    }
    return "unknown"; // unreachable
}

// ---------------------------------------------------------------------------
// SymlinkPair
// ---------------------------------------------------------------------------

/// A declared link: `target` should be a symlink whose referent is `source`.
struct SymlinkPair {
    std::filesystem::path source;
    std::filesystem::path target;

    bool operator==(const SymlinkPair& o) const {
        return source == o.source && target == o.target;
    }
    bool operator<(const SymlinkPair& o) const { return target < o.target; }
};

// ---------------------------------------------------------------------------
// ConflictPolicy
// ---------------------------------------------------------------------------

/// What to do when a link target exists as a real file or directory.
enum class ConflictPolicy : uint8_t {
    Fail, ///< Throw SymlinkConflictError.
    Skip, ///< Warn and leave the entry alone.
};

inline const char* to_string(ConflictPolicy p) {
    return p == ConflictPolicy::Fail ? "fail" : "skip";
}

// ---------------------------------------------------------------------------
// LinkState / ReconcileReport
// ---------------------------------------------------------------------------

/// What reconciling a single pair did.
enum class LinkState : uint8_t {
    Created,   ///< Target was absent; link created.
    Skipped,   ///< Source absent; nothing to link to.
    Preserved, ///< Link already correct; left alone.
    Replaced,  ///< Link pointed elsewhere; recreated.
    Conflict,  ///< Target is a real file or directory (skip policy only).
};

inline const char* to_string(LinkState s) {
    switch (s) {
        case LinkState::Created:   return "created";
        case LinkState::Skipped:   return "skipped";
        case LinkState::Preserved: return "preserved";
        case LinkState::Replaced:  return "replaced";
        case LinkState::Conflict:  return "conflict";
    }
    return "unknown"; // unreachable
}

/// Outcome for one pair.
struct LinkResult {
    SymlinkPair pair;
    LinkState   state;
};

/// Summary of a reconcile run.
struct ReconcileReport {
    size_t created   = 0;
    size_t skipped   = 0;
    size_t preserved = 0;
    size_t replaced  = 0;
    size_t conflicts = 0;
    std::vector<LinkResult> results;

    size_t changed() const { return created + replaced; }
    size_t total()   const { return results.size(); }
};

// ---------------------------------------------------------------------------
// GroupAccessResult
// ---------------------------------------------------------------------------

enum class GroupAccessResult : uint8_t {
    Ok,            ///< Group ensured, path regrouped, g+rwx applied.
    SkippedNoPath, ///< Shared path not present in this container.
};

inline const char* to_string(GroupAccessResult r) {
    return r == GroupAccessResult::Ok ? "ok" : "skipped-no-path";
}

// ---------------------------------------------------------------------------
// Mount planning
// ---------------------------------------------------------------------------

/// Bind-mount mode for an auto-mounted file.
enum class MountMode : uint8_t {
    ReadWrite, ///< `rw`
    ReadOnly,  ///< `ro`
};

inline const char* to_string(MountMode m) {
    return m == MountMode::ReadWrite ? "rw" : "ro";
}

/// A single bind mount derived from the mounted-files tree.
struct MountEntry {
    std::filesystem::path host_path;      ///< Absolute path on the host.
    std::string           container_path; ///< Absolute path in the container.
    MountMode             mode;

    bool operator<(const MountEntry& o) const {
        return container_path < o.container_path;
    }
};

/// Everything the planner found under a mounted-files tree.
struct MountPlan {
    std::vector<MountEntry>  mounts;
    std::vector<SymlinkPair> links;    ///< Container-side links to create.
    std::vector<std::string> warnings; ///< Entries that were rejected.

    bool empty() const { return mounts.empty() && links.empty(); }
};

} // namespace volmap
