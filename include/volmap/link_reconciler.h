#pragma once

/// @file link_reconciler.h
/// Container-side symlink reconciliation.

#include "privilege.h"
#include "types.h"

#include <optional>
#include <vector>

namespace volmap {

/// Owner applied to links the reconciler creates.
struct LinkOwner {
    uid_t uid;
    gid_t gid;
};

/// Options for LinkReconciler.
struct ReconcileOptions {
    ConflictPolicy           conflict = ConflictPolicy::Fail;
    std::optional<LinkOwner> owner;   ///< lchown new links to this owner.
};

// ---------------------------------------------------------------------------
// LinkReconciler
// ---------------------------------------------------------------------------

/// Makes each declared `target -> source` link exist and point at the
/// right place.  Pairs are handled independently and re-running converges
/// to the same state.
///
/// @code
///     volmap::SystemPrivilegeOps ops;
///     volmap::LinkReconciler rec(ops);
///     auto report = rec.reconcile({{"/root/dev", "/home/dev/dev"}});
/// @endcode
class LinkReconciler {
public:
    explicit LinkReconciler(PrivilegeOps& ops, ReconcileOptions opts = {});

    /// Reconcile every pair in order.
    /// @throws SymlinkConflictError under ConflictPolicy::Fail.
    /// @throws IoError when a link or directory cannot be created.
    ReconcileReport reconcile(const std::vector<SymlinkPair>& pairs);

    /// Reconcile a single pair.
    LinkState reconcile_one(const SymlinkPair& pair);

    /// Pairs whose source exists but whose target is not (yet) a link to
    /// it.  Empty after a successful reconcile.
    std::vector<SymlinkPair> verify(const std::vector<SymlinkPair>& pairs) const;

    const ReconcileOptions& options() const { return opts_; }

private:
    void create_link(const SymlinkPair& pair);
    void apply_owner(const std::filesystem::path& link);

    PrivilegeOps&    ops_;
    ReconcileOptions opts_;
};

} // namespace volmap
