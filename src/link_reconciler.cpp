#include "volmap/link_reconciler.h"
#include "volmap/error.h"
#include "volmap/log.h"
#include "internal.h"

#include <sys/stat.h>

#include <system_error>
#include <utility>

namespace volmap {

namespace fs = std::filesystem;

namespace {

/// Referent of @p link, or nullopt if it is not a readable symlink.
std::optional<fs::path> link_referent(const fs::path& link) {
    std::error_code ec;
    auto referent = fs::read_symlink(link, ec);
    if (ec) return std::nullopt;
    return referent;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LinkReconciler
// ---------------------------------------------------------------------------

LinkReconciler::LinkReconciler(PrivilegeOps& ops, ReconcileOptions opts)
    : ops_(ops), opts_(std::move(opts)) {}

ReconcileReport LinkReconciler::reconcile(const std::vector<SymlinkPair>& pairs) {
    auto logger = log::get();
    ReconcileReport report;
    report.results.reserve(pairs.size());

    for (const auto& pair : pairs) {
        LinkState state = reconcile_one(pair);
        switch (state) {
            case LinkState::Created:   ++report.created;   break;
            case LinkState::Skipped:   ++report.skipped;   break;
            case LinkState::Preserved: ++report.preserved; break;
            case LinkState::Replaced:  ++report.replaced;  break;
            case LinkState::Conflict:  ++report.conflicts; break;
        }
        report.results.push_back({pair, state});
    }

    if (report.changed() > 0) {
        logger->info("Created {} and replaced {} symlink(s)",
                     report.created, report.replaced);
    }
    if (report.skipped + report.preserved > 0) {
        logger->info("Skipped {} symlink(s) (source missing), "
                     "{} already correct",
                     report.skipped, report.preserved);
    }
    if (report.conflicts > 0) {
        logger->warn("{} target(s) left alone (manual intervention required)",
                     report.conflicts);
    }
    return report;
}

LinkState LinkReconciler::reconcile_one(const SymlinkPair& pair) {
    auto logger = log::get();

    if (!sys::stat_path(pair.source)) {
        logger->info("Source does not exist: {} (skipping)", pair.source.string());
        return LinkState::Skipped;
    }

    auto target_st = sys::lstat_path(pair.target);
    if (!target_st) {
        create_link(pair);
        logger->info("Created symlink: {} -> {}",
                     pair.target.string(), pair.source.string());
        return LinkState::Created;
    }

    if (S_ISLNK(target_st->st_mode)) {
        auto current = link_referent(pair.target);
        if (current && *current == pair.source) {
            logger->debug("Symlink already correct: {} -> {}",
                          pair.target.string(), pair.source.string());
            return LinkState::Preserved;
        }

        logger->warn("Symlink points to wrong location: {} -> {}",
                     pair.target.string(),
                     current ? current->string() : std::string("?"));
        std::error_code ec;
        fs::remove(pair.target, ec);
        if (ec) {
            throw IoError("cannot remove stale link " + pair.target.string() +
                          ": " + ec.message());
        }
        create_link(pair);
        logger->info("Replaced symlink: {} -> {}",
                     pair.target.string(), pair.source.string());
        return LinkState::Replaced;
    }

    if (opts_.conflict == ConflictPolicy::Fail) {
        throw SymlinkConflictError(pair.target.string());
    }
    logger->warn("Target exists as regular file/directory: {} (skipping)",
                 pair.target.string());
    return LinkState::Conflict;
}

std::vector<SymlinkPair>
LinkReconciler::verify(const std::vector<SymlinkPair>& pairs) const {
    std::vector<SymlinkPair> broken;
    for (const auto& pair : pairs) {
        if (!sys::stat_path(pair.source)) continue;
        auto target_st = sys::lstat_path(pair.target);
        if (!target_st || !S_ISLNK(target_st->st_mode)) {
            broken.push_back(pair);
            continue;
        }
        auto current = link_referent(pair.target);
        if (!current || *current != pair.source) broken.push_back(pair);
    }
    return broken;
}

void LinkReconciler::create_link(const SymlinkPair& pair) {
    std::error_code ec;
    auto parent = pair.target.parent_path();
    if (!parent.empty() && fs::create_directories(parent, ec)) {
        log::get()->info("Created directory: {}", parent.string());
    }
    if (ec) {
        throw IoError("cannot create " + parent.string() + ": " + ec.message());
    }

    fs::create_symlink(pair.source, pair.target, ec);
    if (ec) {
        throw IoError("cannot link " + pair.target.string() + " -> " +
                      pair.source.string() + ": " + ec.message());
    }
    apply_owner(pair.target);
}

void LinkReconciler::apply_owner(const fs::path& link) {
    if (!opts_.owner) return;
    try {
        ops_.set_link_owner(link, opts_.owner->uid, opts_.owner->gid);
    } catch (const VolmapError& e) {
        log::get()->warn("Could not set owner of {}: {}", link.string(), e.what());
    }
}

} // namespace volmap
