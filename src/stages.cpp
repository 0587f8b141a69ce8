#include "volmap/stages.h"
#include "volmap/group_access.h"
#include "volmap/link_reconciler.h"
#include "volmap/log.h"
#include "volmap/mount_plan.h"
#include "volmap/template_sync.h"

#include <filesystem>
#include <system_error>
#include <utility>

namespace volmap {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// pre-up
// ---------------------------------------------------------------------------

PreUpResult run_pre_up(const Config& cfg) {
    auto logger = log::get();
    logger->info("Checking for custom volume configuration...");

    PreUpResult result{sync_template(cfg.template_file(), cfg.override_file(),
                                     cfg.custom_volumes),
                       std::nullopt};

    if (result.outcome == SyncOutcome::Copied) {
        logger->info("Edit {} to customize volume mounts",
                     cfg.override_file().string());
    }

    std::error_code ec;
    if (cfg.custom_volumes && fs::is_directory(cfg.mounted_files_dir(), ec)) {
        auto plan = plan_mounts(cfg.mounted_files_dir());
        write_compose_layer(plan, cfg.auto_mounts_file(), cfg.compose_service);
        if (cfg.link_manifest) write_link_manifest(plan, *cfg.link_manifest);
        logger->info("Planned {} auto-mount(s) and {} link(s) from {}",
                     plan.mounts.size(), plan.links.size(),
                     cfg.mounted_files_dir().string());
        result.plan = std::move(plan);
    }
    return result;
}

// ---------------------------------------------------------------------------
// container-startup
// ---------------------------------------------------------------------------

namespace {

std::optional<LinkOwner> resolve_owner(const Config& cfg, PrivilegeOps& ops) {
    if (!cfg.link_owner) return std::nullopt;
    auto user = ops.find_user(*cfg.link_owner);
    if (!user) {
        log::get()->warn("Link owner {} not found; links stay owned by root",
                         *cfg.link_owner);
        return std::nullopt;
    }
    return LinkOwner{user->uid, user->gid};
}

} // anonymous namespace

StartupResult run_container_startup(const Config& cfg, PrivilegeOps& ops) {
    auto logger = log::get();
    StartupResult result;

    logger->info("Setting up multi-user access...");
    if (cfg.required_user && !ops.find_user(*cfg.required_user)) {
        logger->warn("{} user not found - skipping symlink creation",
                     *cfg.required_user);
    } else {
        std::vector<SymlinkPair> pairs = cfg.links;
        if (cfg.link_manifest) {
            auto planned = read_link_manifest(*cfg.link_manifest);
            pairs.insert(pairs.end(), planned.begin(), planned.end());
        }

        LinkReconciler reconciler(ops, {cfg.conflict_policy, resolve_owner(cfg, ops)});
        logger->info("Reconciling {} symlink(s) (conflict policy: {})",
                     pairs.size(), to_string(reconciler.options().conflict));
        result.report = reconciler.reconcile(pairs);
        result.links_ran = true;

        result.unverified = reconciler.verify(pairs);
        for (const auto& pair : result.unverified) {
            logger->warn("Link verification failed: {} -> {}",
                         pair.target.string(), pair.source.string());
        }
    }

    if (cfg.group_access_configured()) {
        result.group = fix_group_access(ops, *cfg.shared_path, *cfg.host_uid,
                                        *cfg.host_subordinate_gid,
                                        cfg.group_name);
    } else if (cfg.shared_path) {
        logger->warn("Shared path set but host uid / subordinate gid missing; "
                     "skipping group fix");
    }
    return result;
}

} // namespace volmap
