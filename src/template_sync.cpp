#include "volmap/template_sync.h"
#include "volmap/error.h"
#include "volmap/log.h"
#include "internal.h"

#include <sys/stat.h>

#include <filesystem>
#include <system_error>

namespace volmap {

SyncOutcome sync_template(const std::filesystem::path& template_path,
                          const std::filesystem::path& override_path,
                          bool enabled) {
    namespace fs = std::filesystem;
    auto logger = log::get();

    if (!enabled) {
        logger->info("Custom volumes disabled (skipping override file)");
        return SyncOutcome::SkippedDisabled;
    }

    auto tmpl_st = sys::stat_path(template_path);
    if (!tmpl_st || !S_ISREG(tmpl_st->st_mode)) {
        logger->warn("Override template not found at: {} "
                     "(skipping custom volume setup)",
                     template_path.string());
        return SyncOutcome::SkippedMissingTemplate;
    }

    auto ovr_st = sys::stat_path(override_path);
    if (ovr_st && sys::mtime_newer(*ovr_st, *tmpl_st)) {
        logger->info("Override file is up-to-date: {}", override_path.string());
        return SyncOutcome::SkippedNewer;
    }

    fs::path parent = override_path.parent_path();
    if (parent.empty()) parent = ".";
    auto parent_st = sys::stat_path(parent);
    if (!parent_st || !S_ISDIR(parent_st->st_mode)) {
        throw MissingParentDirectoryError(parent.string());
    }

    std::error_code ec;
    fs::copy_file(template_path, override_path,
                  fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw IoError("cannot copy " + template_path.string() + " to " +
                      override_path.string() + ": " + ec.message());
    }

    // Mode bits follow the template even when the override already existed
    fs::permissions(override_path,
                    static_cast<fs::perms>(tmpl_st->st_mode & 07777),
                    fs::perm_options::replace, ec);
    if (ec) {
        throw IoError("cannot set mode on " + override_path.string() + ": " +
                      ec.message());
    }

    logger->info("Copied volume override configuration to {}",
                 override_path.string());
    return SyncOutcome::Copied;
}

} // namespace volmap
