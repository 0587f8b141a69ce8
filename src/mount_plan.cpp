#include "volmap/mount_plan.h"
#include "volmap/config.h"
#include "volmap/error.h"
#include "volmap/log.h"
#include "internal.h"

#include <sys/stat.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace volmap {

namespace fs = std::filesystem;

namespace {

bool has_colon(const std::string& s) {
    return s.find(':') != std::string::npos;
}

bool is_excluded(const std::string& name, const std::vector<std::string>& exclude) {
    return std::any_of(exclude.begin(), exclude.end(),
                       [&](const std::string& pat) { return glob::fnmatch(pat, name); });
}

/// Absolute, lexically normal form of @p p (no symlink resolution).
fs::path normal_absolute(const fs::path& p) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    return (ec ? p : abs).lexically_normal();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// mount_mode_for
// ---------------------------------------------------------------------------

/// Only owner and group write bits count; a world-writable file that its
/// owner cannot write is still mounted read-only.
MountMode mount_mode_for(const fs::path& path) {
    auto st = sys::stat_path(path);
    if (!st) throw IoError("cannot stat " + path.string() + ": not found");
    return (st->st_mode & (S_IWUSR | S_IWGRP)) ? MountMode::ReadWrite
                                                : MountMode::ReadOnly;
}

// ---------------------------------------------------------------------------
// validate_link
// ---------------------------------------------------------------------------

bool validate_link(const fs::path& link, const fs::path& base) {
    std::error_code ec;
    auto referent = fs::read_symlink(link, ec);
    if (ec || referent.empty() || referent.is_absolute()) return false;

    auto abs_base = normal_absolute(base);
    auto resolved = (normal_absolute(link).parent_path() / referent).lexically_normal();
    if (!paths::is_within(resolved, abs_base)) return false;
    if (!fs::exists(resolved, ec) || ec) return false;

    // Links inside the tree may still lead out of it
    auto real = fs::weakly_canonical(resolved, ec);
    if (ec) return false;
    auto real_base = fs::weakly_canonical(abs_base, ec);
    if (ec) return false;
    return paths::is_within(real, real_base);
}

// ---------------------------------------------------------------------------
// plan_mounts
// ---------------------------------------------------------------------------

MountPlan plan_mounts(const fs::path& mounted_files, const PlanOptions& opts) {
    MountPlan plan;
    std::error_code ec;
    if (!fs::is_directory(mounted_files, ec)) return plan;

    auto base = normal_absolute(mounted_files);
    auto logger = log::get();

    fs::recursive_directory_iterator it(
        base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw IoError("cannot walk " + base.string() + ": " + ec.message());
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            throw IoError("cannot walk " + base.string() + ": " + ec.message());
        }
        const auto& path = it->path();
        auto status = it->symlink_status(ec);
        if (ec) {
            throw IoError("cannot stat " + path.string() + ": " + ec.message());
        }

        if (is_excluded(path.filename().string(), opts.exclude)) {
            if (fs::is_directory(status)) it.disable_recursion_pending();
            continue;
        }

        auto rel = path.lexically_relative(base);

        if (fs::is_symlink(status)) {
            if (!validate_link(path, base)) {
                plan.warnings.push_back("invalid symlink (absolute, external or "
                                        "dangling): " + paths::container_path(rel));
                logger->warn("Skipping invalid symlink: {}", path.string());
                continue;
            }
            auto referent = (path.parent_path() / fs::read_symlink(path))
                                .lexically_normal()
                                .lexically_relative(base);
            auto source = paths::container_path(referent);
            auto target = paths::container_path(rel);
            if (has_colon(source) || has_colon(target)) {
                plan.warnings.push_back("symlink path contains ':': " + target);
                logger->warn("Skipping symlink with ':' in its path: {}", path.string());
                continue;
            }
            plan.links.push_back({source, target});
            continue;
        }

        if (fs::is_regular_file(status)) {
            auto container = paths::container_path(rel);
            if (has_colon(path.string())) {
                plan.warnings.push_back("file path contains ':': " + container);
                logger->warn("Skipping file with ':' in its path: {}", path.string());
                continue;
            }
            plan.mounts.push_back({path, container, mount_mode_for(path)});
        }
    }

    std::sort(plan.mounts.begin(), plan.mounts.end());
    std::sort(plan.links.begin(), plan.links.end());
    return plan;
}

// ---------------------------------------------------------------------------
// Rendering and manifests
// ---------------------------------------------------------------------------

std::vector<std::string> render_volume_lines(const MountPlan& plan) {
    std::vector<std::string> lines;
    lines.reserve(plan.mounts.size());
    for (const auto& m : plan.mounts) {
        lines.push_back("- " + m.host_path.string() + ":" + m.container_path +
                        ":" + to_string(m.mode));
    }
    return lines;
}

void write_compose_layer(const MountPlan& plan, const fs::path& path,
                         const std::string& service) {
    auto parent = path.parent_path();
    if (parent.empty()) parent = ".";
    auto parent_st = sys::stat_path(parent);
    if (!parent_st || !S_ISDIR(parent_st->st_mode)) {
        throw MissingParentDirectoryError(parent.string());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw IoError(sys::errno_message("cannot open", path));

    out << "# Generated by volmap pre-up; rewritten on every run\n"
        << "services:\n"
        << "  " << service << ":\n"
        << "    volumes:";
    if (plan.mounts.empty()) {
        out << " []\n";
    } else {
        out << '\n';
        for (const auto& line : render_volume_lines(plan)) {
            out << "      " << line << '\n';
        }
    }
    out.flush();
    if (!out) throw IoError(sys::errno_message("cannot write", path));
}

void write_link_manifest(const MountPlan& plan, const fs::path& path) {
    for (const auto& link : plan.links) {
        if (has_colon(link.source.string()) || has_colon(link.target.string())) {
            throw ConfigError("link path contains ':': " + link.target.string() +
                              " -> " + link.source.string());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw IoError(sys::errno_message("cannot open", path));

    out << "# volmap link manifest: source:target\n";
    for (const auto& link : plan.links) {
        out << link.source.string() << ':' << link.target.string() << '\n';
    }
    out.flush();
    if (!out) throw IoError(sys::errno_message("cannot write", path));
}

std::vector<SymlinkPair> read_link_manifest(const fs::path& path) {
    std::vector<SymlinkPair> pairs;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (!sys::stat_path(path)) return pairs;
        throw IoError(sys::errno_message("cannot open", path));
    }

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        pairs.push_back(parse_link(line));
    }
    return pairs;
}

} // namespace volmap
