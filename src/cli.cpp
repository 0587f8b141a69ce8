#include "volmap/cli.h"
#include "volmap/config.h"
#include "volmap/error.h"
#include "volmap/group_access.h"
#include "volmap/log.h"
#include "volmap/mount_plan.h"
#include "volmap/stages.h"

#include <getopt.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace volmap {

namespace {

struct CliOptions {
    std::string config_file;
    std::string command;
    std::string log_level;
};

void print_help(std::ostream& out) {
    out << "Usage: volmap [OPTIONS] <command>\n\n";
    out << "Commands:\n";
    out << "  pre-up             Sync the compose override and auto-mounts (host)\n";
    out << "  container-startup  Reconcile symlinks and shared group access (container)\n";
    out << "  plan               Print auto-mount volume lines and links\n";
    out << "  gid                Print the in-container GID for the shared group\n\n";
    out << "Options:\n";
    out << "  -c, --config FILE  YAML configuration file\n";
    out << "  -v, --verbose      Debug logging\n";
    out << "  -q, --quiet        Warnings and errors only\n";
    out << "  -h, --help         Show this help\n\n";
    out << "Environment variables (VOLMAP_*) override the configuration file.\n";
}

bool known_command(const std::string& cmd) {
    return cmd == "pre-up" || cmd == "container-startup" || cmd == "plan" ||
           cmd == "gid";
}

Config load_config(const CliOptions& cli) {
    Config cfg = cli.config_file.empty() ? Config{}
                                         : Config::from_yaml_file(cli.config_file);
    cfg.apply_env(process_env());
    if (!cli.log_level.empty()) cfg.log_level = cli.log_level;
    return cfg;
}

int cmd_pre_up(const Config& cfg, std::ostream& out) {
    auto result = run_pre_up(cfg);
    out << to_string(result.outcome);
    if (result.plan) {
        out << " mounts=" << result.plan->mounts.size()
            << " links=" << result.plan->links.size();
    }
    out << "\n";
    return 0;
}

int cmd_container_startup(const Config& cfg, PrivilegeOps& ops, std::ostream& out) {
    auto result = run_container_startup(cfg, ops);
    const auto& r = result.report;
    out << "created=" << r.created << " skipped=" << r.skipped
        << " preserved=" << r.preserved << " replaced=" << r.replaced;
    if (r.conflicts > 0) out << " conflicts=" << r.conflicts;
    if (result.group) out << " group=" << to_string(*result.group);
    out << "\n";
    return 0;
}

int cmd_plan(const Config& cfg, std::ostream& out) {
    auto plan = plan_mounts(cfg.mounted_files_dir());
    for (const auto& line : render_volume_lines(plan)) {
        out << line << "\n";
    }
    for (const auto& link : plan.links) {
        out << "# link " << link.target.string() << " -> "
            << link.source.string() << "\n";
    }
    return 0;
}

int cmd_gid(const Config& cfg, std::ostream& out) {
    if (!cfg.host_uid || !cfg.host_subordinate_gid) {
        throw ConfigError("gid needs host_uid and host_subordinate_gid");
    }
    out << container_gid(*cfg.host_uid, *cfg.host_subordinate_gid) << "\n";
    return 0;
}

} // anonymous namespace

int run_cli(int argc, char* argv[], PrivilegeOps& ops, std::ostream& out) {
    CliOptions cli;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"quiet", no_argument, 0, 'q'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    // 0 makes glibc reinitialize its scanner between calls
    optind = 0;
    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "c:vqh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            cli.config_file = optarg;
            break;
        case 'v':
            cli.log_level = "debug";
            break;
        case 'q':
            cli.log_level = "warn";
            break;
        case 'h':
            print_help(out);
            return 0;
        default:
            print_help(out);
            return EXIT_USAGE;
        }
    }

    if (optind != argc - 1) {
        print_help(out);
        return EXIT_USAGE;
    }
    cli.command = argv[optind];

    if (!known_command(cli.command)) {
        std::cerr << "Unknown command: " << cli.command << "\n";
        print_help(out);
        return EXIT_USAGE;
    }

    log::init(cli.command);
    try {
        Config cfg = load_config(cli);
        log::init(cli.command, log::parse_level(cfg.log_level));

        if (cli.command == "pre-up") return cmd_pre_up(cfg, out);
        if (cli.command == "container-startup") return cmd_container_startup(cfg, ops, out);
        if (cli.command == "plan") return cmd_plan(cfg, out);
        return cmd_gid(cfg, out);
    } catch (const VolmapError& e) {
        log::get()->error("{}", e.what());
    } catch (const std::exception& e) {
        log::get()->error("unexpected failure: {}", e.what());
    }
    return EXIT_FAILURE;
}

} // namespace volmap
