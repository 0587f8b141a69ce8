#include <catch2/catch_test_macros.hpp>
#include <volmap/volmap.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("volmap_plan_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return tmp;
}

static void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << content;
}

static void set_mode(const fs::path& p, unsigned mode) {
    fs::permissions(p, static_cast<fs::perms>(mode), fs::perm_options::replace);
}

// ---------------------------------------------------------------------------
// mount_mode_for
// ---------------------------------------------------------------------------

TEST_CASE("mount_mode_for: owner or group write gives rw", "[plan]") {
    auto dir = make_temp_dir();
    auto f = dir / "file";
    write_file(f, "x");

    struct Case { unsigned mode; volmap::MountMode expect; };
    const Case cases[] = {
        {0640, volmap::MountMode::ReadWrite},
        {0600, volmap::MountMode::ReadWrite},
        {0460, volmap::MountMode::ReadWrite},
        {0750, volmap::MountMode::ReadWrite},
        {0444, volmap::MountMode::ReadOnly},
        {0440, volmap::MountMode::ReadOnly},
        {0004, volmap::MountMode::ReadOnly},
        {0446, volmap::MountMode::ReadOnly},
    };
    for (const auto& c : cases) {
        set_mode(f, c.mode);
        INFO("mode " << std::oct << c.mode);
        CHECK(volmap::mount_mode_for(f) == c.expect);
    }

    set_mode(f, 0600);
    fs::remove_all(dir);
}

TEST_CASE("mount_mode_for: missing path throws", "[plan]") {
    CHECK_THROWS_AS(volmap::mount_mode_for("/nonexistent/volmap/file"),
                    volmap::IoError);
}

// ---------------------------------------------------------------------------
// validate_link
// ---------------------------------------------------------------------------

TEST_CASE("validate_link: relative link inside base", "[plan]") {
    auto base = make_temp_dir();
    write_file(base / "root" / "target.txt", "t");
    fs::create_directories(base / "home" / "mars");
    auto link = base / "home" / "mars" / "link.txt";
    fs::create_symlink("../../root/target.txt", link);

    CHECK(volmap::validate_link(link, base));

    fs::remove_all(base);
}

TEST_CASE("validate_link: rejects absolute, external and dangling", "[plan]") {
    auto base = make_temp_dir();
    auto files = base / "mounted-files";
    write_file(files / "root" / "target.txt", "t");
    write_file(base / "outside.txt", "o");

    auto absolute = files / "abs";
    fs::create_symlink(files / "root" / "target.txt", absolute);
    CHECK_FALSE(volmap::validate_link(absolute, files));

    auto external = files / "ext";
    fs::create_symlink("../outside.txt", external);
    CHECK_FALSE(volmap::validate_link(external, files));

    auto dangling = files / "dangling";
    fs::create_symlink("root/missing.txt", dangling);
    CHECK_FALSE(volmap::validate_link(dangling, files));

    CHECK_FALSE(volmap::validate_link(files / "root" / "target.txt", files));

    // Lexically inside, but the hop through esc/ lands outside the tree
    write_file(base / "secret" / "id_rsa", "k");
    fs::create_symlink("../secret", files / "esc");
    fs::create_directories(files / "home");
    auto escaping = files / "home" / "key";
    fs::create_symlink("../esc/id_rsa", escaping);
    CHECK(fs::exists(escaping));
    CHECK_FALSE(volmap::validate_link(escaping, files));

    auto plan = volmap::plan_mounts(files);
    for (const auto& link : plan.links) {
        CHECK(link.target != "/home/key");
    }
    CHECK(plan.mounts.size() == 1);

    fs::remove_all(base);
}

TEST_CASE("validate_link: hop through an in-tree directory link is fine", "[plan]") {
    auto base = make_temp_dir();
    write_file(base / "shared" / "dotfiles" / ".vimrc", "set nu\n");
    fs::create_symlink("shared/dotfiles", base / "dots");
    fs::create_directories(base / "root");
    fs::create_symlink("../dots/.vimrc", base / "root" / ".vimrc");

    CHECK(volmap::validate_link(base / "root" / ".vimrc", base));

    fs::remove_all(base);
}

// ---------------------------------------------------------------------------
// plan_mounts
// ---------------------------------------------------------------------------

TEST_CASE("plan_mounts: missing directory gives an empty plan", "[plan]") {
    auto plan = volmap::plan_mounts("/nonexistent/volmap/mounted-files");
    CHECK(plan.empty());
}

TEST_CASE("plan_mounts: files map to container paths", "[plan]") {
    auto dir = make_temp_dir();
    write_file(dir / "root" / ".vimrc", "set nu\n");
    write_file(dir / "home" / "mars" / ".config" / "app" / "settings.json", "{}");
    write_file(dir / "etc" / "motd", "hello");
    set_mode(dir / "etc" / "motd", 0444);

    auto plan = volmap::plan_mounts(dir);
    REQUIRE(plan.mounts.size() == 3);
    CHECK(plan.links.empty());
    CHECK(plan.warnings.empty());

    CHECK(plan.mounts[0].container_path == "/etc/motd");
    CHECK(plan.mounts[0].mode == volmap::MountMode::ReadOnly);
    CHECK(plan.mounts[1].container_path == "/home/mars/.config/app/settings.json");
    CHECK(plan.mounts[2].container_path == "/root/.vimrc");
    CHECK(plan.mounts[2].mode == volmap::MountMode::ReadWrite);
    CHECK(plan.mounts[2].host_path.filename() == ".vimrc");
    CHECK(plan.mounts[2].host_path.is_absolute());

    fs::remove_all(dir);
}

TEST_CASE("plan_mounts: .gitkeep placeholders are skipped", "[plan]") {
    auto dir = make_temp_dir();
    write_file(dir / ".gitkeep", "");
    write_file(dir / "root" / ".gitkeep", "");
    write_file(dir / "root" / ".bashrc", "alias ll='ls -l'\n");

    auto plan = volmap::plan_mounts(dir);
    REQUIRE(plan.mounts.size() == 1);
    CHECK(plan.mounts[0].container_path == "/root/.bashrc");

    fs::remove_all(dir);
}

TEST_CASE("plan_mounts: exclude globs prune files and directories", "[plan]") {
    auto dir = make_temp_dir();
    write_file(dir / "root" / "notes.swp", "");
    write_file(dir / "root" / "keep.txt", "k");
    write_file(dir / "cache" / "big.bin", "b");

    volmap::PlanOptions opts;
    opts.exclude = {".gitkeep", "*.swp", "cache"};
    auto plan = volmap::plan_mounts(dir, opts);
    REQUIRE(plan.mounts.size() == 1);
    CHECK(plan.mounts[0].container_path == "/root/keep.txt");

    fs::remove_all(dir);
}

TEST_CASE("plan_mounts: symlinks become links or warnings", "[plan]") {
    auto dir = make_temp_dir();
    write_file(dir / "root" / "target.txt", "t");
    fs::create_directories(dir / "home" / "mars");
    fs::create_symlink("../../root/target.txt", dir / "home" / "mars" / "target.txt");
    fs::create_symlink("/etc/passwd", dir / "home" / "mars" / "passwd");

    auto plan = volmap::plan_mounts(dir);
    REQUIRE(plan.mounts.size() == 1);
    CHECK(plan.mounts[0].container_path == "/root/target.txt");

    REQUIRE(plan.links.size() == 1);
    CHECK(plan.links[0].source == "/root/target.txt");
    CHECK(plan.links[0].target == "/home/mars/target.txt");

    REQUIRE(plan.warnings.size() == 1);
    CHECK(plan.warnings[0].find("/home/mars/passwd") != std::string::npos);

    fs::remove_all(dir);
}

TEST_CASE("plan_mounts: names with ':' are rejected with a warning", "[plan]") {
    auto dir = make_temp_dir();
    write_file(dir / "root" / "ok.txt", "o");
    write_file(dir / "root" / "a:b.txt", "x");
    fs::create_directories(dir / "home" / "mars");
    fs::create_symlink("../../root/ok.txt", dir / "home" / "mars" / "c:d");

    auto plan = volmap::plan_mounts(dir);
    REQUIRE(plan.mounts.size() == 1);
    CHECK(plan.mounts[0].container_path == "/root/ok.txt");
    CHECK(plan.links.empty());
    CHECK(plan.warnings.size() == 2);

    // Whatever is planned can be written and read back
    auto manifest = dir / "links.txt";
    volmap::write_link_manifest(plan, manifest);
    CHECK(volmap::read_link_manifest(manifest).empty());

    fs::remove_all(dir);
}

TEST_CASE("render_volume_lines: host:container:mode", "[plan]") {
    volmap::MountPlan plan;
    plan.mounts.push_back({"/opt/plugin/mounted-files/root/.vimrc", "/root/.vimrc",
                           volmap::MountMode::ReadWrite});
    plan.mounts.push_back({"/opt/plugin/mounted-files/etc/motd", "/etc/motd",
                           volmap::MountMode::ReadOnly});

    auto lines = volmap::render_volume_lines(plan);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "- /opt/plugin/mounted-files/root/.vimrc:/root/.vimrc:rw");
    CHECK(lines[1] == "- /opt/plugin/mounted-files/etc/motd:/etc/motd:ro");
}

// ---------------------------------------------------------------------------
// Link manifest
// ---------------------------------------------------------------------------

TEST_CASE("link manifest: written links read back", "[plan]") {
    auto dir = make_temp_dir();
    volmap::MountPlan plan;
    plan.links.push_back({"/root/target.txt", "/home/mars/target.txt"});
    plan.links.push_back({"/root/dev", "/home/dev/dev"});

    auto manifest = dir / "links.txt";
    volmap::write_link_manifest(plan, manifest);
    auto pairs = volmap::read_link_manifest(manifest);
    CHECK(pairs == plan.links);

    fs::remove_all(dir);
}

TEST_CASE("link manifest: comments, blank lines and CRLF", "[plan]") {
    auto dir = make_temp_dir();
    auto manifest = dir / "links.txt";
    write_file(manifest, "# header\r\n\r\n/a:/b\r\n  \n# trailing\n");

    // A whitespace-only line is not blank and must parse as a link
    CHECK_THROWS_AS(volmap::read_link_manifest(manifest), volmap::ConfigError);

    write_file(manifest, "# header\r\n\r\n/a:/b\r\n# trailing\n");
    auto pairs = volmap::read_link_manifest(manifest);
    REQUIRE(pairs.size() == 1);
    CHECK(pairs[0].source == "/a");
    CHECK(pairs[0].target == "/b");

    fs::remove_all(dir);
}

TEST_CASE("link manifest: paths with ':' are refused", "[plan]") {
    auto dir = make_temp_dir();
    volmap::MountPlan plan;
    plan.links.push_back({"/root/a:b", "/home/mars/ab"});

    CHECK_THROWS_AS(volmap::write_link_manifest(plan, dir / "links.txt"),
                    volmap::ConfigError);
    CHECK_FALSE(fs::exists(dir / "links.txt"));

    fs::remove_all(dir);
}

TEST_CASE("compose layer: parent directory must exist", "[plan]") {
    auto dir = make_temp_dir();
    volmap::MountPlan plan;
    CHECK_THROWS_AS(volmap::write_compose_layer(plan, dir / "missing" / "auto.yml", "dev"),
                    volmap::MissingParentDirectoryError);

    fs::remove_all(dir);
}

TEST_CASE("link manifest: missing file reads as empty", "[plan]") {
    CHECK(volmap::read_link_manifest("/nonexistent/volmap/links.txt").empty());
}
