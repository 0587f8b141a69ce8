#include <catch2/catch_test_macros.hpp>
#include <volmap/volmap.h>

#include "fake_privilege.h"

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    auto tmp = fs::temp_directory_path() /
               ("volmap_group_" + std::to_string(
                    std::hash<std::thread::id>{}(std::this_thread::get_id())
                    ^ static_cast<size_t>(
                          std::chrono::steady_clock::now()
                              .time_since_epoch()
                              .count())));
    fs::create_directories(tmp);
    return tmp;
}

// ---------------------------------------------------------------------------
// container_gid
// ---------------------------------------------------------------------------

TEST_CASE("container_gid: subtracts the host uid", "[group]") {
    CHECK(volmap::container_gid(10227, 54556) == 44329);
    CHECK(volmap::container_gid(1000, 55556) == 54556);
    CHECK(volmap::container_gid(0, 55556) == 55556);
    CHECK(volmap::container_gid(500, 500) == 0);
}

TEST_CASE("container_gid: negative result is a config error", "[group]") {
    CHECK_THROWS_AS(volmap::container_gid(60000, 55556), volmap::ConfigError);
}

// ---------------------------------------------------------------------------
// fix_group_access
// ---------------------------------------------------------------------------

TEST_CASE("fix_group_access: missing path is skipped", "[group]") {
    auto dir = make_temp_dir();
    FakePrivilegeOps ops;

    auto r = volmap::fix_group_access(ops, dir / "absent", 10227, 54556, "docs");
    CHECK(r == volmap::GroupAccessResult::SkippedNoPath);
    CHECK(ops.created.empty());
    CHECK(ops.regrouped.empty());

    fs::remove_all(dir);
}

TEST_CASE("fix_group_access: creates group and applies it", "[group]") {
    auto dir = make_temp_dir();
    auto shared = dir / "credentials";
    fs::create_directories(shared);
    FakePrivilegeOps ops;

    auto r = volmap::fix_group_access(ops, shared, 10227, 54556, "docs");
    CHECK(r == volmap::GroupAccessResult::Ok);
    REQUIRE(ops.created.size() == 1);
    CHECK(ops.created[0].first == "docs");
    CHECK(ops.created[0].second == 44329);
    CHECK(ops.regrouped[shared] == 44329);
    CHECK(ops.mode_bits[shared] == S_IRWXG);

    fs::remove_all(dir);
}

TEST_CASE("fix_group_access: existing group with right gid is reused", "[group]") {
    auto dir = make_temp_dir();
    FakePrivilegeOps ops;
    ops.groups[44329] = "docs";

    auto r = volmap::fix_group_access(ops, dir, 10227, 54556, "docs");
    CHECK(r == volmap::GroupAccessResult::Ok);
    CHECK(ops.created.empty());
    CHECK(ops.regrouped[dir] == 44329);

    fs::remove_all(dir);
}

TEST_CASE("fix_group_access: gid owned by another group", "[group]") {
    auto dir = make_temp_dir();
    FakePrivilegeOps ops;
    ops.groups[44329] = "somebody-else";

    try {
        volmap::fix_group_access(ops, dir, 10227, 54556, "docs");
        FAIL("expected GidConflictError");
    } catch (const volmap::GidConflictError& e) {
        CHECK(e.group() == "docs");
        CHECK(e.gid() == 44329);
    }
    CHECK(ops.regrouped.empty());

    fs::remove_all(dir);
}

TEST_CASE("fix_group_access: group name exists with another gid", "[group]") {
    auto dir = make_temp_dir();
    FakePrivilegeOps ops;
    ops.groups[55556] = "docs";

    CHECK_THROWS_AS(volmap::fix_group_access(ops, dir, 10227, 54556, "docs"),
                    volmap::GidConflictError);
    CHECK(ops.created.empty());

    fs::remove_all(dir);
}

TEST_CASE("fix_group_access: unprivileged caller", "[group]") {
    auto dir = make_temp_dir();
    FakePrivilegeOps ops;
    ops.privileged = false;

    CHECK_THROWS_AS(volmap::fix_group_access(ops, dir, 10227, 54556, "docs"),
                    volmap::PermissionError);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// SystemPrivilegeOps
// ---------------------------------------------------------------------------

TEST_CASE("SystemPrivilegeOps: add_mode_bits keeps owner bits", "[group][system]") {
    auto dir = make_temp_dir();
    auto shared = dir / "shared";
    fs::create_directories(shared);
    fs::permissions(shared, fs::perms::owner_all, fs::perm_options::replace);

    volmap::SystemPrivilegeOps ops;
    ops.add_mode_bits(shared, S_IRWXG);

    auto p = fs::status(shared).permissions();
    CHECK((p & fs::perms::owner_all) == fs::perms::owner_all);
    CHECK((p & fs::perms::group_all) == fs::perms::group_all);
    CHECK((p & fs::perms::others_all) == fs::perms::none);

    fs::remove_all(dir);
}

TEST_CASE("SystemPrivilegeOps: set_group to own primary group", "[group][system]") {
    auto dir = make_temp_dir();
    volmap::SystemPrivilegeOps ops;
    CHECK_NOTHROW(ops.set_group(dir, ::getegid()));
    fs::remove_all(dir);
}

TEST_CASE("SystemPrivilegeOps: looks up the root group and user", "[group][system]") {
    volmap::SystemPrivilegeOps ops;
    auto g = ops.find_group_by_gid(0);
    REQUIRE(g);
    CHECK(g->gid == 0);
    CHECK(ops.find_group_by_name(g->name)->gid == 0);

    auto u = ops.find_user("root");
    REQUIRE(u);
    CHECK(u->uid == 0);

    CHECK_FALSE(ops.find_user("volmap-no-such-user"));
    CHECK_FALSE(ops.find_group_by_name("volmap-no-such-group"));
}

TEST_CASE("SystemPrivilegeOps: group creation needs root", "[group][system]") {
    if (::geteuid() == 0) {
        SKIP("running as root");
    }
    volmap::SystemPrivilegeOps ops;
    CHECK_THROWS_AS(ops.create_group("volmap-test", 64999), volmap::PermissionError);
}
