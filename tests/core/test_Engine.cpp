#include <gtest/gtest.h>
#include "engine/Engine.hpp"
#include "io/Transfer.hpp"
#include "store/TrashInfo.hpp"
#include "types/Error.hpp"
#include "util/timestamp.hpp"
#include "support/TempTree.hpp"

#include <algorithm>
#include <atomic>
#include <random>
#include <sys/stat.h>
#include <thread>

using namespace trashy;
using namespace trashy::engine;
using namespace trashy::types;
using trashy::test::TempTreeTest;

namespace fs = std::filesystem;

class EngineTest : public TempTreeTest {
protected:
    fs::path base, data, trashDir;
    config::Config cfg;
    std::unique_ptr<Engine> engine;

    void SetUp() override {
        TempTreeTest::SetUp();
        base = fs::canonical(root);
        data = base / "data";
        trashDir = base / "home/.local/share/Trash";
        fs::create_directories(data);

        cfg.trash.home_dir = trashDir;
        cfg.trash.use_topdir_trash = false;
        rebuild();
    }

    void rebuild() { engine = std::make_unique<Engine>(std::make_shared<Context>(cfg)); }

    static ErrorCode codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const Error& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected an Error";
        return ErrorCode::NotFound;
    }

    static void backdate(const TrashedItem& item, const std::chrono::hours age) {
        const store::TrashInfo info{item.original_path, item.deleted_at - static_cast<std::time_t>(age.count()) * 3600};
        writeTextFile(item.info_path, info.serialize());
    }
};

// ===== put / list / restore round trips =====

TEST_F(EngineTest, ReportScenarioPutListRestore) {
    const auto report = data / "report.txt";
    writeTextFile(report, "abc");

    (void)engine->put(report);
    EXPECT_FALSE(entryExists(report));

    auto items = engine->list();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].original_path, report);
    EXPECT_EQ(readTextFile(items[0].payload_path), "abc");

    EXPECT_EQ(engine->restore(items[0]), report);
    EXPECT_EQ(readTextFile(report), "abc");
    EXPECT_TRUE(engine->list().empty());
}

TEST_F(EngineTest, RestorePreservesModificationTime) {
    const auto p = data / "old.txt";
    writeTextFile(p, "content");
    const auto mtime = fs::file_time_type::clock::now() - std::chrono::hours(24 * 400);
    fs::last_write_time(p, mtime);

    const auto item = engine->put(p);
    (void)engine->restore(item);

    EXPECT_EQ(readTextFile(p), "content");
    EXPECT_EQ(fs::last_write_time(p), mtime);
}

TEST_F(EngineTest, TrashingSamePathTwiceKeepsBothItems) {
    const auto report = data / "report.txt";
    writeTextFile(report, "first");
    const auto a = engine->put(report);
    writeTextFile(report, "second");
    const auto b = engine->put(report);

    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(engine->list().size(), 2u);

    // Restore the second, move it aside, then the first restores to the same path
    (void)engine->restore(b);
    EXPECT_EQ(readTextFile(report), "second");
    fs::rename(report, data / "second.txt");

    (void)engine->restore(a);
    EXPECT_EQ(readTextFile(report), "first");
    EXPECT_TRUE(engine->list().empty());
}

TEST_F(EngineTest, SameBasenameFromDifferentDirectoriesRestoresToEachOrigin) {
    writeTextFile(data / "x/notes.txt", "x");
    writeTextFile(data / "y/notes.txt", "y");
    (void)engine->put(data / "x/notes.txt");
    (void)engine->put(data / "y/notes.txt");

    const auto items = engine->list();
    ASSERT_EQ(items.size(), 2u);
    for (const auto& item : items) (void)engine->restore(item);

    EXPECT_EQ(readTextFile(data / "x/notes.txt"), "x");
    EXPECT_EQ(readTextFile(data / "y/notes.txt"), "y");
}

TEST_F(EngineTest, DirectoriesAndSymlinksAreTrashedWhole) {
    writeTextFile(data / "tree/a/b.txt", "deep");
    writeTextFile(data / "target.txt", "target");
    fs::create_symlink(data / "target.txt", data / "link");

    const auto dir = engine->put(data / "tree");
    const auto link = engine->put(data / "link");

    EXPECT_TRUE(dir.isDirectory());
    EXPECT_TRUE(fs::is_symlink(link.payload_path));
    EXPECT_EQ(readTextFile(data / "target.txt"), "target"); // link target untouched

    (void)engine->restore(dir);
    (void)engine->restore(link);
    EXPECT_EQ(readTextFile(data / "tree/a/b.txt"), "deep");
    EXPECT_EQ(fs::read_symlink(data / "link"), data / "target.txt");
}

TEST_F(EngineTest, RelativePathsAreRecordedAbsolute) {
    writeTextFile(data / "rel.txt", "r");
    const auto cwd = fs::current_path();
    fs::current_path(data);
    const auto item = engine->put("rel.txt");
    fs::current_path(cwd);

    EXPECT_EQ(item.original_path, data / "rel.txt");
}

// ===== put failures =====

TEST_F(EngineTest, PutMissingPathIsNotFound) {
    EXPECT_EQ(codeOf([&] { (void)engine->put(data / "absent"); }), ErrorCode::NotFound);
}

TEST_F(EngineTest, PutRefusesRootAndTheTrashItself) {
    writeTextFile(data / "f", "x");
    (void)engine->put(data / "f");

    EXPECT_EQ(codeOf([&] { (void)engine->put("/"); }), ErrorCode::InvalidPath);
    EXPECT_EQ(codeOf([&] { (void)engine->put(trashDir); }), ErrorCode::InvalidPath);
    EXPECT_EQ(codeOf([&] { (void)engine->put(trashDir / "files/f"); }), ErrorCode::InvalidPath);
    EXPECT_EQ(codeOf([&] { (void)engine->put(base / "home"); }), ErrorCode::InvalidPath);
}

TEST_F(EngineTest, NameExhaustionLeavesSourceInPlace) {
    cfg.trash.max_name_attempts = 2;
    rebuild();

    const auto p = data / "f";
    for (int i = 0; i < 2; ++i) {
        writeTextFile(p, "x");
        (void)engine->put(p);
    }
    writeTextFile(p, "third");
    EXPECT_EQ(codeOf([&] { (void)engine->put(p); }), ErrorCode::NameExhausted);
    EXPECT_EQ(readTextFile(p), "third");
    EXPECT_EQ(engine->list().size(), 2u);
}

TEST_F(EngineTest, PutFromReadOnlyDirectoryIsPermissionDeniedAndLeavesNoRecord) {
    if (runningAsRoot()) GTEST_SKIP() << "root bypasses directory permissions";
    writeTextFile(data / "locked/f", "x");
    fs::permissions(data / "locked", fs::perms::owner_read | fs::perms::owner_exec);

    EXPECT_EQ(codeOf([&] { (void)engine->put(data / "locked/f"); }), ErrorCode::PermissionDenied);
    EXPECT_TRUE(entryExists(data / "locked/f"));
    EXPECT_TRUE(engine->list().empty());
    EXPECT_TRUE(engine->check().empty());
}

TEST_F(EngineTest, ConcurrentPutsOfSameBasenameNeverCollide) {
    constexpr int threads = 8;
    for (int i = 0; i < threads; ++i) writeTextFile(data / std::to_string(i) / "same.txt", std::to_string(i));

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&, i] {
            // Separate engines stand in for separate processes
            Engine own(std::make_shared<Context>(cfg));
            try {
                (void)own.put(data / std::to_string(i) / "same.txt");
            } catch (const Error&) {
                ++failures;
            }
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(failures.load(), 0);
    const auto items = engine->list();
    ASSERT_EQ(items.size(), static_cast<size_t>(threads));
    for (const auto& item : items)
        EXPECT_EQ(readTextFile(item.payload_path), item.original_path.parent_path().filename().string());
}

// ===== restore =====

TEST_F(EngineTest, RestoreNeverOverwritesAndChangesNothing) {
    const auto p = data / "f";
    writeTextFile(p, "trashed");
    const auto item = engine->put(p);
    writeTextFile(p, "newer");

    EXPECT_EQ(codeOf([&] { (void)engine->restore(item); }), ErrorCode::DestinationExists);
    EXPECT_EQ(readTextFile(p), "newer");
    EXPECT_EQ(readTextFile(item.payload_path), "trashed");
    EXPECT_TRUE(entryExists(item.info_path));
    EXPECT_EQ(engine->list().size(), 1u);
}

TEST_F(EngineTest, RestoreToDestination) {
    writeTextFile(data / "f", "x");
    const auto item = engine->put(data / "f");

    EXPECT_EQ(engine->restore(item, data / "elsewhere/g"), data / "elsewhere/g");
    EXPECT_EQ(readTextFile(data / "elsewhere/g"), "x");
    EXPECT_FALSE(entryExists(data / "f"));
    EXPECT_TRUE(engine->list().empty());
}

TEST_F(EngineTest, RestoreRecreatesMissingParentsUnlessDisabled) {
    writeTextFile(data / "gone/f", "x");
    const auto item = engine->put(data / "gone/f");
    fs::remove(data / "gone");

    cfg.restore.recreate_parents = false;
    rebuild();
    EXPECT_EQ(codeOf([&] { (void)engine->restore(item); }), ErrorCode::NotFound);
    EXPECT_EQ(engine->list().size(), 1u);

    cfg.restore.recreate_parents = true;
    rebuild();
    (void)engine->restore(item);
    EXPECT_EQ(readTextFile(data / "gone/f"), "x");
}

TEST_F(EngineTest, RestoreOfItemWithoutPayloadIsOrphanedMetadata) {
    writeTextFile(data / "f", "x");
    const auto item = engine->put(data / "f");
    fs::remove(item.payload_path);

    EXPECT_EQ(codeOf([&] { (void)engine->restore(item); }), ErrorCode::OrphanedMetadata);
    EXPECT_FALSE(entryExists(data / "f"));
}

TEST_F(EngineTest, RestoreOfAlreadyRestoredItemIsNotFound) {
    writeTextFile(data / "f", "x");
    const auto item = engine->put(data / "f");
    (void)engine->restore(item);
    fs::remove(data / "f");

    EXPECT_EQ(codeOf([&] { (void)engine->restore(item); }), ErrorCode::NotFound);
}

// ===== purge =====

TEST_F(EngineTest, PurgeIsIrreversible) {
    writeTextFile(data / "f", "x");
    const auto item = engine->put(data / "f");

    EXPECT_EQ(engine->purge(PurgeSelector::of(item)), 1u);
    EXPECT_TRUE(engine->list().empty());
    EXPECT_FALSE(entryExists(item.payload_path));
    EXPECT_FALSE(entryExists(item.info_path));
    EXPECT_EQ(codeOf([&] { (void)engine->restore(item); }), ErrorCode::NotFound);
}

TEST_F(EngineTest, EmptyingEverythingRequiresConfirmation) {
    for (const auto* n : {"a", "b", "c"}) {
        writeTextFile(data / n, n);
        (void)engine->put(data / n);
    }

    EXPECT_EQ(codeOf([&] { (void)engine->purge(PurgeSelector::everything()); }), ErrorCode::NotConfirmed);
    EXPECT_EQ(codeOf([&] { (void)engine->purge(PurgeSelector::matching({})); }), ErrorCode::NotConfirmed);
    EXPECT_EQ(engine->list().size(), 3u);

    EXPECT_EQ(engine->purge(PurgeSelector::everything(), true), 3u);
    EXPECT_TRUE(engine->list().empty());
}

TEST_F(EngineTest, PurgeByFilterOnlyTouchesMatches) {
    writeTextFile(data / "keep.txt", "k");
    writeTextFile(data / "drop.log", "d");
    (void)engine->put(data / "keep.txt");
    (void)engine->put(data / "drop.log");

    ListFilter filter;
    filter.patterns = {"*.log"};
    EXPECT_EQ(engine->purge(PurgeSelector::matching(filter)), 1u);

    const auto left = engine->list();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].original_path, data / "keep.txt");
}

TEST_F(EngineTest, PurgeExpiredUsesRetention) {
    writeTextFile(data / "old", "o");
    writeTextFile(data / "new", "n");
    backdate(engine->put(data / "old"), std::chrono::hours(24 * 31));
    (void)engine->put(data / "new");

    EXPECT_EQ(engine->purgeExpired(), 1u);
    const auto left = engine->list();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].original_path, data / "new");

    cfg.trash.retention_days = std::chrono::days(0);
    rebuild();
    backdate(left[0], std::chrono::hours(24 * 365));
    EXPECT_EQ(engine->purgeExpired(), 0u);
}

TEST_F(EngineTest, NegativeRetentionNeverPurges) {
    for (const auto* n : {"a", "b", "c"}) {
        writeTextFile(data / n, n);
        (void)engine->put(data / n);
    }

    cfg.trash.retention_days = std::chrono::days(-1);
    rebuild();
    EXPECT_EQ(engine->purgeExpired(), 0u);
    EXPECT_EQ(engine->list().size(), 3u);
}

TEST_F(EngineTest, PurgeSweepsInterruptedPurges) {
    writeTextFile(data / "f", "x");
    (void)engine->put(data / "f");
    writeTextFile(trashDir / "expunged/leftover.123/x", "half deleted");

    (void)engine->purge(PurgeSelector::everything(), true);
    EXPECT_TRUE(fs::is_empty(trashDir / "expunged"));
}

TEST_F(EngineTest, EmptyingEverythingAlsoClearsBrokenEntries) {
    writeTextFile(data / "f", "x");
    (void)engine->put(data / "f");

    const store::Store store(trashDir);
    (void)store.reserve("crashed");
    fs::last_write_time(store.infoPath("crashed"), fs::file_time_type::clock::now() - std::chrono::hours(1));
    writeTextFile(store.payloadPath("stray"), "x");
    (void)store.reserve("inflight");
    ASSERT_EQ(engine->check().size(), 3u);

    EXPECT_EQ(engine->purge(PurgeSelector::everything(), true), 1u);
    EXPECT_TRUE(engine->list().empty());

    // Only the reservation a put could still be committing survives
    const auto issues = engine->check();
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, store::IssueKind::Pending);
    EXPECT_EQ(issues[0].name, "inflight");

    writeTextFile(data / "crashed", "y");
    writeTextFile(data / "stray", "z");
    EXPECT_EQ(engine->put(data / "crashed").id, "crashed");
    EXPECT_EQ(engine->put(data / "stray").id, "stray");
}

// ===== list / scan / check =====

TEST_F(EngineTest, CrashBetweenReserveAndCommitIsNeverListed) {
    writeTextFile(data / "f", "x");
    (void)engine->put(data / "f");

    const store::Store store(trashDir);
    (void)store.reserve("crashed");                    // pending record, no payload
    writeTextFile(store.payloadPath("stray"), "x");    // payload, no record

    const auto items = engine->list();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].id, "f");

    const auto issues = engine->check();
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_TRUE(std::ranges::any_of(issues, [](const auto& i) { return i.kind == store::IssueKind::Pending; }));
    EXPECT_TRUE(std::ranges::any_of(issues, [](const auto& i) { return i.kind == store::IssueKind::OrphanedPayload; }));

    // A later put of the same names skips both
    writeTextFile(data / "crashed", "y");
    EXPECT_EQ(engine->put(data / "crashed").id, "crashed.1");
}

TEST_F(EngineTest, CheckReportsCopiesLeftByInterruptedRestores) {
    writeTextFile(data / "f", "x");
    const auto item = engine->put(data / "f");
    writeTextFile(data / ".f.trashy-restore.4242/part", "half copied");
    writeTextFile(data / ".other.trashy-restore.4242", "not ours to judge");
    writeTextFile(data / ".f.trashy-restore.notapid", "unrelated");

    const auto issues = engine->check();
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, store::IssueKind::IncompleteRestore);
    EXPECT_EQ(issues[0].name, item.id);
    EXPECT_EQ(issues[0].path, data / ".f.trashy-restore.4242");
}

TEST_F(EngineTest, ListOrdersAndLimits) {
    for (const auto* n : {"a", "b", "c"}) {
        writeTextFile(data / n, n);
        (void)engine->put(data / n);
    }
    const auto all = engine->list();
    backdate(*std::ranges::find(all, data / "a", &TrashedItem::original_path), std::chrono::hours(3));
    backdate(*std::ranges::find(all, data / "c", &TrashedItem::original_path), std::chrono::hours(1));

    auto items = engine->list();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].original_path, data / "b");
    EXPECT_EQ(items[2].original_path, data / "a");

    ListFilter filter;
    filter.order = Order::OldestFirst;
    filter.limit = 1;
    items = engine->list(filter);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].original_path, data / "a");

    filter = {};
    filter.older_than = std::chrono::minutes(30);
    EXPECT_EQ(engine->list(filter).size(), 2u);
}

TEST_F(EngineTest, ConfiguredDefaultOrderApplies) {
    cfg.list.default_order = Order::Path;
    rebuild();
    for (const auto* n : {"b", "a"}) {
        writeTextFile(data / n, n);
        (void)engine->put(data / n);
    }
    const auto items = engine->list();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].original_path, data / "a");
}

TEST_F(EngineTest, ScanStopsWhenVisitorSaysSo) {
    for (const auto* n : {"a", "b", "c"}) {
        writeTextFile(data / n, n);
        (void)engine->put(data / n);
    }
    size_t seen = 0;
    EXPECT_EQ(engine->scan({}, [&](const TrashedItem&) { return ++seen < 2; }), 2u);
    EXPECT_EQ(seen, 2u);
}

TEST_F(EngineTest, EnginesWithSeparateContextsDoNotShareStores) {
    auto otherCfg = cfg;
    otherCfg.trash.home_dir = base / "other/Trash";
    Engine other(std::make_shared<Context>(otherCfg));

    writeTextFile(data / "mine", "m");
    writeTextFile(data / "theirs", "t");
    (void)engine->put(data / "mine");
    (void)other.put(data / "theirs");

    ASSERT_EQ(engine->list().size(), 1u);
    ASSERT_EQ(other.list().size(), 1u);
    EXPECT_EQ(other.list()[0].original_path, data / "theirs");
}

TEST_F(EngineTest, EmptyTrashListsNothing) {
    EXPECT_TRUE(engine->list().empty());
    EXPECT_TRUE(engine->check().empty());
}

// ===== restore across filesystems =====

class CrossDeviceRestoreTest : public EngineTest {
protected:
    fs::path away;

    void SetUp() override {
        EngineTest::SetUp();

        struct stat local{};
        ASSERT_EQ(::stat(base.c_str(), &local), 0);

        std::random_device rd;
        for (const auto& candidate : {fs::path("/dev/shm"), fs::path("/run/user") / std::to_string(::getuid())}) {
            struct stat st{};
            if (::stat(candidate.c_str(), &st) != 0 || st.st_dev == local.st_dev) continue;
            const auto dir = candidate / ("trashy_restore_" + std::to_string(rd()));
            std::error_code ec;
            if (fs::create_directory(dir, ec)) {
                away = dir;
                break;
            }
        }
        if (away.empty()) GTEST_SKIP() << "no writable directory on a second filesystem";
    }

    void TearDown() override {
        if (!away.empty()) {
            std::error_code ec;
            fs::remove_all(away, ec);
        }
        EngineTest::TearDown();
    }
};

TEST_F(CrossDeviceRestoreTest, RefusePolicyLeavesItemTrashed) {
    cfg.restore.cross_device = config::CrossDevicePolicy::Refuse;
    rebuild();

    writeTextFile(data / "f", "payload");
    const auto item = engine->put(data / "f");

    EXPECT_EQ(codeOf([&] { (void)engine->restore(item, away / "f"); }), ErrorCode::CrossDevice);
    EXPECT_FALSE(entryExists(away / "f"));
    EXPECT_EQ(readTextFile(item.payload_path), "payload");
    EXPECT_TRUE(entryExists(item.info_path));
    EXPECT_EQ(engine->list().size(), 1u);
}

TEST_F(CrossDeviceRestoreTest, CopyPolicyRestoresWholeTree) {
    writeTextFile(data / "dir/a.txt", "alpha");
    writeTextFile(data / "dir/sub/b.txt", "beta");
    const auto item = engine->put(data / "dir");

    EXPECT_EQ(engine->restore(item, away / "dir"), away / "dir");
    EXPECT_EQ(readTextFile(away / "dir/a.txt"), "alpha");
    EXPECT_EQ(readTextFile(away / "dir/sub/b.txt"), "beta");

    EXPECT_FALSE(entryExists(item.payload_path));
    EXPECT_FALSE(entryExists(item.info_path));
    EXPECT_FALSE(entryExists(io::stagingPathFor(away / "dir")));
    EXPECT_TRUE(engine->list().empty());
    EXPECT_TRUE(engine->check().empty());
}
