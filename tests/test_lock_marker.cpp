#include "test_util.hpp"

#include "intentional/instance_lock.hpp"
#include "intentional/marker_store.hpp"

using namespace intentional;
using namespace intentional::test;

// ═══════════════════════════════════════════════════════════════════════════════
// Instance lock
// ═══════════════════════════════════════════════════════════════════════════════

TEST(InstanceLock, AcquireRecordsOwnPid) {
  TempDir dir;
  InstanceLock lock(dir / "test.lock");

  EXPECT_FALSE(lock.exists());
  ASSERT_TRUE(lock.acquire());
  EXPECT_TRUE(lock.owned());
  EXPECT_TRUE(lock.exists());
  ASSERT_TRUE(lock.readPid().has_value());
  EXPECT_EQ(*lock.readPid(), ::getpid());
  EXPECT_EQ(readFile(dir / "test.lock"), std::to_string(::getpid()) + "\n");
  EXPECT_TRUE(lock.holderAlive());
}

TEST(InstanceLock, SecondAcquireFails) {
  TempDir dir;
  InstanceLock first(dir / "test.lock");
  InstanceLock second(dir / "test.lock");

  ASSERT_TRUE(first.acquire());
  EXPECT_FALSE(second.acquire());
  EXPECT_FALSE(second.owned());
}

TEST(InstanceLock, AcquireLeavesNoTempFiles) {
  TempDir dir;
  InstanceLock lock(dir / "test.lock");
  ASSERT_TRUE(lock.acquire());

  size_t entries = 0;
  for (const auto &e : std::filesystem::directory_iterator(dir.path())) {
    (void)e;
    ++entries;
  }
  EXPECT_EQ(entries, 1u);
}

TEST(InstanceLock, DestructorReleasesOwnedLock) {
  TempDir dir;
  {
    InstanceLock lock(dir / "test.lock");
    ASSERT_TRUE(lock.acquire());
  }
  EXPECT_FALSE(std::filesystem::exists(dir / "test.lock"));
}

TEST(InstanceLock, ReleaseKeepsLockNamingAnotherPid) {
  TempDir dir;
  InstanceLock lock(dir / "test.lock");
  ASSERT_TRUE(lock.acquire());

  // Another primary replaced the lock after a preemption
  writeFile(dir / "test.lock", "1\n");
  lock.release();
  EXPECT_TRUE(std::filesystem::exists(dir / "test.lock"));
}

TEST(InstanceLock, UnownedLockIsNeverReleased) {
  TempDir dir;
  writeFile(dir / "test.lock", std::to_string(::getpid()) + "\n");
  {
    InstanceLock lock(dir / "test.lock");
    lock.release();
  }
  EXPECT_TRUE(std::filesystem::exists(dir / "test.lock"));
}

TEST(InstanceLock, DeadPidIsNotAlive) {
  TempDir dir;
  writeFile(dir / "test.lock", std::to_string(deadPid()) + "\n");

  InstanceLock lock(dir / "test.lock");
  EXPECT_TRUE(lock.exists());
  EXPECT_TRUE(lock.readPid().has_value());
  EXPECT_FALSE(lock.holderAlive());
}

TEST(InstanceLock, UnreadableContentHasNoPid) {
  TempDir dir;
  writeFile(dir / "test.lock", "garbage");

  InstanceLock lock(dir / "test.lock");
  EXPECT_FALSE(lock.readPid().has_value());
  EXPECT_FALSE(lock.holderAlive());
  EXPECT_TRUE(lock.remove());
  EXPECT_FALSE(lock.exists());
}

TEST(InstanceLock, TrailingJunkIsUnreadable) {
  TempDir dir;
  writeFile(dir / "test.lock", "123abc\n");

  InstanceLock lock(dir / "test.lock");
  EXPECT_FALSE(lock.readPid().has_value());
  EXPECT_FALSE(lock.holderAlive());
}

TEST(InstanceLock, PidParsing) {
  EXPECT_EQ(InstanceLock::parsePid("4242").value_or(-1), 4242);
  EXPECT_EQ(InstanceLock::parsePid("4242\n").value_or(-1), 4242);
  EXPECT_EQ(InstanceLock::parsePid("  4242 \r\n").value_or(-1), 4242);

  EXPECT_FALSE(InstanceLock::parsePid("").has_value());
  EXPECT_FALSE(InstanceLock::parsePid("\n").has_value());
  EXPECT_FALSE(InstanceLock::parsePid("42 42").has_value());
  EXPECT_FALSE(InstanceLock::parsePid("42\n43\n").has_value());
  EXPECT_FALSE(InstanceLock::parsePid("0").has_value());
  EXPECT_FALSE(InstanceLock::parsePid("-7").has_value());
  EXPECT_FALSE(InstanceLock::parsePid("99999999999999999999").has_value());
}

TEST(InstanceLock, RemoveStaleDeletesDeadHolder) {
  TempDir dir;
  writeFile(dir / "test.lock", std::to_string(deadPid()) + "\n");

  InstanceLock lock(dir / "test.lock");
  EXPECT_TRUE(lock.removeStale());
  EXPECT_FALSE(lock.exists());
}

TEST(InstanceLock, RemoveStaleDeletesUnreadableLock) {
  TempDir dir;
  writeFile(dir / "test.lock", "123abc");

  InstanceLock lock(dir / "test.lock");
  EXPECT_TRUE(lock.removeStale());
  EXPECT_FALSE(lock.exists());
}

TEST(InstanceLock, RemoveStaleKeepsLiveHolder) {
  TempDir dir;
  InstanceLock holder(dir / "test.lock");
  ASSERT_TRUE(holder.acquire());

  // A launch that saw a stale lock earlier must not delete the new one
  InstanceLock late(dir / "test.lock");
  EXPECT_FALSE(late.removeStale());
  EXPECT_TRUE(late.exists());
  EXPECT_EQ(*late.readPid(), ::getpid());
}

TEST(InstanceLock, RemoveStaleWithoutLockIsNoop) {
  TempDir dir;
  InstanceLock lock(dir / "test.lock");
  EXPECT_FALSE(lock.removeStale());
  EXPECT_FALSE(lock.exists());
}

TEST(InstanceLock, ExitHookRemovesLockOnExit) {
  TempDir dir;
  auto path = dir / "test.lock";

  pid_t child = forkChild();
  if (child == 0) {
    InstanceLock lock(path);
    if (!lock.acquire())
      ::_exit(2);
    lock.installExitHook();
    // exit() without unwinding: only the hook can remove the lock
    std::exit(0);
  }

  int status = waitChild(child);
  ASSERT_TRUE(WIFEXITED(status));
  EXPECT_EQ(WEXITSTATUS(status), 0);
  EXPECT_FALSE(std::filesystem::exists(path));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Markers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(MarkerStore, AbsentMarkerHasNoAge) {
  TempDir dir;
  MarkerStore markers(dir / "no-relaunch", dir / "strict-mode");
  EXPECT_FALSE(markers.markerAge().has_value());
  EXPECT_FALSE(markers.markerFresh());
  EXPECT_FALSE(markers.removeMarker());
}

TEST(MarkerStore, WrittenMarkerIsFresh) {
  TempDir dir;
  MarkerStore markers(dir / "no-relaunch", dir / "strict-mode");

  ASSERT_TRUE(markers.writeNoRelaunch());
  ASSERT_TRUE(markers.markerAge().has_value());
  EXPECT_LT(*markers.markerAge(), std::chrono::seconds(5));
  EXPECT_TRUE(markers.markerFresh());
}

TEST(MarkerStore, OldMarkerIsStale) {
  TempDir dir;
  MarkerStore markers(dir / "no-relaunch", dir / "strict-mode");
  ASSERT_TRUE(markers.writeNoRelaunch());
  ASSERT_TRUE(setMtimeOffset(dir / "no-relaunch", std::chrono::seconds(-31)));

  EXPECT_GE(*markers.markerAge(), MarkerStore::kMarkerFreshness);
  EXPECT_FALSE(markers.markerFresh());
}

TEST(MarkerStore, RewriteRefreshesTimestamp) {
  TempDir dir;
  MarkerStore markers(dir / "no-relaunch", dir / "strict-mode");
  ASSERT_TRUE(markers.writeNoRelaunch());
  ASSERT_TRUE(setMtimeOffset(dir / "no-relaunch", std::chrono::seconds(-120)));
  ASSERT_FALSE(markers.markerFresh());

  ASSERT_TRUE(markers.writeNoRelaunch());
  EXPECT_TRUE(markers.markerFresh());
}

TEST(MarkerStore, FutureTimestampReadsAsFresh) {
  TempDir dir;
  MarkerStore markers(dir / "no-relaunch", dir / "strict-mode");
  ASSERT_TRUE(markers.writeNoRelaunch());
  ASSERT_TRUE(setMtimeOffset(dir / "no-relaunch", std::chrono::seconds(3600)));

  EXPECT_EQ(*markers.markerAge(), std::chrono::seconds(0));
  EXPECT_TRUE(markers.markerFresh());
}

TEST(MarkerStore, StrictModeIsExistenceOnly) {
  TempDir dir;
  MarkerStore markers(dir / "no-relaunch", dir / "strict-mode");

  EXPECT_FALSE(markers.strictMode());
  ASSERT_TRUE(markers.setStrictMode(true));
  EXPECT_TRUE(markers.strictMode());
  EXPECT_TRUE(readFile(dir / "strict-mode").empty());

  ASSERT_TRUE(markers.setStrictMode(false));
  EXPECT_FALSE(markers.strictMode());
  EXPECT_TRUE(markers.setStrictMode(false));
}
