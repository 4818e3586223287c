#include "test_util.hpp"

#include "intentional/launch_classifier.hpp"
#include "intentional/process.hpp"
#include "intentional/relay_bridge.hpp"

#include <thread>

using namespace intentional;
using namespace intentional::test;

namespace {

// Polls until the file has a full line, returns it without the newline
std::string waitForLine(const std::filesystem::path &path, int timeoutMs = 3000) {
  for (int waited = 0; waited < timeoutMs; waited += 10) {
    std::string content = readFile(path);
    auto nl = content.find('\n');
    if (nl != std::string::npos)
      return content.substr(0, nl);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return "";
}

bool waitForExit(int pid, int timeoutMs = 3000) {
  for (int waited = 0; waited < timeoutMs; waited += 10) {
    if (!Process::isAlive(pid))
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Liveness and /proc helpers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Process, SelfIsAlive) {
  EXPECT_TRUE(Process::isAlive(::getpid()));
  EXPECT_FALSE(Process::isAlive(0));
  EXPECT_FALSE(Process::isAlive(-1));
  EXPECT_FALSE(Process::isAlive(deadPid()));
}

TEST(Process, UnreapedChildCountsAsDead) {
  pid_t child = forkChild();
  if (child == 0)
    ::_exit(0);

  // Exited but not yet reaped: a zombie still answers signal 0
  bool dead = waitForExit(child);
  waitChild(child);
  EXPECT_TRUE(dead);
}

TEST(Process, ParentPidOfChild) {
  pid_t child = forkChild();
  if (child == 0) {
    ::pause();
    ::_exit(0);
  }

  auto ppid = Process::parentPid(child);
  ASSERT_TRUE(ppid.has_value());
  EXPECT_EQ(*ppid, ::getpid());
  EXPECT_TRUE(Process::commandName(child).has_value());

  EXPECT_TRUE(Process::kill(child, true));
  waitChild(child);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Detached launch
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ProcessSpawn, DetachedProcessIsNotOurChild) {
  TempDir dir;
  auto pidFile = dir / "spawned.pid";

  ASSERT_TRUE(Process::spawnDetached(
      "/bin/sh", {"-c", "echo $$ > '" + pidFile.string() + "'; exec sleep 10"},
      std::chrono::milliseconds(3000)));

  std::string line = waitForLine(pidFile);
  ASSERT_FALSE(line.empty());
  int pid = std::stoi(line);
  EXPECT_TRUE(Process::isAlive(pid));

  auto ppid = Process::parentPid(pid);
  ASSERT_TRUE(ppid.has_value());
  EXPECT_NE(*ppid, ::getpid());

  // Not reapable by the launcher
  int status = 0;
  pid_t reaped = ::waitpid(pid, &status, WNOHANG);
  int err = errno;
  EXPECT_EQ(reaped, -1);
  EXPECT_EQ(err, ECHILD);

  // Its own session, so the launcher's terminal signals never reach it
  EXPECT_NE(::getsid(pid), ::getsid(0));

  EXPECT_TRUE(Process::kill(pid, true));
  EXPECT_TRUE(waitForExit(pid));
}

TEST(ProcessSpawn, ExtraEnvironmentReachesProcess) {
  TempDir dir;
  auto out = dir / "env.txt";

  ASSERT_TRUE(Process::spawnDetached(
      "/bin/sh",
      {"-c", "echo \"$" + std::string(kBackgroundLaunchEnv) + "\" > '" +
                 out.string() + "'"},
      std::chrono::milliseconds(3000), {{kBackgroundLaunchEnv, "1"}}));

  EXPECT_EQ(waitForLine(out), "1");
}

TEST(ProcessSpawn, MissingExecutableFailsFast) {
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(Process::spawnDetached("/nonexistent/intentional", {},
                                      std::chrono::milliseconds(5000)));
  // The exec error arrives on the report pipe; no need to sit out the timeout
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(ProcessSpawn, NonExecutableFileFails) {
  TempDir dir;
  auto script = dir / "not-executable.sh";
  writeFile(script, "#!/bin/sh\nexit 0\n");
  std::filesystem::permissions(script, std::filesystem::perms::owner_read |
                                           std::filesystem::perms::owner_write);

  EXPECT_FALSE(Process::spawnDetached(script.string(), {},
                                      std::chrono::milliseconds(3000)));
}

TEST(ProcessSpawn, RelayLauncherStartsExecutable) {
  auto launcher = RelayBridge::spawnLauncher("/bin/true");
  EXPECT_TRUE(launcher(std::chrono::milliseconds(3000)));

  auto missing = RelayBridge::spawnLauncher("/nonexistent/intentional");
  EXPECT_FALSE(missing(std::chrono::milliseconds(3000)));
}
