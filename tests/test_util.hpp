#ifndef INTENTIONAL_TEST_UTIL_HPP
#define INTENTIONAL_TEST_UTIL_HPP

#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>

namespace intentional::test {

// Scratch directory removed on destruction
class TempDir {
public:
  TempDir() {
    std::string tmpl =
        (std::filesystem::temp_directory_path() / "intentional-test-XXXXXX")
            .string();
    char *made = ::mkdtemp(tmpl.data());
    if (made)
      path_ = made;
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path &path() const { return path_; }
  std::filesystem::path operator/(const std::string &name) const {
    return path_ / name;
  }

private:
  std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path &p,
                      const std::string &content) {
  std::ofstream out(p, std::ios::trunc);
  out << content;
}

inline std::string readFile(const std::filesystem::path &p) {
  std::ifstream in(p);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

// Sets mtime to now + offset
inline bool setMtimeOffset(const std::filesystem::path &p,
                           std::chrono::seconds offset) {
  timespec times[2];
  times[0].tv_sec = ::time(nullptr) + offset.count();
  times[0].tv_nsec = 0;
  times[1] = times[0];
  return ::utimensat(AT_FDCWD, p.c_str(), times, 0) == 0;
}

// fork() that keeps buffered gtest output from being emitted twice
inline pid_t forkChild() {
  std::fflush(nullptr);
  return ::fork();
}

// Pid of a process that has exited and been reaped
inline pid_t deadPid() {
  pid_t pid = forkChild();
  if (pid == 0)
    ::_exit(0);
  int status = 0;
  ::waitpid(pid, &status, 0);
  return pid;
}

// Waits until fd is readable, returns false on timeout
inline bool waitReadable(int fd, int timeoutMs) {
  pollfd pfd{fd, POLLIN, 0};
  return ::poll(&pfd, 1, timeoutMs) == 1;
}

inline bool readByte(int fd, char &out, int timeoutMs = 2000) {
  if (!waitReadable(fd, timeoutMs))
    return false;
  return ::read(fd, &out, 1) == 1;
}

// waitpid with a deadline; kills the child if it does not exit in time
inline int waitChild(pid_t pid, int timeoutMs = 5000) {
  int status = 0;
  for (int waited = 0; waited < timeoutMs; waited += 10) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid)
      return status;
    if (r == -1 && errno == ECHILD)
      return 0;
    ::usleep(10 * 1000);
  }
  ::kill(pid, SIGKILL);
  ::waitpid(pid, &status, 0);
  return status;
}

// Listening Unix socket bound to path, or -1
inline int listenUnix(const std::filesystem::path &path) {
  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0)
    return -1;
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
      ::listen(fd, 5) != 0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

} // namespace intentional::test

#endif // INTENTIONAL_TEST_UTIL_HPP
