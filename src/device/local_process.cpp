#include "local_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace mbf_device {

namespace {

constexpr size_t kReadChunkBytes = 64u * 1024u;

// A write to an agent that already exited must fail with EPIPE, not kill us.
void ignore_sigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool write_all(int fd, const char *data, size_t len, std::string &err) {
  size_t done = 0;
  while (done < len) {
    const ssize_t n = ::write(fd, data + done, len - done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      err = (errno == EPIPE) ? "EPIPE" : std::strerror(errno);
      return false;
    }
    done += static_cast<size_t>(n);
  }
  return true;
}

int decode_wait_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

std::unique_ptr<LocalProcess>
LocalProcess::start(const std::vector<std::string> &argv, std::string &err) {
  err.clear();
  if (argv.empty()) {
    err = "empty command line";
    return nullptr;
  }

  ignore_sigpipe();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1}; // carries errno if exec fails

  auto close_all = [&]() {
    for (int *p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
  };

  if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    err = std::string("pipe2 failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    c_argv.push_back(const_cast<char *>(a.c_str()));
  }
  c_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    err = std::string("fork failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    ::setpgid(0, 0);
    ::signal(SIGPIPE, SIG_DFL);
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(c_argv[0], c_argv.data());

    const int e = errno;
    ssize_t ignored = ::write(exec_pipe[1], &e, sizeof(e));
    (void)ignored;
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    err = "failed to execute '" + argv[0] + "': " + std::strerror(exec_errno);
    int status = 0;
    ::waitpid(pid, &status, 0);
    close_all();
    return nullptr;
  }

  return std::unique_ptr<LocalProcess>(
      new LocalProcess(pid, in_pipe[1], out_pipe[0], err_pipe[0]));
}

LocalProcess::LocalProcess(pid_t pid, int stdin_fd, int stdout_fd,
                           int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd) {
  stderr_thread_ = std::thread(&LocalProcess::drain_stderr, this);
}

LocalProcess::~LocalProcess() {
  kill();
  close_fd(stdin_fd_);
  close_fd(stdout_fd_);
  wait_exit();
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }
  close_fd(stderr_fd_);
}

bool LocalProcess::write_stdin(const std::string &data, std::string &err) {
  err.clear();
  if (stdin_fd_ < 0) {
    err = "stdin already closed";
    return false;
  }
  return write_all(stdin_fd_, data.data(), data.size(), err);
}

void LocalProcess::close_stdin() { close_fd(stdin_fd_); }

bool LocalProcess::read_stdout(std::string &chunk) {
  chunk.clear();
  if (stdout_fd_ < 0) {
    return false;
  }

  char buf[kReadChunkBytes];
  while (true) {
    const ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    chunk.assign(buf, static_cast<size_t>(n));
    return true;
  }
}

int LocalProcess::wait_exit() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) {
      return exit_code_;
    }
  }

  // Wait without reaping so kill() never signals a recycled pid.
  siginfo_t info;
  while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) !=
         0) {
    if (errno != EINTR) {
      break;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!exited_) {
    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    exit_code_ = (r == pid_) ? decode_wait_status(status) : -1;
    exited_ = true;
  }
  return exit_code_;
}

std::string LocalProcess::read_stderr() {
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }
  return stderr_buf_;
}

void LocalProcess::kill() {
  std::lock_guard<std::mutex> lock(mutex_);
  // Signal the group even after the child exited: a descendant left in it
  // can still hold stderr open. Linux keeps the id reserved while the group
  // has members, and an empty group just yields ESRCH.
  ::kill(-pid_, SIGKILL);
}

void LocalProcess::drain_stderr() {
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return;
    }
    stderr_buf_.append(buf, static_cast<size_t>(n));
  }
}

bool LocalProcess::run(const std::vector<std::string> &argv,
                       const std::string &input, CommandResult &result,
                       std::string &err) {
  auto proc = start(argv, err);
  if (!proc) {
    return false;
  }

  // Feed stdin from a second thread so a child that answers before it has
  // read everything cannot deadlock us.
  std::string write_err;
  std::thread writer([&]() {
    if (!input.empty()) {
      proc->write_stdin(input, write_err);
    }
    proc->close_stdin();
  });

  result.out.clear();
  std::string chunk;
  while (proc->read_stdout(chunk)) {
    result.out += chunk;
  }

  writer.join();
  result.exit_code = proc->wait_exit();
  proc->kill();
  result.err = proc->read_stderr();

  if (!write_err.empty() && write_err != "EPIPE") {
    err = "failed writing to '" + argv[0] + "': " + write_err;
    return false;
  }
  return true;
}

} // namespace mbf_device
