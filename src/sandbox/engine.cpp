#include "liteagent/sandbox/engine.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace liteagent::sandbox {

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

/// Drains whatever is readable; returns false once the write end is closed.
bool read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

/// Reads the errno the child reports when execvp fails; 0 when exec succeeded.
int read_exec_errno(const int fd) {
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = read(fd, &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  return got == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

} // namespace

std::string join_command(const std::string &binary, const std::vector<std::string> &args) {
  std::string out = binary;
  for (const auto &arg : args) {
    out.push_back(' ');
    out += arg;
  }
  return out;
}

common::Result<EngineProcessResult> EngineCliRunner::run(const std::string &binary,
                                                         const std::vector<std::string> &args,
                                                         const EngineCommandOptions &options) {
  using ResultT = common::Result<EngineProcessResult>;
  if (binary.empty()) {
    return ResultT::failure("engine binary is empty", common::ErrorKind::InvalidArgument);
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
    for (int *fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                    &exec_pipe[0], &exec_pipe[1]}) {
      close_fd(*fd);
    }
    return ResultT::failure("failed to create pipes for " + binary, common::ErrorKind::Io);
  }

  const pid_t pid = fork();
  if (pid < 0) {
    for (int *fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0], &stderr_pipe[1],
                    &exec_pipe[0], &exec_pipe[1]}) {
      close_fd(*fd);
    }
    return ResultT::failure("failed to fork " + binary + " process", common::ErrorKind::Io);
  }

  if (pid == 0) {
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      (void)dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    close(exec_pipe[0]);

    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(binary.c_str()));
    for (const auto &arg : args) {
      argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    execvp(binary.c_str(), argv.data());
    const int exec_errno = errno;
    (void)!write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
    _exit(127);
  }

  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);
  close_fd(exec_pipe[1]);

  // exec_pipe is close-on-exec: EOF means the engine binary started.
  const int exec_errno = read_exec_errno(exec_pipe[0]);
  close_fd(exec_pipe[0]);
  if (exec_errno != 0) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);
    return ResultT::failure(binary + " is not available: " + std::strerror(exec_errno),
                            common::ErrorKind::EngineUnavailable);
  }

  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  std::string stdout_text;
  std::string stderr_text;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    (void)read_into_buffer(stdout_pipe[0], stdout_text);
    (void)read_into_buffer(stderr_pipe[0], stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > options.timeout) {
      timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  (void)read_into_buffer(stdout_pipe[0], stdout_text);
  (void)read_into_buffer(stderr_pipe[0], stderr_text);
  close_fd(stdout_pipe[0]);
  close_fd(stderr_pipe[0]);

  EngineProcessResult result;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.timed_out = timed_out;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }

  if (timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return ResultT::failure("command timed out: " + join_command(binary, args),
                              common::ErrorKind::Io);
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "command failed: " + join_command(binary, args)
                                    : result.stderr_text;
    return ResultT::failure(message);
  }

  return ResultT::success(std::move(result));
}

} // namespace liteagent::sandbox
