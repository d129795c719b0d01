#include "probes/process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

namespace activity_agent::probes {
namespace {

constexpr int kPollSliceMs = 50;

int poll_timeout_ms(const SampleContext& context) {
  if (!context.deadline.has_value()) {
    return kPollSliceMs;
  }
  const auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(*context.deadline - std::chrono::steady_clock::now());
  return static_cast<int>(std::clamp<long long>(remaining.count(), 0, kPollSliceMs));
}

command_status stop_status(const SampleContext& context) {
  if (context.cancel != nullptr && context.cancel->cancelled()) {
    return command_status::CANCELLED;
  }
  return command_status::TIMED_OUT;
}

void kill_group(const pid_t pid) {
  kill(-pid, SIGKILL);
  kill(pid, SIGKILL);
  while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
  }
}

int decode_exit(const int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace

const char* to_string(const command_status status) noexcept {
  switch (status) {
    case command_status::EXITED:
      return "exited";
    case command_status::LAUNCH_FAILED:
      return "launch_failed";
    case command_status::TIMED_OUT:
      return "timed_out";
    case command_status::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

CommandResult run_command(const std::vector<std::string>& argv, const SampleContext& context,
                          const std::size_t max_output_bytes) {
  CommandResult result{};
  if (argv.empty()) {
    return result;
  }

  // Everything the child touches is prepared before fork.
  std::vector<char*> exec_argv;
  exec_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    exec_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  exec_argv.push_back(nullptr);

  const int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
  if (null_fd < 0) {
    return result;
  }

  int pipe_fds[2]{};
  if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
    close(null_fd);
    return result;
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    close(null_fd);
    return result;
  }

  if (pid == 0) {
    setpgid(0, 0);
    dup2(null_fd, STDIN_FILENO);
    dup2(pipe_fds[1], STDOUT_FILENO);
    dup2(null_fd, STDERR_FILENO);
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    execvp(exec_argv[0], exec_argv.data());
    _exit(127);
  }

  close(pipe_fds[1]);
  close(null_fd);
  const int read_fd = pipe_fds[0];

  const int flags = fcntl(read_fd, F_GETFL, 0);
  if (flags < 0 || fcntl(read_fd, F_SETFL, flags | O_NONBLOCK) != 0) {
    close(read_fd);
    kill_group(pid);
    return result;
  }

  bool stream_open = true;
  char chunk[4096];
  while (true) {
    if (context.should_stop()) {
      close(read_fd);
      kill_group(pid);
      result.status = stop_status(context);
      return result;
    }

    if (stream_open) {
      pollfd descriptor{read_fd, POLLIN, 0};
      const int ready = poll(&descriptor, 1, poll_timeout_ms(context));
      if (ready < 0 && errno != EINTR) {
        stream_open = false;
      } else if (ready > 0) {
        const ssize_t bytes_read = read(read_fd, chunk, sizeof(chunk));
        if (bytes_read > 0) {
          const std::size_t room = max_output_bytes - std::min(max_output_bytes, result.output.size());
          result.output.append(chunk, std::min(room, static_cast<std::size_t>(bytes_read)));
        } else if (bytes_read == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
          stream_open = false;
        }
      }
      if (stream_open) {
        continue;
      }
    }

    int status = 0;
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      close(read_fd);
      result.status = command_status::EXITED;
      result.exit_code = decode_exit(status);
      return result;
    }
    if (waited < 0 && errno != EINTR) {
      close(read_fd);
      result.status = command_status::LAUNCH_FAILED;
      return result;
    }

    // Output closed but the child is still running.
    std::this_thread::sleep_for(std::chrono::milliseconds(std::max(1, poll_timeout_ms(context))));
  }
}

CommandResult run_shell(const std::string& command, const SampleContext& context, const std::size_t max_output_bytes) {
  return run_command({"/bin/sh", "-c", command}, context, max_output_bytes);
}

}  // namespace activity_agent::probes
