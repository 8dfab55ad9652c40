#include <metatree/subprocess.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <optional>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace metatree {
namespace {

using Clock = std::chrono::steady_clock;

constexpr int kStopPollMilliseconds = 100;

[[noreturn]] void ThrowErrno(const std::string &what) {
  throw std::system_error(errno, std::generic_category(), what);
}

class Pipe {
public:
  Pipe() {
    if (::pipe2(descriptors_.data(), O_CLOEXEC) != 0) {
      ThrowErrno("Cannot create pipe");
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  int Read() const { return descriptors_[0]; }
  int Write() const { return descriptors_[1]; }
  void CloseRead() { Close(descriptors_[0]); }
  void CloseWrite() { Close(descriptors_[1]); }

private:
  static void Close(int &descriptor) {
    if (descriptor >= 0) {
      ::close(descriptor);
      descriptor = -1;
    }
  }

  std::array<int, 2> descriptors_{-1, -1};
};

// Runs in the forked child: async-signal-safe calls only.
[[noreturn]] void ExecChild(char *const *arguments,
                            const ProcessOptions &options, Pipe &output,
                            Pipe &error, Pipe &exec_status) {
  const int null_input = ::open("/dev/null", O_RDONLY);
  if (null_input >= 0) {
    ::dup2(null_input, STDIN_FILENO);
  }
  ::dup2(output.Write(), STDOUT_FILENO);
  ::dup2(error.Write(), STDERR_FILENO);
  ::setpgid(0, 0);

  if (options.working_directory &&
      ::chdir(options.working_directory->c_str()) != 0) {
    const int failure = errno;
    (void)::write(exec_status.Write(), &failure, sizeof(failure));
    ::_exit(127);
  }

  ::execvp(arguments[0], arguments);

  const int failure = errno;
  (void)::write(exec_status.Write(), &failure, sizeof(failure));
  ::_exit(127);
}

bool DrainInto(int descriptor, std::string &target) {
  std::array<char, 4096> buffer{};
  const auto count = ::read(descriptor, buffer.data(), buffer.size());
  if (count > 0) {
    target.append(buffer.data(), static_cast<std::size_t>(count));
    return true;
  }
  return count < 0 && (errno == EINTR || errno == EAGAIN);
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string> &argv,
                         const ProcessOptions &options) {
  if (argv.empty()) {
    throw std::invalid_argument("Cannot run an empty command");
  }

  std::vector<char *> arguments;
  arguments.reserve(argv.size() + 1);
  for (const auto &argument : argv) {
    arguments.push_back(const_cast<char *>(argument.c_str()));
  }
  arguments.push_back(nullptr);

  Pipe output;
  Pipe error;
  Pipe exec_status;
  const pid_t pid = ::fork();
  if (pid < 0) {
    ThrowErrno("Cannot fork for " + argv.front());
  }
  if (pid == 0) {
    ExecChild(arguments.data(), options, output, error, exec_status);
  }

  output.CloseWrite();
  error.CloseWrite();
  exec_status.CloseWrite();

  int exec_errno = 0;
  if (::read(exec_status.Read(), &exec_errno, sizeof(exec_errno)) ==
      static_cast<ssize_t>(sizeof(exec_errno))) {
    int ignored = 0;
    while (::waitpid(pid, &ignored, 0) < 0 && errno == EINTR) {
    }
    throw std::system_error(exec_errno, std::generic_category(),
                            "Cannot execute " + argv.front());
  }

  ProcessResult result;
  const auto started = Clock::now();
  std::optional<Clock::time_point> kill_deadline;
  bool killed = false;

  const auto terminate = [&](bool timed_out) {
    result.timed_out = timed_out;
    result.stopped = !timed_out;
    ::kill(-pid, SIGTERM);
    kill_deadline = Clock::now() + options.grace;
  };

  std::array<pollfd, 2> descriptors{pollfd{output.Read(), POLLIN, 0},
                                    pollfd{error.Read(), POLLIN, 0}};
  std::array<std::string *, 2> targets{&result.standard_output,
                                       &result.standard_error};
  int open_descriptors = 2;
  int status = 0;
  while (true) {
    const auto now = Clock::now();
    if (!kill_deadline) {
      if (options.stop_requested != nullptr && options.stop_requested->load()) {
        terminate(false);
      } else if (options.timeout.count() > 0 &&
                 now - started >= options.timeout) {
        terminate(true);
      }
    } else if (!killed && now >= *kill_deadline) {
      ::kill(-pid, SIGKILL);
      killed = true;
    }

    // Once the output is closed, or the process is killed while leftover
    // grandchildren keep the pipes open, only its exit matters.
    if (open_descriptors == 0 || killed) {
      const auto waited = ::waitpid(pid, &status, WNOHANG);
      if (waited == pid) {
        break;
      }
      if (waited < 0 && errno != EINTR) {
        ThrowErrno("Cannot wait for " + argv.front());
      }
    }

    std::optional<Clock::time_point> deadline;
    if (kill_deadline) {
      if (!killed) {
        deadline = kill_deadline;
      }
    } else if (options.timeout.count() > 0) {
      deadline = started + options.timeout;
    }

    int wait_milliseconds = -1;
    if (options.stop_requested != nullptr || killed || open_descriptors == 0) {
      wait_milliseconds = kStopPollMilliseconds;
    }
    if (deadline) {
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(*deadline -
                                                                now)
              .count();
      const int bounded = static_cast<int>(std::max<long long>(0, remaining));
      wait_milliseconds =
          wait_milliseconds < 0 ? bounded : std::min(wait_milliseconds, bounded);
    }

    const int ready =
        ::poll(descriptors.data(), descriptors.size(), wait_milliseconds);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      ThrowErrno("Cannot poll output of " + argv.front());
    }
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
      if (descriptors[i].fd < 0 || descriptors[i].revents == 0) {
        continue;
      }
      if (!DrainInto(descriptors[i].fd, *targets[i])) {
        descriptors[i].fd = -1;
        --open_descriptors;
      }
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

} // namespace metatree
