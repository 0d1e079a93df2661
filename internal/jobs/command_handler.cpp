#include "command_handler.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

extern char** environ;

namespace jobhub::jobs {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

constexpr const char* kTruncatedMarker = "\n[output truncated]";

std::string SystemError(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

// Scalar config value as text; `what` names the value in errors.
std::string ScalarText(const Value& value, const std::string& what) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return value.string_value();
    case Value::kNumberValue: {
      const double number = value.number_value();
      if (std::floor(number) == number && std::fabs(number) < 1e15) {
        return std::to_string(static_cast<long long>(number));
      }
      return std::to_string(number);
    }
    case Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    default:
      throw util::InvalidConfig(what + " must be a string, number or bool");
  }
}

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd = -1) : fd_(fd) {
  }
  ~FileDescriptor() {
    Reset();
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const {
    return fd_;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_;
};

// Appends up to the cap and keeps draining past it so the child never
// blocks on a full pipe. Returns false on EOF.
bool DrainPipe(int fd, std::string& output, bool& truncated) {
  std::array<char, 4096> buffer;
  for (;;) {
    const ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      const auto room = CommandHandler::kMaxOutputBytes - std::min(output.size(), CommandHandler::kMaxOutputBytes);
      output.append(buffer.data(), std::min<std::size_t>(room, static_cast<std::size_t>(n)));
      truncated = truncated || static_cast<std::size_t>(n) > room;
      continue;
    }
    if (n == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    // EAGAIN: nothing buffered right now
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace

CommandHandler::Invocation CommandHandler::Parse(const Struct& config) {
  Invocation invocation;

  for (const auto& [key, value] : config.fields()) {
    if (key == "command") {
      if (value.kind_case() != Value::kStringValue || value.string_value().empty()) {
        throw util::InvalidConfig("command must be a non-empty string");
      }
      invocation.command = value.string_value();
    } else if (key == "arguments") {
      if (value.kind_case() != Value::kListValue) {
        throw util::InvalidConfig("arguments must be a list");
      }
      const auto& list = value.list_value().values();
      for (int i = 0; i < list.size(); ++i) {
        invocation.arguments.push_back(ScalarText(list[i], "arguments[" + std::to_string(i) + "]"));
      }
    } else if (key == "working_dir") {
      if (value.kind_case() != Value::kStringValue) {
        throw util::InvalidConfig("working_dir must be a string");
      }
      invocation.working_dir = value.string_value();
    } else if (key == "environment") {
      if (value.kind_case() != Value::kStructValue) {
        throw util::InvalidConfig("environment must be a map");
      }
      for (const auto& [name, entry] : value.struct_value().fields()) {
        if (name.empty() || name.find('=') != std::string::npos) {
          throw util::InvalidConfig("invalid environment variable name: " + name);
        }
        invocation.environment[name] = ScalarText(entry, "environment." + name);
      }
    } else {
      throw util::InvalidConfig("unknown command config key: " + key);
    }
  }

  if (invocation.command.empty()) {
    throw util::InvalidConfig("command is required");
  }
  return invocation;
}

void CommandHandler::Validate(const Struct& config) const {
  Parse(config);
}

WorkResult CommandHandler::Run(JobContext& context) {
  const auto invocation = Parse(context.job().config());

  // Everything the child touches is prepared before fork().
  std::vector<std::string> argv_storage;
  argv_storage.reserve(invocation.arguments.size() + 1);
  argv_storage.push_back(invocation.command);
  argv_storage.insert(argv_storage.end(), invocation.arguments.begin(), invocation.arguments.end());
  std::vector<char*> argv;
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::vector<std::string> env_storage;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    std::string_view text(*entry);
    const auto       name = text.substr(0, text.find('='));
    if (invocation.environment.count(std::string(name)) == 0) {
      env_storage.emplace_back(text);
    }
  }
  for (const auto& [name, value] : invocation.environment) {
    env_storage.push_back(name + "=" + value);
  }
  std::vector<char*> envp;
  for (auto& entry : env_storage) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  const char* working_dir = invocation.working_dir.empty() ? nullptr : invocation.working_dir.c_str();

  int pipefd[2];
  if (::pipe2(pipefd, O_CLOEXEC) < 0) {
    throw util::ExecutionFailure(SystemError("pipe"));
  }
  FileDescriptor read_end(pipefd[0]);
  FileDescriptor write_end(pipefd[1]);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw util::ExecutionFailure(SystemError("fork"));
  }

  if (pid == 0) {
    // Child path: async-signal-safe calls only.
    ::setpgid(0, 0);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      if (devnull != STDIN_FILENO) {
        ::close(devnull);
      }
    }
    ::dup2(write_end.get(), STDOUT_FILENO);
    ::dup2(write_end.get(), STDERR_FILENO);
    if (working_dir != nullptr && ::chdir(working_dir) < 0) {
      static constexpr char kMessage[] = "jobhub: cannot change to working directory\n";
      [[maybe_unused]] auto written    = ::write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1);
      ::_exit(126);
    }
    ::execvpe(argv[0], argv.data(), envp.data());
    static constexpr char kMessage[] = "jobhub: exec failed\n";
    [[maybe_unused]] auto written    = ::write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1);
    ::_exit(127);
  }

  // Parent path.
  ::setpgid(pid, pid);
  write_end.Reset();
  ::fcntl(read_end.get(), F_SETFL, ::fcntl(read_end.get(), F_GETFL) | O_NONBLOCK);

  JOBHUB_LOG_DEBUG("command started",
                   {observability::StringField("job_id", context.job().id()), observability::StringField("command", invocation.command),
                    observability::IntField("pid", pid)});

  std::string                           output;
  bool                                  truncated   = false;
  bool                                  pipe_open   = true;
  bool                                  term_sent   = false;
  bool                                  kill_sent   = false;
  int                                   wait_status = 0;
  std::chrono::steady_clock::time_point term_deadline;

  for (;;) {
    if (pipe_open) {
      pollfd pfd{read_end.get(), POLLIN, 0};
      const int ready = ::poll(&pfd, 1, static_cast<int>(kPollInterval.count()));
      if (ready > 0) {
        pipe_open = DrainPipe(read_end.get(), output, truncated);
      }
    } else {
      context.token().WaitFor(kPollInterval);
    }

    const pid_t waited = ::waitpid(pid, &wait_status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      throw util::ExecutionFailure(SystemError("waitpid"));
    }

    if (context.IsCancelled()) {
      const auto now = std::chrono::steady_clock::now();
      if (!term_sent) {
        ::kill(-pid, SIGTERM);
        term_sent     = true;
        term_deadline = now + kKillGracePeriod;
        JOBHUB_LOG_INFO("command cancelled, sent SIGTERM",
                        {observability::StringField("job_id", context.job().id()), observability::IntField("pid", pid)});
      } else if (!kill_sent && now >= term_deadline) {
        ::kill(-pid, SIGKILL);
        kill_sent = true;
        JOBHUB_LOG_WARN("command ignored SIGTERM, sent SIGKILL",
                        {observability::StringField("job_id", context.job().id()), observability::IntField("pid", pid)});
      }
    }
  }

  if (pipe_open) {
    DrainPipe(read_end.get(), output, truncated);
  }
  if (truncated) {
    output += kTruncatedMarker;
  }

  WorkResult result;
  if (WIFEXITED(wait_status)) {
    result.exit_code = WEXITSTATUS(wait_status);
    if (result.exit_code != 0) {
      result = WorkResult::Failure("exit status " + std::to_string(WEXITSTATUS(wait_status)));
      result.exit_code = WEXITSTATUS(wait_status);
    }
  } else if (WIFSIGNALED(wait_status)) {
    result           = WorkResult::Failure("terminated by signal " + std::to_string(WTERMSIG(wait_status)));
    result.exit_code = -1;
  }
  result.output = std::move(output);
  return result;
}

} // namespace jobhub::jobs
