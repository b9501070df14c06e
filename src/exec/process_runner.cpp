#include "exec/process_runner.hpp"

#include <boost/process.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "exec/limited_text.hpp"
#include "utils/logging.hpp"

namespace chix::exec {
namespace bp = boost::process;
namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);
constexpr auto kTerminateGrace = std::chrono::seconds(2);

std::atomic<unsigned long> g_capture_counter{0};

// Temp files receiving the child's stdout and stderr; removed on scope exit.
class CaptureFiles {
public:
    CaptureFiles() {
        const auto stamp = std::to_string(::getpid()) + "_" +
                           std::to_string(g_capture_counter.fetch_add(1)) + "_" +
                           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        const auto dir = std::filesystem::temp_directory_path();
        stdout_path_ = dir / ("chix_stdout_" + stamp + ".log");
        stderr_path_ = dir / ("chix_stderr_" + stamp + ".log");
    }

    ~CaptureFiles() {
        std::error_code ec;
        std::filesystem::remove(stdout_path_, ec);
        std::filesystem::remove(stderr_path_, ec);
    }

    CaptureFiles(const CaptureFiles&) = delete;
    CaptureFiles& operator=(const CaptureFiles&) = delete;

    const std::filesystem::path& StdoutPath() const { return stdout_path_; }
    const std::filesystem::path& StderrPath() const { return stderr_path_; }

private:
    std::filesystem::path stdout_path_;
    std::filesystem::path stderr_path_;
};

// Owns the obligation to reap the child and kill whatever is left of its
// process group, on every path out of Run.
class ChildReaper {
public:
    ChildReaper(pid_t pid, bp::group& group)
        : pid_(pid)
        , group_(group) {}

    ~ChildReaper() {
        std::error_code ec;
        if (group_.valid()) {
            group_.terminate(ec);
        }
        if (!reaped_) {
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    ChildReaper(const ChildReaper&) = delete;
    ChildReaper& operator=(const ChildReaper&) = delete;

    // Non-blocking. Returns true once the child has exited and been reaped.
    bool Poll(int& status) {
        if (reaped_) {
            return true;
        }
        const auto waited = ::waitpid(pid_, &status, WNOHANG);
        if (waited == pid_) {
            reaped_ = true;
        } else if (waited < 0 && errno == ECHILD) {
            reaped_ = true;
            lost_status_ = true;
        }
        return reaped_;
    }

    bool LostStatus() const { return lost_status_; }

    void SignalGroup(int signal) {
        if (group_.valid()) {
            ::killpg(group_.native_handle(), signal);
        }
    }

private:
    pid_t pid_;
    bp::group& group_;
    bool reaped_ = false;
    bool lost_status_ = false;
};

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::string ResolveProgram(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return program;
    }
    const auto found = bp::search_path(program);
    return found.empty() ? std::string() : found.string();
}

bool Expired(std::chrono::steady_clock::time_point deadline, const CancellationTokenPtr& cancel) {
    return std::chrono::steady_clock::now() >= deadline || (cancel && cancel->IsCancelled());
}

}  // namespace

std::optional<Failure> ProcessResult::ToFailure() const {
    if (spawn_error) {
        return Failure{ErrorCode::kSpawnFailed, *spawn_error};
    }
    if (cancelled) {
        return Failure{ErrorCode::kCancelled, "command cancelled by caller"};
    }
    if (timed_out) {
        return Failure{ErrorCode::kTimeout, "command timed out"};
    }
    if (status_lost) {
        return Failure{ErrorCode::kSpawnFailed, "exit status unavailable"};
    }
    return std::nullopt;
}

ProcessResult ProcessRunner::Run(const std::string& program,
                                 const std::vector<std::string>& arguments,
                                 const ProcessOptions& options) {
    ProcessResult result{};
    if (program.empty()) {
        result.spawn_error = "program must not be empty";
        return result;
    }
    const auto executable = ResolveProgram(program);
    if (executable.empty()) {
        result.spawn_error = "program not found: " + program;
        utils::LogWarn("exec", "spawn failed", {{"program", program}, {"reason", "not found"}});
        return result;
    }

    CaptureFiles capture;
    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : options.env) {
        env[key] = value;
    }
    std::string start_dir;
    if (options.working_dir) {
        start_dir = *options.working_dir;
    } else {
        std::error_code ec;
        start_dir = std::filesystem::current_path(ec).string();
    }

    bp::group group;
    bp::child child_process;
    try {
        child_process = bp::child(
            bp::exe = executable,
            bp::args = arguments,
            env,
            bp::start_dir = start_dir,
            bp::std_in.close(),
            bp::std_out > capture.StdoutPath().string(),
            bp::std_err > capture.StderrPath().string(),
            group);
    } catch (const bp::process_error& ex) {
        result.spawn_error = std::string("failed to start ") + program + ": " + ex.what();
        utils::LogWarn("exec", "spawn failed", {{"program", program}, {"reason", ex.what()}});
        return result;
    }

    result.pid = child_process.id();
    // Reaping is ChildReaper's job from here on.
    child_process.detach();
    utils::LogDebug("exec", "spawned", {{"program", program}, {"pid", std::to_string(result.pid)}});

    int status = 0;
    {
        ChildReaper reaper(result.pid, group);
        const auto deadline = std::chrono::steady_clock::now() + options.timeout;
        bool finished = false;
        while (!Expired(deadline, options.cancel)) {
            if (reaper.Poll(status)) {
                finished = true;
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }

        if (!finished) {
            // Checked once more so a child finishing right at the deadline
            // still reports its exit code.
            finished = reaper.Poll(status);
        }

        if (!finished) {
            if (options.cancel && options.cancel->IsCancelled()) {
                result.cancelled = true;
            } else {
                result.timed_out = true;
            }
            utils::LogWarn("exec", result.cancelled ? "cancelled, terminating" : "timed out, terminating",
                           {{"program", program}, {"pid", std::to_string(result.pid)}});
            reaper.SignalGroup(SIGTERM);
            const auto grace_deadline = std::chrono::steady_clock::now() + kTerminateGrace;
            while (std::chrono::steady_clock::now() < grace_deadline) {
                if (reaper.Poll(status)) {
                    break;
                }
                std::this_thread::sleep_for(kPollInterval);
            }
            reaper.SignalGroup(SIGKILL);
        } else if (reaper.LostStatus()) {
            result.status_lost = true;
            utils::LogWarn("exec", "exit status unavailable", {
                {"program", program}, {"pid", std::to_string(result.pid)}});
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        } else {
            result.status_lost = true;
        }
    }

    result.output = SanitizeUtf8(ReadFile(capture.StdoutPath()));
    result.error = SanitizeUtf8(ReadFile(capture.StderrPath()));
    utils::LogDebug("exec", "finished", {
        {"program", program},
        {"exit_code", result.exit_code ? std::to_string(*result.exit_code) : std::string("none")},
        {"stdout_bytes", std::to_string(result.output.size())},
        {"stderr_bytes", std::to_string(result.error.size())}});
    return result;
}

ProcessResult ProcessRunner::Run(const CommandSpec& spec, const ExecutionContext& context) {
    ProcessOptions options{};
    options.working_dir = context.working_dir;
    options.env = context.env;
    options.timeout = context.timeout;
    options.cancel = context.cancel;
    return Run(spec.Program(), spec.Arguments(), options);
}

}  // namespace chix::exec
