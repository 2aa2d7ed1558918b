#include "runguard.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace safeexec {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// 子进程退出与输出的检查间隔
const int POLL_INTERVAL_MS = 20;

template <typename... Args>
[[noreturn]] static void error(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static void terminate(pid_t child_pid) {
    /* First try to kill graciously, then hard.
	   Don't report an already exited process as error. */
    LOG(INFO) << "sending SIGTERM to process group " << child_pid;
    if (kill(-child_pid, SIGTERM) != 0 && errno != ESRCH) {
        error(errno, "sending SIGTERM to command");
    }

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to process group " << child_pid;
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH) {
        error(errno, "sending SIGKILL to command");
    }
}

/**
 * @brief 运行中途出错时直接杀死整个进程组并回收子进程，不抛出异常
 */
static void abort_child(pid_t child_pid, bool reaped) noexcept {
    if (kill(-child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to kill process group " << child_pid << ": " << strerror(errno);
    if (reaped) return;
    while (waitpid(child_pid, nullptr, 0) < 0) {
        if (errno != EINTR) {
            LOG(ERROR) << "unable to reap child " << child_pid << ": " << strerror(errno);
            break;
        }
    }
}

static void pump_pipes(const runguard_options &opt, pollfd fds[], int child_pipefd[3][2],
                       string *buffers[3], bool *truncated[3]) {
    char buf[BUF_SIZE];

    for (int i = 1; i <= 2; i++) {
        pollfd &pfd = fds[i - 1];
        if (child_pipefd[i][PIPE_OUT] < 0 || !(pfd.revents & (POLLIN | POLLHUP | POLLERR)))
            continue;

        ssize_t nread = read(child_pipefd[i][PIPE_OUT], buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            error(errno, "copying data fd {}", i);
        }
        if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            close_fd(child_pipefd[i][PIPE_OUT]);
            continue;
        }

        string &buffer = *buffers[i];
        size_t to_write = nread;
        if (opt.stream_size >= 0) {
            size_t room = buffer.size() < (size_t)opt.stream_size ? opt.stream_size - buffer.size() : 0;
            if (room < to_write) {
                if (!*truncated[i]) LOG(INFO) << "child fd " << i << " limit reached";
                *truncated[i] = true;
                to_write = room;
            }
        }
        buffer.append(buf, to_write);
    }
}

static void summarize_status(int status, runguard_result &result) {
    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        if (!result.deadline_exceeded)
            LOG(WARNING) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }
}

/**
 * @brief 读取子进程的输出并等待子进程结束，超出时钟时间限制时杀死子进程所在的进程组
 * @param reaped 子进程是否已经被回收，抛出异常时调用方据此决定是否还需要回收
 */
static void supervise(const runguard_options &opt, pid_t child_pid, int child_pipefd[3][2],
                      chrono::steady_clock::time_point starttime, runguard_result &result, bool &reaped) {
    int status = 0;
    const bool use_wall_limit = opt.wall_limit.count() > 0;
    const auto deadline = starttime + opt.wall_limit;
    if (use_wall_limit)
        LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.count() / 1000.0);

    string *buffers[3] = {nullptr, &result.stdout_content, &result.stderr_content};
    bool *truncated[3] = {nullptr, &result.stdout_truncated, &result.stderr_truncated};

    while (!reaped || child_pipefd[1][PIPE_OUT] >= 0 || child_pipefd[2][PIPE_OUT] >= 0) {
        if (!reaped) {
            pid_t pid = waitpid(child_pid, &status, WNOHANG);
            if (pid == child_pid)
                reaped = true;
            else if (pid < 0 && errno != EINTR)
                error(errno, "waiting on child");
        }

        int timeout_ms = POLL_INTERVAL_MS;
        if (use_wall_limit) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command";
                result.deadline_exceeded = true;
                break;
            }
            timeout_ms = (int)min<long long>(timeout_ms, remaining);
        }

        pollfd fds[2];
        int nfds = 0;
        for (int i = 1; i <= 2; i++) {
            fds[i - 1].fd = child_pipefd[i][PIPE_OUT];  // poll ignores negative fds
            fds[i - 1].events = POLLIN;
            fds[i - 1].revents = 0;
            if (child_pipefd[i][PIPE_OUT] >= 0) ++nfds;
        }

        if (nfds == 0) {
            // 输出流都已关闭，只需要等待子进程退出
            struct timespec interval = {0, timeout_ms * 1000000L};
            nanosleep(&interval, nullptr);
            continue;
        }

        int r = poll(fds, 2, timeout_ms);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");
        if (r > 0) pump_pipes(opt, fds, child_pipefd, buffers, truncated);
    }

    if (result.deadline_exceeded) {
        // 子进程已经被回收时，进程组内可能还有占用管道的孙进程
        terminate(child_pid);
        if (!reaped) {
            while (waitpid(child_pid, &status, 0) < 0) {
                if (errno != EINTR) error(errno, "waiting on child");
            }
            reaped = true;
        }
    }

    auto endtime = chrono::steady_clock::now();
    result.wall_time = chrono::duration<double>(endtime - starttime).count();

    summarize_status(status, result);
}

runguard_result runit(const runguard_options &opt) {
    if (opt.command.empty())
        throw invalid_argument("runguard: no command to run");

    // 子进程在 exec 之前只能调用 async-signal-safe 的函数，因此参数必须在 fork 之前准备好
    vector<char *> argv;
    for (auto &arg : opt.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

#ifndef NDEBUG
    LOG(INFO) << join_command(opt.command);
#endif

    int child_pipefd[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
    int exec_pipefd[2] = {-1, -1};
    defer {
        for (int i = 1; i <= 2; i++) {
            close_fd(child_pipefd[i][PIPE_IN]);
            close_fd(child_pipefd[i][PIPE_OUT]);
        }
        close_fd(exec_pipefd[PIPE_IN]);
        close_fd(exec_pipefd[PIPE_OUT]);
    };

    /* Setup pipes connecting to child stdout/err streams (ignore stdin). */
    for (int i = 1; i <= 2; i++) {
        if (pipe2(child_pipefd[i], O_CLOEXEC) != 0) error(errno, "creating pipe for fd {}", i);
    }
    if (pipe2(exec_pipefd, O_CLOEXEC) != 0) error(errno, "creating pipe for exec status");

    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) error(errno, "opening /dev/null");
    defer { close_fd(devnull); };

    sigset_t emptymask;
    sigemptyset(&emptymask);

    runguard_result result;
    auto starttime = chrono::steady_clock::now();

    pid_t child_pid = fork();
    switch (child_pid) {
        case -1:
            error(errno, "unable to fork");
        case 0: {  // child process, run the command
            // run the command in a separate process group,
            // so the command and all its child processes can be killed
            // off with one signal
            setsid();
            sigprocmask(SIG_SETMASK, &emptymask, nullptr);
            signal(SIGPIPE, SIG_DFL);

            if (dup2(devnull, STDIN_FILENO) < 0 ||
                dup2(child_pipefd[1][PIPE_IN], STDOUT_FILENO) < 0 ||
                dup2(child_pipefd[2][PIPE_IN], STDERR_FILENO) < 0) {
                int err = errno;
                (void)!write(exec_pipefd[PIPE_IN], &err, sizeof(err));
                _exit(127);
            }

            execvp(argv[0], argv.data());
            int err = errno;
            (void)!write(exec_pipefd[PIPE_IN], &err, sizeof(err));
            _exit(127);
        }
        default:
            break;
    }

    /* Close unused file descriptors */
    for (int i = 1; i <= 2; i++) close_fd(child_pipefd[i][PIPE_IN]);
    close_fd(exec_pipefd[PIPE_IN]);

    {
        // 管道在 exec 成功时因为 O_CLOEXEC 被关闭，读到 EOF；失败时读到 errno
        int exec_errno = 0;
        ssize_t nread;
        do {
            nread = read(exec_pipefd[PIPE_OUT], &exec_errno, sizeof(exec_errno));
        } while (nread == -1 && errno == EINTR);
        close_fd(exec_pipefd[PIPE_OUT]);

        if (nread == sizeof(exec_errno)) {
            while (waitpid(child_pid, nullptr, 0) < 0 && errno == EINTR)
                ;
            LOG(ERROR) << "unable to start command " << opt.command[0] << ": " << strerror(exec_errno);
            throw launch_error(opt.command[0], exec_errno);
        }
    }

    bool reaped = false;
    try {
        supervise(opt, child_pid, child_pipefd, starttime, result, reaped);
    } catch (...) {
        // 比如输出过多导致 bad_alloc，子进程不能比 runit 活得更久
        abort_child(child_pid, reaped);
        result = runguard_result();
        LOG(ERROR) << "runguard failed while command " << opt.command[0] << " was running, process group " << child_pid << " killed";
        throw;
    }

    LOG(INFO) << fmt::format("run time: real {:.3f}, exitcode {}", result.wall_time, result.exitcode);
    return result;
}

}  // namespace safeexec
