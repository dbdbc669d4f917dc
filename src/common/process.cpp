#include "common/process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include "common/defer.hpp"
#include "common/utils.hpp"

extern char **environ;

namespace codebox {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 4096;

// 每次最多连续读取的次数，避免输出过快的子进程让监控循环错过时间限制
const int MAX_READS_PER_PUMP = 64;

const int POLL_INTERVAL_MS = 50;

// 子进程退出后读取管道中剩余输出的最大轮数，脱离了进程组的后代进程可能一直持有写端
const int MAX_DRAIN_ROUNDS = 16;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

[[noreturn]] static void error(int err, const string &what) {
    throw system_error(err, system_category(), what);
}

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static vector<string> build_environment(const process_options &options) {
    map<string, string> merged;
    if (options.inherit_env) {
        for (char **e = environ; e && *e; ++e) {
            string entry(*e);
            size_t pos = entry.find('=');
            if (pos == string::npos) continue;
            merged[entry.substr(0, pos)] = entry.substr(pos + 1);
        }
    }
    for (auto &[key, value] : options.env)
        merged[key] = value;

    vector<string> result;
    for (auto &[key, value] : merged)
        result.push_back(key + "=" + value);
    return result;
}

/**
 * @brief 从非阻塞的管道中读取子进程输出
 * @return 是否读取到了数据
 */
static bool pump_pipe(int &fd, string &buffer, bool &truncated, size_t limit) {
    char buf[BUF_SIZE];
    bool progress = false;
    for (int i = 0; fd >= 0 && i < MAX_READS_PER_PUMP; ++i) {
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread > 0) {
            progress = true;
            size_t keep = buffer.size() < limit ? min((size_t)nread, limit - buffer.size()) : 0;
            buffer.append(buf, keep);
            if (keep < (size_t)nread) truncated = true;
        } else if (nread == 0) {
            // EOF：所有写端都已经关闭
            close_fd(fd);
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        } else {
            error(errno, "copying data from child process");
        }
    }
    return progress;
}

/**
 * @brief 先尝试让进程组正常退出，再强制杀死
 * 已经退出的进程组不视为错误
 */
static void terminate_group(pid_t pid) {
    LOG(INFO) << "sending SIGTERM to process group " << pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGTERM to process group " << pid << ": " << strerror(errno);

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to process group " << pid;
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
}

process_result posix_process_runner::run(const process_options &options) {
    if (options.argv.empty())
        throw invalid_argument("no command provided");

#ifndef NDEBUG
    LOG(INFO) << format_command(options.argv);
#endif

    // fork 之后子进程中只能调用 async-signal-safe 的函数，因此所有内存分配都要在 fork 之前完成
    vector<string> args = options.argv;
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    vector<string> envs = build_environment(options);
    vector<char *> envp;
    for (auto &env : envs) envp.push_back(env.data());
    envp.push_back(nullptr);

    string workdir = options.workdir.string();

    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    defer {
        for (int *p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[PIPE_OUT]);
            close_fd(p[PIPE_IN]);
        }
    };
    if (pipe2(out_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stdout");
    if (pipe2(err_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for stderr");
    // exec 成功时该管道会因为 O_CLOEXEC 被关闭，失败时子进程将 errno 写入该管道
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) error(errno, "creating pipe for exec status");

    elapsed_time timer;

    pid_t pid = fork();
    if (pid < 0) error(errno, "unable to fork");

    if (pid == 0) {  // 子进程
        setpgid(0, 0);

        sigset_t emptymask;
        sigemptyset(&emptymask);
        sigprocmask(SIG_SETMASK, &emptymask, nullptr);
        signal(SIGPIPE, SIG_DFL);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 ||
            dup2(out_pipe[PIPE_IN], STDOUT_FILENO) < 0 ||
            dup2(err_pipe[PIPE_IN], STDERR_FILENO) < 0) {
            int err = errno;
            (void)!write(exec_pipe[PIPE_IN], &err, sizeof(err));
            _exit(127);
        }

        if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
            int err = errno;
            (void)!write(exec_pipe[PIPE_IN], &err, sizeof(err));
            _exit(127);
        }

        execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        (void)!write(exec_pipe[PIPE_IN], &err, sizeof(err));
        _exit(127);
    }

    // 父进程
    // 子进程可能还没来得及调用 setpgid，这里也设置一次，避免超时时 kill(-pid) 找不到进程组
    setpgid(pid, pid);

    bool reaped = false;
    int status = 0;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        }
    };

    close_fd(out_pipe[PIPE_IN]);
    close_fd(err_pipe[PIPE_IN]);
    close_fd(exec_pipe[PIPE_IN]);

    {
        int child_errno = 0;
        ssize_t n;
        while ((n = read(exec_pipe[PIPE_OUT], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
        close_fd(exec_pipe[PIPE_OUT]);
        if (n == sizeof(child_errno)) {
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            reaped = true;
            error(child_errno, "unable to start command " + options.argv[0]);
        }
    }

    for (int fd : {out_pipe[PIPE_OUT], err_pipe[PIPE_OUT]}) {
        int flags = fcntl(fd, F_GETFL);
        if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
            error(errno, "fcntl, setting flags");
    }

    process_result result;
    bool has_deadline = options.timeout.count() > 0;
    auto deadline = chrono::steady_clock::now() + options.timeout;

    while (true) {
        int wait_ms = POLL_INTERVAL_MS;
        if (has_deadline) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command " << options.argv[0];
                result.timed_out = true;
                terminate_group(pid);
                break;
            }
            wait_ms = (int)min<long long>(wait_ms, remaining);
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        for (int fd : {out_pipe[PIPE_OUT], err_pipe[PIPE_OUT]}) {
            if (fd >= 0) {
                fds[nfds].fd = fd;
                fds[nfds].events = POLLIN;
                fds[nfds].revents = 0;
                ++nfds;
            }
        }
        if (poll(fds, nfds, wait_ms) < 0 && errno != EINTR)
            error(errno, "waiting for child data");

        pump_pipe(out_pipe[PIPE_OUT], result.out, result.out_truncated, options.output_limit);
        pump_pipe(err_pipe[PIPE_OUT], result.err, result.err_truncated, options.output_limit);

        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped = true;
            break;
        }
        if (r < 0 && errno != EINTR) error(errno, "waiting on child");
    }

    if (!reaped) {
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) error(errno, "waiting on child");
        }
        reaped = true;
    }

    // 进程组内可能还有残留的子进程持有管道写端，杀死它们之后再读取剩余输出
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill process group " << pid << ": " << strerror(errno);

    for (int i = 0; i < MAX_DRAIN_ROUNDS; ++i) {
        bool progress = pump_pipe(out_pipe[PIPE_OUT], result.out, result.out_truncated, options.output_limit);
        progress |= pump_pipe(err_pipe[PIPE_OUT], result.err, result.err_truncated, options.output_limit);
        if (!progress) break;
    }

    result.wall_time = timer.duration<chrono::milliseconds>().count() / 1000.0;

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitcode = 128 + result.signal;
        if (!result.timed_out)
            LOG(INFO) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    }

    if (result.out_truncated || result.err_truncated)
        LOG(INFO) << "output of " << options.argv[0] << " truncated to " << options.output_limit << " bytes";

    return result;
}

}  // namespace codebox
