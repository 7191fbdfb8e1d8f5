#include "monitor/resource_monitor.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/single_fire_channel.hpp"
#include "common/utils.hpp"
#include "monitor/process_tree.hpp"

namespace sandbox {
using namespace std;

static const int PIPE_IN = 1;
static const int PIPE_OUT = 0;
static const size_t BUF_SIZE = 4 * 1024;

// 内存采样间隔
static const auto WATCH_INTERVAL = chrono::milliseconds(100);
// 读取管道时 poll 的等待时间，同时也是检查进程是否退出的间隔
static const int POLL_INTERVAL_MS = 20;
// 进程退出或被杀死后，最多再等待多久读完管道中残留的数据
static const auto DRAIN_GRACE = chrono::seconds(1);

static const char *DEFAULT_PATH = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

[[noreturn]] static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

namespace {

/**
 * @brief 持有一个文件描述符，析构时关闭
 */
struct unique_fd {
    int fd = -1;

    unique_fd() = default;
    explicit unique_fd(int fd) : fd(fd) {}
    unique_fd(const unique_fd &) = delete;
    unique_fd &operator=(const unique_fd &) = delete;
    ~unique_fd() { reset(); }

    void reset(int new_fd = -1) {
        if (fd >= 0) close(fd);
        fd = new_fd;
    }
};

struct pipe_fds {
    unique_fd end[2];

    pipe_fds() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) error(errno, "creating pipe");
        end[PIPE_OUT].reset(fds[PIPE_OUT]);
        end[PIPE_IN].reset(fds[PIPE_IN]);
    }
};

/**
 * @brief 子进程的一路输出
 * 超出 stream_size 的数据照常读出，但直接丢弃，以免子进程因为管道写满而阻塞。
 */
struct output_stream {
    int fd;
    string &data;
    size_t limit;
    bool limit_reached = false;

    /**
     * @return 是否读到 EOF
     */
    bool pump() {
        char buf[BUF_SIZE];
        ssize_t nread = read(fd, buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return false;
            error(errno, fmt::format("copying data from fd {}", fd));
        }
        if (nread == 0) return true;

        size_t to_keep = min((size_t) nread, limit - data.size());
        data.append(buf, to_keep);
        if (!limit_reached && data.size() == limit) {
            limit_reached = true;
            LOG(INFO) << "child fd " << fd << " limit reached";
        }
        return false;
    }
};

}  // namespace

/**
 * @brief 在子进程中报告错误并退出，只能调用 async-signal-safe 的函数
 */
[[noreturn]] static void child_fail(int error_fd) {
    int err = errno;
    ssize_t written = write(error_fd, &err, sizeof(err));
    (void) written;
    _exit(127);
}

static void set_child_limit(int resource, rlim_t limit, int error_fd) {
    struct rlimit lim;
    lim.rlim_cur = lim.rlim_max = limit;
    if (setrlimit(resource, &lim) != 0) child_fail(error_fd);
}

static int exit_code_from_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

raw_run_outcome run_monitored(const run_options &opt) {
    if (opt.command.empty())
        throw invalid_argument("command to run must not be empty");

    // fork 之后子进程只能调用 async-signal-safe 的函数，因此在这里准备好 argv 和 envp
    vector<string> env_list;
    env_list.push_back("PATH=" + get_env("PATH", DEFAULT_PATH));
    for (auto &[key, value] : opt.env)
        if (key != "PATH") env_list.push_back(key + "=" + value);

    vector<char *> argv, envp;
    for (auto &arg : opt.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    for (auto &var : env_list) envp.push_back(const_cast<char *>(var.c_str()));
    envp.push_back(nullptr);

    string stdin_filename = opt.stdin_filename.empty() ? "/dev/null" : opt.stdin_filename.string();
    unique_fd stdin_fd(open(stdin_filename.c_str(), O_RDONLY | O_CLOEXEC));
    if (stdin_fd.fd < 0) error(errno, fmt::format("opening stdin file {}", stdin_filename));

    string work_dir = opt.work_dir.string();
    pipe_fds out_pipe, err_pipe, exec_pipe;

    elapsed_time timer;
    pid_t pid = fork();
    if (pid == -1) error(errno, "unable to fork");

    if (pid == 0) {  // child
        int error_fd = exec_pipe.end[PIPE_IN].fd;

        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        // 新的进程组，杀死进程组即可杀死程序创建的所有进程
        if (setpgid(0, 0) != 0) child_fail(error_fd);

        if (dup2(stdin_fd.fd, STDIN_FILENO) < 0 ||
            dup2(out_pipe.end[PIPE_IN].fd, STDOUT_FILENO) < 0 ||
            dup2(err_pipe.end[PIPE_IN].fd, STDERR_FILENO) < 0)
            child_fail(error_fd);

        set_child_limit(RLIMIT_CORE, 0, error_fd);
        if (opt.file_limit > 0) set_child_limit(RLIMIT_FSIZE, opt.file_limit, error_fd);

        if (!work_dir.empty() && chdir(work_dir.c_str()) != 0) child_fail(error_fd);

        execvpe(argv[0], argv.data(), envp.data());
        child_fail(error_fd);
    }

    // 父进程同样设置一次进程组，避免在子进程调用 setpgid 之前就需要杀死进程组
    setpgid(pid, pid);

    stdin_fd.reset();
    out_pipe.end[PIPE_IN].reset();
    err_pipe.end[PIPE_IN].reset();
    exec_pipe.end[PIPE_IN].reset();

    bool reaped = false;
    single_fire_channel<termination_reason> channel;
    thread watcher;

    defer {
        // 只在异常路径上生效：确保子进程被杀死回收，监控线程已经结束
        channel.fire(termination_reason::EXITED);
        if (watcher.joinable()) watcher.join();
        if (!reaped) {
            kill_process_tree(pid);
            while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR)
                ;
        }
    };

    // execvpe 成功时 close-on-exec 的管道被关闭，read 返回 0
    int exec_errno = 0;
    ssize_t nread;
    while ((nread = read(exec_pipe.end[PIPE_OUT].fd, &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR)
        ;
    if (nread == sizeof(exec_errno)) {
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR)
            ;
        reaped = true;
        throw infrastructure_error(fmt::format("unable to start {}: {}", opt.command[0], strerror(exec_errno)));
    }

    atomic<long long> peak_rss_kb{0};
    long long memory_limit_kb = opt.memory_limit_mb > 0 ? (long long) opt.memory_limit_mb * 1024 : 0;
    if (process_memory_supported()) {
        watcher = thread([&, pid] {
            while (!channel.wait_for(WATCH_INTERVAL)) {
                long long rss = process_tree_rss_kb(pid);
                if (rss > peak_rss_kb) peak_rss_kb = rss;
                if (memory_limit_kb > 0 && rss > memory_limit_kb) {
                    // 只有赢得信道的一方才能杀死进程树，此时主线程还没有回收子进程
                    if (channel.fire(termination_reason::MEMORY_EXCEEDED)) {
                        LOG(WARNING) << "memory limit exceeded: " << rss << "KB > " << memory_limit_kb << "KB, killing process " << pid;
                        kill_process_tree(pid);
                    }
                    return;
                }
            }
        });
    } else {
        LOG(WARNING) << "/proc is not available, memory limit will not be enforced";
    }

    raw_run_outcome outcome;
    output_stream streams[2] = {
        {out_pipe.end[PIPE_OUT].fd, outcome.stdout_data, opt.stream_size},
        {err_pipe.end[PIPE_OUT].fd, outcome.stderr_data, opt.stream_size}};

    auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(opt.wall_limit));
    bool exited = false, killed = false;
    chrono::steady_clock::time_point drain_deadline;

    while (true) {
        if (!exited) {
            siginfo_t info;
            memset(&info, 0, sizeof(info));
            if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) {
                exited = true;
                outcome.elapsed_ms = timer.milliseconds();
                channel.fire(termination_reason::EXITED);
                if (watcher.joinable()) watcher.join();
                // 子进程还未被回收，进程组号不会被复用；杀死仍然持有管道的残留进程
                kill(-pid, SIGKILL);
                drain_deadline = chrono::steady_clock::now() + DRAIN_GRACE;
            }
        }

        auto now = chrono::steady_clock::now();
        if (!exited && !killed && now >= deadline) {
            killed = true;
            if (channel.fire(termination_reason::TIMED_OUT)) {
                LOG(WARNING) << "wall time limit of " << opt.wall_limit << "s exceeded, killing process " << pid;
                kill_process_tree(pid);
            }
        }

        vector<pollfd> fds;
        vector<output_stream *> polled;
        for (auto &stream : streams) {
            if (stream.fd < 0) continue;
            fds.push_back({stream.fd, POLLIN, 0});
            polled.push_back(&stream);
        }

        if (exited && (fds.empty() || now >= drain_deadline)) break;

        int ready = poll(fds.data(), fds.size(), POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            error(errno, "polling child output");
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents == 0) continue;
            if (polled[i]->pump()) polled[i]->fd = -1;
        }
    }

    out_pipe.end[PIPE_OUT].reset();
    err_pipe.end[PIPE_OUT].reset();

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    while (wait4(pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) error(errno, fmt::format("waiting for process {}", pid));
    }
    reaped = true;

    outcome.exit_code = exit_code_from_status(status);
    outcome.memory_mb = max((long long) peak_rss_kb, (long long) usage.ru_maxrss) / 1024.0;

    termination_reason reason = channel.peek().value_or(termination_reason::EXITED);
    if (reason == termination_reason::MEMORY_EXCEEDED && outcome.elapsed_ms >= opt.wall_limit * 1000)
        reason = termination_reason::TIMED_OUT;
    outcome.timed_out = reason == termination_reason::TIMED_OUT;
    outcome.memory_exceeded = reason == termination_reason::MEMORY_EXCEEDED;

    DLOG(INFO) << "process " << pid << " finished with exit code " << outcome.exit_code
               << ", elapsed " << outcome.elapsed_ms << "ms, memory " << outcome.memory_mb << "MB";
    return outcome;
}

}  // namespace sandbox
