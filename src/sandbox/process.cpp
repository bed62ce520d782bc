#include "sandbox/process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace codejudge {
using namespace std;

namespace {

using clock_type = chrono::steady_clock;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const size_t BUF_SIZE = 65536;

const auto wait_interval = chrono::milliseconds(5);

[[noreturn]] void error(const string &what) {
    throw system_error(errno, system_category(), what);
}

struct pipe_fds {
    int fd[2] = {-1, -1};

    pipe_fds() {
        // O_CLOEXEC 确保其他线程同时 fork 出来的子进程不会继承这些管道
        if (pipe2(fd, O_CLOEXEC) != 0) error("creating pipe");
    }

    ~pipe_fds() {
        close_end(PIPE_IN);
        close_end(PIPE_OUT);
    }

    pipe_fds(const pipe_fds &) = delete;
    pipe_fds &operator=(const pipe_fds &) = delete;

    int operator[](int end) const { return fd[end]; }

    void close_end(int end) {
        if (fd[end] < 0) return;
        close(fd[end]);
        fd[end] = -1;
    }
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        error("fcntl, setting flags");
}

void ignore_sigpipe() {
    // 子进程提前退出时继续写 stdin 会触发 SIGPIPE，我们需要的是 EPIPE
    static once_flag flag;
    call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

void write_message(const char *message) {
    if (write(STDERR_FILENO, message, strlen(message)) < 0) {
        // nothing we can do in the child
    }
}

/**
 * @brief fork 之后在子进程中调用，只使用 async-signal-safe 的函数
 */
[[noreturn]] void exec_child(const process_options &opt, char **argv, pipe_fds &in, pipe_fds &out, pipe_fds &err) {
    setpgid(0, 0);

    // 被忽略的信号在 exec 后仍然被忽略，需要恢复 SIGPIPE 的默认行为
    signal(SIGPIPE, SIG_DFL);
    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);

    if (dup2(in[PIPE_OUT], STDIN_FILENO) < 0 ||
        dup2(out[PIPE_IN], STDOUT_FILENO) < 0 ||
        dup2(err[PIPE_IN], STDERR_FILENO) < 0)
        _exit(127);

    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0) {
        write_message("unable to change working directory\n");
        _exit(127);
    }

    execvp(argv[0], argv);
    write_message("unable to start command ");
    write_message(argv[0]);
    write_message("\n");
    _exit(127);
}

/**
 * @brief 等待子进程结束，但不回收子进程
 * 子进程变成僵尸进程后，其 pid 不会被复用，此时仍然可以安全地杀死整个进程组
 * @return 若在 deadline 之前子进程结束，返回 true
 */
bool wait_exit(pid_t pid, const optional<clock_type::time_point> &deadline) {
    while (true) {
        siginfo_t info;
        memset(&info, 0, sizeof(info));
        int flags = WEXITED | WNOWAIT | (deadline ? WNOHANG : 0);
        if (waitid(P_PID, pid, &info, flags) != 0) {
            if (errno == EINTR) continue;
            error("waiting on child");
        }
        if (info.si_pid == pid) return true;
        if (clock_type::now() >= *deadline) return false;
        this_thread::sleep_for(wait_interval);
    }
}

/**
 * @brief 向子进程写入 stdin，并读取子进程的 stdout 和 stderr，直到输出结束或者超时
 */
void pump_pipes(const process_options &opt, const optional<clock_type::time_point> &deadline,
                pipe_fds &in, pipe_fds &out, pipe_fds &err, process_result &result) {
    static thread_local char buf[BUF_SIZE];
    size_t written = 0;
    if (opt.stdin_data.empty()) in.close_end(PIPE_IN);

    while (out[PIPE_OUT] >= 0 || err[PIPE_OUT] >= 0) {
        int timeout = -1;
        if (deadline) {
            auto remaining = chrono::duration_cast<chrono::milliseconds>(*deadline - clock_type::now()).count();
            if (remaining <= 0) {
                result.timed_out = true;
                return;
            }
            timeout = (int)remaining + 1;
        }

        pollfd fds[3];
        int nfds = 0;
        if (in[PIPE_IN] >= 0) fds[nfds++] = {in[PIPE_IN], POLLOUT, 0};
        if (out[PIPE_OUT] >= 0) fds[nfds++] = {out[PIPE_OUT], POLLIN, 0};
        if (err[PIPE_OUT] >= 0) fds[nfds++] = {err[PIPE_OUT], POLLIN, 0};

        int r = poll(fds, nfds, timeout);
        if (r < 0) {
            if (errno == EINTR) continue;
            error("waiting for child data");
        }

        for (int i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;

            if (fds[i].fd == in[PIPE_IN]) {
                size_t to_write = min(BUF_SIZE, opt.stdin_data.size() - written);
                ssize_t nwritten = write(in[PIPE_IN], opt.stdin_data.data() + written, to_write);
                if (nwritten < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    if (errno == EPIPE) {  // 子进程不再读取 stdin
                        in.close_end(PIPE_IN);
                        continue;
                    }
                    error("writing child stdin");
                }
                written += nwritten;
                if (written == opt.stdin_data.size()) in.close_end(PIPE_IN);
                continue;
            }

            pipe_fds &p = fds[i].fd == out[PIPE_OUT] ? out : err;
            string &target = fds[i].fd == out[PIPE_OUT] ? result.out : result.err;
            ssize_t nread = read(p[PIPE_OUT], buf, BUF_SIZE);
            if (nread < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                error("reading child output");
            }
            if (nread == 0) {  // EOF
                p.close_end(PIPE_OUT);
                continue;
            }
            if (target.size() < opt.output_limit)
                target.append(buf, min((size_t)nread, opt.output_limit - target.size()));
        }
    }
}

}  // namespace

process_result run_process(const process_options &opt) {
    if (opt.command.empty()) throw invalid_argument("command should not be empty");
    ignore_sigpipe();

    // fork 之后子进程不能再分配内存，因此先准备好 argv
    vector<string> cmd = opt.command;
    vector<char *> argv;
    for (auto &arg : cmd) argv.push_back(arg.data());
    argv.push_back(nullptr);

    DLOG(INFO) << "Executing " << boost::algorithm::join(opt.command, " ") << " in " << opt.work_dir;

    pipe_fds in, out, err;

    process_result result;
    auto start = clock_type::now();
    optional<clock_type::time_point> deadline;
    if (opt.time_limit > 0)
        deadline = start + chrono::duration_cast<clock_type::duration>(chrono::duration<double>(opt.time_limit));

    pid_t pid = fork();
    if (pid < 0) error("unable to fork");
    if (pid == 0) exec_child(opt, argv.data(), in, out, err);

    // 父子进程都设置进程组，确保之后 kill(-pid) 时进程组已经存在
    setpgid(pid, pid);
    in.close_end(PIPE_OUT);
    out.close_end(PIPE_IN);
    err.close_end(PIPE_IN);

    try {
        if (in[PIPE_IN] >= 0) set_nonblocking(in[PIPE_IN]);
        set_nonblocking(out[PIPE_OUT]);
        set_nonblocking(err[PIPE_OUT]);

        pump_pipes(opt, deadline, in, out, err, result);
        in.close_end(PIPE_IN);
        out.close_end(PIPE_OUT);
        err.close_end(PIPE_OUT);

        if (!result.timed_out && !wait_exit(pid, deadline))
            result.timed_out = true;
    } catch (system_error &) {
        kill(-pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        throw;
    }

    if (result.timed_out)
        LOG(INFO) << "Time limit exceeded (hard wall time " << opt.time_limit << "s): killing " << opt.command[0];

    // 杀死进程组中残留的进程，比如选手程序 fork 出来的后台进程
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH && errno != EPERM)
        LOG(WARNING) << "Unable to send SIGKILL to process group " << pid << ": " << strerror(errno);

    int status = 0;
    struct rusage usage;
    while (wait4(pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) error("waiting on child");
    }
    result.wall_time = chrono::duration<double>(clock_type::now() - start).count();
    result.memory = usage.ru_maxrss;

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exitcode = 128 + result.signal;
    }
    return result;
}

}  // namespace codejudge
