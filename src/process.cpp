#include "ojudge/process.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <fstream>
#include <limits>
#include <mutex>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace ojudge {
using namespace std;
namespace fs = std::filesystem;
using chrono::steady_clock;

const int BUF_SIZE = 4096;

// 每次 pump 最多读取的块数，避免输出很快的程序让监控循环无法检查时间限制
const int MAX_READS_PER_PUMP = 16;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

// 子进程退出后，等待管道中剩余数据的最长时间
const chrono::milliseconds DRAIN_TIMEOUT(100);

// ru_maxrss 在 execve 之后仍然保留 fork 出来的父进程内存镜像的峰值，
// 只有明显超过父进程常驻内存时才可信
const int64_t MAXRSS_SLACK = 1 << 20;

[[noreturn]] static void error(int err, const string &message) {
    throw system_error(err, system_category(), message);
}

namespace {

/**
 * @brief 持有一个文件描述符，析构时关闭
 */
struct unique_fd {
    unique_fd() = default;
    explicit unique_fd(int fd) : fd(fd) {}
    unique_fd(unique_fd &&other) noexcept : fd(exchange(other.fd, -1)) {}
    unique_fd &operator=(unique_fd &&other) noexcept {
        if (this != &other) {
            reset();
            fd = exchange(other.fd, -1);
        }
        return *this;
    }
    unique_fd(const unique_fd &) = delete;
    unique_fd &operator=(const unique_fd &) = delete;
    ~unique_fd() { reset(); }

    int get() const { return fd; }

    explicit operator bool() const { return fd >= 0; }

    void reset() noexcept {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }

private:
    int fd = -1;
};

/**
 * @brief 持有一个子进程
 * 如果析构时子进程还没有被回收（比如监控过程中抛出了异常），
 * 杀死整个进程组并回收子进程，保证不会留下僵尸进程或者失控的用户程序。
 */
struct child_process {
    pid_t pid = -1;
    bool reaped = false;

    child_process() = default;
    child_process(const child_process &) = delete;
    child_process &operator=(const child_process &) = delete;

    ~child_process() {
        if (pid <= 0 || reaped) return;
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
    }
};

}  // namespace

/**
 * @brief 将文件描述符移到 0、1、2 之外
 * 如果宿主进程关闭了标准输入输出，新建的管道可能会占用 0、1、2，
 * 子进程重定向时会互相覆盖。
 */
static unique_fd above_stdio(int fd) {
    if (fd > STDERR_FILENO) return unique_fd(fd);
    int moved = fcntl(fd, F_DUPFD_CLOEXEC, STDERR_FILENO + 1);
    int saved_errno = errno;
    ::close(fd);
    if (moved < 0) error(saved_errno, "duplicating pipe");
    return unique_fd(moved);
}

static pair<unique_fd, unique_fd> make_pipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) error(errno, "creating pipe");
    unique_fd out = above_stdio(fds[PIPE_OUT]);
    unique_fd in = above_stdio(fds[PIPE_IN]);
    return {move(out), move(in)};
}

static void set_nonblock(const unique_fd &fd) {
    if (!fd) return;
    int flags = fcntl(fd.get(), F_GETFL);
    if (flags == -1) error(errno, "fcntl, getting flags");
    if (fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
}

static void ignore_sigpipe() {
    // 用户程序提前关闭标准输入时，写管道会产生 SIGPIPE，默认处理会杀死评测进程
    static once_flag flag;
    call_once(flag, [] {
        struct sigaction sigact;
        memset(&sigact, 0, sizeof(sigact));
        sigact.sa_handler = SIG_IGN;
        sigemptyset(&sigact.sa_mask);
        if (sigaction(SIGPIPE, &sigact, nullptr) != 0)
            LOG(WARNING) << "could not ignore SIGPIPE: " << strerror(errno);
    });
}

static int64_t self_resident_memory() {
    static const long page_size = sysconf(_SC_PAGESIZE);
    ifstream fin("/proc/self/statm");
    int64_t size = 0, resident = 0;
    if (!(fin >> size >> resident)) return 0;
    return resident * page_size;
}

[[noreturn]] static void report_and_exit(int status_fd) {
    int err = errno;
    ssize_t ignored = write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

/**
 * @brief fork 之后在子进程中执行
 * 宿主进程可能是多线程的，这里只能调用 async-signal-safe 的函数，
 * 所有需要分配内存的准备工作都在 fork 之前完成。
 */
[[noreturn]] static void exec_child(char *const *argv, const char *work_dir, int stdin_fd, int stdout_fd, int stderr_fd, int status_fd) {
    // run the command in a separate process group, so the command and
    // all its child processes can be killed off with one signal
    if (setsid() == -1) report_and_exit(status_fd);

    if (work_dir[0] != '\0' && chdir(work_dir) != 0) report_and_exit(status_fd);

    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0)
        report_and_exit(status_fd);

    struct rlimit no_core = {0, 0};
    setrlimit(RLIMIT_CORE, &no_core);

    // 被忽略的信号在 execve 之后仍然是忽略的，恢复 SIGPIPE 的默认行为
    struct sigaction sigact;
    memset(&sigact, 0, sizeof(sigact));
    sigact.sa_handler = SIG_DFL;
    sigemptyset(&sigact.sa_mask);
    sigaction(SIGPIPE, &sigact, nullptr);

    sigset_t emptymask;
    sigemptyset(&emptymask);
    sigprocmask(SIG_SETMASK, &emptymask, nullptr);

    execvp(argv[0], argv);
    report_and_exit(status_fd);
}

/**
 * @brief 检查子进程是否已经退出，但不回收子进程
 * 子进程保持僵尸状态时进程组 id 不会被复用，之后可以安全地杀死整个进程组。
 */
static bool has_exited(pid_t pid) {
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno == EINTR) return false;
        error(errno, "waiting on child");
    }
    return info.si_pid == pid;
}

/**
 * @brief 读取管道中可读的数据，超过 limit 的部分读取后丢弃
 * @return 读到 EOF 时关闭管道并返回 false
 */
static bool pump_pipe(unique_fd &fd, string &buffer, size_t &total, size_t limit) {
    char buf[BUF_SIZE];
    for (int i = 0; i < MAX_READS_PER_PUMP; ++i) {
        ssize_t nread = read(fd.get(), buf, sizeof(buf));
        if (nread > 0) {
            total += nread;
            if (buffer.size() < limit)
                buffer.append(buf, min<size_t>(nread, limit - buffer.size()));
            continue;
        }
        if (nread == 0) {
            fd.reset();
            return false;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        error(errno, "copying data from child");
    }
    return true;
}

/**
 * @brief 向子进程的标准输入写入数据，全部写完后关闭管道
 */
static void feed_stdin(unique_fd &fd, const string &data, size_t &written) {
    while (written < data.size()) {
        ssize_t nwritten = write(fd.get(), data.data() + written, min<size_t>(data.size() - written, BUF_SIZE * MAX_READS_PER_PUMP));
        if (nwritten > 0) {
            written += nwritten;
            continue;
        }
        if (nwritten < 0 && errno == EINTR) continue;
        if (nwritten < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // EPIPE: the command closed its standard input, drop the rest
        if (nwritten < 0 && errno != EPIPE)
            LOG(WARNING) << "writing standard input of child: " << strerror(errno);
        break;
    }
    fd.reset();
}

static chrono::milliseconds to_milliseconds(const struct timeval &tv) {
    return chrono::milliseconds(static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000);
}

bool run_result::succeeded() const {
    return started && !time_exceeded && !memory_exceeded && !cancelled && signal < 0 && exitcode == 0;
}

run_result run_process(const run_options &opt) {
    if (opt.command.empty()) throw invalid_argument("command must not be empty");
    ignore_sigpipe();

    run_result result;

    auto [stdin_read, stdin_write] = make_pipe();
    auto [stdout_read, stdout_write] = make_pipe();
    unique_fd stderr_read, stderr_write;
    if (!opt.merge_stderr) tie(stderr_read, stderr_write) = make_pipe();
    auto [status_read, status_write] = make_pipe();

    vector<char *> argv;
    for (const string &arg : opt.command) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string work_dir = opt.work_dir.string();

    DLOG(INFO) << "Starting command: " << boost::algorithm::join(opt.command, " ") << " in " << opt.work_dir;

    int64_t parent_memory = self_resident_memory();

    child_process child;
    switch (child.pid = fork()) {
        case -1:
            error(errno, "unable to fork");
        case 0:
            exec_child(argv.data(), work_dir.c_str(),
                       stdin_read.get(), stdout_write.get(),
                       opt.merge_stderr ? stdout_write.get() : stderr_write.get(),
                       status_write.get());
        default:
            break;
    }
    result.pid = child.pid;

    /* Close the ends owned by the child */
    stdin_read.reset();
    stdout_write.reset();
    stderr_write.reset();
    status_write.reset();

    {
        // 状态管道设置了 CLOEXEC，execvp 成功时读到 EOF，失败时读到 errno
        int err = 0;
        ssize_t nread;
        while ((nread = read(status_read.get(), &err, sizeof(err))) < 0 && errno == EINTR)
            ;
        if (nread == sizeof(err)) {
            result.spawn_error = fmt::format("unable to start command {}: {}", opt.command[0], strerror(err));
            LOG(WARNING) << result.spawn_error;
            return result;
        }
    }
    result.started = true;

    auto start = steady_clock::now();
    auto deadline = opt.wall_limit.count() >= 0 ? start + opt.wall_limit : steady_clock::time_point::max();

    unique_fd pidfd;
#ifdef SYS_pidfd_open
    // 内核不支持 pidfd (< 5.3) 时退化为按采样间隔检查子进程状态
    pidfd = unique_fd(static_cast<int>(syscall(SYS_pidfd_open, child.pid, 0)));
#endif

    set_nonblock(stdin_write);
    set_nonblock(stdout_read);
    set_nonblock(stderr_read);

    size_t written = 0, out_total = 0, err_total = 0;
    if (opt.stdin_data.empty()) stdin_write.reset();

    bool exited = false;
    int64_t peak = 0;
    auto next_sample = start;
    auto end = start;

    while (true) {
        auto now = steady_clock::now();
        auto wake = min(next_sample, deadline);
        int timeout = wake <= now ? 0 : static_cast<int>(chrono::ceil<chrono::milliseconds>(wake - now).count());

        struct pollfd fds[4];
        int nfds = 0, out_idx = -1, err_idx = -1, in_idx = -1;
        if (stdout_read) out_idx = nfds, fds[nfds++] = {stdout_read.get(), POLLIN, 0};
        if (stderr_read) err_idx = nfds, fds[nfds++] = {stderr_read.get(), POLLIN, 0};
        if (stdin_write) in_idx = nfds, fds[nfds++] = {stdin_write.get(), POLLOUT, 0};
        if (pidfd) fds[nfds++] = {pidfd.get(), POLLIN, 0};

        int r = poll(fds, nfds, timeout);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");

        if (r > 0) {
            if (out_idx >= 0 && fds[out_idx].revents)
                pump_pipe(stdout_read, result.out, out_total, opt.stream_size);
            if (err_idx >= 0 && fds[err_idx].revents)
                pump_pipe(stderr_read, result.err, err_total, opt.stream_size);
            if (in_idx >= 0 && fds[in_idx].revents)
                feed_stdin(stdin_write, opt.stdin_data, written);
        }

        now = steady_clock::now();
        if (has_exited(child.pid)) {
            exited = true;
            end = now;
            break;
        }

        if (now >= deadline) {
            result.time_exceeded = true;
            LOG(INFO) << fmt::format("timelimit exceeded (hard wall time {}ms): aborting command", opt.wall_limit.count());
            break;
        }

        if (opt.cancel && opt.cancel->cancelled()) {
            result.cancelled = true;
            LOG(INFO) << "cancellation requested: aborting command";
            break;
        }

        if (opt.kill_on_stream_limit && out_total > opt.stream_size) {
            result.output_exceeded = true;
            LOG(INFO) << "output limit exceeded: aborting command";
            break;
        }

        if (now >= next_sample) {
            peak = max(peak, process_tree_memory(child.pid));
            next_sample = now + opt.sample_interval;
            if (opt.memory_limit >= 0 && peak > opt.memory_limit) {
                result.memory_exceeded = true;
                LOG(INFO) << "memory limit exceeded (" << peak / 1024 << "kB): aborting command";
                break;
            }
        }
    }

    if (!exited) {
        end = steady_clock::now();
        result.killed = true;
    }

    // 杀死整个进程组，这样用户程序 fork 出来的子进程也不会留驻系统
    if (kill(-child.pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to process group " << child.pid << ": " << strerror(errno);
    stdin_write.reset();

    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    while (wait4(child.pid, &status, 0, &usage) < 0) {
        if (errno != EINTR) error(errno, "waiting on child");
    }
    child.reaped = true;

    // 进程组已经被杀死，读出管道中剩余的数据。逃离进程组的进程可能仍然持有管道，
    // 因此最多等待 DRAIN_TIMEOUT
    while (stdout_read || stderr_read) {
        struct pollfd fds[2];
        int nfds = 0, out_idx = -1, err_idx = -1;
        if (stdout_read) out_idx = nfds, fds[nfds++] = {stdout_read.get(), POLLIN, 0};
        if (stderr_read) err_idx = nfds, fds[nfds++] = {stderr_read.get(), POLLIN, 0};
        int r = poll(fds, nfds, static_cast<int>(DRAIN_TIMEOUT.count()));
        if (r == -1 && errno == EINTR) continue;
        if (r == -1) error(errno, "draining child output");
        if (r == 0) {
            LOG(WARNING) << "output pipes of " << child.pid << " are still open, giving up";
            break;
        }
        if (out_idx >= 0 && fds[out_idx].revents)
            pump_pipe(stdout_read, result.out, out_total, opt.stream_size);
        if (err_idx >= 0 && fds[err_idx].revents)
            pump_pipe(stderr_read, result.err, err_total, opt.stream_size);
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        if (!result.time_exceeded && !result.memory_exceeded && !result.cancelled && !result.output_exceeded)
            LOG(INFO) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    }

    result.wall_time = chrono::duration_cast<chrono::milliseconds>(end - start);
    result.cpu_time = to_milliseconds(usage.ru_utime) + to_milliseconds(usage.ru_stime);

    int64_t maxrss = static_cast<int64_t>(usage.ru_maxrss) * 1024;
    if (maxrss > parent_memory + MAXRSS_SLACK) peak = max(peak, maxrss);
    result.memory = peak;

    if (opt.memory_limit >= 0 && result.memory > opt.memory_limit && !result.time_exceeded)
        result.memory_exceeded = true;
    if (out_total > opt.stream_size)
        result.output_exceeded = true;

    DLOG(INFO) << fmt::format("run time: real {}ms, cpu {}ms, memory {}kB, exitcode {}, signal {}",
                              result.wall_time.count(), result.cpu_time.count(), result.memory / 1024,
                              result.exitcode, result.signal);
    return result;
}

/**
 * @brief 读取 /proc/[pid]/status 中的 VmRSS 和 VmHWM（单位为字节）
 */
static pair<int64_t, int64_t> read_status_memory(pid_t pid) {
    ifstream fin("/proc/" + to_string(pid) + "/status");
    int64_t rss = 0, hwm = 0;
    string key;
    while (fin >> key) {
        if (key == "VmRSS:") {
            fin >> rss;
            rss *= 1024;
        } else if (key == "VmHWM:") {
            fin >> hwm;
            hwm *= 1024;
        }
        fin.ignore(numeric_limits<streamsize>::max(), '\n');
    }
    return {rss, hwm};
}

int64_t process_tree_memory(pid_t root) {
    int64_t total_rss = 0, max_hwm = 0;
    vector<pid_t> pending{root};
    set<pid_t> visited;
    while (!pending.empty()) {
        pid_t pid = pending.back();
        pending.pop_back();
        if (!visited.insert(pid).second) continue;

        auto [rss, hwm] = read_status_memory(pid);
        total_rss += rss;
        max_hwm = max(max_hwm, hwm);

        // 进程随时可能退出，遍历过程中的错误都忽略
        error_code ec;
        fs::path task_dir = fs::path("/proc") / to_string(pid) / "task";
        for (fs::directory_iterator it(task_dir, ec), end; !ec && it != end; it.increment(ec)) {
            ifstream children(it->path() / "children");
            pid_t child;
            while (children >> child) pending.push_back(child);
        }
    }
    // VmHWM 是单个进程自 execve 以来的常驻内存峰值，可以捕捉两次采样之间的内存峰值
    return max(total_rss, max_hwm);
}

}  // namespace ojudge
