#include "process_runner.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include "log/logger.h"

namespace scripthub::exec {

namespace {

// 父进程持有的一个 fd，离开作用域自动关闭
class FdGuard {
public:
    FdGuard() = default;
    explicit FdGuard(int fd) : m_fd(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }

    void reset(int fd = -1) {
        if (m_fd >= 0) ::close(m_fd);
        m_fd = fd;
    }

private:
    int m_fd{-1};
};

// pipe2 + O_CLOEXEC：其他线程并发 fork 出来的子进程不会继承这些 fd
bool make_pipe(FdGuard& readEnd, FdGuard& writeEnd) {
    int fds[2]{-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return;
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/**
 * @brief 读出 fd 中当前所有可读数据追加到 out
 *
 * EOF 或读错误时关闭 fd；EAGAIN 时保持打开直接返回。
 */
void drain_fd(FdGuard& fd, std::string& out) {
    char buf[4096];
    while (fd.valid()) {
        const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // EOF 或其他错误
        fd.reset();
    }
}

pid_t wait_child(pid_t pid, int* status, int flags) {
    while (true) {
        const pid_t w = ::waitpid(pid, status, flags);
        if (w < 0 && errno == EINTR) continue;
        return w;
    }
}

// 子进程里只调用 async-signal-safe 的函数
[[noreturn]] void exec_child(const std::vector<char*>& argv,
                             const char* cwd,
                             int outWrite, int errWrite, int statusWrite) {
    ::setpgid(0, 0);

    auto report = [statusWrite](int err) {
        ssize_t ignored = ::write(statusWrite, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    };

    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull < 0) report(errno);
    if (::dup2(devnull, STDIN_FILENO) < 0) report(errno);
    if (::dup2(outWrite, STDOUT_FILENO) < 0) report(errno);
    if (::dup2(errWrite, STDERR_FILENO) < 0) report(errno);

    if (::chdir(cwd) != 0) report(errno);

    ::execvp(argv[0], argv.data());
    report(errno);
    _exit(127);
}

} // namespace

ProcessRunner::ProcessRunner(std::string interpreter) : m_interpreter(std::move(interpreter))
{
}

/**
 * @brief 运行一次驱动程序
 *
 * fork/exec `<interpreter> harness.py <script> <payload>`，stdout/stderr 经非阻塞管道 + poll 读取。
 * exec 是否成功通过一条 close-on-exec 状态管道确认：exec 成功时管道在子进程里自动关闭，
 * 父进程读到 EOF；失败时子进程写回 errno。
 *
 * @param artifact 本次执行的临时目录，函数结束前一定被删除
 * @param workingDirectory 子进程工作目录
 * @param timeout 墙钟超时；<=0 时立即超时
 * @return RunResult 退出码、输出以及是否超时
 */
RunResult ProcessRunner::run(HarnessArtifact artifact,
                             const std::filesystem::path& workingDirectory,
                             std::chrono::milliseconds timeout) const
{
    RunResult r;

    // 1) fork 之前准备好 argv，子进程里不再分配内存
    const std::string harness = artifact.harnessFile().string();
    const std::string script  = artifact.scriptFile().string();
    const std::string payload = artifact.payloadFile().string();
    const std::string cwd     = workingDirectory.string();
    std::vector<char*> argv{
        const_cast<char*>(m_interpreter.c_str()),
        const_cast<char*>(harness.c_str()),
        const_cast<char*>(script.c_str()),
        const_cast<char*>(payload.c_str()),
        nullptr
    };

    // 2) stdout / stderr / 状态管道
    FdGuard outRead, outWrite, errRead, errWrite, statusRead, statusWrite;
    if (!make_pipe(outRead, outWrite) ||
        !make_pipe(errRead, errWrite) ||
        !make_pipe(statusRead, statusWrite)) {
        const int err = errno;
        throw SpawnError(std::string("pipe() failed: ") + std::strerror(err), err);
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        throw SpawnError(std::string("fork() failed: ") + std::strerror(err), err);
    }

    if (pid == 0) {
        exec_child(argv, cwd.c_str(), outWrite.get(), errWrite.get(), statusWrite.get());
    }

    // ---- parent ----
    const auto start = SteadyClock::now();
    ::setpgid(pid, pid);

    outWrite.reset();
    errWrite.reset();
    statusWrite.reset();

    // 3) 等待 exec 结果：EOF 表示 exec 成功
    int childErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(statusRead.get(), &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    statusRead.reset();

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int ignored = 0;
        wait_child(pid, &ignored, 0);
        artifact.cleanup();
        throw SpawnError("cannot start '" + m_interpreter + "' in " + cwd + ": " +
                         std::strerror(childErrno), childErrno);
    }

    set_nonblocking(outRead.get());
    set_nonblocking(errRead.get());

    const auto deadline = start + std::max(timeout, std::chrono::milliseconds::zero());

    bool childExited = false;
    int childStatus = 0;

    auto kill_group = [pid]() {
        ::killpg(pid, SIGKILL);
    };

    // 4) 读输出直到子进程退出且管道都读完，或到达截止时间
    while (outRead.valid() || errRead.valid() || !childExited) {
        const auto now = SteadyClock::now();
        if (now >= deadline) {
            if (!childExited) {
                // 超时：不留宽限期，直接杀整个进程组并回收
                r.timedOut = true;
                kill_group();
                if (wait_child(pid, &childStatus, 0) == pid) childExited = true;
            } else {
                // 子进程已退出但管道被遗留的后台进程占用，清掉它们
                kill_group();
            }
            drain_fd(outRead, r.stdoutData);
            drain_fd(errRead, r.stderrData);
            break;
        }

        // poll 最多等 50ms，且不超过剩余时间
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        const int waitMs = static_cast<int>(std::max<long long>(1, std::min<long long>(50, left)));

        pollfd fds[2];
        nfds_t nfds = 0;
        if (outRead.valid()) fds[nfds++] = pollfd{outRead.get(), POLLIN, 0};
        if (errRead.valid()) fds[nfds++] = pollfd{errRead.get(), POLLIN, 0};

        if (nfds > 0) {
            ::poll(fds, nfds, waitMs);
        } else {
            ::usleep(static_cast<useconds_t>(std::min(waitMs, 10)) * 1000);
        }

        drain_fd(outRead, r.stdoutData);
        drain_fd(errRead, r.stderrData);

        if (!childExited && wait_child(pid, &childStatus, WNOHANG) == pid) {
            childExited = true;
        }
    }

    outRead.reset();
    errRead.reset();

    // 5) 退出码：被信号杀死时记为 128 + signo
    if (!childExited) {
        kill_group();
        wait_child(pid, &childStatus, 0);
    }
    if (WIFEXITED(childStatus)) {
        r.exitCode = WEXITSTATUS(childStatus);
    } else if (WIFSIGNALED(childStatus)) {
        r.exitCode = 128 + WTERMSIG(childStatus);
    } else {
        r.exitCode = childStatus;
    }

    r.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();

    // 6) 子进程已结束，删除临时目录
    artifact.cleanup();

    Logger::debug("ProcessRunner::run, script=" + script +
                  ", exitCode=" + std::to_string(r.exitCode) +
                  ", timedOut=" + (r.timedOut ? std::string("true") : std::string("false")) +
                  ", duration=" + std::to_string(r.durationMs) + "ms");
    return r;
}

} // namespace scripthub::exec
