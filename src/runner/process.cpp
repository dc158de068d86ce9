#include "runner/process.hpp"
#include <errno.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace assessor {
using namespace std;

child_process::~child_process() {}

process_launcher::~process_launcher() {}

static const int PIPE_READ = 0;
static const int PIPE_WRITE = 1;

static void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

struct posix_child_process : public child_process {
    posix_child_process(pid_t pid, int stdout_fd, int stderr_fd, size_t output_limit)
        : pid(pid), output_limit(output_limit), start(chrono::steady_clock::now()) {
        fds[0] = stdout_fd;
        fds[1] = stderr_fd;
    }

    ~posix_child_process() override {
        if (!reaped) {
            // 调用方没有回收子进程（比如抛出了异常），在这里保证子进程不会留驻系统
            kill_group();
            int status;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        }
        close_fd(fds[0]);
        close_fd(fds[1]);
    }

    bool wait_for(chrono::milliseconds timeout) override {
        auto deadline = chrono::steady_clock::now() + timeout;
        while (true) {
            if (output_exceeded) return true;
            if (has_exited()) {
                // 子进程已经退出，读出管道中剩余的数据
                drain(0);
                return true;
            }

            auto now = chrono::steady_clock::now();
            if (now >= deadline) return false;
            int remaining = (int)chrono::duration_cast<chrono::milliseconds>(deadline - now).count();
            // 子进程退出后管道可能仍被孙进程持有，因此每次最多等待 5ms 后重新检查子进程状态
            drain(min(remaining, 5));
        }
    }

    void kill() override {
        kill_group();
    }

    process_result collect() override {
        process_result result;
        if (!reaped) {
            // 子进程可能已经退出，但它创建的进程仍在进程组中，一并清理
            kill_group();
            int status = 0;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    LOG(WARNING) << "waitpid(" << pid << ") failed: " << strerror(errno);
                    break;
                }
            }
            reaped = true;
            if (WIFEXITED(status))
                exitcode = WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                signal = WTERMSIG(status);
            end = chrono::steady_clock::now();
        }
        drain(0);
        close_fd(fds[0]);
        close_fd(fds[1]);

        result.exitcode = exitcode;
        result.signal = signal;
        result.output_exceeded = output_exceeded;
        result.stdout_data = move(buffers[0]);
        result.stderr_data = move(buffers[1]);
        result.wall_time = chrono::duration_cast<chrono::milliseconds>(end - start);
        return result;
    }

private:
    pid_t pid;
    int fds[2];
    string buffers[2];
    size_t captured = 0;
    size_t output_limit;
    bool output_exceeded = false;
    bool reaped = false;
    int exitcode = -1;
    int signal = -1;
    chrono::steady_clock::time_point start, end;

    /**
     * @brief 检查子进程是否已经退出，但不回收子进程
     * 不回收子进程可以保证 pid 和进程组号在 kill_group 之前不会被系统复用
     */
    bool has_exited() {
        siginfo_t info;
        memset(&info, 0, sizeof(info));
        if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0)
            return errno == ECHILD;
        if (info.si_pid == pid) {
            end = chrono::steady_clock::now();
            return true;
        }
        return false;
    }

    void kill_group() {
        if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG(WARNING) << "Unable to kill process group " << pid << ": " << strerror(errno);
            ::kill(pid, SIGKILL);
        }
    }

    void append(int index, const char *data, size_t size) {
        if (output_exceeded) return;
        if (captured + size > output_limit) {
            size = output_limit - captured;
            output_exceeded = true;
        }
        buffers[index].append(data, size);
        captured += size;
    }

    /**
     * @brief 读取管道中已有的数据
     * @param timeout_ms 没有数据时最多等待的毫秒数
     */
    void drain(int timeout_ms) {
        pollfd pfds[2];
        int index[2];
        int n = 0;
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[n].fd = fds[i];
            pfds[n].events = POLLIN;
            pfds[n].revents = 0;
            index[n] = i;
            ++n;
        }
        if (n == 0) {
            if (timeout_ms > 0) usleep(timeout_ms * 1000);
            return;
        }

        int ready = poll(pfds, n, timeout_ms);
        if (ready <= 0) return;  // 超时或者被信号中断，由调用方重新检查

        char buf[4096];
        for (int k = 0; k < n; ++k) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int i = index[k];
            while (fds[i] >= 0) {
                ssize_t len = read(fds[i], buf, sizeof(buf));
                if (len > 0) {
                    append(i, buf, (size_t)len);
                    if (output_exceeded) break;
                } else if (len == 0) {
                    close_fd(fds[i]);
                } else if (errno == EINTR) {
                    continue;
                } else {
                    if (errno != EAGAIN && errno != EWOULDBLOCK)
                        close_fd(fds[i]);
                    break;
                }
            }
        }
    }
};

unique_ptr<child_process> posix_process_launcher::spawn(const process_request &request) {
    if (request.argv.empty())
        throw spawn_error("Empty command line");

    // fork 之后子进程只能调用异步信号安全的函数，因此先准备好 argv
    vector<char *> argv;
    for (auto &arg : request.argv)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);
    string workdir = request.workdir.string();

    int out_pipe[2], err_pipe[2], exec_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0)
        throw spawn_error(strerror(errno));
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(out_pipe[0]), close(out_pipe[1]);
        throw spawn_error(strerror(err));
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(out_pipe[0]), close(out_pipe[1]);
        close(err_pipe[0]), close(err_pipe[1]);
        throw spawn_error(strerror(err));
    }

    pid_t pid = fork();
    switch (pid) {
        case -1: {  // fork 失败
            int err = errno;
            for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]})
                close(fd);
            throw spawn_error(strerror(err));
        }
        case 0: {  // 子进程
            setpgid(0, 0);
            signal(SIGPIPE, SIG_DFL);
            signal(SIGINT, SIG_DFL);
            signal(SIGTERM, SIG_DFL);

            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            dup2(out_pipe[PIPE_WRITE], STDOUT_FILENO);
            dup2(err_pipe[PIPE_WRITE], STDERR_FILENO);

            struct rlimit no_core = {0, 0};
            setrlimit(RLIMIT_CORE, &no_core);
            if (request.address_space_limit) {
                struct rlimit as_limit = {(rlim_t)*request.address_space_limit, (rlim_t)*request.address_space_limit};
                setrlimit(RLIMIT_AS, &as_limit);
            }

            if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
                int err = errno;
                (void)!write(exec_pipe[PIPE_WRITE], &err, sizeof(err));
                _exit(127);
            }

            execvp(argv[0], argv.data());
            int err = errno;
            (void)!write(exec_pipe[PIPE_WRITE], &err, sizeof(err));
            _exit(127);
        }
        default:  // 父进程
            break;
    }

    // 与子进程中的 setpgid 竞争，保证 kill(-pid) 之前进程组已经建立
    setpgid(pid, pid);
    close(out_pipe[PIPE_WRITE]);
    close(err_pipe[PIPE_WRITE]);
    close(exec_pipe[PIPE_WRITE]);

    // exec 成功时 CLOEXEC 管道被关闭，read 返回 0
    int child_errno = 0;
    ssize_t len;
    while ((len = read(exec_pipe[PIPE_READ], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    close(exec_pipe[PIPE_READ]);

    if (len == sizeof(child_errno)) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close(out_pipe[PIPE_READ]);
        close(err_pipe[PIPE_READ]);
        throw spawn_error(request.argv[0] + ": " + strerror(child_errno));
    }

    fcntl(out_pipe[PIPE_READ], F_SETFL, fcntl(out_pipe[PIPE_READ], F_GETFL) | O_NONBLOCK);
    fcntl(err_pipe[PIPE_READ], F_SETFL, fcntl(err_pipe[PIPE_READ], F_GETFL) | O_NONBLOCK);

    return make_unique<posix_child_process>(pid, out_pipe[PIPE_READ], err_pipe[PIPE_READ], request.output_limit);
}

}  // namespace assessor
