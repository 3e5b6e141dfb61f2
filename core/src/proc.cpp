#include "labwright/proc.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace labwright {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string tok;
    bool in_token = false;
    char quote = 0; // 0, '\'' or '"'

    for (size_t i = 0; i < cmd.size(); i++) {
        const char c = cmd[i];
        if (quote == '\'') {
            if (c == '\'') quote = 0;
            else tok += c;
            continue;
        }
        if (quote == '"') {
            if (c == '\\' && i + 1 < cmd.size()) tok += cmd[++i];
            else if (c == '"') quote = 0;
            else if (c != '\\') tok += c;
            continue;
        }
        if (std::isspace((unsigned char)c)) {
            if (in_token) out.push_back(std::move(tok));
            tok.clear();
            in_token = false;
            continue;
        }
        in_token = true;
        if (c == '\'' || c == '"') quote = c;
        else tok += c;
    }
    if (quote != 0) return {};
    if (in_token) out.push_back(std::move(tok));
    return out;
}

namespace {

void set_nonblocking(int fd) {
    int fl = fcntl(fd, F_GETFL, 0);
    if (fl >= 0) (void)fcntl(fd, F_SETFL, fl | O_NONBLOCK);
}

void apply_limit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

// Child side of fork(); replaces the image or exits 126/127.
[[noreturn]] void child_main(const std::vector<std::string>& argv,
                             const std::string& cwd,
                             const ProcLimits& lim,
                             int stdin_fd, int out_fd) {
    int in = stdin_fd >= 0 ? stdin_fd : open("/dev/null", O_RDONLY);
    if (in >= 0) (void)dup2(in, STDIN_FILENO);
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(out_fd, STDERR_FILENO);

    // new group: a timeout takes grandchildren down too
    (void)setpgid(0, 0);
    (void)umask(077);

    const long maxfd = std::max(256L, sysconf(_SC_OPEN_MAX));
    for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

    unsetenv("LD_PRELOAD");
#ifdef __linux__
    if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
    if (lim.rlimit_fsize_mb > 0) apply_limit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb << 20);
    if (lim.rlimit_nofile > 0) apply_limit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);

    std::vector<char*> cargv;
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    execvp(cargv[0], cargv.data());
    _exit(127);
}

// Bounded accumulator for the merged output stream.
struct OutputSink {
    size_t cap;
    std::string data;
    bool truncated{false};

    void take(const char* p, size_t n) {
        size_t room = cap > data.size() ? cap - data.size() : 0;
        if (n > room) truncated = true;
        data.append(p, std::min(n, room));
    }

    // Reads until the non-blocking fd has nothing more.
    void drain(int fd) {
        char buf[4096];
        for (;;) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) take(buf, (size_t)n);
            else if (n < 0 && errno == EINTR) continue;
            else return;
        }
    }
};

// Writes as much of `data` as the pipe takes. Returns true once nothing is
// left to send, including when the child closed its end.
bool pump_stdin(int fd, const std::string& data, size_t* off) {
    while (*off < data.size()) {
        ssize_t n = write(fd, data.data() + *off, data.size() - *off);
        if (n > 0) {
            *off += (size_t)n;
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return false;
        } else {
            return true;
        }
    }
    return true;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 128;
}

} // namespace

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res) {
    return proc_run_capture_stdin(argv, cwd, std::string(), lim, res);
}

bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    if (!stdin_data.empty() && pipe(in_pipe) != 0) {
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        for (int fd : {out_pipe[0], out_pipe[1], in_pipe[0], in_pipe[1]}) {
            if (fd >= 0) close(fd);
        }
        return false;
    }
    if (pid == 0) {
        close(out_pipe[0]);
        if (in_pipe[1] >= 0) close(in_pipe[1]);
        child_main(argv, cwd, lim, in_pipe[0], out_pipe[1]);
    }

    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    const int out_fd = out_pipe[0];
    set_nonblocking(out_fd);

    int in_fd = -1;
    if (in_pipe[1] >= 0) {
        close(in_pipe[0]);
        in_fd = in_pipe[1];
        set_nonblocking(in_fd);
    }
    size_t sent = 0;

    OutputSink sink{lim.stdout_max_bytes, {}};
    sink.data.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(lim.timeout_ms);
    int status = 0;
    bool reaped = false;

    while (!reaped) {
        int wait_ms = 50;
        if (lim.timeout_ms > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            if (left <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                reaped = waitpid(pid, &status, 0) == pid;
                break;
            }
            wait_ms = (int)std::min<long long>(wait_ms, left);
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        fds[nfds++] = {out_fd, POLLIN, 0};
        if (in_fd >= 0) fds[nfds++] = {in_fd, POLLOUT, 0};

        if (poll(fds, nfds, wait_ms) < 0 && errno == EINTR) continue;

        if (fds[0].revents & (POLLIN | POLLERR | POLLHUP)) sink.drain(out_fd);
        if (in_fd >= 0 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
            if (pump_stdin(in_fd, stdin_data, &sent)) {
                close(in_fd);
                in_fd = -1;
            }
        }

        reaped = waitpid(pid, &status, WNOHANG) == pid;
    }

    if (in_fd >= 0) close(in_fd);
    sink.drain(out_fd);
    close(out_fd);

    res->output = std::move(sink.data);
    res->output_truncated = sink.truncated;
    if (!reaped) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }
    res->exit_code = decode_status(status);
    return true;
}

} // namespace labwright
