#include <commitwatch/util.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace commitwatch {

static int safe_pipe(int fds[2]){
    return pipe2(fds, O_CLOEXEC);
}

CmdResult run_command(const std::vector<std::string>& args,
                      const std::filesystem::path& cwd,
                      const EnvVars& env)
{
    CmdResult res{};
    if (args.empty()) {
        res.exit_code = -1;
        res.err = "empty argv";
        return res;
    }

    // built before fork: the child may only call async-signal-safe functions
    std::vector<std::string> env_strs;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        bool overridden = false;
        for (const auto& kv : env) {
            if (entry.compare(0, kv.first.size() + 1, kv.first + "=") == 0) { overridden = true; break; }
        }
        if (!overridden) env_strs.push_back(std::move(entry));
    }
    for (const auto& kv : env) env_strs.push_back(kv.first + "=" + kv.second);

    std::vector<char*> envp;
    envp.reserve(env_strs.size()+1);
    for (auto& s : env_strs) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    std::vector<char*> argv_c;
    argv_c.reserve(args.size()+1);
    for (auto& s : args) argv_c.push_back(const_cast<char*>(s.c_str()));
    argv_c.push_back(nullptr);

    int out_pipe[2], err_pipe[2];
    if (safe_pipe(out_pipe) != 0) {
        res.exit_code = -1;
        res.err = "pipe failed";
        return res;
    }
    if (safe_pipe(err_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res.exit_code = -1;
        res.err = "pipe failed";
        return res;
    }

    pid_t pid = fork();
    if (pid == -1) {
        res.exit_code = -1;
        res.err = "fork failed";
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return res;
    }

    if (pid == 0) {
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        execvpe(argv_c[0], argv_c.data(), envp.data());
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    // drain both pipes together so a chatty stderr can't block the child
    std::array<pollfd, 2> fds{{ {out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0} }};
    std::array<std::string*, 2> sinks{{ &res.out, &res.err }};
    std::array<char, 4096> buf{};
    int open_fds = 2;
    while (open_fds > 0) {
        if (::poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (size_t i=0;i<fds.size();++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n > 0) {
                sinks[i]->append(buf.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& f : fds) if (f.fd >= 0) close(f.fd);

    int status = 0;
    if (waitpid(pid, &status, 0) == -1) {
        res.exit_code = -1;
        return res;
    }
    if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
    else res.exit_code = -1;

    return res;
}

std::string iso8601(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[64];
    strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return std::string(buf);
}

std::string iso8601_now() {
    return iso8601(std::chrono::system_clock::now());
}

} // namespace commitwatch
