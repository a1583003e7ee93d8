#include "Process.hpp"

#include <iostream>
#include <thread>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace net_scout::common
{
    namespace
    {
        constexpr size_t MAX_CAPTURE = 4 * 1024 * 1024;

        void CloseFd(int &fd)
        {
            if (fd != -1)
            {
                close(fd);
                fd = -1;
            }
        }

        bool DrainInto(int &fd, std::string &sink)
        {
            char buf[4096];
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0)
            {
                if (sink.size() < MAX_CAPTURE)
                    sink.append(buf, static_cast<size_t>(n));
                return true;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN))
                return true;
            CloseFd(fd);
            return false;
        }
    }

    ProcessResult PosixProcessRunner::Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout)
    {
        ProcessResult result;
        if (argv.empty())
        {
            result.err = "empty command";
            return result;
        }

        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        int exec_pipe[2] = {-1, -1};

        // Every end is close-on-exec; dup2 clears the flag on the child's stdout and stderr.
        if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0)
        {
            result.err = std::string("pipe: ") + std::strerror(errno);
            for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]})
                if (fd != -1)
                    close(fd);
            return result;
        }

        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &a : argv)
            args.push_back(const_cast<char *>(a.c_str()));
        args.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            result.err = std::string("fork: ") + std::strerror(errno);
            for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]})
                close(fd);
            return result;
        }

        if (pid == 0)
        {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
            close(out_pipe[0]);
            close(out_pipe[1]);
            close(err_pipe[0]);
            close(err_pipe[1]);
            close(exec_pipe[0]);

            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0)
            {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }

            execvp(args[0], args.data());

            // exec failed: report errno through the close-on-exec pipe
            int code = errno;
            ssize_t ignored = write(exec_pipe[1], &code, sizeof(code));
            (void)ignored;
            _exit(127);
        }

        close(out_pipe[1]);
        close(err_pipe[1]);
        close(exec_pipe[1]);

        int exec_errno = 0;
        ssize_t n;
        do
        {
            n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
        } while (n < 0 && errno == EINTR);
        close(exec_pipe[0]);

        int out_fd = out_pipe[0];
        int err_fd = err_pipe[0];

        if (n == sizeof(exec_errno))
        {
            CloseFd(out_fd);
            CloseFd(err_fd);
            int status = 0;
            waitpid(pid, &status, 0);
            result.err = argv[0] + ": " + std::strerror(exec_errno);
            return result;
        }

        result.launched = true;
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        while (out_fd != -1 || err_fd != -1)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                result.timed_out = true;
                break;
            }

            struct pollfd pfds[2];
            int count = 0;
            int out_idx = -1;
            int err_idx = -1;
            if (out_fd != -1)
            {
                pfds[count] = {out_fd, POLLIN, 0};
                out_idx = count++;
            }
            if (err_fd != -1)
            {
                pfds[count] = {err_fd, POLLIN, 0};
                err_idx = count++;
            }

            int ret = poll(pfds, count, static_cast<int>(remaining.count()));
            if (ret < 0)
            {
                if (errno == EINTR)
                    continue;
                result.err += std::string("poll: ") + std::strerror(errno);
                break;
            }
            if (ret == 0)
                continue;

            if (out_idx != -1 && (pfds[out_idx].revents & (POLLIN | POLLHUP | POLLERR)))
                DrainInto(out_fd, result.out);
            if (err_idx != -1 && (pfds[err_idx].revents & (POLLIN | POLLHUP | POLLERR)))
                DrainInto(err_fd, result.err);
        }

        CloseFd(out_fd);
        CloseFd(err_fd);

        // output closed; the child may still be running
        int status = 0;
        pid_t waited = 0;
        while (!result.timed_out)
        {
            waited = waitpid(pid, &status, WNOHANG);
            if (waited != 0 && !(waited < 0 && errno == EINTR))
                break;
            if (std::chrono::steady_clock::now() >= deadline)
                result.timed_out = true;
            else
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (result.timed_out)
        {
            std::cerr << "[Process] " << argv[0] << " exceeded " << timeout.count() << "ms, killing pid " << pid << "\n";
            kill(pid, SIGKILL);
            do
            {
                waited = waitpid(pid, &status, 0);
            } while (waited < 0 && errno == EINTR);
        }

        if (waited == pid)
        {
            if (WIFEXITED(status))
                result.exit_code = WEXITSTATUS(status);
            else if (WIFSIGNALED(status))
                result.exit_code = 128 + WTERMSIG(status);
        }
        return result;
    }
}
