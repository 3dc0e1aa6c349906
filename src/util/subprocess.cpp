#include <cerrno>
#include <string>
#include <vector>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <util/expected.h>
#include <util/subprocess.h>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace util {

expected<pipe, int> make_pipe() {
    pipe p;
    if (auto rval = ::pipe(p.state); rval == -1) {
        return unexpected(errno);
    }
    return p;
}

expected<subprocess, std::string> run(const std::vector<std::string>& argv) {
    // WARNING: NEVER add logging of the call and its arguments here.
    // The arguments may contain sensitive information like passwords, and
    // we rely on the caller printing redacted logs one level up.
    if (argv.empty()) {
        return unexpected("need at least one argument");
    }

    auto inpipe = make_pipe();
    if (!inpipe) {
        return unexpected(fmt::format("unable to create pipe (errno {})",
                                      inpipe.error()));
    }
    auto outpipe = make_pipe();
    if (!outpipe) {
        inpipe->close();
        return unexpected(fmt::format("unable to create pipe (errno {})",
                                      outpipe.error()));
    }
    auto errpipe = make_pipe();
    if (!errpipe) {
        inpipe->close();
        outpipe->close();
        return unexpected(fmt::format("unable to create pipe (errno {})",
                                      errpipe.error()));
    }

    auto pid = ::fork();

    if (pid == -1) {
        inpipe->close();
        outpipe->close();
        errpipe->close();
        return unexpected(fmt::format("unable to fork (errno {})", errno));
    }

    if (pid == 0) {
        // run the child in its own process group, so that an interrupt
        // from the terminal is delivered to the parent only, which decides
        // whether the child is allowed to complete.
        ::setpgid(0, 0);

        ::dup2(outpipe->write(), STDOUT_FILENO);
        ::dup2(errpipe->write(), STDERR_FILENO);
        ::dup2(inpipe->read(), STDIN_FILENO);

        outpipe->close();
        errpipe->close();
        inpipe->close();

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.data()));
        }
        args.push_back(nullptr);

        execvp(args[0], &args[0]);

        // this code only executes if the attempt to launch the subprocess
        // fails to launch.
        std::perror(fmt::format("subprocess error running '{}'", argv[0])
                        .c_str());
        _exit(1);
    }

    // also set in the parent, so that the group exists before the child is
    // scheduled and kill() can signal it.
    ::setpgid(pid, pid);

    outpipe->close_write();
    errpipe->close_write();
    inpipe->close_read();

    return subprocess{*outpipe, *errpipe, *inpipe, pid};
}

void subprocess::setrcode(int status) {
    if (WIFEXITED(status)) {
        rcode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        rcode_ = WTERMSIG(status);
    } else {
        rcode_ = 255;
    }
}

int subprocess::wait() {
    if (!finished_) {
        int status = 0;
        waitpid(pid, &status, 0);
        finished_ = true;
        setrcode(status);
    }
    return *rcode_;
}

bool subprocess::finished() {
    if (finished_) {
        return true;
    }

    int status;
    auto rc = waitpid(pid, &status, WNOHANG);
    if (rc == 0) {
        return false;
    }

    finished_ = true;
    setrcode(status);

    return true;
}

void subprocess::kill(int signal) {
    if (!finished_) {
        // signal the whole process group, so that processes started by the
        // child are not left running after it has been killed
        if (::kill(-pid, signal) == -1) {
            ::kill(pid, signal);
        }
        wait();
    }
    finished_ = true;
}

int subprocess::rvalue() {
    if (!finished_) {
        return wait();
    }
    return *rcode_;
}

subprocess_output subprocess::communicate(std::optional<std::string> input,
                                          std::chrono::milliseconds timeout) {
    using namespace std::chrono;

    if (input) {
        in.stream() << *input;
    }
    in.close();

    subprocess_output result;
    struct pollfd fds[2] = {{out.fd(), POLLIN, 0}, {err.fd(), POLLIN, 0}};
    std::string* targets[2] = {&result.out, &result.err};
    int open_streams = 2;
    char buffer[4096];

    const auto deadline = steady_clock::now() + timeout;
    while (open_streams > 0) {
        const auto remaining =
            duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        const auto rc = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP))) {
                continue;
            }
            const auto n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                targets[i]->append(buffer, n);
            } else if (n == 0 || errno != EINTR) {
                // end of file: poll ignores negative file descriptors
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    if (result.timed_out) {
        kill();
    }
    result.returncode = rvalue();

    return result;
}

std::istream& buffered_istream::stream() {
    return *stream_;
}

std::string buffered_istream::string() {
    return {std::istreambuf_iterator<char>(*stream_), {}};
}

std::optional<std::string> buffered_istream::getline() {
    if (std::string line; std::getline(stream(), line)) {
        return line;
    }
    return {};
}

std::ostream& buffered_ostream::stream() {
    return *stream_;
}

void buffered_ostream::close() {
    if (buffer_ && buffer_->is_open()) {
        stream_->flush();
        buffer_->close();
    }
}

} // namespace util
