#pragma once

#include <unistd.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <ext/stdio_filebuf.h>

#include <util/expected.h>

namespace util {

struct pipe {
    int state[2];
    int read() const {
        return state[0];
    }
    int write() const {
        return state[1];
    }
    void close() {
        ::close(read());
        ::close(write());
    }
    void close_read() {
        ::close(read());
    }
    void close_write() {
        ::close(write());
    }
};

class buffered_istream {
    int fd_;
    std::unique_ptr<__gnu_cxx::stdio_filebuf<char>> buffer_;
    std::unique_ptr<std::istream> stream_;

  public:
    buffered_istream() = delete;
    buffered_istream(const pipe& p)
        : fd_(p.read()), buffer_(new __gnu_cxx::stdio_filebuf<char>(
                             p.read(), std::ios_base::in, 1)),
          stream_(new std::istream(buffer_.get())) {
    }

    std::istream& stream();

    // the underlying file descriptor, for unbuffered reads with poll
    int fd() const {
        return fd_;
    }

    std::optional<std::string> getline();
    std::string string();
};

class buffered_ostream {
    std::unique_ptr<__gnu_cxx::stdio_filebuf<char>> buffer_;
    std::unique_ptr<std::ostream> stream_;

  public:
    buffered_ostream() = delete;
    buffered_ostream(const pipe& p)
        : buffer_(new __gnu_cxx::stdio_filebuf<char>(p.write(),
                                                     std::ios_base::out, 1)),
          stream_(new std::ostream(buffer_.get())) {
    }

    std::ostream& stream();

    // flush and close the pipe, so that the child sees end of file
    void close();
};

// the captured result of running a process to completion
struct subprocess_output {
    int returncode = -1;
    std::string out;
    std::string err;
    // true if the process was killed because it ran past its deadline
    bool timed_out = false;
};

enum class proc_status { running, finished };

class subprocess {
  public:
    buffered_istream out;
    buffered_istream err;
    buffered_ostream in;
    pid_t pid;

    subprocess() = delete;

    subprocess(buffered_istream out, buffered_istream err, buffered_ostream in,
               pid_t pid)
        : out(std::move(out)), err(std::move(err)), in(std::move(in)),
          pid(pid) {
    }

    int wait();
    bool finished();
    int rvalue();
    void kill(int signal = 9);

    // write input (if any) to stdin and close it, then read stdout and stderr
    // until the process exits or the timeout expires, in which case the
    // process is killed.
    // stdout and stderr are drained concurrently, so processes that produce a
    // lot of output can't block on a full pipe.
    subprocess_output communicate(std::optional<std::string> input,
                                  std::chrono::milliseconds timeout);

  private:
    bool finished_ = false;
    std::optional<int> rcode_;
    void setrcode(int);
};

expected<subprocess, std::string> run(const std::vector<std::string>& argv);

} // namespace util
