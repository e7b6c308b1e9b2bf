//
//  encoder_process.cpp
//  NarrateForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "encoder_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

#include "logging.hpp"

namespace narrateforge {

namespace {

bool is_executable(const std::filesystem::path &p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

void set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

// A closed encoder stdin must surface as EPIPE from write(), not kill the process.
void ignore_sigpipe() {
    struct sigaction sa {};
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGPIPE, &sa, nullptr);
}

}  // namespace

std::optional<std::filesystem::path> find_executable(const std::string &name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }
    const char *path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }
    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = std::filesystem::path(dir) / name;
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

EncoderProcess::~EncoderProcess() { abort(); }

RunStatus EncoderProcess::start(const std::vector<std::string> &argv, bool pipe_stdin) {
    if (running()) {
        return make_error(ErrorKind::Export, "encoder already running");
    }
    if (argv.empty()) {
        return make_error(ErrorKind::Export, "empty encoder command");
    }
    program_ = std::filesystem::path(argv[0]).filename().string();

    stderr_file_ = TempFile::create(".log");
    if (!stderr_file_) {
        return make_error(ErrorKind::Io, "failed to create encoder log file");
    }
    int err_fd = ::open(stderr_file_->path().c_str(), O_WRONLY | O_TRUNC);
    if (err_fd < 0) {
        return make_error(ErrorKind::Io, "failed to open encoder log " + errno_text());
    }

    int fds[2] = {-1, -1};
    if (pipe_stdin) {
        if (::pipe(fds) != 0) {
            ::close(err_fd);
            return make_error(ErrorKind::Export, "pipe failed " + errno_text());
        }
        set_cloexec(fds[1]);
        ignore_sigpipe();
    }

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &a : argv) {
        cargv.push_back(const_cast<char *>(a.c_str()));
    }
    cargv.push_back(nullptr);

    NF_LOG("io", "spawning " << program_ << " with " << argv.size() - 1 << " args");
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(err_fd);
        if (pipe_stdin) {
            ::close(fds[0]);
            ::close(fds[1]);
        }
        return make_error(ErrorKind::Export, "fork failed " + errno_text(err));
    }
    if (pid == 0) {
        int in_fd = pipe_stdin ? fds[0] : ::open("/dev/null", O_RDONLY);
        int null_fd = ::open("/dev/null", O_WRONLY);
        if (in_fd >= 0) {
            ::dup2(in_fd, STDIN_FILENO);
        }
        if (null_fd >= 0) {
            ::dup2(null_fd, STDOUT_FILENO);
        }
        ::dup2(err_fd, STDERR_FILENO);
        ::execv(cargv[0], cargv.data());
        _exit(127);
    }

    ::close(err_fd);
    if (pipe_stdin) {
        ::close(fds[0]);
        stdin_fd_ = fds[1];
    }
    pid_ = pid;
    return ok_status();
}

RunStatus EncoderProcess::write(const char *data, size_t size) {
    if (stdin_fd_ < 0) {
        return make_error(ErrorKind::Export, program_ + " export process is not writable.");
    }
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(stdin_fd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            NF_LOG("error", "write to " << program_ << " failed " << errno_text(err));
            return make_error(ErrorKind::Export,
                              program_ + " stopped accepting audio: " + errno_text(err));
        }
        written += static_cast<size_t>(n);
    }
    return ok_status();
}

int EncoderProcess::wait_child() {
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            NF_LOG("error", "waitpid failed " << errno_text());
            pid_ = -1;
            return -1;
        }
    }
    pid_ = -1;
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

std::string EncoderProcess::captured_stderr() const {
    if (!stderr_file_) {
        return {};
    }
    std::ifstream in(stderr_file_->path(), std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

RunStatus EncoderProcess::finish() {
    if (!running()) {
        return make_error(ErrorKind::Export, "encoder not running");
    }
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
    int code = wait_child();
    if (code != 0) {
        auto err = captured_stderr();
        NF_LOG("error", program_ << " exited with " << code);
        stderr_file_.reset();
        return make_error(ErrorKind::Export, program_ + " failed: " + err);
    }
    stderr_file_.reset();
    return ok_status();
}

void EncoderProcess::abort() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (running()) {
        ::kill(pid_, SIGKILL);
        wait_child();
    }
    stderr_file_.reset();
}

RunStatus run_encoder(const std::vector<std::string> &argv) {
    EncoderProcess proc;
    auto st = proc.start(argv, false);
    if (!st) {
        return st;
    }
    return proc.finish();
}

}  // namespace narrateforge
