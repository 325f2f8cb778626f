#include "transport.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tether {

namespace {

constexpr size_t kMaxStderrBuffer = 64 * 1024;

bool make_pipe(int fds[2]) {
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// Keep only the most recent output when the peer is chatty on stderr
void append_capped(std::string& buffer, const char* data, size_t len) {
    buffer.append(data, len);
    if (buffer.size() > kMaxStderrBuffer) {
        buffer.erase(0, buffer.size() - kMaxStderrBuffer);
    }
}

} // namespace

ProcessTransport::ProcessTransport(std::chrono::milliseconds stop_grace)
    : stop_grace_(stop_grace) {}

ProcessTransport::~ProcessTransport() {
    stop();
}

bool ProcessTransport::start(const std::vector<std::string>& argv, std::string* err) {
    if (running()) {
        if (err) *err = "process already running";
        return false;
    }
    if (argv.empty() || argv[0].empty()) {
        if (err) *err = "empty command";
        return false;
    }

    // A dead peer must surface as a failed write, not terminate us
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1}; // carries errno if exec fails

    if (!make_pipe(in_pipe) || !make_pipe(out_pipe) ||
        !make_pipe(err_pipe) || !make_pipe(status_pipe)) {
        int saved = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        if (err) *err = std::string("failed to create pipes: ") + std::strerror(saved);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        if (err) *err = std::string("failed to fork: ") + std::strerror(saved);
        return false;
    }

    if (pid == 0) {
        // Child: dup2 clears FD_CLOEXEC on the standard descriptors only
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        int code = errno;
        ssize_t ignored = write(status_pipe[1], &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        // exec failed: reap the child and report
        int status = 0;
        waitpid(pid, &status, 0);
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        if (err) *err = "failed to start '" + argv[0] + "': " + std::strerror(exec_errno);
        return false;
    }

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    read_buffer_.clear();
    stderr_buffer_.clear();
    stdout_eof_ = false;
    return true;
}

void ProcessTransport::stop() {
    if (pid_ <= 0) {
        close_fds();
        return;
    }

    // Closing stdin lets well-behaved servers exit on EOF
    close_fd(stdin_fd_);
    kill(pid_, SIGTERM);

    bool reaped = false;
    auto deadline = std::chrono::steady_clock::now() + stop_grace_;
    while (true) {
        int status = 0;
        pid_t r = waitpid(pid_, &status, WNOHANG);
        if (r == pid_ || (r < 0 && errno != EINTR)) {
            reaped = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (!reaped) {
        kill(pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }

    pid_ = -1;
    close_fds();
}

void ProcessTransport::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    read_buffer_.clear();
    stdout_eof_ = true;
}

bool ProcessTransport::write_line(const nlohmann::json& document) {
    if (stdin_fd_ < 0) return false;

    std::string data = document.dump(-1, ' ', false,
                                     nlohmann::json::error_handler_t::replace);
    data += '\n';

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false; // EPIPE: peer closed its stdin
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

ReadResult ProcessTransport::read_line() {
    std::array<char, 4096> buffer;

    while (true) {
        auto nl = read_buffer_.find('\n');
        if (nl != std::string::npos || (stdout_eof_ && !read_buffer_.empty())) {
            std::string line;
            if (nl != std::string::npos) {
                line = read_buffer_.substr(0, nl);
                read_buffer_.erase(0, nl + 1);
            } else {
                line = std::move(read_buffer_);
                read_buffer_.clear();
            }
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos) continue;

            ReadResult result;
            result.line = line;
            try {
                result.document = nlohmann::json::parse(line);
                result.status = ReadResult::Status::Ok;
            } catch (const nlohmann::json::parse_error& e) {
                result.status = ReadResult::Status::DecodeError;
                result.error = e.what();
            }
            return result;
        }

        if (stdout_eof_ || stdout_fd_ < 0) {
            return ReadResult{};
        }

        // Service stderr while waiting so a chatty peer never blocks on it
        struct pollfd pfds[2];
        nfds_t nfds = 0;
        pfds[nfds++] = {stdout_fd_, POLLIN, 0};
        if (stderr_fd_ >= 0) {
            pfds[nfds++] = {stderr_fd_, POLLIN, 0};
        }

        int ret = poll(pfds, nfds, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            stdout_eof_ = true;
            continue;
        }

        if (nfds > 1 && (pfds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            ssize_t n = read(stderr_fd_, buffer.data(), buffer.size());
            if (n > 0) {
                append_capped(stderr_buffer_, buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(stderr_fd_);
            }
        }

        if ((pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            ssize_t n = read(stdout_fd_, buffer.data(), buffer.size());
            if (n > 0) {
                read_buffer_.append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                stdout_eof_ = true;
            }
        }
    }
}

std::string ProcessTransport::drain_stderr() {
    std::array<char, 4096> buffer;
    while (stderr_fd_ >= 0) {
        struct pollfd pfd = {stderr_fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, 0);
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) break;
        ssize_t n = read(stderr_fd_, buffer.data(), buffer.size());
        if (n > 0) {
            append_capped(stderr_buffer_, buffer.data(), static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            close_fd(stderr_fd_);
        }
    }
    std::string out = std::move(stderr_buffer_);
    stderr_buffer_.clear();
    return out;
}

} // namespace tether
