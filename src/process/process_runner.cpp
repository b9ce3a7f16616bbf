#include "process/process_runner.h"

#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <poll.h>
#include <cstring>
#include <cerrno>
#include <cstdlib>
#include <termios.h>
#include <chrono>
#include <cstdio>
#include <vector>
#include <spdlog/spdlog.h>

#if defined(__APPLE__)
#include <util.h>
#elif defined(__linux__)
#include <pty.h>
#endif

namespace termdock {

namespace {

std::string default_shell() {
    const char* shell = std::getenv("SHELL");
    return (shell && *shell) ? shell : "/bin/bash";
}

std::string default_working_dir() {
    const char* home = std::getenv("HOME");
    return (home && *home) ? home : "/tmp";
}

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}

ProcessRunner::ProcessRunner() = default;

ProcessRunner::~ProcessRunner() {
    stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

bool ProcessRunner::start(const ProcessSpec& spec) {
    if (running_.load()) {
        return false;
    }
    
    std::string executable = spec.executable.empty() ? default_shell() : spec.executable;
    std::string working_dir = spec.working_dir.empty() ? default_working_dir() : spec.working_dir;
    
    struct winsize ws;
    ws.ws_col = static_cast<unsigned short>(spec.dimensions.cols);
    ws.ws_row = static_cast<unsigned short>(spec.dimensions.rows);
    ws.ws_xpixel = 0;
    ws.ws_ypixel = 0;
    
    int fd = -1;
    pid_t pid = forkpty(&fd, nullptr, nullptr, &ws);
    
    if (pid < 0) {
        spdlog::error("[ProcessRunner] forkpty failed: {}", strerror(errno));
        return false;
    }
    
    if (pid == 0) {
        setpgid(0, 0);
        
        if (chdir(working_dir.c_str()) != 0) {
            fprintf(stderr, "Failed to change directory to %s: %s\n", working_dir.c_str(), strerror(errno));
            _exit(127);
        }
        
        setenv("TERM", "xterm-256color", 1);
        setenv("COLORTERM", "truecolor", 1);
        setenv("LANG", "en_US.UTF-8", 1);
        
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : spec.args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        
        execvp(executable.c_str(), argv.data());
        
        fprintf(stderr, "Failed to execute '%s': %s\n", executable.c_str(), strerror(errno));
        _exit(127);
    }
    
    fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
    
    pid_.store(pid);
    pty_fd_.store(fd);
    running_.store(true);
    stop_requested_.store(false);
    
    io_thread_ = std::thread(&ProcessRunner::io_thread_func, this);
    
    spdlog::info("[ProcessRunner] Started '{}' (pid {}) in {}", executable, pid, working_dir);
    return true;
}

void ProcessRunner::stop() {
    if (!running_.load()) return;
    
    stop_requested_.store(true);
    
    pid_t pid = pid_.load();
    if (pid > 0) {
        ::kill(-pid, SIGTERM);
    }
}

void ProcessRunner::kill() {
    if (!running_.load()) return;
    
    stop_requested_.store(true);
    
    pid_t pid = pid_.load();
    if (pid > 0) {
        ::kill(pid, SIGKILL);
    }
}

bool ProcessRunner::write_stdin(const std::string& data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    int fd = pty_fd_.load();
    if (!running_.load() || fd < 0) {
        return false;
    }
    
    size_t offset = 0;
    int stalls = 0;
    while (offset < data.size()) {
        ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written > 0) {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) && stalls < 50) {
            ++stalls;
            struct pollfd pfd{fd, POLLOUT, 0};
            poll(&pfd, 1, 10);
            continue;
        }
        spdlog::warn("[ProcessRunner] Write to pid {} failed after {} of {} bytes: {}",
                     pid_.load(), offset, data.size(), strerror(errno));
        return false;
    }
    return true;
}

bool ProcessRunner::resize(Dimensions dimensions) {
    int fd = pty_fd_.load();
    if (fd < 0) return false;
    
    struct winsize ws;
    ws.ws_row = static_cast<unsigned short>(dimensions.rows);
    ws.ws_col = static_cast<unsigned short>(dimensions.cols);
    ws.ws_xpixel = 0;
    ws.ws_ypixel = 0;
    
    if (ioctl(fd, TIOCSWINSZ, &ws) != 0) {
        spdlog::warn("[ProcessRunner] TIOCSWINSZ failed: {}", strerror(errno));
        return false;
    }
    return true;
}

void ProcessRunner::io_thread_func() {
    constexpr size_t BUFFER_SIZE = 4096;
    char buffer[BUFFER_SIZE];
    
    struct pollfd fds[1];
    fds[0].fd = pty_fd_.load();
    fds[0].events = POLLIN;
    
    int exit_code = -1;
    pid_t pid = pid_.load();
    
    auto emit = [this](const char* data, ssize_t n) {
        if (output_callback_) {
            output_callback_(std::string(data, static_cast<size_t>(n)));
        }
    };
    
    while (!stop_requested_.load()) {
        int ret = poll(fds, 1, 100);
        
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        
        bool hangup = ret > 0 && (fds[0].revents & POLLHUP);
        if (ret > 0 && (fds[0].revents & (POLLIN | POLLHUP))) {
            while (true) {
                ssize_t n = read(fds[0].fd, buffer, BUFFER_SIZE);
                if (n > 0) {
                    emit(buffer, n);
                    continue;
                }
                if (n == 0) {
                    hangup = true;
                    break;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    break;
                }
                hangup = true;
                break;
            }
        }
        
        int status;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            exit_code = exit_code_from_status(status);
            pid = -1;
            pid_.store(-1);
            
            for (int drain_attempts = 0; drain_attempts < 50; ++drain_attempts) {
                ssize_t n = read(fds[0].fd, buffer, BUFFER_SIZE);
                if (n > 0) {
                    emit(buffer, n);
                } else if (n == 0) {
                    break;
                } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            break;
        }
        
        if (hangup) {
            break;
        }
    }
    
    if (pid > 0) {
        close_pty();
        
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        
        int status;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exit_code = exit_code_from_status(status);
        } else {
            ::kill(pid, SIGKILL);
            ::kill(-pid, SIGKILL);
            
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            r = waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                exit_code = exit_code_from_status(status);
            }
        }
        pid_.store(-1);
    }
    
    close_pty();
    running_.store(false);
    
    if (exit_callback_) {
        exit_callback_(exit_code);
    }
}

void ProcessRunner::close_pty() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    int fd = pty_fd_.exchange(-1);
    if (fd >= 0) {
        close(fd);
    }
}

}
