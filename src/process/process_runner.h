#pragma once

#include "process/process_host.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <sys/types.h>

namespace termdock {

using OutputCallback = std::function<void(const std::string& data)>;
using ExitCallback = std::function<void(int exit_code)>;

// One forkpty child plus the thread that pumps its output.
class ProcessRunner {
public:
    ProcessRunner();
    ~ProcessRunner();
    
    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;
    
    // Callbacks must be set before start(); they run on the I/O thread.
    bool start(const ProcessSpec& spec);
    void stop();
    void kill();
    
    bool write_stdin(const std::string& data);
    bool resize(Dimensions dimensions);
    
    bool is_running() const { return running_.load(); }
    pid_t pid() const { return pid_.load(); }
    
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }
    void set_exit_callback(ExitCallback cb) { exit_callback_ = std::move(cb); }

private:
    void io_thread_func();
    void close_pty();
    
    std::atomic<pid_t> pid_{-1};
    std::atomic<int> pty_fd_{-1};
    std::mutex write_mutex_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread io_thread_;
    
    OutputCallback output_callback_;
    ExitCallback exit_callback_;
};

}
