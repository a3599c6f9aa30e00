#include "shutdown_signal.h"

#include <csignal>
#include <cstring>
#include <iostream>
#include <system_error>

#include <pthread.h>
#include <signal.h>

namespace alloc_mem {

namespace {

    sigset_t ShutdownSignalSet() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        return set;
    }

} // anonymous namespace

// ============================================================================
// ShutdownSignal
// ============================================================================

void ShutdownSignal::Request(int signo) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requested_) {
            return;
        }
        requested_ = true;
        signo_ = signo;
    }
    cv_.notify_all();
}

bool ShutdownSignal::IsRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_;
}

void ShutdownSignal::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return requested_; });
}

bool ShutdownSignal::WaitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return requested_; });
}

int ShutdownSignal::Signal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signo_;
}

// ============================================================================
// SignalWatcher
// ============================================================================

SignalWatcher::SignalWatcher(ShutdownSignal& shutdown)
    : shutdown_(shutdown)
{
}

SignalWatcher::~SignalWatcher() {
    if (!running_) {
        return;
    }
    // 监听线程阻塞在 sigwait 中，定向发送一个信号将其唤醒
    stopping_ = true;
    pthread_kill(thread_.native_handle(), SIGTERM);
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

bool SignalWatcher::Start(std::string& err) {
    if (running_) {
        return true;
    }

    sigset_t set = ShutdownSignalSet();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        err = std::string("pthread_sigmask failed: ") + std::strerror(rc);
        return false;
    }

    try {
        thread_ = std::thread(&SignalWatcher::WatchLoop, this);
    } catch (const std::system_error& e) {
        err = std::string("failed to start signal thread: ") + e.what();
        return false;
    }

    running_ = true;
    return true;
}

void SignalWatcher::WatchLoop() {
    sigset_t set = ShutdownSignalSet();
    while (true) {
        int signo = 0;
        int rc = sigwait(&set, &signo);
        if (rc != 0) {
            std::cerr << "[Signal] sigwait failed: " << std::strerror(rc) << std::endl;
            return;
        }
        if (stopping_) {
            return;
        }
        std::cerr << "[Signal] Received " << SignalName(signo) << std::endl;
        shutdown_.Request(signo);
        // 后续重复的 Ctrl+C 继续被吞掉，进程只走正常退出路径
    }
}

std::string SignalName(int signo) {
    switch (signo) {
        case SIGINT:  return "SIGINT";
        case SIGTERM: return "SIGTERM";
        case 0:       return "none";
        default:      return "signal " + std::to_string(signo);
    }
}

} // namespace alloc_mem
