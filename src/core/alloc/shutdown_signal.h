#ifndef ALLOC_MEM_SHUTDOWN_SIGNAL_H
#define ALLOC_MEM_SHUTDOWN_SIGNAL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace alloc_mem {

/**
 * @brief 单槽位关闭通知 (单生产者 / 单消费者)
 *
 * 状态是持久的: 在 Wait() 之前到达的 Request() 不会丢失。
 * 只负责记录与唤醒，不终止进程。
 */
class ShutdownSignal {
public:
    ShutdownSignal() = default;

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    /**
     * @brief 请求关闭 (幂等)，只记录第一次的信号值
     * @param signo 触发的信号，0 表示程序内部请求
     */
    void Request(int signo = 0);

    bool IsRequested() const;

    /**
     * @brief 阻塞直到 Request() 被调用
     */
    void Wait();

    /**
     * @brief 带超时的等待
     * @return true 如果在超时前收到关闭请求
     */
    bool WaitFor(std::chrono::milliseconds timeout);

    /**
     * @brief 触发关闭的信号值 (未关闭或内部请求时为 0)
     */
    int Signal() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool requested_ = false;
    int signo_ = 0;
};

/**
 * @brief 把 SIGINT/SIGTERM 转换为 ShutdownSignal::Request()
 *
 * 原理:
 * 1. 在当前线程屏蔽 SIGINT/SIGTERM，之后创建的线程继承该屏蔽字
 * 2. 后台线程 sigwait() 同步接收信号，不在异步信号上下文里加锁
 * 3. 析构时向监听线程发送 SIGTERM 将其唤醒并 join
 *
 * 必须在创建其它线程之前构造。
 */
class SignalWatcher {
public:
    explicit SignalWatcher(ShutdownSignal& shutdown);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /**
     * @brief 屏蔽信号并启动监听线程
     * @return false 时 err 中包含原因
     */
    bool Start(std::string& err);

    bool IsRunning() const { return running_; }

private:
    void WatchLoop();

private:
    ShutdownSignal& shutdown_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
};

/**
 * @brief 信号编号转名字 (SIGINT -> "SIGINT")
 */
std::string SignalName(int signo);

} // namespace alloc_mem

#endif // ALLOC_MEM_SHUTDOWN_SIGNAL_H
