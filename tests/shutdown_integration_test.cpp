#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "../src/core/alloc/alloc_internal.h"
#include "test_harness.h"

using alloc_mem_test::RunTest;

#ifndef ALLOC_MEM_BINARY
#define ALLOC_MEM_BINARY "./alloc_mem"
#endif

namespace {

    // 以子进程运行 alloc_mem，stdout 通过管道读回
    class ChildProcess {
    public:
        explicit ChildProcess(const std::vector<std::string>& args) {
            int fds[2];
            if (pipe(fds) != 0) {
                return;
            }
            pid_ = fork();
            if (pid_ == 0) {
                dup2(fds[1], STDOUT_FILENO);
                int dev_null = open("/dev/null", O_RDWR);
                if (dev_null >= 0) {
                    dup2(dev_null, STDERR_FILENO);
                    dup2(dev_null, STDIN_FILENO);
                }
                close(fds[0]);
                close(fds[1]);

                std::vector<char*> argv;
                argv.push_back(const_cast<char*>(ALLOC_MEM_BINARY));
                for (const auto& a : args) {
                    argv.push_back(const_cast<char*>(a.c_str()));
                }
                argv.push_back(nullptr);
                execv(ALLOC_MEM_BINARY, argv.data());
                _exit(127);
            }
            close(fds[1]);
            fd_ = fds[0];
        }

        ~ChildProcess() {
            if (pid_ > 0 && !reaped_) {
                ::kill(pid_, SIGKILL);
                int status;
                waitpid(pid_, &status, 0);
            }
            if (fd_ >= 0) {
                close(fd_);
            }
        }

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

        bool Started() const { return pid_ > 0 && fd_ >= 0; }

        // 读到 needle 出现或 EOF 为止
        bool ReadUntil(const std::string& needle) {
            char buf[4096];
            while (output_.find(needle) == std::string::npos) {
                ssize_t n = read(fd_, buf, sizeof(buf));
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) return false;
                output_.append(buf, static_cast<std::size_t>(n));
            }
            return true;
        }

        void ReadToEnd() {
            char buf[4096];
            while (true) {
                ssize_t n = read(fd_, buf, sizeof(buf));
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) return;
                output_.append(buf, static_cast<std::size_t>(n));
            }
        }

        bool StillRunning() {
            int status;
            return waitpid(pid_, &status, WNOHANG) == 0;
        }

        void Signal(int signo) { ::kill(pid_, signo); }

        // 返回退出码，被信号杀死时返回 -signo
        int Wait() {
            ReadToEnd();
            int status = 0;
            while (waitpid(pid_, &status, 0) == -1) {
                if (errno != EINTR) return -1000;
            }
            reaped_ = true;
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return -WTERMSIG(status);
            return -1000;
        }

        const std::string& Output() const { return output_; }

    private:
        pid_t pid_ = -1;
        int fd_ = -1;
        bool reaped_ = false;
        std::string output_;
    };

} // anonymous namespace

int main() {
    std::cout << "=== Shutdown Integration Test ===" << std::endl;
    // 防止子进程卡死导致测试永久挂起
    alarm(120);

    RunTest("bounded_run_exits_on_sigint", []() -> std::string {
        ChildProcess child({"-m", "1", "-f", "0.5", "-x", "3", "-s", "0"});
        EXPECT(child.Started());
        EXPECT(child.ReadUntil("Allocating memory complete"));
        // 分配完成后进程持有内存，不会自行退出
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        EXPECT(child.StillRunning());

        child.Signal(SIGINT);
        int code = child.Wait();
        EXPECT_EQ(code, alloc_mem::EXIT_OK);
        const std::string& out = child.Output();
        EXPECT(out.find("Will allocate 3 blocks") != std::string::npos);
        EXPECT(out.find("Block #2  +1MB (touched 50%)  [so far total allocated= 3MB / total touched= 1.5MB]")
               != std::string::npos);
        EXPECT(out.find("Block #3") == std::string::npos);
        EXPECT(out.find("Shutdown signal received (SIGINT)") != std::string::npos);
        return "";
    });

    RunTest("unbounded_run_exits_on_sigterm", []() -> std::string {
        ChildProcess child({"-m", "1", "-f", "0.1", "-x", "0", "-e", "20", "-s", "0"});
        EXPECT(child.Started());
        EXPECT(child.ReadUntil("Block #2 "));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        EXPECT(child.StillRunning());

        child.Signal(SIGTERM);
        int code = child.Wait();
        EXPECT_EQ(code, alloc_mem::EXIT_OK);
        EXPECT(child.Output().find("Allocating memory complete") == std::string::npos);
        EXPECT(child.Output().find("Shutdown signal received (SIGTERM)") != std::string::npos);
        return "";
    });

    RunTest("oversized_block_is_config_error", []() -> std::string {
        ChildProcess child({"-m", "8189", "-x", "10000"});
        EXPECT(child.Started());
        int code = child.Wait();
        EXPECT_EQ(code, alloc_mem::ERR_CONFIG);
        EXPECT(child.Output().find("Maximum allowed value is 8188 MB") != std::string::npos);
        EXPECT(child.Output().find("Block #") == std::string::npos);
        return "";
    });

    RunTest("huge_max_commit_starts_allocating", []() -> std::string {
        ChildProcess child({"-m", "2", "-f", "0", "-e", "50", "-s", "0", "-x", "9223372036854775807"});
        EXPECT(child.Started());
        EXPECT(child.ReadUntil("Block #0 "));
        child.Signal(SIGINT);
        EXPECT_EQ(child.Wait(), alloc_mem::EXIT_OK);
        EXPECT(child.Output().find("Will allocate 4611686018427387904 blocks") != std::string::npos);
        EXPECT(child.Output().find("Shutdown signal received (SIGINT)") != std::string::npos);
        return "";
    });

    RunTest("missing_max_commit_is_config_error", []() -> std::string {
        ChildProcess child({"-m", "1"});
        EXPECT(child.Started());
        EXPECT_EQ(child.Wait(), alloc_mem::ERR_CONFIG);
        EXPECT(child.Output().find("Block #") == std::string::npos);
        return "";
    });

    RunTest("bad_number_is_usage_error", []() -> std::string {
        ChildProcess child({"-m", "ten", "-x", "10"});
        EXPECT(child.Started());
        EXPECT_EQ(child.Wait(), alloc_mem::ERR_USAGE);
        return "";
    });

    RunTest("break_after_start_continues_on_eof", []() -> std::string {
        // stdin 为 /dev/null，暂停立即结束并输出基线统计
        ChildProcess child({"-m", "1", "-x", "1", "-b"});
        EXPECT(child.Started());
        EXPECT(child.ReadUntil("Allocating memory complete"));
        child.Signal(SIGINT);
        EXPECT_EQ(child.Wait(), alloc_mem::EXIT_OK);
        const std::string& out = child.Output();
        std::size_t baseline = out.find("[stats baseline]");
        EXPECT(baseline != std::string::npos);
        EXPECT(baseline < out.find("Block #0"));
        return "";
    });

    RunTest("json_mode", []() -> std::string {
        ChildProcess child({"-m", "1", "-x", "2", "-s", "0", "--json"});
        EXPECT(child.Started());
        EXPECT(child.ReadUntil("\"event\":\"complete\""));
        child.Signal(SIGINT);
        EXPECT_EQ(child.Wait(), alloc_mem::EXIT_OK);
        EXPECT(child.Output().find("\"event\":\"shutdown\"") != std::string::npos);
        return "";
    });

    return alloc_mem_test::Summary("Shutdown Integration Test");
}
