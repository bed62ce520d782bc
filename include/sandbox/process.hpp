#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace codejudge {

struct process_options {
    /**
     * @brief 要执行的命令，command[0] 会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作路径，为空时继承当前进程的工作路径
     */
    std::filesystem::path work_dir;

    /**
     * @brief 喂给子进程 stdin 的数据，写完后关闭 stdin
     */
    std::string stdin_data;

    /**
     * @brief 时钟时间限制，单位为秒，不大于 0 表示不限制
     * 超时后整个进程组会被 SIGKILL 杀死
     */
    double time_limit = -1;

    /**
     * @brief stdout、stderr 各自最多保存多少字节
     * 超出的部分仍然会被读出，以免子进程阻塞在写管道上，但不会被保存
     */
    std::size_t output_limit = 64 * 1024 * 1024;
};

struct process_result {
    /**
     * @brief 子进程的退出码
     * 若子进程因为信号结束，则为 128 + 信号编号，和 shell 的约定一致
     */
    int exitcode = -1;

    /**
     * @brief 导致子进程结束的信号，-1 表示子进程正常退出
     */
    int signal = -1;

    /**
     * @brief 子进程是否因为超出时间限制被杀死
     */
    bool timed_out = false;

    std::string out;

    std::string err;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 子进程树的峰值常驻内存，单位为 KB，来自 wait4 返回的 rusage
     */
    long memory = -1;
};

/**
 * @brief 执行外部命令，并收集输出、运行时间和内存使用
 * 子进程位于独立的进程组，以便超时时杀死其 fork 出来的所有进程。
 * 子进程结束后，残留在进程组中的进程同样会被杀死。
 * 
 * @note 与 system(cmd) 的区别是，这个函数不经过 shell，避免了转义导致的安全问题
 * @throw std::system_error 若无法创建管道、fork 或等待子进程
 */
process_result run_process(const process_options &opt);

}  // namespace codejudge
