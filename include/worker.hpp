#pragma once

#include <future>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/judge.hpp"

/**
 * 执行线程池
 * judge::execute 会阻塞调用线程直到编译运行结束（最长为编译和运行的时间限制之和），
 * 调用者如果在处理请求的线程中使用评测系统，需要通过线程池来执行。
 *
 * 每个 worker 线程从 task_queue 中取出执行请求，调用 judge::execute，
 * 并通过 promise 将结果返回给提交请求的线程。
 */
namespace sandbox {

struct execution_task {
    execution_request request;
    std::promise<execution_result> promise;
};

struct execution_pool {
    /**
     * @brief 启动 worker 线程
     * @param j 评测门面，必须比线程池活得更久
     * @param threads worker 线程数，至少为 1
     */
    execution_pool(judge &j, std::size_t threads);

    /**
     * @brief 执行完队列中剩余的请求后停止所有 worker
     */
    ~execution_pool();

    execution_pool(const execution_pool &) = delete;
    execution_pool &operator=(const execution_pool &) = delete;

    /**
     * @brief 提交一个执行请求
     * @return 执行结果，judge::execute 不会抛出异常，因此 future 总会得到一个结果
     * @throw std::logic_error 线程池已经停止
     */
    std::future<execution_result> submit(const execution_request &request);

    /**
     * @brief 停止接受新的请求，等待 worker 执行完剩余的请求后退出
     * 可以重复调用。
     */
    void stop();

    std::size_t size() const;

private:
    judge &j;
    concurrent_queue<execution_task> task_queue;
    std::vector<std::thread> workers;

    void worker_loop(std::size_t worker_id);
};

}  // namespace sandbox
