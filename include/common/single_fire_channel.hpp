#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace sandbox {

/**
 * @brief 只能发送一次的信道
 * 多个线程可以竞争发送，只有第一次发送生效，之后的发送全部被忽略。
 * 资源监控中用来传递进程的终止原因（超时、内存超限、进程退出），
 * 取代多个线程共同读写的标记变量。
 * @param <T> 信道传递的值类型
 */
template <typename T>
struct single_fire_channel {
    /**
     * @brief 发送 value
     * @return 是否是第一次发送，若为假则 value 被丢弃
     */
    bool fire(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (fired) return false;
        fired = value;
        mlock.unlock();
        cond.notify_all();
        return true;
    }

    /**
     * @brief 最多等待 timeout，期间若信道已经发送则立即返回
     * @return 已发送的值，超时仍未发送时返回空值
     */
    template <typename Rep, typename Period>
    std::optional<T> wait_for(const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait_for(mlock, timeout, [this] { return fired.has_value(); });
        return fired;
    }

    std::optional<T> peek() {
        std::unique_lock<std::mutex> mlock(mut);
        return fired;
    }

private:
    std::optional<T> fired;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace sandbox
