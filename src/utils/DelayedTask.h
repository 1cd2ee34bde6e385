#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

/**
 * @brief 单槽延时任务
 *
 * 任意时刻最多只有一个待执行任务:schedule() 会替换尚未触发的旧任务。
 * 任务在内部工作线程上执行,可以在任务里再次 schedule()。
 * 不能在任务内部析构本对象。
 */
class DelayedTask {
public:
    using Clock = std::chrono::steady_clock;

    DelayedTask();
    ~DelayedTask();

    DelayedTask(const DelayedTask&) = delete;
    DelayedTask& operator=(const DelayedTask&) = delete;

    void schedule(std::chrono::milliseconds delay, std::function<void()> task);

    /** @return 是否取消了一个待执行的任务 */
    bool cancel();

    bool pending() const;

private:
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::optional<Clock::time_point> due;
    std::function<void()> task;
    bool stopping = false;
    std::thread worker;

    void loop();
};
