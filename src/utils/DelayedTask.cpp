#include "utils/DelayedTask.h"
#include "utils/Logger.h"
#include <exception>

DelayedTask::DelayedTask() {
    worker = std::thread(&DelayedTask::loop, this);
}

DelayedTask::~DelayedTask() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
        due.reset();
        task = nullptr;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();
}

void DelayedTask::schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopping) return;
        due = Clock::now() + delay;
        task = std::move(fn);
    }
    cv.notify_all();
}

bool DelayedTask::cancel() {
    bool hadPending;
    {
        std::lock_guard<std::mutex> lock(mtx);
        hadPending = due.has_value();
        due.reset();
        task = nullptr;
    }
    cv.notify_all();
    return hadPending;
}

bool DelayedTask::pending() const {
    std::lock_guard<std::mutex> lock(mtx);
    return due.has_value();
}

void DelayedTask::loop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!stopping) {
        if (!due) {
            cv.wait(lock);
            continue;
        }

        auto deadline = *due;
        cv.wait_until(lock, deadline);
        // 被取消、被替换或虚假唤醒时重新判断
        if (stopping || !due || Clock::now() < *due) continue;

        auto fn = std::move(task);
        task = nullptr;
        due.reset();

        lock.unlock();
        try {
            if (fn) fn();
        } catch (const std::exception& e) {
            Logger::getInstance().error(std::string("[Timer] Scheduled task failed: ") + e.what());
        }
        lock.lock();
    }
}
