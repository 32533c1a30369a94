/**
 * @file admission.h
 * @brief 准入控制：有界 FIFO 队列与按用户的滑动窗口限流
 */

#ifndef LABYRINTH_PIPELINE_ADMISSION_H
#define LABYRINTH_PIPELINE_ADMISSION_H

#include <string>
#include <deque>
#include <map>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>

#include "core/error.h"

namespace labyrinth {

/**
 * @brief 有界阻塞队列
 *
 * push 超过容量返回 QUEUE_FULL；close 之后 push 返回 PIPELINE_STOPPED，
 * pop 取完剩余元素后返回空。
 */
template<typename T>
class BoundedQueue {
private:
    std::deque<T> items_;
    size_t capacity_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    Result<void> push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return LABYRINTH_ERROR(ErrorCode::PIPELINE_STOPPED, "pipeline is stopped");
            }
            if (items_.size() >= capacity_) {
                return LABYRINTH_ERROR(ErrorCode::QUEUE_FULL,
                                 "queue is full (" + std::to_string(capacity_) + ")");
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return Ok();
    }

    /**
     * @brief 阻塞直到有元素或队列关闭
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /**
     * @brief 最多等待 timeout；超时或已关闭时返回空，用 closed() 区分
     */
    std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /**
     * @brief 关闭队列，返回仍未取走的元素
     */
    std::deque<T> close() {
        std::deque<T> rest;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            rest.swap(items_);
        }
        cv_.notify_all();
        return rest;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }
};

/**
 * @brief 每用户 window 内最多 limit 次
 *
 * check 与 record 分开：只有真正创建了提交才计数。
 */
class RateLimiter {
public:
    using SteadyClock = std::chrono::steady_clock;

private:
    size_t limit_;
    SteadyClock::duration window_;
    std::map<std::string, std::deque<SteadyClock::time_point>> history_;
    mutable std::mutex mutex_;

    void prune(std::deque<SteadyClock::time_point> &q, SteadyClock::time_point now) const {
        while (!q.empty() && now - q.front() >= window_) {
            q.pop_front();
        }
    }

public:
    RateLimiter(size_t limit, SteadyClock::duration window)
        : limit_(limit), window_(window) {}

    bool check(const std::string &user, SteadyClock::time_point now = SteadyClock::now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &q = history_[user];
        prune(q, now);
        return q.size() < limit_;
    }

    void record(const std::string &user, SteadyClock::time_point now = SteadyClock::now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        history_[user].push_back(now);
    }

    size_t recent(const std::string &user, SteadyClock::time_point now = SteadyClock::now()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = history_.find(user);
        if (it == history_.end()) return 0;
        prune(it->second, now);
        return it->second.size();
    }
};

} // namespace labyrinth

#endif // LABYRINTH_PIPELINE_ADMISSION_H
