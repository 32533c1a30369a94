/**
 * @file leaderboard.h
 * @brief 排行榜
 *
 * 每个 (user, maze) 一个槽位，槽位内容是不可变的
 * shared_ptr<const LeaderboardEntry>。更新只走一次
 * std::atomic_compare_exchange_strong：新成绩严格更好才替换，
 * 相同成绩保留先到的记录。只有创建槽位时加锁。
 *
 * 每次成功的 offer 恰好产生一个事件，推送给所有订阅者。
 * 订阅者按 seq 去重。restore 用于重启时回放已持久化的成绩，
 * 保留原始 achieved_at，不产生事件。
 *
 * 同分按 achieved_at 再按 seq 排序。
 */

#ifndef LABYRINTH_LEADERBOARD_LEADERBOARD_H
#define LABYRINTH_LEADERBOARD_LEADERBOARD_H

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <optional>
#include <algorithm>
#include <cstdint>

#include "core/utils.h"
#include "core/labyrinth_logger.h"

namespace labyrinth {

struct LeaderboardEntry {
    std::string user;
    std::string maze_id;
    int score = 0;
    uint64_t seq = 0;             ///< 全局递增，achieved_at 相同时先到者排前
    TimePoint achieved_at;
};

using EntryPtr = std::shared_ptr<const LeaderboardEntry>;

struct RankedEntry {
    int rank = 0;                 ///< 从 1 开始
    std::string user;
    std::string maze_id;
    int score = 0;
    TimePoint achieved_at;
};

struct LeaderboardEvent {
    uint64_t seq = 0;
    std::string user;
    std::string maze_id;
    int score = 0;
    int rank = 0;                 ///< 该迷宫榜内的名次
};

//==============================================================================
// 订阅
//==============================================================================

/**
 * @brief 一个订阅者的事件队列
 *
 * 由 Leaderboard 推送，订阅者自行取出。close() 或析构后不再接收。
 */
class Subscription {
private:
    std::deque<LeaderboardEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;

public:
    void push(const LeaderboardEvent &event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            events_.push_back(event);
        }
        cv_.notify_one();
    }

    /**
     * @brief 等待下一个事件，超时或已关闭时返回空
     */
    std::optional<LeaderboardEvent> next(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
        if (events_.empty()) {
            return std::nullopt;
        }
        LeaderboardEvent event = events_.front();
        events_.pop_front();
        return event;
    }

    std::vector<LeaderboardEvent> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LeaderboardEvent> out(events_.begin(), events_.end());
        events_.clear();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

//==============================================================================
// 排行榜
//==============================================================================

class Leaderboard {
private:
    struct Slot {
        EntryPtr entry;           ///< 只通过 std::atomic_load / atomic_compare_exchange 访问
    };
    using SlotPtr = std::shared_ptr<Slot>;

    std::map<std::string, SlotPtr> slots_;
    mutable std::mutex slots_mutex_;

    std::vector<std::weak_ptr<Subscription>> subscribers_;
    std::mutex subscribers_mutex_;

    std::atomic<uint64_t> seq_{0};

    static std::string key_of(const std::string &user, const std::string &maze_id) {
        return maze_id + '\n' + user;
    }

    SlotPtr slot_for(const std::string &key) {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto &slot = slots_[key];
        if (!slot) {
            slot = std::make_shared<Slot>();
        }
        return slot;
    }

    SlotPtr find_slot(const std::string &key) const {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto it = slots_.find(key);
        return it != slots_.end() ? it->second : nullptr;
    }

    /// 所有已有成绩的快照；可选按迷宫过滤
    std::vector<EntryPtr> snapshot(const std::string *maze_id) const {
        std::vector<SlotPtr> slots;
        {
            std::lock_guard<std::mutex> lock(slots_mutex_);
            slots.reserve(slots_.size());
            for (const auto &kv : slots_) {
                slots.push_back(kv.second);
            }
        }
        std::vector<EntryPtr> entries;
        for (const auto &slot : slots) {
            EntryPtr e = std::atomic_load(&slot->entry);
            if (e && (!maze_id || e->maze_id == *maze_id)) {
                entries.push_back(e);
            }
        }
        std::sort(entries.begin(), entries.end(), [](const EntryPtr &a, const EntryPtr &b) {
            if (a->score != b->score) return a->score < b->score;
            if (a->achieved_at != b->achieved_at) return a->achieved_at < b->achieved_at;
            return a->seq < b->seq;
        });
        return entries;
    }

    static std::vector<RankedEntry> ranked(const std::vector<EntryPtr> &entries, size_t n) {
        std::vector<RankedEntry> out;
        for (size_t i = 0; i < entries.size() && i < n; i++) {
            RankedEntry r;
            r.rank = static_cast<int>(i) + 1;
            r.user = entries[i]->user;
            r.maze_id = entries[i]->maze_id;
            r.score = entries[i]->score;
            r.achieved_at = entries[i]->achieved_at;
            out.push_back(r);
        }
        return out;
    }

    void publish(const LeaderboardEvent &event) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        auto it = subscribers_.begin();
        while (it != subscribers_.end()) {
            auto sub = it->lock();
            if (!sub || sub->closed()) {
                it = subscribers_.erase(it);
                continue;
            }
            sub->push(event);
            ++it;
        }
    }

    /**
     * @brief 严格更好时装入槽位，返回装入的记录，否则返回空
     */
    EntryPtr install(const std::string &user, const std::string &maze_id, int score,
                     TimePoint achieved_at) {
        if (score < 0) {
            BLOG_WARN << "rejecting negative score " << score << " for " << user;
            return nullptr;
        }
        SlotPtr slot = slot_for(key_of(user, maze_id));

        auto candidate = std::make_shared<LeaderboardEntry>();
        candidate->user = user;
        candidate->maze_id = maze_id;
        candidate->score = score;
        candidate->seq = ++seq_;
        candidate->achieved_at = achieved_at;
        EntryPtr desired = candidate;

        EntryPtr current = std::atomic_load(&slot->entry);
        while (true) {
            if (current && current->score <= score) {
                BLOG_DEBUG << user << "@" << maze_id << " keeps " << current->score
                           << " over " << score;
                return nullptr;
            }
            // 失败时 current 被更新为最新值，重新比较
            if (std::atomic_compare_exchange_strong(&slot->entry, &current, desired)) {
                return desired;
            }
        }
    }

public:
    Leaderboard() = default;
    Leaderboard(const Leaderboard&) = delete;
    Leaderboard& operator=(const Leaderboard&) = delete;

    /**
     * @brief 提交一次通关成绩
     *
     * @return true 表示替换了旧记录（或首次记录）并已推送事件
     */
    bool offer(const std::string &user, const std::string &maze_id, int score) {
        EntryPtr installed = install(user, maze_id, score, Clock::now());
        if (!installed) return false;

        LeaderboardEvent event;
        event.seq = installed->seq;
        event.user = user;
        event.maze_id = maze_id;
        event.score = score;
        event.rank = rank(user, maze_id);
        BLOG_INFO << user << "@" << maze_id << " new best " << score << " rank " << event.rank;
        publish(event);
        return true;
    }

    /**
     * @brief 回放持久化的成绩，不推送事件
     *
     * 调用方应按 achieved_at 递增回放，同分时先回放者保留。
     */
    bool restore(const std::string &user, const std::string &maze_id, int score,
                 TimePoint achieved_at) {
        return install(user, maze_id, score, achieved_at) != nullptr;
    }

    std::vector<RankedEntry> top(size_t n) const {
        return ranked(snapshot(nullptr), n);
    }

    std::vector<RankedEntry> top(size_t n, const std::string &maze_id) const {
        return ranked(snapshot(&maze_id), n);
    }

    std::optional<LeaderboardEntry> best(const std::string &user, const std::string &maze_id) const {
        SlotPtr slot = find_slot(key_of(user, maze_id));
        if (!slot) return std::nullopt;
        EntryPtr e = std::atomic_load(&slot->entry);
        if (!e) return std::nullopt;
        return *e;
    }

    /**
     * @return 该用户在迷宫榜内的名次，没有成绩时返回 0
     */
    int rank(const std::string &user, const std::string &maze_id) const {
        auto entries = snapshot(&maze_id);
        for (size_t i = 0; i < entries.size(); i++) {
            if (entries[i]->user == user) {
                return static_cast<int>(i) + 1;
            }
        }
        return 0;
    }

    SubscriptionPtr subscribe() {
        auto sub = std::make_shared<Subscription>();
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers_.push_back(sub);
        return sub;
    }

    size_t size() const {
        return snapshot(nullptr).size();
    }
};

} // namespace labyrinth

#endif // LABYRINTH_LEADERBOARD_LEADERBOARD_H
