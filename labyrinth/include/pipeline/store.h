/**
 * @file store.h
 * @brief 提交记录存储
 *
 * FileStore 每条记录一个 <id>.yml，先写临时文件再 rename。
 * retry_transient / save_with_retry 对可重试错误做指数退避，不会重新执行沙箱。
 */

#ifndef LABYRINTH_PIPELINE_STORE_H
#define LABYRINTH_PIPELINE_STORE_H

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <chrono>
#include <fstream>
#include <filesystem>
#include <system_error>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <cerrno>

#include "core/error.h"
#include "core/utils.h"
#include "core/yaml_config.h"
#include "core/labyrinth_logger.h"
#include "pipeline/submission.h"

namespace labyrinth {

class SubmissionStore {
public:
    virtual ~SubmissionStore() = default;

    virtual Result<void> save(const Submission &s) = 0;
    virtual Result<Submission> load(const std::string &id) = 0;
    virtual Result<std::vector<Submission>> load_all() = 0;
};

//==============================================================================
// 内存存储
//==============================================================================

class MemoryStore : public SubmissionStore {
private:
    std::map<std::string, Submission> records_;
    std::mutex mutex_;

public:
    Result<void> save(const Submission &s) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_[s.id] = s;
        return Ok();
    }

    Result<Submission> load(const std::string &id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) {
            return LABYRINTH_ERROR(ErrorCode::SUBMISSION_NOT_FOUND, "no submission " + id);
        }
        return it->second;
    }

    Result<std::vector<Submission>> load_all() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Submission> out;
        for (const auto &kv : records_) {
            out.push_back(kv.second);
        }
        return out;
    }
};

//==============================================================================
// 文件存储
//==============================================================================

class FileStore : public SubmissionStore {
private:
    std::string dir_;
    std::mutex mutex_;

    std::string path_of(const std::string &id) const {
        return dir_ + "/" + id + ".yml";
    }

public:
    explicit FileStore(const std::string &dir) : dir_(dir) {}

    Result<void> init() {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            return LABYRINTH_ERROR(ErrorCode::FILE_WRITE_ERROR,
                                   "cannot create " + dir_ + ": " + ec.message());
        }
        return Ok();
    }

    Result<void> save(const Submission &s) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string path = path_of(s.id);
        std::string tmp = path + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                return LABYRINTH_ERROR(ErrorCode::FILE_WRITE_ERROR, "cannot open " + tmp);
            }
            out << to_yaml(s);
            out.flush();
            if (!out) {
                return LABYRINTH_ERROR(ErrorCode::FILE_WRITE_ERROR, "cannot write " + tmp);
            }
        }
        if (std::rename(tmp.c_str(), path.c_str()) != 0) {
            return LABYRINTH_ERROR(ErrorCode::PERSISTENCE_FAILED,
                                   "rename " + tmp + ": " + strerror(errno));
        }
        return Ok();
    }

    Result<Submission> load(const std::string &id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string path = path_of(id);
        if (!file_exists(path)) {
            return LABYRINTH_ERROR(ErrorCode::SUBMISSION_NOT_FOUND, "no submission " + id);
        }
        LABYRINTH_TRY_UNWRAP(doc, yaml::load_yaml(path));
        return submission_from_yaml(doc);
    }

    /**
     * @brief 读取目录下全部记录；损坏的文件记日志后跳过
     */
    Result<std::vector<Submission>> load_all() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Submission> out;
        std::error_code ec;
        if (!std::filesystem::is_directory(dir_, ec)) {
            return out;
        }
        std::vector<std::string> files;
        for (const auto &entry : std::filesystem::directory_iterator(dir_, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".yml") {
                files.push_back(entry.path().string());
            }
        }
        if (ec) {
            return LABYRINTH_ERROR(ErrorCode::FILE_READ_ERROR,
                                   "cannot list " + dir_ + ": " + ec.message());
        }
        std::sort(files.begin(), files.end());
        for (const auto &file : files) {
            auto doc = yaml::load_yaml(file);
            if (!doc.ok()) {
                PLOG_WARN << "skipping " << file << ": " << doc.error().to_string();
                continue;
            }
            auto s = submission_from_yaml(doc.value());
            if (!s.ok()) {
                PLOG_WARN << "skipping " << file << ": " << s.error().to_string();
                continue;
            }
            out.push_back(std::move(s.value()));
        }
        return out;
    }

    const std::string& dir() const { return dir_; }
};

//==============================================================================
// 重试
//==============================================================================

/**
 * @brief 执行 save，可重试错误按 backoff, 2*backoff, 4*backoff ... 重试
 *
 * @param retries 首次失败后最多再试几次
 */
template<typename Save>
Result<void> retry_transient(const std::string &id, Save save,
                             int retries, std::chrono::milliseconds backoff) {
    Result<void> result = save();
    for (int attempt = 0; attempt < retries && !result.ok(); attempt++) {
        if (!is_transient(result.error().code())) {
            break;
        }
        auto delay = backoff * (1LL << std::min(attempt, 16));
        PLOG_WARN << "persist " << id << " failed (" << result.error().message()
                  << "), retry " << (attempt + 1) << "/" << retries
                  << " in " << delay.count() << "ms";
        std::this_thread::sleep_for(delay);
        result = save();
    }
    return result;
}

inline Result<void> save_with_retry(SubmissionStore &store, const Submission &s,
                                    int retries, std::chrono::milliseconds backoff) {
    return retry_transient(s.id, [&store, &s] { return store.save(s); }, retries, backoff);
}

} // namespace labyrinth

#endif // LABYRINTH_PIPELINE_STORE_H
