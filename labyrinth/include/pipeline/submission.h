/**
 * @file submission.h
 * @brief 提交记录与状态机
 *
 * pending -> running -> {completed | failed | timeout}
 *
 * 状态只前进不后退，终态不可再改。
 */

#ifndef LABYRINTH_PIPELINE_SUBMISSION_H
#define LABYRINTH_PIPELINE_SUBMISSION_H

#include <string>
#include <sstream>
#include <optional>
#include <cstdint>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/yaml_config.h"

namespace labyrinth {

struct Submission {
    std::string id;
    std::string user;
    std::string maze_id;
    std::string artifact;
    SubmissionStatus status = SubmissionStatus::Pending;
    std::optional<int> score;               ///< 仅 completed
    FailureKind failure = FailureKind::None;
    std::string error;                      ///< 面向用户的说明
    std::string session_id;

    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> finished_at;

    uint64_t cpu_ms = 0;
    uint64_t wall_ms = 0;
    uint64_t memory_kb = 0;
    std::string stdout_preview;
    std::string stderr_preview;

    bool is_terminal() const { return labyrinth::is_terminal(status); }

    /**
     * @brief 状态前进一步
     *
     * 只允许 pending -> running 和 running -> 终态。
     */
    Result<void> transition(SubmissionStatus next) {
        bool allowed = false;
        if (status == SubmissionStatus::Pending) {
            allowed = next == SubmissionStatus::Running;
        } else if (status == SubmissionStatus::Running) {
            allowed = labyrinth::is_terminal(next);
        }
        if (!allowed) {
            return LABYRINTH_ERROR(ErrorCode::INVALID_TRANSITION,
                std::string(to_string(status)) + " -> " + to_string(next));
        }
        status = next;
        if (next == SubmissionStatus::Running) {
            started_at = Clock::now();
        } else {
            finished_at = Clock::now();
        }
        return Ok();
    }
};

//==============================================================================
// 持久化格式
//==============================================================================

namespace detail {

/// 单行、双引号包裹；内部双引号换成单引号
inline std::string quote_line(const std::string &s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '\n' || c == '\r' || c == '\t') out += ' ';
        else if (c == '"') out += '\'';
        else out += c;
    }
    return out + "\"";
}

} // namespace detail

/**
 * @brief 记录写成 YAML（不含输出预览）
 */
inline std::string to_yaml(const Submission &s) {
    std::ostringstream oss;
    oss << "id: " << detail::quote_line(s.id) << "\n"
        << "user: " << detail::quote_line(s.user) << "\n"
        << "maze_id: " << detail::quote_line(s.maze_id) << "\n"
        << "artifact: " << detail::quote_line(s.artifact) << "\n"
        << "status: " << to_string(s.status) << "\n";
    if (s.score) {
        oss << "score: " << *s.score << "\n";
    }
    oss << "failure: " << to_string(s.failure) << "\n"
        << "error: " << detail::quote_line(s.error) << "\n"
        << "session_id: " << detail::quote_line(s.session_id) << "\n"
        << "created_at: " << to_unix_ms(s.created_at) << "\n";
    if (s.started_at) {
        oss << "started_at: " << to_unix_ms(*s.started_at) << "\n";
    }
    if (s.finished_at) {
        oss << "finished_at: " << to_unix_ms(*s.finished_at) << "\n";
    }
    oss << "cpu_ms: " << s.cpu_ms << "\n"
        << "wall_ms: " << s.wall_ms << "\n"
        << "memory_kb: " << s.memory_kb << "\n";
    return oss.str();
}

inline Result<Submission> submission_from_yaml(const yaml::YamlNodePtr &doc) {
    if (!doc || !doc->is_map() || !doc->has("id") || !doc->has("status")) {
        return LABYRINTH_ERROR(ErrorCode::FILE_READ_ERROR, "not a submission record");
    }
    Submission s;
    s.id = doc->get("id")->as_string();
    if (doc->has("user")) s.user = doc->get("user")->as_string();
    if (doc->has("maze_id")) s.maze_id = doc->get("maze_id")->as_string();
    if (doc->has("artifact")) s.artifact = doc->get("artifact")->as_string();
    if (doc->has("error")) s.error = doc->get("error")->as_string();
    if (doc->has("session_id")) s.session_id = doc->get("session_id")->as_string();

    if (!parse_submission_status(doc->get("status")->as_string(), s.status)) {
        return LABYRINTH_ERROR(ErrorCode::FILE_READ_ERROR,
                               "bad status in record " + s.id);
    }
    if (doc->has("failure") && !parse_failure_kind(doc->get("failure")->as_string(), s.failure)) {
        return LABYRINTH_ERROR(ErrorCode::FILE_READ_ERROR,
                               "bad failure kind in record " + s.id);
    }
    if (doc->has("score")) {
        s.score = static_cast<int>(doc->get("score")->as_int());
    }
    if (doc->has("created_at")) {
        s.created_at = from_unix_ms(doc->get("created_at")->as_int());
    }
    if (doc->has("started_at")) {
        s.started_at = from_unix_ms(doc->get("started_at")->as_int());
    }
    if (doc->has("finished_at")) {
        s.finished_at = from_unix_ms(doc->get("finished_at")->as_int());
    }
    if (doc->has("cpu_ms")) s.cpu_ms = static_cast<uint64_t>(doc->get("cpu_ms")->as_int());
    if (doc->has("wall_ms")) s.wall_ms = static_cast<uint64_t>(doc->get("wall_ms")->as_int());
    if (doc->has("memory_kb")) s.memory_kb = static_cast<uint64_t>(doc->get("memory_kb")->as_int());
    return s;
}

} // namespace labyrinth

#endif // LABYRINTH_PIPELINE_SUBMISSION_H
