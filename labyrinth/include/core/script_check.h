/**
 * @file script_check.h
 * @brief 脚本类 artifact 的受理检查
 *
 * 由解释器执行的 artifact 在入队前逐行扫描：
 *   - import / from 语句引入了禁止的模块
 *   - 命中禁止的正则（忽略大小写）
 * 任一命中即 ARTIFACT_INVALID，消息带行号。
 *
 * 这只是受理时的快速拒绝，隔离仍由沙箱负责。
 */

#ifndef LABYRINTH_CORE_SCRIPT_CHECK_H
#define LABYRINTH_CORE_SCRIPT_CHECK_H

#include <string>
#include <vector>
#include <regex>
#include <sstream>
#include <algorithm>
#include <utility>

#include "error.h"
#include "utils.h"

namespace labyrinth {

/**
 * @brief 一种脚本语言的禁止规则
 */
struct ScriptRules {
    std::vector<std::string> blocked_imports;   ///< 顶层模块名
    std::vector<std::string> blocked_patterns;  ///< ECMAScript 正则

    bool empty() const { return blocked_imports.empty() && blocked_patterns.empty(); }
};

/**
 * @brief Python 玩家程序的缺省规则
 *
 * os 不在禁止之列：玩家通过 os.read / os.write 使用 fd 3 上的会话通道。
 */
inline ScriptRules default_python_rules() {
    ScriptRules rules;
    rules.blocked_imports = {
        "subprocess", "socket", "ctypes", "multiprocessing", "threading", "asyncio",
        "concurrent", "pty", "fcntl", "termios", "resource", "signal", "mmap",
        "pickle", "marshal", "shelve", "importlib", "builtins", "code", "shutil", "glob",
        "requests", "httpx", "aiohttp", "urllib", "http", "ftplib", "smtplib", "telnetlib",
    };
    rules.blocked_patterns = {
        R"((^|[^.\w])(exec|eval|compile)\s*\()",
        R"(__import__|__builtins__|__globals__|__subclasses__|__bases__|__mro__|__code__)",
        R"(\bos\s*\.\s*(system|popen|exec\w*|spawn\w*|fork\w*|kill\w*))",
        R"(\.\./)",
        R"(/(etc|proc|sys)/)",
    };
    return rules;
}

/**
 * @brief 编译后的规则
 */
class ScriptCheck {
private:
    std::vector<std::string> blocked_imports_;
    std::vector<std::pair<std::string, std::regex>> patterns_;

    // "import a.b as c, d" 与 "from a.b import c" 引入的顶层模块
    static std::vector<std::string> imported_modules(const std::string &line) {
        static const std::regex import_re(R"(^\s*import\s+(.+)$)");
        static const std::regex from_re(R"(^\s*from\s+([A-Za-z_][\w.]*)\s+import\b)");
        std::vector<std::string> modules;
        std::smatch m;
        if (std::regex_search(line, m, from_re)) {
            modules.push_back(m[1].str());
        } else if (std::regex_search(line, m, import_re)) {
            std::istringstream names(m[1].str());
            std::string item;
            while (std::getline(names, item, ',')) {
                auto words = split_ws(item);
                if (!words.empty()) modules.push_back(words[0]);
            }
        }
        for (auto &name : modules) {
            name = name.substr(0, name.find('.'));
        }
        return modules;
    }

public:
    ScriptCheck() = default;

    /**
     * @brief 编译规则；正则不合法时返回 CONFIG_INVALID_VALUE
     */
    static Result<ScriptCheck> compile(const ScriptRules &rules) {
        ScriptCheck check;
        check.blocked_imports_ = rules.blocked_imports;
        for (const auto &pattern : rules.blocked_patterns) {
            try {
                check.patterns_.emplace_back(pattern,
                    std::regex(pattern, std::regex::ECMAScript | std::regex::icase));
            } catch (const std::regex_error &e) {
                return LABYRINTH_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                                       "bad pattern '" + pattern + "': " + e.what());
            }
        }
        return check;
    }

    bool empty() const { return blocked_imports_.empty() && patterns_.empty(); }

    Result<void> check(const std::string &source) const {
        std::istringstream in(source);
        std::string line;
        int line_no = 0;
        while (std::getline(in, line)) {
            line_no++;
            for (const auto &module : imported_modules(line)) {
                if (std::find(blocked_imports_.begin(), blocked_imports_.end(), module) !=
                    blocked_imports_.end()) {
                    return LABYRINTH_ERROR(ErrorCode::ARTIFACT_INVALID,
                        "blocked import '" + module + "' at line " + std::to_string(line_no));
                }
            }
            for (const auto &p : patterns_) {
                if (std::regex_search(line, p.second)) {
                    return LABYRINTH_ERROR(ErrorCode::ARTIFACT_INVALID,
                        "blocked pattern '" + p.first + "' at line " + std::to_string(line_no));
                }
            }
        }
        return Ok();
    }
};

} // namespace labyrinth

#endif // LABYRINTH_CORE_SCRIPT_CHECK_H
