/**
 * @file yaml_config.h
 * @brief 配置与提交记录使用的 YAML 子集
 *
 * 支持：
 * - 块式 map 与列表，缩进宽度由每个块的第一行决定
 * - 列表项为 map（"- key: v" 后续行继续该 map）
 * - 流式列表 [a, b] 与流式 map {a: 1, b: 2}，不嵌套
 * - 单/双引号字符串，# 注释（引号内除外）
 *
 * 不支持锚点、多文档、多行字符串。
 */

#ifndef LABYRINTH_CORE_YAML_CONFIG_H
#define LABYRINTH_CORE_YAML_CONFIG_H

#include "error.h"

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <variant>
#include <memory>
#include <cstdint>
#include <cstdlib>
#include <cerrno>
#include <cctype>

namespace labyrinth {
namespace yaml {

class YamlNode;
using YamlNodePtr = std::shared_ptr<YamlNode>;
using YamlMap = std::map<std::string, YamlNodePtr>;
using YamlList = std::vector<YamlNodePtr>;

namespace detail {

inline std::string to_lower(std::string s) {
    for (auto &c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::string strip(const std::string &s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

/// 整串是十进制整数
inline bool parse_int64(const std::string &s, int64_t &out) {
    if (s.empty()) return false;
    errno = 0;
    char *end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

inline bool parse_double(const std::string &s, double &out) {
    if (s.empty()) return false;
    errno = 0;
    char *end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

inline bool is_quoted(const std::string &s) {
    return s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front();
}

inline std::string unquote(const std::string &s) {
    return is_quoted(s) ? s.substr(1, s.size() - 2) : s;
}

} // namespace detail

//==============================================================================
// 节点
//==============================================================================

class YamlNode {
public:
    using Value = std::variant<std::monostate, std::string, int64_t, double, bool, YamlMap, YamlList>;
    Value value;

    YamlNode() = default;
    explicit YamlNode(Value v) : value(std::move(v)) {}

    bool is_null() const { return value.index() == 0; }
    bool is_string() const { return std::holds_alternative<std::string>(value); }
    bool is_int() const { return std::holds_alternative<int64_t>(value); }
    bool is_bool() const { return std::holds_alternative<bool>(value); }
    bool is_map() const { return std::holds_alternative<YamlMap>(value); }
    bool is_list() const { return std::holds_alternative<YamlList>(value); }

    /// 标量的文本形式；map、list、null 返回 def
    std::string as_string(const std::string &def = "") const {
        if (auto s = std::get_if<std::string>(&value)) return *s;
        if (auto i = std::get_if<int64_t>(&value)) return std::to_string(*i);
        if (auto d = std::get_if<double>(&value)) {
            std::ostringstream oss;
            oss << *d;
            return oss.str();
        }
        if (auto b = std::get_if<bool>(&value)) return *b ? "true" : "false";
        return def;
    }

    int64_t as_int(int64_t def = 0) const {
        if (auto i = std::get_if<int64_t>(&value)) return *i;
        if (auto d = std::get_if<double>(&value)) return static_cast<int64_t>(*d);
        return def;
    }

    double as_double(double def = 0.0) const {
        if (auto d = std::get_if<double>(&value)) return *d;
        if (auto i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
        return def;
    }

    bool as_bool(bool def = false) const {
        if (auto b = std::get_if<bool>(&value)) return *b;
        return def;
    }

    const YamlList& as_list() const {
        static const YamlList none;
        auto l = std::get_if<YamlList>(&value);
        return l ? *l : none;
    }

    std::vector<std::string> as_string_list() const {
        std::vector<std::string> out;
        for (const auto &item : as_list()) {
            if (item && !item->is_null()) out.push_back(item->as_string());
        }
        return out;
    }

    YamlNodePtr get(const std::string &key) const {
        auto m = std::get_if<YamlMap>(&value);
        if (!m) return nullptr;
        auto it = m->find(key);
        return it == m->end() ? nullptr : it->second;
    }

    bool has(const std::string &key) const { return get(key) != nullptr; }

    /// 点分路径，如 "pipeline.max_queue_depth"
    YamlNodePtr operator[](const std::string &path) const {
        size_t dot = path.find('.');
        if (dot == std::string::npos) return get(path);
        auto child = get(path.substr(0, dot));
        return child ? (*child)[path.substr(dot + 1)] : nullptr;
    }
};

//==============================================================================
// 解析
//==============================================================================

class YamlParser {
private:
    struct Line {
        size_t indent;
        std::string text;   ///< 去掉缩进、注释和行尾空白
    };

    std::vector<Line> lines_;
    size_t pos_ = 0;

    static std::string strip_comment(const std::string &raw) {
        char quote = 0;
        for (size_t i = 0; i < raw.size(); i++) {
            char c = raw[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || raw[i - 1] == ' ' || raw[i - 1] == '\t')) {
                return raw.substr(0, i);
            }
        }
        return raw;
    }

    static bool is_item(const std::string &text) {
        return text == "-" || text.compare(0, 2, "- ") == 0;
    }

    static bool is_flow(const std::string &s) {
        return s.size() >= 2 && ((s.front() == '[' && s.back() == ']') ||
                                 (s.front() == '{' && s.back() == '}'));
    }

    /// "key: value" 或 "key:" 中冒号的位置，引号内的冒号不算
    static size_t key_colon(const std::string &text) {
        char quote = 0;
        for (size_t i = 0; i < text.size(); i++) {
            char c = text[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == ':' && (i + 1 == text.size() || text[i + 1] == ' ')) {
                return i;
            }
        }
        return std::string::npos;
    }

    /// 按顶层逗号切分流式集合的内容
    static std::vector<std::string> split_flow(const std::string &body) {
        std::vector<std::string> parts;
        std::string cur;
        char quote = 0;
        for (char c : body) {
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == ',') {
                parts.push_back(detail::strip(cur));
                cur.clear();
                continue;
            }
            cur += c;
        }
        if (!detail::strip(cur).empty() || !parts.empty()) {
            parts.push_back(detail::strip(cur));
        }
        return parts;
    }

    static YamlNodePtr node(YamlNode::Value v) {
        return std::make_shared<YamlNode>(std::move(v));
    }

    static YamlNodePtr scalar(const std::string &text) {
        if (text.empty() || text == "~" || text == "null") return node(std::monostate{});
        if (detail::is_quoted(text)) return node(detail::unquote(text));

        std::string lower = detail::to_lower(text);
        if (lower == "true" || lower == "yes") return node(true);
        if (lower == "false" || lower == "no") return node(false);

        int64_t i = 0;
        if (detail::parse_int64(text, i)) return node(i);
        double d = 0.0;
        bool numeric_tail = std::isdigit(static_cast<unsigned char>(text.back())) != 0;
        if (numeric_tail && text.find_first_of(".eE") != std::string::npos &&
            detail::parse_double(text, d)) {
            return node(d);
        }
        return node(text);
    }

    static YamlNodePtr inline_value(const std::string &text) {
        if (!is_flow(text)) return scalar(text);

        auto parts = split_flow(text.substr(1, text.size() - 2));
        if (text.front() == '[') {
            YamlList list;
            for (const auto &p : parts) list.push_back(scalar(p));
            return node(std::move(list));
        }
        YamlMap map;
        for (const auto &p : parts) {
            size_t colon = key_colon(p);
            if (colon == std::string::npos) colon = p.find(':');
            if (colon == std::string::npos) continue;
            map[detail::unquote(detail::strip(p.substr(0, colon)))] =
                scalar(detail::strip(p.substr(colon + 1)));
        }
        return node(std::move(map));
    }

    bool at(size_t indent) const {
        return pos_ < lines_.size() && lines_[pos_].indent == indent;
    }

    /// key 后面的值：行内值，或下一行开始的更深的块
    YamlNodePtr value_after_key(const std::string &rest, size_t key_indent) {
        if (!rest.empty()) return inline_value(rest);
        if (pos_ < lines_.size() && lines_[pos_].indent > key_indent) {
            return block(lines_[pos_].indent);
        }
        // "key:" 下紧跟同缩进的 "- item"
        if (at(key_indent) && is_item(lines_[pos_].text)) {
            return sequence(key_indent);
        }
        return node(std::monostate{});
    }

    void read_pairs(size_t indent, YamlMap &map) {
        while (at(indent) && !is_item(lines_[pos_].text)) {
            const std::string text = lines_[pos_].text;
            pos_++;
            size_t colon = key_colon(text);
            if (colon == std::string::npos) continue;
            std::string key = detail::unquote(detail::strip(text.substr(0, colon)));
            map[key] = value_after_key(detail::strip(text.substr(colon + 1)), indent);
        }
    }

    YamlNodePtr sequence(size_t indent) {
        YamlList list;
        while (at(indent) && is_item(lines_[pos_].text)) {
            const std::string text = lines_[pos_].text;
            pos_++;
            std::string rest = detail::strip(text.substr(1));
            size_t colon = is_flow(rest) ? std::string::npos : key_colon(rest);

            if (rest.empty()) {
                bool nested = pos_ < lines_.size() && lines_[pos_].indent > indent;
                list.push_back(nested ? block(lines_[pos_].indent) : node(std::monostate{}));
            } else if (colon != std::string::npos) {
                // 列表项是 map：第一对在 "- " 之后，其余在更深的缩进上
                size_t key_indent = indent + (text.size() - rest.size());
                YamlMap map;
                std::string key = detail::unquote(detail::strip(rest.substr(0, colon)));
                map[key] = value_after_key(detail::strip(rest.substr(colon + 1)), key_indent);
                if (pos_ < lines_.size() && lines_[pos_].indent > indent &&
                    !is_item(lines_[pos_].text)) {
                    read_pairs(lines_[pos_].indent, map);
                }
                list.push_back(node(std::move(map)));
            } else {
                list.push_back(inline_value(rest));
            }
        }
        return node(std::move(list));
    }

    YamlNodePtr block(size_t indent) {
        if (at(indent) && is_item(lines_[pos_].text)) {
            return sequence(indent);
        }
        YamlMap map;
        read_pairs(indent, map);
        return node(std::move(map));
    }

public:
    explicit YamlParser(const std::string &content) {
        std::istringstream in(content);
        std::string raw;
        while (std::getline(in, raw)) {
            std::string text = strip_comment(raw);
            size_t indent = 0;
            while (indent < text.size() && (text[indent] == ' ' || text[indent] == '\t')) {
                indent++;
            }
            text = detail::strip(text);
            if (!text.empty()) {
                lines_.push_back(Line{indent, text});
            }
        }
    }

    /// 空文档得到空 map
    YamlNodePtr parse() {
        pos_ = 0;
        if (lines_.empty()) return node(YamlMap{});
        return block(lines_.front().indent);
    }
};

//==============================================================================
// 入口
//==============================================================================

inline YamlNodePtr parse_yaml(const std::string &content) {
    return YamlParser(content).parse();
}

inline Result<YamlNodePtr> load_yaml(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return LABYRINTH_ERROR(ErrorCode::FILE_NOT_FOUND, "cannot open " + filename);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return LABYRINTH_ERROR(ErrorCode::FILE_READ_ERROR, "cannot read " + filename);
    }
    return parse_yaml(buffer.str());
}

} // namespace yaml
} // namespace labyrinth

#endif // LABYRINTH_CORE_YAML_CONFIG_H
