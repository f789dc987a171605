#include "plan_parser.hpp"
#include "util.hpp"
#include <cctype>

namespace sciclaw {

nlohmann::json AnalysisStep::to_json() const {
    return {{"id", id},
            {"title", title},
            {"tool_hint", tool_hint ? nlohmann::json(*tool_hint) : nlohmann::json()},
            {"status", status}};
}

nlohmann::json AnalysisPlan::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& step : steps) arr.push_back(step.to_json());
    return {{"steps", arr}, {"raw_text", raw_text}};
}

AnalysisStep* AnalysisPlan::claim_step(const std::string& tool_name) {
    for (auto& step : steps) {
        if (step.status == "pending" && step.tool_hint && *step.tool_hint == tool_name) {
            return &step;
        }
    }
    for (auto& step : steps) {
        if (step.status == "pending") return &step;
    }
    return nullptr;
}

namespace {

bool consume(const std::string& s, size_t& pos, const char* token) {
    size_t len = std::char_traits<char>::length(token);
    if (s.compare(pos, len, token) != 0) return false;
    pos += len;
    return true;
}

size_t skip_spaces(const std::string& s, size_t pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;
    return pos;
}

bool read_number(const std::string& s, size_t& pos, int& out) {
    size_t start = pos;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
    if (pos == start || pos - start > 3) {
        pos = start;
        return false;
    }
    out = std::stoi(s.substr(start, pos - start));
    return true;
}

// "1. x", "1) x", "1、x", "第1步 x", "Step 1: x". Returns the title start.
bool match_numbered(const std::string& line, int& number, size_t& title_pos) {
    size_t pos = skip_spaces(line, 0);

    size_t p = pos;
    if (consume(line, p, "第") && read_number(line, p, number) && consume(line, p, "步")) {
        if (!consume(line, p, "：") && !consume(line, p, "、")) {
            if (p < line.size() && (line[p] == ':' || line[p] == '.')) ++p;
        }
        title_pos = skip_spaces(line, p);
        return true;
    }

    p = pos;
    if (to_lower(line.substr(p, 4)) == "step") {
        p = skip_spaces(line, p + 4);
        if (read_number(line, p, number)) {
            if (p < line.size() && (line[p] == ':' || line[p] == '.' || line[p] == ')')) ++p;
            else consume(line, p, "：");
            title_pos = skip_spaces(line, p);
            return true;
        }
    }

    p = pos;
    if (!read_number(line, p, number)) return false;
    if (consume(line, p, "、")) {
        title_pos = skip_spaces(line, p);
        return true;
    }
    if (p < line.size() && (line[p] == '.' || line[p] == ')')) {
        ++p;
        // "1.5" is a number, not a step
        if (p < line.size() && line[p] != ' ' && line[p] != '\t') return false;
        title_pos = skip_spaces(line, p);
        return true;
    }
    return false;
}

bool match_bullet(const std::string& line, size_t& title_pos) {
    size_t p = skip_spaces(line, 0);
    if (p < line.size() && (line[p] == '-' || line[p] == '*' || line[p] == '+')) {
        ++p;
    } else if (!consume(line, p, "•")) {
        return false;
    }
    if (p >= line.size() || (line[p] != ' ' && line[p] != '\t')) return false;
    title_pos = skip_spaces(line, p);
    return true;
}

std::string strip_trailing_dashes(std::string s) {
    for (;;) {
        s = trim(s);
        if (ends_with(s, "-")) s.pop_back();
        else if (ends_with(s, "—") || ends_with(s, "–")) s.erase(s.size() - 3);
        else return s;
    }
}

// "Title - tool: name" -> ("Title", "name")
void split_tool_hint(std::string& title, std::optional<std::string>& hint) {
    static const char* markers[] = {"使用工具：", "使用工具:", "tool：", "tool:"};
    std::string lower = to_lower(title);
    for (const char* marker : markers) {
        size_t at = lower.rfind(marker);
        if (at == std::string::npos) continue;

        std::string prefix = trim(title.substr(0, at));
        if (ends_with(to_lower(prefix), "using")) prefix = trim(prefix.substr(0, prefix.size() - 5));
        if (!(ends_with(prefix, "-") || ends_with(prefix, "—") || ends_with(prefix, "–"))) continue;

        size_t p = skip_spaces(title, at + std::char_traits<char>::length(marker));
        size_t start = p;
        while (p < title.size() &&
               (std::isalnum(static_cast<unsigned char>(title[p])) || title[p] == '_')) {
            ++p;
        }
        if (p == start || !trim(title.substr(p)).empty()) continue;

        hint = title.substr(start, p - start);
        title = prefix;
        return;
    }
}

AnalysisStep make_step(int id, const std::string& rest) {
    AnalysisStep step;
    step.id = id;
    step.title = trim(rest);
    split_tool_hint(step.title, step.tool_hint);
    step.title = strip_trailing_dashes(step.title);
    return step;
}

} // namespace

std::optional<AnalysisPlan> parse_analysis_plan(const std::string& text) {
    std::vector<AnalysisStep> numbered;
    std::vector<AnalysisStep> bulleted;

    for (auto line : split(text, '\n')) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        int number = 0;
        size_t title_pos = 0;
        if (match_numbered(line, number, title_pos)) {
            AnalysisStep step = make_step(number, line.substr(title_pos));
            if (!step.title.empty()) numbered.push_back(std::move(step));
        } else if (match_bullet(line, title_pos)) {
            AnalysisStep step = make_step(static_cast<int>(bulleted.size()) + 1,
                                          line.substr(title_pos));
            if (!step.title.empty()) bulleted.push_back(std::move(step));
        }
    }

    std::vector<AnalysisStep>& steps = numbered.size() >= 2 ? numbered : bulleted;
    if (steps.size() < 2) return std::nullopt;

    AnalysisPlan plan;
    plan.steps = std::move(steps);
    plan.raw_text = text;
    return plan;
}

} // namespace sciclaw
