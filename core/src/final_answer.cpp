#include "agentbox/final_answer.h"

#include <cctype>
#include <vector>

namespace agentbox {

namespace {

// Skips a string literal starting at code[i] (a quote char). Returns the
// index just past the closing quote, or code.size() when unterminated.
size_t skip_string(const std::string& code, size_t i) {
    const char q = code[i];
    const bool triple = i + 2 < code.size() && code[i+1] == q && code[i+2] == q;
    size_t j = i + (triple ? 3 : 1);
    while (j < code.size()) {
        char c = code[j];
        if (c == '\\') { j += 2; continue; }
        if (triple) {
            if (c == q && j + 2 < code.size() && code[j+1] == q && code[j+2] == q) return j + 3;
        } else {
            if (c == q) return j + 1;
            if (c == '\n') return j; // unterminated single-line literal
        }
        j++;
    }
    return code.size();
}

struct Segment {
    size_t begin;
    size_t end;
    bool top_level; // starts in column 0 of its logical line
};

// Splits code into top-level statements on newlines and ';' outside of
// brackets, strings and comments. Explicit line continuations join lines.
std::vector<Segment> split_statements(const std::string& code) {
    std::vector<Segment> out;
    int depth = 0;
    size_t start = 0;
    bool line_top = true;   // current logical line starts in column 0
    bool seg_top = true;

    auto flush = [&](size_t end) {
        size_t b = start;
        while (b < end && (code[b] == ' ' || code[b] == '\t')) b++;
        size_t e = end;
        while (e > b && std::isspace((unsigned char)code[e-1])) e--;
        if (e > b) out.push_back({b, e, seg_top});
    };

    size_t i = 0;
    while (i < code.size()) {
        char c = code[i];
        if (c == '"' || c == '\'') { i = skip_string(code, i); continue; }
        if (c == '#') {
            size_t nl = code.find('\n', i);
            if (nl == std::string::npos) nl = code.size();
            // comment text never belongs to a statement
            if (depth == 0) {
                flush(i);
                start = nl;
            }
            i = nl;
            continue;
        }
        if (c == '\\' && i + 1 < code.size() && code[i+1] == '\n') { i += 2; continue; }
        if (c == '(' || c == '[' || c == '{') depth++;
        else if ((c == ')' || c == ']' || c == '}') && depth > 0) depth--;
        else if (depth == 0 && (c == '\n' || c == ';')) {
            flush(i);
            if (c == '\n') {
                size_t next = i + 1;
                line_top = next >= code.size() || (code[next] != ' ' && code[next] != '\t');
                seg_top = line_top;
            } else {
                seg_top = line_top;
            }
            start = i + 1;
        }
        i++;
    }
    flush(code.size());
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e-1])) e--;
    return s.substr(b, e - b);
}

} // namespace

std::optional<FinalAnswerMatch> match_final_answer(const std::string& code) {
    auto stmts = split_statements(code);
    if (stmts.empty()) return std::nullopt;
    const Segment& last = stmts.back();
    if (!last.top_level) return std::nullopt;

    const std::string stmt = code.substr(last.begin, last.end - last.begin);
    static const std::string kName = "final_answer";
    if (stmt.compare(0, kName.size(), kName) != 0) return std::nullopt;

    size_t i = kName.size();
    while (i < stmt.size() && (stmt[i] == ' ' || stmt[i] == '\t')) i++;
    if (i >= stmt.size() || stmt[i] != '(') return std::nullopt;
    const size_t open = i;

    // The parenthesis opened after the name must close on the final char,
    // with no top-level comma in between.
    int depth = 0;
    size_t close = std::string::npos;
    for (size_t j = open; j < stmt.size(); ) {
        char c = stmt[j];
        if (c == '"' || c == '\'') { j = skip_string(stmt, j); continue; }
        if (c == '(' || c == '[' || c == '{') depth++;
        else if (c == ')' || c == ']' || c == '}') {
            depth--;
            if (depth == 0) { close = j; break; }
        } else if (c == ',' && depth == 1) {
            // a trailing comma before ')' is still a single argument
            size_t k = j + 1;
            while (k < stmt.size() && std::isspace((unsigned char)stmt[k])) k++;
            if (k >= stmt.size() || stmt[k] != ')') return std::nullopt;
        }
        j++;
    }
    if (close == std::string::npos || close != stmt.size() - 1) return std::nullopt;

    std::string expr = trim(stmt.substr(open + 1, close - open - 1));
    if (!expr.empty() && expr.back() == ',') expr = trim(expr.substr(0, expr.size() - 1));
    if (expr.empty()) return std::nullopt;

    FinalAnswerMatch m;
    m.prefix = code.substr(0, last.begin);
    m.expression = std::move(expr);
    return m;
}

std::string rewrite_final_answer(const FinalAnswerMatch& m, const std::string& hook) {
    std::string out = m.prefix;
    out += hook;
    out += "(";
    out += m.expression;
    out += ")\n";
    return out;
}

} // namespace agentbox
