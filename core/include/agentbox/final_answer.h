#pragma once

#include <optional>
#include <string>

namespace agentbox {

// Narrow grammar check for the final-answer convention.
//
// Code is in final-answer form when its LAST top-level statement (column 0,
// separated by a newline or ';') is exactly one call `final_answer(<expr>)`
// with a single positional argument. Everything before that statement runs
// unchanged. This is a contract on the code generator upstream: a
// final_answer call nested in a block, or with several arguments, is not
// recognized here (the guest still honors it at run time).
struct FinalAnswerMatch {
    std::string prefix;      // code preceding the final statement, verbatim
    std::string expression;  // the argument expression, trimmed
};

std::optional<FinalAnswerMatch> match_final_answer(const std::string& code);

// prefix + `<hook>(<expression>)`
std::string rewrite_final_answer(const FinalAnswerMatch& m, const std::string& hook);

} // namespace agentbox
