#include "test_common.h"

#include "agentbox/final_answer.h"

using agentbox::match_final_answer;
using agentbox::rewrite_final_answer;

static void expect_expr(const std::string& code, const std::string& expr, const std::string& prefix) {
    auto m = match_final_answer(code);
    expect_true(m.has_value(), "should match: " + code);
    expect_eq_str(m->expression, expr, "expression of: " + code);
    expect_eq_str(m->prefix, prefix, "prefix of: " + code);
}

static void expect_no_match(const std::string& code) {
    expect_true(!match_final_answer(code).has_value(), "should not match: " + code);
}

int main() {
    // Test 1: accepted forms
    expect_expr("final_answer(42)", "42", "");
    expect_expr("x = 2; final_answer(x + 3)", "x + 3", "x = 2; ");
    expect_expr("a = 1\nb = 2\nfinal_answer(a + b)\n", "a + b", "a = 1\nb = 2\n");
    expect_expr("final_answer({'k': [1, 2], 'v': (3, 4)})", "{'k': [1, 2], 'v': (3, 4)}", "");
    expect_expr("final_answer(\"a, b)\")", "\"a, b)\"", "");
    expect_expr("final_answer(f(1, 2),)", "f(1, 2)", "");
    expect_expr("final_answer(\n    compute(\n        1\n    )\n)", "compute(\n        1\n    )", "");
    expect_expr("s = '''\nfinal_answer(1)\n'''\nfinal_answer(s)  # done", "s", "s = '''\nfinal_answer(1)\n'''\n");

    // Test 2: rejected forms
    expect_no_match("print('no answer')");
    expect_no_match("final_answer(1)\nprint('after')");
    expect_no_match("final_answer(1, 2)");
    expect_no_match("final_answer()");
    expect_no_match("final_answer(1).bit_length()");
    expect_no_match("if True:\n    final_answer(1)");
    expect_no_match("my_final_answer(1)");
    expect_no_match("x = final_answer(1)");
    expect_no_match("# final_answer(1)");
    expect_no_match("");

    // Test 3: rewrite
    {
        auto m = match_final_answer("y = 4\nfinal_answer(y * 2)");
        expect_true(m.has_value(), "rewrite fixture matches");
        expect_eq_str(rewrite_final_answer(*m, "__hook__"), "y = 4\n__hook__(y * 2)\n", "rewritten code");
    }

    std::cerr << "test_final_answer: ALL PASSED" << std::endl;
    return 0;
}
