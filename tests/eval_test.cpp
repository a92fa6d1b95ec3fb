/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * tests/eval_test.cpp
 * - Template substitution
 */
#include <gtest/gtest.h>
#include "test_lexer.hpp"
#include <macro_rules/match.hpp>
#include <macro_rules/eval.hpp>
#include <macro_rules/fragment.hpp>
#include <macro_rules/macro_error.hpp>

namespace {
    TokenTree substitute(const MacroRulesPtr& mr, const TokenTree& input)
    {
        RustFragmentGrammar grammar;
        auto m = Macro_MatchRules(*mr, TokenTreeSlice::group_inner(input), grammar, Span());
        return Macro_Substitute(mr->m_rules[m.arm_index], m.bindings, HygieneContext(), Span());
    }
    ::std::string expand(const char* rules, const char* input)
    {
        auto mr = parse_macro(rules);
        auto tt = lex_tokens(input);
        return substitute(mr, tt).to_str();
    }
}

TEST(EvalTest, Fragments)
{
    EXPECT_EQ(expand("($e:expr; $n:expr) => (REPEAT($e, $n))", "1; 100"), "REPEAT(1,100)");
    EXPECT_EQ(expand("($a:expr) => (($a) * 2)", "x + 1"), "(x+1)*2");
}

TEST(EvalTest, Repetition)
{
    EXPECT_EQ(expand("($($x:expr),*) => (LIST[$($x),*])", "1, 2, 3"), "LIST[1,2,3]");
    EXPECT_EQ(expand("($($x:expr),*) => (LIST[$($x),*])", ""), "LIST[]");
    EXPECT_EQ(expand("($($x:ident)*) => ($($x)-*)", "a b c"), "a-b-c");
    EXPECT_EQ(expand("($($x:ident)*) => ($( f($x); )*)", "a b"), "f(a);f(b);");
}

TEST(EvalTest, NestedRepetition)
{
    auto out = expand("($( $k:ident => $($v:expr),* );*) => ($( $k [$($v)*] )*)", "a => 1, 2; b => 3");
    EXPECT_EQ(out, "a[1 2]b[3]");
}

TEST(EvalTest, NonRepeatingInsideRepetition)
{
    // `$sep` is repeated for each iteration of `$x`
    EXPECT_EQ(expand("($sep:tt; $($x:ident)*) => ($($x $sep)*)", "+; a b"), "a+b+");
}

TEST(EvalTest, RepetitionCountMismatch)
{
    auto mr = parse_macro("($($a:ident)* ; $($b:ident)*) => ($( ($a $b) )*)");
    auto input = lex_tokens("x y z ; p q");
    try
    {
        substitute(mr, input);
        FAIL() << "Expected MacroError";
    }
    catch(const MacroError& e)
    {
        EXPECT_EQ(e.kind(), MacroErrorKind::RepetitionCountMismatch);
    }

    auto same = lex_tokens("x y ; p q");
    EXPECT_EQ(substitute(mr, same).to_str(), "(x p)(y q)");
}

TEST(EvalTest, OutputIsGrouped)
{
    auto mr = parse_macro("($e:expr) => (f($e) [g])");
    auto input = lex_tokens("1");
    auto out = substitute(mr, input);
    EXPECT_EQ(out, lex_tokens("f(1) [g]"));
    ASSERT_EQ(out.size(), 3u);
    EXPECT_TRUE(out[1].is_group());
    EXPECT_TRUE(out[2].is_group());
}

TEST(EvalTest, CapturedFragmentsAreCopied)
{
    auto mr = parse_macro("($t:tt) => ($t $t)");
    auto input = lex_tokens("(a)");
    auto out = substitute(mr, input);
    EXPECT_EQ(out.to_str(), "(a)(a)");
    // Input is untouched
    EXPECT_EQ(input, lex_tokens("(a)"));
}

TEST(EvalTest, TemplateIdentsAreStamped)
{
    auto mr = parse_macro("($e:expr) => (let x = $e;)");
    auto input = lex_tokens("y");
    HygieneContext  ctx(1234);
    RustFragmentGrammar grammar;
    auto m = Macro_MatchRules(*mr, TokenTreeSlice::group_inner(input), grammar, Span());
    auto out = Macro_Substitute(mr->m_rules[m.arm_index], m.bindings, ctx, Span());

    ASSERT_EQ(out.size(), 5u);
    // Template identifier gains the expansion context
    const auto& tmpl_x = out[1].tok().ident();
    ASSERT_FALSE(tmpl_x.hygiene.contexts().empty());
    EXPECT_EQ(tmpl_x.hygiene.contexts().back(), 1234u);
    // Captured identifier keeps the caller's hygiene
    const auto& captured = out[3].tok().ident();
    EXPECT_TRUE(captured.same_binding(input[0].tok().ident()));
}
