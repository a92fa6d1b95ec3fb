/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * tests/match_test.cpp
 * - Rule selection and pattern matching
 */
#include <gtest/gtest.h>
#include "test_lexer.hpp"
#include <macro_rules/match.hpp>
#include <macro_rules/fragment.hpp>
#include <macro_rules/macro_error.hpp>

namespace {
    MacroMatch do_match(const MacroRulesPtr& mr, const TokenTree& input, bool struct_literals=true)
    {
        RustFragmentGrammar grammar(struct_literals);
        return Macro_MatchRules(*mr, TokenTreeSlice::group_inner(input), grammar, Span());
    }

    MacroError match_error(const MacroRulesPtr& mr, const TokenTree& input, bool struct_literals=true)
    {
        try
        {
            do_match(mr, input, struct_literals);
        }
        catch(const MacroError& e)
        {
            return e;
        }
        throw ::std::runtime_error("Match unexpectedly succeeded");
    }

    ::std::string bound(const MacroMatch& m, unsigned idx, const ::std::vector<unsigned>& its={})
    {
        return m.bindings.get(idx, its).slice.to_tree().to_str();
    }
}

TEST(MatchTest, SimpleRule)
{
    auto mr = parse_macro("($e:expr; $n:expr) => (REPEAT($e, $n))");
    auto input = lex_tokens("1; 100");
    auto m = do_match(mr, input);
    EXPECT_EQ(m.arm_index, 0u);
    EXPECT_EQ(bound(m, 0), "1");
    EXPECT_EQ(bound(m, 1), "100");
}

TEST(MatchTest, FirstMatchingRuleWins)
{
    auto mr = parse_macro("($x:ident) => (1); ($x:expr) => (2); ($x:tt) => (3);");
    auto a = lex_tokens("foo");
    EXPECT_EQ(do_match(mr, a).arm_index, 0u);
    auto b = lex_tokens("1 + 2");
    EXPECT_EQ(do_match(mr, b).arm_index, 1u);
    auto c = lex_tokens(";");
    EXPECT_EQ(do_match(mr, c).arm_index, 2u);
}

TEST(MatchTest, FragmentRejectedMidway)
{
    auto mr = parse_macro("($x:expr) => ($x)");
    auto input = lex_tokens("Foo {}");
    auto e = match_error(mr, input, false);
    EXPECT_EQ(e.kind(), MacroErrorKind::MalformedFragment);
    ASSERT_EQ(e.token().type(), TOK_IDENT);
    EXPECT_EQ(e.token().ident().name, "Foo");

    auto m = do_match(mr, input, true);
    EXPECT_EQ(bound(m, 0), "Foo{}");
}

TEST(MatchTest, FurthestFailureReported)
{
    auto mr = parse_macro("(a b c) => (1); (a $x:ident d) => (2);");
    auto input = lex_tokens("a x c");
    auto e = match_error(mr, input);
    EXPECT_EQ(e.kind(), MacroErrorKind::NoMatchingRule);
    ASSERT_EQ(e.token().type(), TOK_IDENT);
    EXPECT_EQ(e.token().ident().name, "c");
    EXPECT_EQ(e.m_expected, "`d`");
}

TEST(MatchTest, TiedFailureKeepsFirstRule)
{
    auto mr = parse_macro("(a b) => (); (a c) => ();");
    auto input = lex_tokens("a d");
    auto e = match_error(mr, input);
    EXPECT_EQ(e.kind(), MacroErrorKind::NoMatchingRule);
    EXPECT_EQ(e.m_expected, "`b`");
}

TEST(MatchTest, TrailingInput)
{
    auto mr = parse_macro("(a) => ()");
    auto input = lex_tokens("a b");
    auto e = match_error(mr, input);
    EXPECT_EQ(e.kind(), MacroErrorKind::NoMatchingRule);
    EXPECT_EQ(e.token().ident().name, "b");
}

TEST(MatchTest, OptionalRepetition)
{
    auto mr = parse_macro("($($x:ident)?) => ()");
    size_t  n = 99;

    auto none = lex_tokens("");
    auto m = do_match(mr, none);
    ASSERT_TRUE(m.bindings.repeat_count(0, {}, n));
    EXPECT_EQ(n, 0u);

    auto one = lex_tokens("a");
    m = do_match(mr, one);
    ASSERT_TRUE(m.bindings.repeat_count(0, {}, n));
    EXPECT_EQ(n, 1u);

    auto two = lex_tokens("a b");
    EXPECT_EQ(match_error(mr, two).kind(), MacroErrorKind::NoMatchingRule);
}

TEST(MatchTest, OneOrMoreRepetition)
{
    auto mr = parse_macro("($($x:ident),+) => ()");
    auto none = lex_tokens("");
    EXPECT_EQ(match_error(mr, none).kind(), MacroErrorKind::NoMatchingRule);

    auto three = lex_tokens("a, b, c");
    auto m = do_match(mr, three);
    size_t  n = 0;
    ASSERT_TRUE(m.bindings.repeat_count(0, {}, n));
    EXPECT_EQ(n, 3u);
    EXPECT_EQ(bound(m, 0, {2}), "c");
}

TEST(MatchTest, SeparatorRequiredBetweenIterations)
{
    auto mr = parse_macro("($($x:ident),*) => ()");
    auto input = lex_tokens("a b");
    auto e = match_error(mr, input);
    EXPECT_EQ(e.kind(), MacroErrorKind::NoMatchingRule);
    EXPECT_EQ(e.token().ident().name, "b");
}

TEST(MatchTest, SeparatorNotTrailing)
{
    auto mr = parse_macro("($($x:expr),*) => ()");
    auto input = lex_tokens("1, 2,");
    auto e = match_error(mr, input);
    EXPECT_EQ(e.kind(), MacroErrorKind::NoMatchingRule);
    EXPECT_EQ(e.token().type(), TOK_EOF);

    // Trailing separator as part of the repeated body
    auto mr2 = parse_macro("($($x:expr,)*) => ()");
    auto m = do_match(mr2, input);
    size_t  n = 0;
    ASSERT_TRUE(m.bindings.repeat_count(0, {}, n));
    EXPECT_EQ(n, 2u);
}

TEST(MatchTest, Delimiters)
{
    auto mr = parse_macro("([$x:ident]) => ()");

    auto ok = lex_tokens("[a]");
    EXPECT_EQ(bound(do_match(mr, ok), 0), "a");

    auto wrong = lex_tokens("(a)");
    auto e = match_error(mr, wrong);
    EXPECT_EQ(e.kind(), MacroErrorKind::NoMatchingRule);
    EXPECT_EQ(e.token().type(), TOK_PAREN_OPEN);

    // The group must be consumed entirely
    auto extra = lex_tokens("[a b]");
    e = match_error(mr, extra);
    EXPECT_EQ(e.token().ident().name, "b");
}

TEST(MatchTest, NestedRepetitions)
{
    auto mr = parse_macro("($( $k:ident => $($v:expr),* );*) => ()");
    auto input = lex_tokens("a => 1, 2; b => 3");
    auto m = do_match(mr, input);

    size_t  n = 0;
    ASSERT_TRUE(m.bindings.repeat_count(0, {}, n));
    EXPECT_EQ(n, 2u);
    ASSERT_TRUE(m.bindings.repeat_count(1, {0}, n));
    EXPECT_EQ(n, 2u);
    ASSERT_TRUE(m.bindings.repeat_count(1, {1}, n));
    EXPECT_EQ(n, 1u);
    EXPECT_EQ(bound(m, 0, {1}), "b");
    EXPECT_EQ(bound(m, 1, {0, 1}), "2");
    EXPECT_EQ(bound(m, 1, {1, 0}), "3");
}

TEST(MatchTest, DuplicateMetavariable)
{
    auto mr = parse_macro("($x:ident $x:ident) => ()");
    auto input = lex_tokens("a b");
    EXPECT_EQ(match_error(mr, input).kind(), MacroErrorKind::DuplicateMetavariableBinding);
}

TEST(MatchTest, TokenTreesCaptureGroups)
{
    auto mr = parse_macro("($($t:tt)*) => ()");
    auto input = lex_tokens("a (b c) [d]");
    auto m = do_match(mr, input);
    size_t  n = 0;
    ASSERT_TRUE(m.bindings.repeat_count(0, {}, n));
    EXPECT_EQ(n, 3u);
    EXPECT_EQ(bound(m, 0, {1}), "(b c)");
}
