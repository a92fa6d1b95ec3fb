/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * tests/bindings_test.cpp
 * - Metavariable binding environment
 */
#include <gtest/gtest.h>
#include "test_lexer.hpp"
#include <macro_rules/bindings.hpp>
#include <macro_rules/macro_error.hpp>
#include <common.hpp>

namespace {
    CapturedFragment ident_at(const TokenTree& tt, size_t idx)
    {
        return CapturedFragment(MacroPatEnt::PAT_IDENT, TokenTreeSlice(tt, idx, idx+1));
    }

    MacroPatEnt make_loop(unsigned name_index)
    {
        ::std::vector<MacroPatEnt>  subpats;
        subpats.push_back( MacroPatEnt(Span(), "x", name_index, MacroPatEnt::PAT_IDENT) );
        return MacroPatEnt(Span(), Token(TOK_COMMA), "*", 0, mv$(subpats));
    }
}

TEST(BindingsTest, BindAndGet)
{
    auto tt = lex_tokens("a b c");
    MacroPatEnt x(Span(), "x", 0, MacroPatEnt::PAT_IDENT);
    MacroPatEnt y(Span(), "y", 1, MacroPatEnt::PAT_IDENT);

    ParameterMappings   pm(2);
    EXPECT_EQ(pm.size(), 2u);
    EXPECT_TRUE(pm.slot(0).is_Unbound());
    pm.bind(x, ident_at(tt, 0));
    pm.bind(y, ident_at(tt, 2));

    EXPECT_EQ(pm.get(0, {}).slice.to_tree().to_str(), "a");
    EXPECT_EQ(pm.get(1, {}).slice.to_tree().to_str(), "c");
    EXPECT_EQ(pm.get(1, {}).type, MacroPatEnt::PAT_IDENT);
}

TEST(BindingsTest, DuplicateBind)
{
    auto tt = lex_tokens("a b");
    MacroPatEnt x(Span(), "x", 0, MacroPatEnt::PAT_IDENT);
    ParameterMappings   pm(1);
    pm.bind(x, ident_at(tt, 0));
    try
    {
        pm.bind(x, ident_at(tt, 1));
        FAIL() << "Expected MacroError";
    }
    catch(const MacroError& e)
    {
        EXPECT_EQ(e.kind(), MacroErrorKind::DuplicateMetavariableBinding);
    }
}

TEST(BindingsTest, IgnoredNameIsNotBound)
{
    auto tt = lex_tokens("a b");
    MacroPatEnt ign(Span(), "", NAMEDVALUE_IGNORE, MacroPatEnt::PAT_IDENT);
    ParameterMappings   pm(0);
    pm.bind(ign, ident_at(tt, 0));
    pm.bind(ign, ident_at(tt, 1));
    EXPECT_EQ(pm.size(), 0u);
}

TEST(BindingsTest, Repetition)
{
    auto tt = lex_tokens("a b c");
    auto loop = make_loop(0);

    ::std::vector<ParameterMappings>    its;
    for(size_t i = 0; i < 3; i ++)
    {
        ParameterMappings   child(1);
        child.bind(loop.subpats[0], ident_at(tt, i));
        its.push_back( mv$(child) );
    }
    ParameterMappings   pm(1);
    pm.bind_repetition(loop, mv$(its));

    size_t  n = 0;
    ASSERT_TRUE(pm.repeat_count(0, {}, n));
    EXPECT_EQ(n, 3u);
    EXPECT_EQ(pm.get(0, {0}).slice.to_tree().to_str(), "a");
    EXPECT_EQ(pm.get(0, {1}).slice.to_tree().to_str(), "b");
    EXPECT_EQ(pm.get(0, {2}).slice.to_tree().to_str(), "c");
    // Within an iteration the name no longer repeats
    EXPECT_FALSE(pm.repeat_count(0, {1}, n));

    // Already bound
    EXPECT_THROW(pm.bind_repetition(loop, {}), MacroError);
}

TEST(BindingsTest, EmptyRepetition)
{
    auto loop = make_loop(0);
    ParameterMappings   pm(1);
    pm.bind_repetition(loop, {});
    ASSERT_TRUE(pm.slot(0).is_Repeat());
    size_t  n = 1;
    ASSERT_TRUE(pm.repeat_count(0, {}, n));
    EXPECT_EQ(n, 0u);
}
