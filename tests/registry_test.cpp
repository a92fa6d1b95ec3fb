/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * tests/registry_test.cpp
 * - Macro registry and scoping
 */
#include <gtest/gtest.h>
#include "test_lexer.hpp"
#include <macro_rules/registry.hpp>
#include <macro_rules/macro_error.hpp>
#include <compile_error.hpp>

TEST(RegistryTest, DefineAndFind)
{
    MacroRegistry   reg;
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_EQ(reg.find("m"), nullptr);

    reg.define("m", parse_macro("() => (a); ($x:ident) => ($x);"), Span());
    EXPECT_EQ(reg.size(), 1u);
    const auto* mr = reg.find("m");
    ASSERT_NE(mr, nullptr);
    EXPECT_EQ(mr->m_rules.size(), 2u);
    EXPECT_EQ(&reg.lookup("m", Span()), mr);
}

TEST(RegistryTest, DuplicateDefinition)
{
    MacroRegistry   reg;
    reg.define("m", parse_macro("() => ()"), Span());
    try
    {
        reg.define("m", parse_macro("() => (b)"), Span());
        FAIL() << "Expected MacroError";
    }
    catch(const MacroError& e)
    {
        EXPECT_EQ(e.kind(), MacroErrorKind::DuplicateDefinition);
    }
    // The first definition is kept
    EXPECT_TRUE(reg.find("m")->m_rules[0].m_contents.empty());
}

TEST(RegistryTest, NotFound)
{
    MacroRegistry   reg;
    try
    {
        reg.lookup("missing", Span());
        FAIL() << "Expected MacroError";
    }
    catch(const MacroError& e)
    {
        EXPECT_EQ(e.kind(), MacroErrorKind::NotFound);
        EXPECT_NE(e.m_detail.find("missing"), ::std::string::npos);
    }
}

TEST(RegistryTest, ParentScopes)
{
    MacroRegistry   outer;
    outer.define("a", parse_macro("() => (outer_a)"), Span());
    outer.define("b", parse_macro("() => (outer_b)"), Span());

    MacroRegistry   inner(&outer);
    EXPECT_EQ(inner.parent(), &outer);
    // Shadowing an outer definition is not a duplicate
    inner.define("a", parse_macro("() => (inner_a)"), Span());

    EXPECT_EQ(inner.find("a"), inner.find("a"));
    EXPECT_NE(inner.find("a"), outer.find("a"));
    EXPECT_EQ(inner.find("b"), outer.find("b"));
    EXPECT_EQ(outer.find("a")->m_rules[0].m_contents[0].as_Token().ident().name, "outer_a");
    EXPECT_EQ(inner.find("a")->m_rules[0].m_contents[0].as_Token().ident().name, "inner_a");
    EXPECT_EQ(inner.size(), 1u);
}

TEST(RegistryTest, EmptyDefinitionIsBug)
{
    MacroRegistry   reg;
    EXPECT_THROW(reg.define("m", MacroRulesPtr(), Span()), CompileError::BugCheck);
}
