/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * tests/expand_test.cpp
 * - Expansion driver
 */
#include <gtest/gtest.h>
#include "test_lexer.hpp"
#include <macro_rules/expand.hpp>
#include <common.hpp>
#include <sstream>

namespace {
    void define(MacroRegistry& reg, const char* name, const char* rules)
    {
        reg.define(name, parse_macro(rules), Span());
    }

    class ExpandTest:
        public ::testing::Test
    {
    protected:
        MacroRegistry   reg;

        void SetUp() override
        {
            define(reg, "repeat", "($e:expr; $n:expr) => (REPEAT($e, $n))");
            define(reg, "list",
                "($($x:expr),*) => (LIST[$($x),*]);"
                "($($x:expr,)*) => (list!($($x),*));"
                );
        }

        ::std::string invoke(const MacroExpander& ex, const char* name, const char* args)
        {
            auto tt = lex_tokens(args);
            auto r = ex.expand_invocation(name, Span(), tt);
            if( r.is_Err() )
                return FMT("ERR " << r.as_Err().kind);
            return r.as_Ok().to_str();
        }
    };
}

TEST_F(ExpandTest, SingleInvocation)
{
    MacroExpander   ex(reg);
    EXPECT_EQ(invoke(ex, "repeat", "1; 100"), "REPEAT(1,100)");
    EXPECT_EQ(invoke(ex, "list", "1, 2, 3"), "LIST[1,2,3]");
}

TEST_F(ExpandTest, NestedInvocationInOutput)
{
    MacroExpander   ex(reg);
    // Second rule re-invokes `list!` without the trailing comma
    EXPECT_EQ(invoke(ex, "list", "1, 2, 3,"), "LIST[1,2,3]");
}

TEST_F(ExpandTest, InvocationInArguments)
{
    MacroExpander   ex(reg);
    // Arguments are not expanded before matching, only the output is scanned
    EXPECT_EQ(invoke(ex, "list", "repeat!(0; 2), 5"), "LIST[REPEAT(0,2),5]");
}

TEST_F(ExpandTest, GroupArguments)
{
    MacroExpander   ex(reg);
    auto args = lex_tokens("(7; 8)");
    auto r = ex.expand_invocation("repeat", Span(), args[0]);
    ASSERT_TRUE(r.is_Ok());
    EXPECT_EQ(r.as_Ok().to_str(), "REPEAT(7,8)");
}

TEST_F(ExpandTest, NoMatchingRule)
{
    MacroExpander   ex(reg);
    auto args = lex_tokens("1, 2");
    auto r = ex.expand_invocation("repeat", Span(), args);
    ASSERT_TRUE(r.is_Err());
    const auto& d = r.as_Err();
    EXPECT_EQ(d.kind, MacroErrorKind::NoMatchingRule);
    EXPECT_EQ(d.token.type(), TOK_COMMA);
    ASSERT_EQ(d.frames.size(), 1u);
    EXPECT_EQ(d.frames[0].macro_name, "repeat");
}

TEST_F(ExpandTest, UnknownMacro)
{
    MacroExpander   ex(reg);
    EXPECT_EQ(invoke(ex, "nope", ""), "ERR NotFound");

    auto tt = lex_tokens("a nope!(x) b");
    auto r = ex.expand_stream(tt, Span());
    ASSERT_TRUE(r.is_Err());
    EXPECT_EQ(r.as_Err().kind, MacroErrorKind::NotFound);
    EXPECT_NE(r.as_Err().message.find("nope"), ::std::string::npos);

    ExpansionOptions    opts;
    opts.unknown_macro_is_error = false;
    MacroExpander   lenient(reg, opts);
    auto r2 = lenient.expand_stream(tt, Span());
    ASSERT_TRUE(r2.is_Ok());
    EXPECT_EQ(r2.as_Ok(), tt);
}

TEST_F(ExpandTest, StreamExpansion)
{
    MacroExpander   ex(reg);
    auto tt = lex_tokens("let v = repeat!(1; 2); { f(list![3, 4]) } repeat(5)");
    auto r = ex.expand_stream(tt, Span());
    ASSERT_TRUE(r.is_Ok());
    // A call without `!` is left alone
    EXPECT_EQ(r.as_Ok(), lex_tokens("let v = REPEAT(1, 2); { f(LIST[3, 4]) } repeat(5)"));
}

TEST_F(ExpandTest, StreamWithoutInvocations)
{
    MacroExpander   ex(reg);
    auto tt = lex_tokens("a (b [c]) { d }");
    auto r = ex.expand_stream(tt, Span());
    ASSERT_TRUE(r.is_Ok());
    EXPECT_EQ(r.as_Ok(), tt);

    // Group input stays a group
    auto r2 = ex.expand_stream(tt[1], Span());
    ASSERT_TRUE(r2.is_Ok());
    EXPECT_TRUE(r2.as_Ok().is_group());
    EXPECT_EQ(r2.as_Ok(), tt[1]);
}

TEST_F(ExpandTest, BangOptional)
{
    ExpansionOptions    opts;
    opts.require_bang = false;
    MacroExpander   ex(reg, opts);
    auto tt = lex_tokens("repeat(1; 2) repeat!(3; 4)");
    auto r = ex.expand_stream(tt, Span());
    ASSERT_TRUE(r.is_Ok());
    EXPECT_EQ(r.as_Ok(), lex_tokens("REPEAT(1, 2) REPEAT(3, 4)"));
}

TEST_F(ExpandTest, StructLiteralOption)
{
    define(reg, "e", "($x:expr) => (E($x))");
    auto tt = lex_tokens("e!(Foo {})");

    MacroExpander   ex(reg);
    auto r = ex.expand_stream(tt, Span());
    ASSERT_TRUE(r.is_Ok());
    EXPECT_EQ(r.as_Ok().to_str(), "E(Foo{})");

    ExpansionOptions    opts;
    opts.struct_literals = false;
    MacroExpander   strict(reg, opts);
    auto r2 = strict.expand_stream(tt, Span());
    ASSERT_TRUE(r2.is_Err());
    EXPECT_EQ(r2.as_Err().kind, MacroErrorKind::MalformedFragment);
    EXPECT_EQ(r2.as_Err().token.ident().name, "Foo");
}

TEST_F(ExpandTest, RepetitionMismatchReported)
{
    define(reg, "zip", "($($a:ident)* ; $($b:ident)*) => ($( ($a $b) )*)");
    MacroExpander   ex(reg);
    EXPECT_EQ(invoke(ex, "zip", "x y z ; p q"), "ERR RepetitionCountMismatch");
    EXPECT_EQ(invoke(ex, "zip", "x y ; p q"), "(x p)(y q)");
}

TEST_F(ExpandTest, DiagnosticRendering)
{
    define(reg, "outer", "() => (inner!(1))");
    define(reg, "inner", "($i:ident) => ($i)");
    MacroExpander   ex(reg);
    auto args = lex_tokens("");
    auto r = ex.expand_invocation("outer", Span(), args);
    ASSERT_TRUE(r.is_Err());
    const auto& d = r.as_Err();
    EXPECT_EQ(d.kind, MacroErrorKind::NoMatchingRule);
    ASSERT_EQ(d.frames.size(), 2u);
    EXPECT_EQ(d.frames[0].macro_name, "outer");
    EXPECT_EQ(d.frames[1].macro_name, "inner");

    ::std::stringstream ss;
    d.render(ss);
    auto text = ss.str();
    EXPECT_NE(text.find("NoMatchingRule"), ::std::string::npos);
    auto outer_pos = text.find("in this expansion of `outer!`");
    auto inner_pos = text.find("in this expansion of `inner!`");
    ASSERT_NE(outer_pos, ::std::string::npos);
    ASSERT_NE(inner_pos, ::std::string::npos);
    EXPECT_LT(outer_pos, inner_pos);
}

TEST_F(ExpandTest, DiagnosticNamesTokenOnce)
{
    define(reg, "id", "($i:ident) => ($i)");
    MacroExpander   ex(reg);
    auto args = lex_tokens("1");
    auto r = ex.expand_invocation("id", Span(), args);
    ASSERT_TRUE(r.is_Err());

    ::std::stringstream ss;
    r.as_Err().render(ss);
    auto text = ss.str();
    auto first = text.find("`1`");
    ASSERT_NE(first, ::std::string::npos);
    EXPECT_EQ(text.find("`1`", first + 1), ::std::string::npos);
    EXPECT_EQ(text.find("found TOK_"), ::std::string::npos);
    EXPECT_EQ(text.find("(found"), ::std::string::npos);
}

TEST_F(ExpandTest, DiagnosticWithoutSpan)
{
    MacroExpander   ex(reg);
    auto args = lex_tokens("");
    auto r = ex.expand_invocation("missing", Span(), args);
    ASSERT_TRUE(r.is_Err());
    EXPECT_EQ(r.as_Err().kind, MacroErrorKind::NotFound);

    ::std::stringstream ss;
    r.as_Err().render(ss);
    auto text = ss.str();
    EXPECT_EQ(text.find("<null>"), ::std::string::npos);
    EXPECT_EQ(text.compare(0, 16, "error: NotFound:"), 0) << text;
}

TEST_F(ExpandTest, DiagnosticFramesWithoutSpan)
{
    define(reg, "outer", "() => (inner!(1))");
    define(reg, "inner", "($i:ident) => ($i)");
    MacroExpander   ex(reg);
    auto args = lex_tokens("");
    auto r = ex.expand_invocation("outer", Span(), args);
    ASSERT_TRUE(r.is_Err());

    ::std::stringstream ss;
    r.as_Err().render(ss);
    auto text = ss.str();
    // The outermost invocation has no location
    EXPECT_NE(text.find("\nnote: in this expansion of `outer!`"), ::std::string::npos) << text;
    EXPECT_EQ(text.find("<null>"), ::std::string::npos);
}
