/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * tests/recursion_test.cpp
 * - Recursion limit and expansion chains
 */
#include <gtest/gtest.h>
#include "test_lexer.hpp"
#include <macro_rules/expand.hpp>
#include <compile_error.hpp>
#include <sstream>

namespace {
    /// Source with `n` copies of `x`
    ::std::string xs(unsigned n)
    {
        ::std::string rv;
        for(unsigned i = 0; i < n; i ++)
            rv += "x ";
        return rv;
    }
    size_t count_lines_containing(const ::std::string& text, const char* needle)
    {
        size_t  rv = 0;
        ::std::stringstream ss(text);
        ::std::string   line;
        while( ::std::getline(ss, line) )
        {
            if( line.find(needle) != ::std::string::npos )
                rv ++;
        }
        return rv;
    }
}

class RecursionTest:
    public ::testing::Test
{
protected:
    MacroRegistry   reg;

    void SetUp() override
    {
        // `count!(x x x)` expands once per `x`, plus once for the empty case
        reg.define("count", parse_macro("() => (done); (x $($rest:tt)*) => (count!($($rest)*));"), Span());
        reg.define("forever", parse_macro("() => (forever!())"), Span());
    }
};

TEST_F(RecursionTest, DepthUpToLimit)
{
    for(unsigned limit = 1; limit <= 10; limit ++)
    {
        ExpansionOptions    opts;
        opts.max_depth = limit;
        MacroExpander   ex(reg, opts);

        auto fits = lex_tokens(xs(limit - 1).c_str());
        auto r = ex.expand_invocation("count", Span(), fits);
        ASSERT_TRUE(r.is_Ok()) << "limit=" << limit;
        EXPECT_EQ(r.as_Ok().to_str(), "done");

        auto over = lex_tokens(xs(limit).c_str());
        r = ex.expand_invocation("count", Span(), over);
        ASSERT_TRUE(r.is_Err()) << "limit=" << limit;
        EXPECT_EQ(r.as_Err().kind, MacroErrorKind::RecursionLimitExceeded);
        EXPECT_EQ(r.as_Err().frames.size(), limit);
    }
}

TEST_F(RecursionTest, DefaultLimit)
{
    MacroExpander   ex(reg);
    EXPECT_EQ(ex.options().max_depth, 128u);
    auto args = lex_tokens("");
    auto r = ex.expand_invocation("forever", Span(), args);
    ASSERT_TRUE(r.is_Err());
    const auto& d = r.as_Err();
    EXPECT_EQ(d.kind, MacroErrorKind::RecursionLimitExceeded);
    EXPECT_EQ(d.frames.size(), 128u);
    for(const auto& f : d.frames)
    {
        EXPECT_EQ(f.macro_name, "forever");
        EXPECT_EQ(f.arm_index, 0u);
    }
}

TEST_F(RecursionTest, ChainRendering)
{
    ExpansionOptions    opts;
    opts.max_depth = 3;
    MacroExpander   ex(reg, opts);
    auto tt = lex_tokens("a forever!() b");
    auto r = ex.expand_stream(tt, Span());
    ASSERT_TRUE(r.is_Err());

    ::std::stringstream ss;
    r.as_Err().render(ss);
    auto text = ss.str();
    EXPECT_EQ(count_lines_containing(text, "RecursionLimitExceeded"), 1u);
    EXPECT_EQ(count_lines_containing(text, "note: in this expansion of `forever!`"), 3u);
    EXPECT_NE(text.find("limit 3"), ::std::string::npos);
}

TEST_F(RecursionTest, SiblingsDontAccumulate)
{
    // Depth counts nesting, not the total number of expansions
    ExpansionOptions    opts;
    opts.max_depth = 2;
    MacroExpander   ex(reg, opts);
    auto tt = lex_tokens("count!(x) count!(x) count!(x) count!(x)");
    auto r = ex.expand_stream(tt, Span());
    ASSERT_TRUE(r.is_Ok());
    EXPECT_EQ(r.as_Ok(), lex_tokens("done done done done"));
}

TEST_F(RecursionTest, ZeroLimitIsBug)
{
    ExpansionOptions    opts;
    opts.max_depth = 0;
    EXPECT_THROW({ MacroExpander ex(reg, opts); (void)ex; }, CompileError::BugCheck);
}
