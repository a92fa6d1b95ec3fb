/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * tests/hygiene_test.cpp
 * - Identifier hygiene across expansions
 */
#include <gtest/gtest.h>
#include "test_lexer.hpp"
#include <macro_rules/expand.hpp>
#include <macro_rules/eval.hpp>
#include <common.hpp>
#include <set>
#include <thread>

namespace {
    TokenTree expand_ok(const MacroExpander& ex, const char* name, const TokenTree& args)
    {
        auto r = ex.expand_invocation(name, Span(), args);
        if( r.is_Err() )
            throw ::std::runtime_error(r.as_Err().message);
        return mv$(r.as_Ok());
    }
}

TEST(HygieneTest, FreshContextsAreUnique)
{
    ::std::set<unsigned>    seen;
    for(int i = 0; i < 100; i ++)
        EXPECT_TRUE(seen.insert(Ident::Hygiene::new_context()).second);

    HygieneContext  a;
    HygieneContext  b;
    EXPECT_NE(a.context, b.context);
}

TEST(HygieneTest, FreshContextsAcrossThreads)
{
    ::std::vector<unsigned> a, b;
    ::std::thread   t1([&]{ for(int i = 0; i < 1000; i ++) a.push_back(Ident::Hygiene::new_context()); });
    ::std::thread   t2([&]{ for(int i = 0; i < 1000; i ++) b.push_back(Ident::Hygiene::new_context()); });
    t1.join();
    t2.join();
    ::std::set<unsigned>    all(a.begin(), a.end());
    all.insert(b.begin(), b.end());
    EXPECT_EQ(all.size(), 2000u);
}

TEST(HygieneTest, Visibility)
{
    auto outer = Ident::Hygiene::new_scope();
    auto inner = outer.stamped(Ident::Hygiene::new_context());

    // Code inside the expansion sees the caller's bindings
    EXPECT_TRUE(outer.is_visible(inner));
    // The caller doesn't see bindings introduced by the expansion
    EXPECT_FALSE(inner.is_visible(outer));
    EXPECT_TRUE(inner.is_visible(inner));
}

TEST(HygieneTest, TemplateBindingHiddenFromCaller)
{
    auto scope = Ident::Hygiene::new_scope();
    MacroRegistry   reg;
    reg.define("bind", Macro_ParseDefinition(Span(), lex_tokens("($e:expr) => (let x = $e; x)", scope, "<macro>")), Span());
    MacroExpander   ex(reg);

    auto args = lex_tokens("x", scope, "<test>");
    auto out = expand_ok(ex, "bind", args);
    // let x = x ; x
    ASSERT_EQ(out.size(), 6u);
    const auto& tmpl_let = out[1].tok().ident();
    const auto& caller_x = out[3].tok().ident();
    const auto& tmpl_use = out[5].tok().ident();

    EXPECT_TRUE(tmpl_let.same_binding(tmpl_use));
    EXPECT_FALSE(tmpl_let.same_binding(caller_x));
    EXPECT_TRUE(caller_x.same_binding(args[0].tok().ident()));
    EXPECT_FALSE(tmpl_let.hygiene.is_visible(caller_x.hygiene));
    EXPECT_TRUE(caller_x.hygiene.is_visible(tmpl_use.hygiene));
}

TEST(HygieneTest, SeparateExpansionsDiffer)
{
    auto scope = Ident::Hygiene::new_scope();
    MacroRegistry   reg;
    reg.define("tmp", Macro_ParseDefinition(Span(), lex_tokens("() => (tmp_var)", scope, "<macro>")), Span());
    MacroExpander   ex(reg);

    auto args = lex_tokens("");
    auto a = expand_ok(ex, "tmp", args);
    auto b = expand_ok(ex, "tmp", args);
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a[0].tok().ident().same_binding(b[0].tok().ident()));
}

TEST(HygieneTest, NestedExpansionsStack)
{
    auto scope = Ident::Hygiene::new_scope();
    MacroRegistry   reg;
    reg.define("outer", Macro_ParseDefinition(Span(), lex_tokens("() => (inner!(v))", scope, "<macro>")), Span());
    reg.define("inner", Macro_ParseDefinition(Span(), lex_tokens("($i:ident) => ($i w)", scope, "<macro>")), Span());
    MacroExpander   ex(reg);

    auto args = lex_tokens("");
    auto out = expand_ok(ex, "outer", args);
    ASSERT_EQ(out.size(), 2u);
    const auto& v = out[0].tok().ident().hygiene;
    const auto& w = out[1].tok().ident().hygiene;
    // `v` came from `outer`'s template, `w` from `inner`'s
    EXPECT_EQ(v.contexts().size(), 2u);
    EXPECT_EQ(w.contexts().size(), 2u);
    EXPECT_NE(v.contexts().back(), w.contexts().back());
}

TEST(HygieneTest, ExpandersShareRegistryAcrossThreads)
{
    auto scope = Ident::Hygiene::new_scope();
    MacroRegistry   reg;
    reg.define("bind", Macro_ParseDefinition(Span(), lex_tokens("($e:expr) => (let x = $e; x)", scope, "<macro>")), Span());
    reg.define("list", Macro_ParseDefinition(Span(), lex_tokens(
        "($($x:expr),*) => (LIST[$($x),*]);"
        "($($x:expr,)*) => (list!($($x),*))", scope, "<macro>")), Span());
    const auto list_args = lex_tokens("1, 2 + 3, f(4),", scope, "<test>");
    const auto bind_args = lex_tokens("y", scope, "<test>");

    struct Worker {
        unsigned    failures = 0;
        ::std::vector<Ident>    template_idents;

        void run(const MacroRegistry& reg, const TokenTree& list_args, const TokenTree& bind_args)
        {
            MacroExpander   ex(reg);
            for(int i = 0; i < 300; i ++)
            {
                auto l = ex.expand_invocation("list", Span(), list_args);
                if( !l.is_Ok() || l.as_Ok().to_str() != "LIST[1,2+3,f(4)]" )
                    failures += 1;
                auto b = ex.expand_invocation("bind", Span(), bind_args);
                if( !b.is_Ok() || b.as_Ok().size() != 6 ) {
                    failures += 1;
                    continue ;
                }
                template_idents.push_back( b.as_Ok()[1].tok().ident() );
            }
        }
    };
    Worker  w1, w2;
    ::std::thread   t1([&]{ w1.run(reg, list_args, bind_args); });
    ::std::thread   t2([&]{ w2.run(reg, list_args, bind_args); });
    t1.join();
    t2.join();

    EXPECT_EQ(w1.failures, 0u);
    EXPECT_EQ(w2.failures, 0u);
    ASSERT_EQ(w1.template_idents.size(), 300u);
    ASSERT_EQ(w2.template_idents.size(), 300u);
    // Every expansion got its own context, whichever thread ran it
    EXPECT_FALSE(w1.template_idents[0].same_binding(w2.template_idents[0]));
    EXPECT_FALSE(w1.template_idents[0].same_binding(w1.template_idents[1]));
    EXPECT_FALSE(w2.template_idents[299].same_binding(w1.template_idents[299]));
}
