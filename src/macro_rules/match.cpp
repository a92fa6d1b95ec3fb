/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/match.cpp
 * - Rule selection and pattern matching
 */
#include <common.hpp>
#include <debug_inner.hpp>
#include "match.hpp"
#include "macro_error.hpp"
#include <parse/ttcursor.hpp>

namespace {

    /// Furthest point reached by a failed match attempt
    struct MatchFailure
    {
        size_t  position;
        Token   token;
        ::std::string   expected;
        /// Failure was the fragment grammar rejecting the input
        bool    is_fragment;
    };

    class PatternMatcher
    {
        const FragmentGrammar&  m_grammar;
        size_t  m_name_count;

        bool    m_has_failure;
        MatchFailure    m_failure;
    public:
        PatternMatcher(const FragmentGrammar& grammar):
            m_grammar(grammar),
            m_name_count(0),
            m_has_failure(false)
        {
        }

        void set_name_count(size_t n) { m_name_count = n; }

        bool match_seq(const ::std::vector<MacroPatEnt>& pats, TokenTreeCursor& lex, ParameterMappings& out);

        bool has_failure() const { return m_has_failure; }
        const MatchFailure& failure() const { return m_failure; }

        void record_failure(size_t position, const Token& tok, ::std::string expected, bool is_fragment)
        {
            DEBUG("@" << position << " " << tok << " != " << expected << (is_fragment ? " (fragment)" : ""));
            // Ties keep the first recorded failure
            if( m_has_failure && position <= m_failure.position )
                return ;
            m_has_failure = true;
            m_failure.position = position;
            m_failure.token = tok;
            m_failure.expected = mv$(expected);
            m_failure.is_fragment = is_fragment;
        }
    private:
        bool match_loop(const MacroPatEnt& ent, TokenTreeCursor& lex, ParameterMappings& out);
    };

    bool PatternMatcher::match_seq(const ::std::vector<MacroPatEnt>& pats, TokenTreeCursor& lex, ParameterMappings& out)
    {
        for(const auto& ent : pats)
        {
            switch(ent.type)
            {
            case MacroPatEnt::PAT_TOKEN:
                if( lex.next_tok() != ent.tok )
                {
                    record_failure(lex.position(), lex.next_tok(), FMT("`" << ent.tok.to_str() << "`"), false);
                    return false;
                }
                lex.consume();
                break;
            case MacroPatEnt::PAT_LOOP:
                if( !match_loop(ent, lex, out) )
                    return false;
                break;
            default: {
                assert(ent.is_fragment());
                auto start = lex;
                if( !m_grammar.consume(lex, ent.type) )
                {
                    // Only a malformed fragment if the grammar got past the first token
                    bool progressed = lex.position() > start.position();
                    record_failure(::std::max(lex.position(), start.position()), start.next_tok(), FMT("`" << MacroPatEnt::type_name(ent.type) << "` fragment"), progressed);
                    return false;
                }
                TokenTreeSlice  slice;
                if( !lex.slice_since(start, slice) )
                {
                    // Fragment ended within a group or a split token
                    DEBUG("Fragment didn't end on a tree boundary at the starting level");
                    record_failure(lex.position(), start.next_tok(), FMT("`" << MacroPatEnt::type_name(ent.type) << "` fragment"), true);
                    return false;
                }
                out.bind(ent, CapturedFragment(ent.type, slice));
                break; }
            }
        }
        return true;
    }

    bool PatternMatcher::match_loop(const MacroPatEnt& ent, TokenTreeCursor& lex, ParameterMappings& out)
    {
        TRACE_FUNCTION_F("loop #" << ent.name_index << ent.name);
        const bool has_sep = ent.tok.type() != TOK_NULL;
        ::std::vector<ParameterMappings>   iterations;
        for(;;)
        {
            if( ent.name == "?" && iterations.size() == 1 )
                break;
            // Rolled back to here (separator included) if the iteration fails
            auto saved = lex;
            if( has_sep && !iterations.empty() )
            {
                if( lex.next_tok() != ent.tok )
                {
                    record_failure(lex.position(), lex.next_tok(), FMT("`" << ent.tok.to_str() << "`"), false);
                    break;
                }
                lex.consume();
            }
            auto iter_start = lex.position();
            ParameterMappings   child(m_name_count);
            if( !match_seq(ent.subpats, lex, child) )
            {
                lex = saved;
                break;
            }
            if( lex.position() == iter_start )
            {
                // Nothing consumed, stop to avoid looping forever
                DEBUG("Empty iteration");
                lex = saved;
                break;
            }
            iterations.push_back( mv$(child) );
        }
        DEBUG(iterations.size() << " iterations");

        if( ent.name == "+" && iterations.empty() )
        {
            record_failure(lex.position(), lex.next_tok(), "repetition", false);
            return false;
        }
        out.bind_repetition(ent, mv$(iterations));
        return true;
    }

    Span token_span(const Span& sp, const Token& tok)
    {
        if( tok.get_pos().filename != "" )
            return Span(sp, tok.get_pos());
        return sp;
    }
}

MacroMatch Macro_MatchRules(const MacroRules& rules, TokenTreeSlice input, const FragmentGrammar& grammar, const Span& sp)
{
    DebugPhaseGuard dpg("Match");
    TRACE_FUNCTION_F(rules.m_rules.size() << " options, input = " << input);
    ASSERT_BUG(sp, rules.m_rules.size() > 0, "Empty macro_rules set");

    PatternMatcher  matcher(grammar);
    for(unsigned int i = 0; i < rules.m_rules.size(); i ++)
    {
        const auto& arm = rules.m_rules[i];
        DEBUG("Arm " << i << ": " << arm.m_pattern);
        matcher.set_name_count(arm.m_param_names.size());

        TokenTreeCursor lex(input);
        ParameterMappings   bindings(arm.m_param_names.size());
        if( !matcher.match_seq(arm.m_pattern, lex, bindings) )
            continue ;
        if( !lex.at_end() )
        {
            matcher.record_failure(lex.position(), lex.next_tok(), "end of macro input", false);
            continue ;
        }
        DEBUG("Matched arm " << i << " - " << bindings);
        return MacroMatch { i, mv$(bindings) };
    }

    assert(matcher.has_failure());
    const auto& f = matcher.failure();
    if( f.is_fragment )
    {
        throw MacroError(MacroErrorKind::MalformedFragment, token_span(sp, f.token), f.token, f.expected,
            FMT("expected " << f.expected << ", found `" << f.token.to_str() << "`"));
    }
    else
    {
        throw MacroError(MacroErrorKind::NoMatchingRule, token_span(sp, f.token), f.token, f.expected,
            FMT("no rules expected the token `" << f.token.to_str() << "`"));
    }
}
