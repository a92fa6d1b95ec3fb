/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/eval.cpp
 * - Template substitution
 */
#include <common.hpp>
#include <debug_inner.hpp>
#include "eval.hpp"
#include "macro_error.hpp"

Token HygieneContext::stamp(const Token& tok) const
{
    switch(tok.type())
    {
    case TOK_IDENT:
    case TOK_LIFETIME:
        return tok.with_hygiene( tok.ident().hygiene.stamped(this->context) );
    default:
        return tok.clone();
    }
}

namespace {

    /// Walks a template, yielding tokens and metavariable references with loops unrolled
    class MacroExpandState
    {
        const ParameterMappings&    m_mappings;

        struct t_offset {
            const ::std::vector<MacroExpansionEnt>* ents;
            /// Loop entry that owns `ents` (nullptr for the root)
            const MacroExpansionEnt*    loop_ent;
            unsigned read_pos;
            unsigned loop_index;
            unsigned max_index;
        };
        /// Layer stack
        ::std::vector<t_offset> m_offsets;
        /// Iteration index of each active loop level
        ::std::vector<unsigned int> m_iterations;

    public:
        MacroExpandState(const ::std::vector<MacroExpansionEnt>& contents, const ParameterMappings& mappings):
            m_mappings(mappings)
        {
            m_offsets.push_back({ &contents, nullptr, 0, 0, 1 });
        }

        /// Returns the next token/metavariable (or a loop, to emit its separator)
        const MacroExpansionEnt* next_ent();

        const ::std::vector<unsigned int>& iterations() const { return m_iterations; }
    };

    const MacroExpansionEnt* MacroExpandState::next_ent()
    {
        while( m_offsets.size() > 0 )
        {
            auto& cur_ofs = m_offsets.back();
            const auto& ents = *cur_ofs.ents;

            if( cur_ofs.read_pos < ents.size() )
            {
                const auto& ent = ents[cur_ofs.read_pos++];
                TU_MATCH_HDRA( (ent), {)
                TU_ARMA(Token, e) {
                    return &ent;
                    }
                TU_ARMA(NamedValue, e) {
                    return &ent;
                    }
                TU_ARMA(Loop, e) {
                    // Counts were checked to agree before expansion started
                    size_t  num_repeats = 0;
                    bool found = m_mappings.repeat_count(*e.controlling_vars.begin(), m_iterations, num_repeats);
                    ASSERT_BUG(Span(), found, "Controlling variable #" << *e.controlling_vars.begin() << " isn't repeating at " << m_iterations);
                    DEBUG("Looping " << num_repeats << " times based on {" << e.controlling_vars << "}");
                    if( num_repeats > 0 )
                    {
                        m_offsets.push_back({ &e.entries, &ent, 0, 0, static_cast<unsigned>(num_repeats) });
                        m_iterations.push_back( 0 );
                    }
                    }
                }
            }
            else if( m_offsets.size() > 1 )
            {
                DEBUG("Layer #" << m_offsets.size()-1 << " Cur: " << cur_ofs.loop_index << ", Max: " << cur_ofs.max_index);
                if( cur_ofs.loop_index + 1 < cur_ofs.max_index )
                {
                    m_iterations.back() ++;
                    cur_ofs.read_pos = 0;
                    cur_ofs.loop_index ++;

                    const auto& loop_layer = *cur_ofs.loop_ent;
                    if( loop_layer.as_Loop().joiner.type() != TOK_NULL ) {
                        DEBUG("- Separator token = " << loop_layer.as_Loop().joiner);
                        return &loop_layer;
                    }
                }
                else
                {
                    DEBUG("Terminate layer");
                    m_offsets.pop_back();
                    m_iterations.pop_back();
                }
            }
            else
            {
                DEBUG("Terminate evaluation");
                m_offsets.pop_back();
            }
        }
        return nullptr;
    }

    /// Check that every repetition echo has agreeing counts, over all iterations
    void check_repetitions(const MacroRulesArm& arm, const ParameterMappings& mappings, const ::std::vector<MacroExpansionEnt>& ents, ::std::vector<unsigned int>& iterations, const Span& sp)
    {
        for(const auto& ent : ents)
        {
            TU_IFLET(MacroExpansionEnt, ent, Loop, e,
                assert( !e.controlling_vars.empty() );
                unsigned int first_var = *e.controlling_vars.begin();
                size_t  num_repeats = 0;
                if( !mappings.repeat_count(first_var, iterations, num_repeats) )
                    BUG(sp, "Controlling variable $" << arm.m_param_names.at(first_var) << " isn't repeating at " << iterations);
                for(auto var : e.controlling_vars)
                {
                    size_t  this_repeats = 0;
                    if( !mappings.repeat_count(var, iterations, this_repeats) )
                        BUG(sp, "Controlling variable $" << arm.m_param_names.at(var) << " isn't repeating at " << iterations);
                    if( this_repeats != num_repeats )
                    {
                        throw MacroError(MacroErrorKind::RepetitionCountMismatch, sp,
                            FMT("meta-variable `" << arm.m_param_names.at(first_var) << "` repeats " << num_repeats << " times, but `"
                                << arm.m_param_names.at(var) << "` repeats " << this_repeats << " times"));
                    }
                }
                for(unsigned int i = 0; i < num_repeats; i ++)
                {
                    iterations.push_back(i);
                    check_repetitions(arm, mappings, e.entries, iterations, sp);
                    iterations.pop_back();
                }
            )
        }
    }

    bool is_open_delim(eTokenType ty) {
        return ty == TOK_PAREN_OPEN || ty == TOK_SQUARE_OPEN || ty == TOK_BRACE_OPEN;
    }
    bool is_close_delim(eTokenType ty) {
        return ty == TOK_PAREN_CLOSE || ty == TOK_SQUARE_CLOSE || ty == TOK_BRACE_CLOSE;
    }

    /// Rebuilds groups from a flat stream of tokens
    class TreeBuilder
    {
        ::std::vector< ::std::vector<TokenTree> >  m_stack;
    public:
        TreeBuilder()
        {
            m_stack.push_back({});
        }

        void push_token(Token tok)
        {
            if( is_open_delim(tok.type()) )
            {
                m_stack.push_back({});
                m_stack.back().push_back( TokenTree(mv$(tok)) );
            }
            else if( is_close_delim(tok.type()) )
            {
                ASSERT_BUG(Span(), m_stack.size() > 1, "Unbalanced " << tok << " in macro output");
                m_stack.back().push_back( TokenTree(mv$(tok)) );
                auto group = TokenTree( mv$(m_stack.back()) );
                m_stack.pop_back();
                m_stack.back().push_back( mv$(group) );
            }
            else
            {
                m_stack.back().push_back( TokenTree(mv$(tok)) );
            }
        }
        void push_fragment(const TokenTreeSlice& slice)
        {
            slice.clone_into(m_stack.back());
        }

        TokenTree finish()
        {
            ASSERT_BUG(Span(), m_stack.size() == 1, "Unclosed group in macro output");
            return TokenTree( mv$(m_stack.back()) );
        }
    };
}

TokenTree Macro_Substitute(const MacroRulesArm& arm, const ParameterMappings& bindings, const HygieneContext& hygiene, const Span& sp)
{
    DebugPhaseGuard dpg("Substitute");
    TRACE_FUNCTION_F("ctx=" << hygiene.context);

    {
        ::std::vector<unsigned int> iterations;
        check_repetitions(arm, bindings, arm.m_contents, iterations, sp);
    }

    MacroExpandState    state(arm.m_contents, bindings);
    TreeBuilder out;
    while( const auto* ent_ptr = state.next_ent() )
    {
        TU_MATCH_HDRA( (*ent_ptr), {)
        TU_ARMA(Token, e) {
            out.push_token( hygiene.stamp(e) );
            }
        TU_ARMA(NamedValue, e) {
            const auto& frag = bindings.get(e, state.iterations());
            DEBUG("Insert replacement #" << e << " = " << frag);
            out.push_fragment(frag.slice);
            }
        TU_ARMA(Loop, e) {
            DEBUG("Loop joiner " << e.joiner);
            out.push_token( hygiene.stamp(e.joiner) );
            }
        }
    }
    auto rv = out.finish();
    DEBUG("=> " << rv);
    return rv;
}
