/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/expand.cpp
 * - Expansion driver (nested invocations, recursion limit)
 */
#include <common.hpp>
#include <debug_inner.hpp>
#include "expand.hpp"
#include "match.hpp"
#include "eval.hpp"
#include <memory>

namespace {
    void init_debug_phases()
    {
        static bool s_done = (debug_init_phases("DECLMACRO_DEBUG", { "Parse", "Match", "Substitute", "Expand" }), true);
        (void)s_done;
    }

    Span token_span(const Span& base, const Token& tok)
    {
        if( tok.get_pos().filename != "" )
            return Span(base, tok.get_pos());
        return base;
    }
}

/// Scan of one token sequence (the caller's input, or the output of one expansion)
struct MacroExpander::Job
{
    struct Level {
        const TokenTree*    node;
        size_t  idx;
        ::std::vector<TokenTree>    out;
    };

    /// Expansion output being scanned (nullptr for borrowed input)
    ::std::unique_ptr<TokenTree>    owned;
    /// Parent span for invocations found in this sequence
    Span    base_span;
    /// Job was created by an expansion (pops a frame when done)
    bool    has_frame;
    ::std::vector<Level>    levels;

    Job(::std::unique_ptr<TokenTree> tree, Span base_span, bool has_frame):
        owned(mv$(tree)),
        base_span(mv$(base_span)),
        has_frame(has_frame)
    {
        levels.push_back(Level { owned.get(), 0, {} });
    }
    Job(const TokenTree& tree, Span base_span):
        base_span(mv$(base_span)),
        has_frame(false)
    {
        levels.push_back(Level { &tree, 0, {} });
    }
};

/// Explicit expansion stack (jobs, and the active frames)
class MacroExpander::State
{
    const MacroExpander&    m_parent;
public:
    ::std::vector<ExpansionFrame>   frames;
    ::std::vector<Job>  jobs;

    State(const MacroExpander& parent):
        m_parent(parent)
    {
    }

    /// Match and substitute one invocation, queueing its output to be scanned
    void start_expansion(const RcString& name, const Span& sp, TokenTreeSlice args)
    {
        TRACE_FUNCTION_F(name << "! @ " << sp << " depth=" << frames.size());
        const auto& opts = m_parent.m_options;
        if( frames.size() >= opts.max_depth )
        {
            throw MacroError(MacroErrorKind::RecursionLimitExceeded, sp,
                FMT("recursion limit reached while expanding `" << name << "!` (limit " << opts.max_depth << ")"));
        }
        const auto& rules = m_parent.m_registry.lookup(name, sp);

        frames.push_back( ExpansionFrame(name, sp) );
        auto m = Macro_MatchRules(rules, args, m_parent.m_grammar, sp);
        frames.back().arm_index = m.arm_index;

        HygieneContext  hygiene;
        auto output = Macro_Substitute(rules.m_rules[m.arm_index], m.bindings, hygiene, sp);
        DEBUG(name << "! => " << output.to_str());

        jobs.push_back( Job(::std::unique_ptr<TokenTree>(new TokenTree(mv$(output))), Span(sp, name), true) );
    }

    /// Check for an invocation at `lvl.idx`, returning the number of trees it spans (0 if none)
    size_t check_invocation(const Job::Level& lvl, RcString& out_name) const
    {
        const auto& opts = m_parent.m_options;
        const auto& n = *lvl.node;
        if( lvl.idx + 1 >= n.size() )
            return 0;
        const auto& name_tt = n[lvl.idx];
        if( !name_tt.is_token() || name_tt.tok().type() != TOK_IDENT )
            return 0;
        const auto& name = name_tt.tok().ident().name;

        size_t  len = 1;
        if( n[lvl.idx+1].is_token() && n[lvl.idx+1].tok().type() == TOK_EXCLAM )
            len += 1;
        else if( opts.require_bang )
            return 0;

        if( lvl.idx + len >= n.size() || !n[lvl.idx + len].is_group() )
            return 0;
        len += 1;

        if( !m_parent.m_registry.find(name) )
        {
            // `foo(...)` is a call, only `foo!(...)` is an unknown macro
            if( len == 3 && opts.unknown_macro_is_error )
                throw MacroError(MacroErrorKind::NotFound, Span(), name_tt.tok(), "", FMT("cannot find macro `" << name << "` in this scope"));
            return 0;
        }
        out_name = name;
        return len;
    }

    /// Advance the top job by one step
    void step()
    {
        auto& job = jobs.back();
        auto& lvl = job.levels.back();
        const auto& n = *lvl.node;
        if( lvl.idx < n.size() )
        {
            const auto& tt = n[lvl.idx];
            RcString    name;
            size_t  len;
            try
            {
                len = check_invocation(lvl, name);
            }
            catch(MacroError& e)
            {
                if( !e.m_span )
                    e.m_span = token_span(job.base_span, tt.tok());
                throw;
            }
            if( len > 0 )
            {
                auto sp = token_span(job.base_span, tt.tok());
                const auto& args = n[lvl.idx + len - 1];
                lvl.idx += len;
                // NOTE: `job` and `lvl` are invalidated by this call
                start_expansion(name, sp, TokenTreeSlice::group_inner(args));
            }
            else if( tt.is_group() )
            {
                lvl.idx += 1;
                job.levels.push_back(Job::Level { &tt, 0, {} });
            }
            else
            {
                lvl.out.push_back( tt.clone() );
                lvl.idx += 1;
            }
        }
        else if( job.levels.size() > 1 )
        {
            // End of a group, hand it to the level above
            auto group = TokenTree( mv$(lvl.out) );
            job.levels.pop_back();
            job.levels.back().out.push_back( mv$(group) );
        }
        else
        {
            // End of a job, splice the output into the parent
            auto out = mv$(lvl.out);
            bool has_frame = job.has_frame;
            jobs.pop_back();
            if( has_frame )
            {
                DEBUG("Done " << frames.back());
                frames.pop_back();
            }
            if( !jobs.empty() )
            {
                auto& dst = jobs.back().levels.back().out;
                for(auto& t : out)
                    dst.push_back( mv$(t) );
            }
            else
            {
                result = mv$(out);
            }
        }
    }

    ::std::vector<TokenTree>    result;
};

MacroExpander::MacroExpander(const MacroRegistry& registry, ExpansionOptions options):
    m_registry(registry),
    m_options(options),
    m_default_grammar(options.struct_literals),
    m_grammar(m_default_grammar)
{
    init_debug_phases();
    ASSERT_BUG(Span(), m_options.max_depth >= 1, "Macro recursion limit must be at least 1");
}
MacroExpander::MacroExpander(const MacroRegistry& registry, const FragmentGrammar& grammar, ExpansionOptions options):
    m_registry(registry),
    m_options(options),
    m_default_grammar(options.struct_literals),
    m_grammar(grammar)
{
    init_debug_phases();
    ASSERT_BUG(Span(), m_options.max_depth >= 1, "Macro recursion limit must be at least 1");
}

MacroExpandResult MacroExpander::expand_invocation(const RcString& name, const Span& sp, const TokenTree& args) const
{
    DebugPhaseGuard dpg("Expand");
    TRACE_FUNCTION_F(name << "! " << args);
    State   state(*this);
    try
    {
        auto args_slice = args.is_group() ? TokenTreeSlice::group_inner(args) : TokenTreeSlice(args, 0, args.size());
        state.start_expansion(name, sp, args_slice);
        while( !state.jobs.empty() )
            state.step();
    }
    catch(MacroError& e)
    {
        if( e.m_frames.empty() )
            e.m_frames = state.frames;
        DEBUG("Failed: " << e.what());
        return MacroExpandResult::make_Err( MacroDiagnostic(mv$(e)) );
    }
    return MacroExpandResult::make_Ok( TokenTree(mv$(state.result)) );
}

MacroExpandResult MacroExpander::expand_stream(const TokenTree& tokens, const Span& sp) const
{
    DebugPhaseGuard dpg("Expand");
    TRACE_FUNCTION_F(tokens);
    State   state(*this);
    try
    {
        if( tokens.is_token() )
        {
            state.result.push_back( tokens.clone() );
        }
        else
        {
            state.jobs.push_back( Job(tokens, sp) );
            while( !state.jobs.empty() )
                state.step();
        }
    }
    catch(MacroError& e)
    {
        if( e.m_frames.empty() )
            e.m_frames = state.frames;
        DEBUG("Failed: " << e.what());
        return MacroExpandResult::make_Err( MacroDiagnostic(mv$(e)) );
    }
    // NOTE: A group input keeps its delimiters (the first child is the open delimiter)
    return MacroExpandResult::make_Ok( TokenTree(mv$(state.result)) );
}
