/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/expand.hpp
 * - Expansion driver (nested invocations, recursion limit)
 */
#pragma once
#include "macro_rules.hpp"
#include "macro_error.hpp"
#include "registry.hpp"
#include "fragment.hpp"
#include <tagged_union.hpp>

struct ExpansionOptions
{
    /// Maximum number of nested expansions (at least 1)
    unsigned int    max_depth = 128;
    /// Require `!` between a macro name and its arguments
    bool    require_bang = true;
    /// Report `name!(...)` with an unknown `name` as an error, otherwise it's left as-is
    bool    unknown_macro_is_error = true;
    /// Allow struct literals in `expr` fragments (built-in grammar only)
    bool    struct_literals = true;
};

TAGGED_UNION(MacroExpandResult, Ok,
    (Ok, TokenTree),
    (Err, MacroDiagnostic)
    );

class MacroExpander
{
    const MacroRegistry&    m_registry;
    ExpansionOptions    m_options;
    RustFragmentGrammar m_default_grammar;
    const FragmentGrammar&  m_grammar;
public:
    MacroExpander(const MacroRegistry& registry, ExpansionOptions options=ExpansionOptions());
    /// Use a custom fragment grammar (`options.struct_literals` is then ignored)
    MacroExpander(const MacroRegistry& registry, const FragmentGrammar& grammar, ExpansionOptions options=ExpansionOptions());

    const ExpansionOptions& options() const { return m_options; }

    /// Expand `name!(args)`, including any invocations in its output
    MacroExpandResult expand_invocation(const RcString& name, const Span& sp, const TokenTree& args) const;
    /// Expand all invocations within a token sequence
    MacroExpandResult expand_stream(const TokenTree& tokens, const Span& sp) const;

private:
    struct Job;
    class State;
};
