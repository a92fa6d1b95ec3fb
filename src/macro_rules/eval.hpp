/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/eval.hpp
 * - Template substitution
 */
#pragma once
#include "macro_rules.hpp"
#include "bindings.hpp"

/// Expansion identity applied to identifiers that come from a macro template
struct HygieneContext
{
    unsigned int    context;

    /// Allocates a fresh context
    HygieneContext():
        context(::Ident::Hygiene::new_context())
    {
    }
    explicit HygieneContext(unsigned int context):
        context(context)
    {
    }

    /// Copy of `tok` with identifier/lifetime hygiene extended with this context
    Token stamp(const Token& tok) const;
};

/// Expand the template of `arm` using the captured `bindings`
///
/// Throws `MacroError` (RepetitionCountMismatch) before producing any output if repetitions disagree.
extern TokenTree Macro_Substitute(const MacroRulesArm& arm, const ParameterMappings& bindings, const HygieneContext& hygiene, const Span& sp);
