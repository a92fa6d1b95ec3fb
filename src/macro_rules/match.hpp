/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/match.hpp
 * - Rule selection and pattern matching
 */
#pragma once
#include "macro_rules.hpp"
#include "bindings.hpp"
#include "fragment.hpp"

/// Result of a successful match
struct MacroMatch
{
    /// Index of the arm that matched
    unsigned int    arm_index;
    ParameterMappings   bindings;
};

/// Selects the first arm of `rules` that matches `input` and captures its metavariables
///
/// Throws `MacroError` (NoMatchingRule, MalformedFragment or DuplicateMetavariableBinding) on failure.
extern MacroMatch Macro_MatchRules(const MacroRules& rules, TokenTreeSlice input, const FragmentGrammar& grammar, const Span& sp);
