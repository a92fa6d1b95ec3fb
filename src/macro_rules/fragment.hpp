/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/fragment.hpp
 * - Fragment grammar (how many tokens a `$name:frag` capture spans)
 */
#pragma once
#include "macro_rules.hpp"
#include <parse/ttcursor.hpp>

/// Oracle used by the matcher to find the extent of a fragment
class FragmentGrammar
{
public:
    virtual ~FragmentGrammar();

    /// Consume the longest valid fragment of type `ty` from `lex`
    ///
    /// Returns false if the upcoming tokens do not form a fragment of that type, the cursor position
    /// is then unspecified (but reports how far the attempt got).
    virtual bool consume(TokenTreeCursor& lex, MacroPatEnt::Type ty) const = 0;
};

/// Rust's fragment rules
class RustFragmentGrammar:
    public FragmentGrammar
{
    bool    m_struct_literals;
public:
    RustFragmentGrammar(bool struct_literals=true):
        m_struct_literals(struct_literals)
    {
    }

    bool struct_literals() const { return m_struct_literals; }

    bool consume(TokenTreeCursor& lex, MacroPatEnt::Type ty) const override;
};
