/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/registry.hpp
 * - Macro name to definition mapping
 */
#pragma once
#include "macro_rules.hpp"
#include <map>

/// Set of known macros, with an optional enclosing scope
///
/// Populated before expansion starts, then only read (may be shared between threads at that point).
class MacroRegistry
{
    struct Entry {
        Span    sp;
        MacroRulesPtr   rules;
    };

    const MacroRegistry*    m_parent;
    ::std::map<RcString, Entry> m_macros;
public:
    MacroRegistry(const MacroRegistry* parent=nullptr):
        m_parent(parent)
    {
    }
    MacroRegistry(const MacroRegistry&) = delete;
    MacroRegistry(MacroRegistry&&) = default;

    const MacroRegistry* parent() const { return m_parent; }
    /// Number of definitions in this scope (not including parents)
    size_t size() const { return m_macros.size(); }

    /// Register `rules` as `name`, errors if `name` is already defined in this scope
    void define(RcString name, MacroRulesPtr rules, Span sp);

    /// Look up a macro by name (searching parent scopes), nullptr if not found
    const MacroRules* find(const RcString& name) const;
    /// Look up a macro by name, errors if not found
    const MacroRules& lookup(const RcString& name, const Span& sp) const;
};
