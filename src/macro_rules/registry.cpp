/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/registry.cpp
 * - Macro name to definition mapping
 */
#include <common.hpp>
#include "registry.hpp"
#include "macro_error.hpp"

void MacroRegistry::define(RcString name, MacroRulesPtr rules, Span sp)
{
    TRACE_FUNCTION_F(name);
    ASSERT_BUG(sp, rules, "Defining macro " << name << "! with no definition");
    ASSERT_BUG(sp, rules->m_rules.size() > 0, "Defining macro " << name << "! with no rules");

    auto it = m_macros.find(name);
    if( it != m_macros.end() )
    {
        throw MacroError(MacroErrorKind::DuplicateDefinition, sp,
            FMT("macro `" << name << "` is already defined (at " << it->second.sp << ")"));
    }
    DEBUG(name << "! = " << rules->m_rules.size() << " rules");
    m_macros.insert( ::std::make_pair(mv$(name), Entry { mv$(sp), mv$(rules) }) );
}

const MacroRules* MacroRegistry::find(const RcString& name) const
{
    for(const auto* reg = this; reg; reg = reg->m_parent)
    {
        auto it = reg->m_macros.find(name);
        if( it != reg->m_macros.end() )
            return it->second.rules.get();
    }
    return nullptr;
}

const MacroRules& MacroRegistry::lookup(const RcString& name, const Span& sp) const
{
    const auto* rv = this->find(name);
    if( !rv )
        throw MacroError(MacroErrorKind::NotFound, sp, FMT("cannot find macro `" << name << "` in this scope"));
    return *rv;
}
