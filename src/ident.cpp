/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * ident.cpp
 * - Identifiers with hygiene
 */
#include <iostream>
#include <ident.hpp>
#include <debug.hpp>
#include <common.hpp>   // vector print

::std::atomic<unsigned> Ident::Hygiene::g_next_scope { 0 };

bool Ident::Hygiene::is_visible(const Hygiene& src) const
{
    if( m_inner->contexts.size() == 0 ) {
        return src->contexts.size() == 0;
    }

    auto des = m_inner->contexts.back();
    for(const auto& c : src->contexts)
        if( des == c )
            return true;
    return false;
}

::std::ostream& operator<<(::std::ostream& os, const Ident& x) {
    os << x.name << x.hygiene;
    return os;
}

::std::ostream& operator<<(::std::ostream& os, const Ident::Hygiene& x) {
    os << "/*" << x->contexts << "*/";
    return os;
}
