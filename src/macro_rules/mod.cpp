/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/mod.cpp
 * - Definition types: owning pointer, specifier names and printers
 */
#include <common.hpp>
#include "macro_rules.hpp"
#include <parse/tokentree.hpp>

MacroRulesPtr::MacroRulesPtr(MacroRules* p):
    m_ptr(p)
{
}
MacroRulesPtr& MacroRulesPtr::operator=(MacroRulesPtr&& x)
{
    ::std::swap(m_ptr, x.m_ptr);
    return *this;
}
MacroRulesPtr::~MacroRulesPtr()
{
    delete m_ptr;
}

namespace {
    struct SpecifierName {
        MacroPatEnt::Type   ty;
        const char* name;
    };
    const SpecifierName SPECIFIER_NAMES[] = {
        { MacroPatEnt::PAT_TT,      "tt" },
        { MacroPatEnt::PAT_PAT,     "pat" },
        { MacroPatEnt::PAT_IDENT,   "ident" },
        { MacroPatEnt::PAT_PATH,    "path" },
        { MacroPatEnt::PAT_TYPE,    "ty" },
        { MacroPatEnt::PAT_EXPR,    "expr" },
        { MacroPatEnt::PAT_STMT,    "stmt" },
        { MacroPatEnt::PAT_BLOCK,   "block" },
        { MacroPatEnt::PAT_META,    "meta" },
        { MacroPatEnt::PAT_ITEM,    "item" },
        { MacroPatEnt::PAT_VIS,     "vis" },
        { MacroPatEnt::PAT_LIFETIME,    "lifetime" },
        { MacroPatEnt::PAT_LITERAL, "literal" },
        { MacroPatEnt::PAT_TOKEN,   "token" },
        { MacroPatEnt::PAT_LOOP,    "repetition" },
    };
}

const char* MacroPatEnt::type_name(Type ty)
{
    for(const auto& e : SPECIFIER_NAMES)
        if( e.ty == ty )
            return e.name;
    return "?";
}

::std::ostream& operator<<(::std::ostream& os, const MacroPatEnt::Type& x)
{
    return os << "PAT_" << MacroPatEnt::type_name(x);
}
::std::ostream& operator<<(::std::ostream& os, const MacroPatEnt& x)
{
    if( x.type == MacroPatEnt::PAT_TOKEN )
        os << "=" << x.tok;
    else if( x.type == MacroPatEnt::PAT_LOOP )
        os << "$#" << x.name_index << "(" << x.subpats << ")" << x.tok << x.name;
    else
        os << "$" << x.name << ":" << MacroPatEnt::type_name(x.type);
    return os;
}

::std::ostream& operator<<(::std::ostream& os, const MacroExpansionEnt& x)
{
    TU_MATCH_HDRA( (x), {)
    TU_ARMA(Token, e) {
        os << "=" << e;
        }
    TU_ARMA(NamedValue, e) {
        os << "$" << e;
        }
    TU_ARMA(Loop, e) {
        os << "$[" << e.controlling_vars << "](" << e.entries << ")" << e.joiner;
        }
    }
    return os;
}

MacroRules::~MacroRules()
{
}
MacroRulesArm::~MacroRulesArm()
{
}
