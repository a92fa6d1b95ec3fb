/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/macro_error.cpp
 * - Expansion failures and diagnostics
 */
#include <common.hpp>
#include "macro_error.hpp"

const char* MacroErrorKind_name(MacroErrorKind k)
{
    switch(k)
    {
    case MacroErrorKind::NotFound:  return "NotFound";
    case MacroErrorKind::DuplicateDefinition:   return "DuplicateDefinition";
    case MacroErrorKind::NoMatchingRule:    return "NoMatchingRule";
    case MacroErrorKind::DuplicateMetavariableBinding:  return "DuplicateMetavariableBinding";
    case MacroErrorKind::RepetitionCountMismatch:   return "RepetitionCountMismatch";
    case MacroErrorKind::RecursionLimitExceeded:    return "RecursionLimitExceeded";
    case MacroErrorKind::MalformedFragment: return "MalformedFragment";
    }
    return "?";
}
::std::ostream& operator<<(::std::ostream& os, const MacroErrorKind& k)
{
    return os << MacroErrorKind_name(k);
}

::std::ostream& operator<<(::std::ostream& os, const ExpansionFrame& x)
{
    os << x.macro_name << "! @ " << x.invocation_span;
    if( x.arm_index != ~0u )
        os << " #" << x.arm_index;
    return os;
}

MacroError::MacroError(MacroErrorKind kind, Span sp, ::std::string detail):
    m_kind(kind),
    m_span(mv$(sp)),
    m_detail(mv$(detail))
{
    format_message();
}
MacroError::MacroError(MacroErrorKind kind, Span sp, Token tok, ::std::string expected, ::std::string detail):
    m_kind(kind),
    m_span(mv$(sp)),
    m_token(mv$(tok)),
    m_expected(mv$(expected)),
    m_detail(mv$(detail))
{
    format_message();
}
void MacroError::format_message()
{
    m_message = m_span ? FMT(m_span << ": " << m_kind << ": " << m_detail) : FMT(m_kind << ": " << m_detail);
    DEBUG(m_message);
}
MacroError::~MacroError() throw()
{
}

MacroDiagnostic::MacroDiagnostic(MacroError e):
    kind(e.m_kind),
    span(mv$(e.m_span)),
    message(mv$(e.m_detail)),
    token(mv$(e.m_token)),
    expected(mv$(e.m_expected)),
    frames(mv$(e.m_frames))
{
}

void MacroDiagnostic::render(::std::ostream& os) const
{
    if( span )
        os << span << ": ";
    os << "error: " << kind << ": " << message;
    if( token.type() != TOK_NULL && message.find(FMT("`" << token.to_str() << "`")) == ::std::string::npos )
    {
        os << " (found `" << token.to_str() << "`";
        if( expected != "" )
            os << ", expected " << expected;
        os << ")";
    }
    os << ::std::endl;
    for(const auto& f : frames)
    {
        if( f.invocation_span )
            os << f.invocation_span << ": ";
        os << "note: in this expansion of `" << f.macro_name << "!`" << ::std::endl;
    }
}
