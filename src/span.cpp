/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * span.cpp
 * - Spans and error handling
 */
#include <functional>
#include <iostream>
#include <span.hpp>
#include <parse/token.hpp>
#include <common.hpp>

/// Either a source range or a macro expansion (`macro` set)
struct Span::Node
{
    Span    parent;
    RcString    filename;
    unsigned int start_line = 0;
    unsigned int start_ofs = 0;
    unsigned int end_line = 0;
    unsigned int end_ofs = 0;
    RcString    macro;
};

Span::Span(Span parent, RcString filename, unsigned int start_line, unsigned int start_ofs,  unsigned int end_line, unsigned int end_ofs)
{
    auto n = ::std::make_shared<Node>();
    n->parent = mv$(parent);
    n->filename = mv$(filename);
    n->start_line = start_line;
    n->start_ofs = start_ofs;
    n->end_line = end_line;
    n->end_ofs = end_ofs;
    m_node = mv$(n);
}
Span::Span(Span parent, const Position& pos):
    Span(mv$(parent), pos.filename, pos.line,pos.ofs, pos.line,pos.ofs)
{
}
Span::Span(Span parent, RcString macro_name)
{
    auto n = ::std::make_shared<Node>();
    n->parent = mv$(parent);
    n->macro = mv$(macro_name);
    m_node = mv$(n);
}

Span Span::parent() const
{
    return m_node ? m_node->parent : Span();
}

void Span::bug(::std::function<void(::std::ostream&)> msg) const
{
    auto text = FMT(*this << ": " << FMT_CB(os, msg(os)));
    DEBUG("BUG " << text);
    throw CompileError::BugCheck( mv$(text) );
}
void Span::error(ErrorType tag, ::std::function<void(::std::ostream&)> msg) const
{
    auto text = FMT(*this << ": " << FMT_CB(os, msg(os)));
    DEBUG("error:" << tag << " " << text);
    throw CompileError::Generic( mv$(text) );
}
void Span::warning(WarningType tag, ::std::function<void(::std::ostream&)> msg) const
{
    auto& sink = ::std::cerr;
    sink << *this << " warn:" << tag << ":";
    msg(sink);
    sink << ::std::endl;
    for(auto p = this->parent(); p; p = p.parent())
        sink << p << ": note: From here" << ::std::endl;
}

::std::ostream& operator<<(::std::ostream& os, const Span& sp)
{
    const auto* n = sp.m_node.get();
    if( !n ) {
        os << "<null>";
    }
    else if( n->macro.size() > 0 ) {
        os << "MACRO<" << n->macro << "!>";
    }
    else if( n->start_line != n->end_line ) {
        os << n->filename << ":" << n->start_line << "-" << n->end_line;
    }
    else if( n->start_ofs != n->end_ofs ) {
        os << n->filename << ":" << n->start_line << ":" << n->start_ofs << "-" << n->end_ofs;
    }
    else {
        os << n->filename << ":" << n->start_line << ":" << n->start_ofs;
    }
    return os;
}
