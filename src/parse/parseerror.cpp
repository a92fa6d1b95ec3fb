/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/parseerror.cpp
 * - Exceptions thrown for different types of parsing errors
 */
#include "parseerror.hpp"
#include <common.hpp>
#include <iostream>

CompileError::Base::~Base() throw()
{
}

CompileError::Generic::Generic(::std::string message):
    Base(mv$(message))
{
    DEBUG("Generic(" << m_message << ")");
}
CompileError::Generic::Generic(const TokenStream& lex, ::std::string message):
    Base(FMT(lex.point_span() << ": " << message))
{
    DEBUG("Generic(" << m_message << ")");
}

CompileError::BugCheck::BugCheck(::std::string message):
    Base(mv$(message))
{
    DEBUG("BugCheck(" << m_message << ")");
}

namespace {
    Span token_span(const TokenStream& lex, const Token& tok)
    {
        return tok.get_pos().filename != "" ? lex.sub_span(tok.get_pos()) : lex.point_span();
    }
}

ParseError::Unexpected::Unexpected(const TokenStream& lex, const Token& tok):
    m_span( token_span(lex, tok) ),
    m_tok( tok )
{
    m_message = FMT(m_span << ": Unexpected token " << tok);
    DEBUG(m_message);
}
ParseError::Unexpected::Unexpected(const TokenStream& lex, const Token& tok, Token exp):
    m_span( token_span(lex, tok) ),
    m_tok( tok )
{
    m_message = FMT(m_span << ": Unexpected token " << tok << ", expected " << exp);
    DEBUG(m_message);
}
ParseError::Unexpected::Unexpected(const TokenStream& lex, const Token& tok, ::std::vector<eTokenType> exp):
    m_span( token_span(lex, tok) ),
    m_tok( tok )
{
    m_message = FMT(m_span << ": Unexpected token " << tok << ", expected one of " << FMT_CB(os, {
        bool f = true;
        for(auto v: exp) {
            if(!f)
                os << " or ";
            f = false;
            os << Token::typestr(v);
        }
        }));
    DEBUG(m_message);
}
ParseError::Unexpected::~Unexpected() throw()
{
}
