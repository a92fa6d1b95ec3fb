/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/parseerror.hpp
 * - Exceptions thrown for different types of parsing errors
 */
#ifndef PARSEERROR_HPP_INCLUDED
#define PARSEERROR_HPP_INCLUDED

#include <stdexcept>
#include <vector>
#include <compile_error.hpp>
#include "tokenstream.hpp"

namespace ParseError {

using CompileError::Generic;
using CompileError::BugCheck;

class Unexpected:
    public CompileError::Base
{
    Span    m_span;
    Token   m_tok;
public:
    Unexpected(const TokenStream& lex, const Token& tok);
    Unexpected(const TokenStream& lex, const Token& tok, Token exp);
    Unexpected(const TokenStream& lex, const Token& tok, ::std::vector<eTokenType> exp);
    virtual ~Unexpected() throw ();

    const Span& span() const { return m_span; }
    const Token& token() const { return m_tok; }
};

}

#endif // PARSEERROR_HPP_INCLUDED
