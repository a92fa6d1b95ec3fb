/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/tokenstream.hpp
 * - Parser stream (TokenStream) header
 */
#pragma once

#include <span.hpp>
#include <debug.hpp>
#include "token.hpp"

class TokenStream
{
    bool    m_cache_valid;
    Token   m_cache;
    bool    m_peek_valid;
    Token   m_peek;
public:
    TokenStream();
    virtual ~TokenStream();
    Token   getToken();
    /// Returns a single token to the stream, only one may be outstanding
    void    putback(Token tok);
    /// Type of the next token (only one token of lookahead is available)
    eTokenType  lookahead(unsigned int count);

    Span    point_span() const;

    Span    sub_span(const Position& p) const {
        return Span(outerSpan(), p);
    }

protected:
    virtual Position getPosition() const = 0;
    virtual Span    outerSpan() const { return Span(); }
    virtual Token   realGetToken() = 0;
private:
    Token innerGetToken();
};
