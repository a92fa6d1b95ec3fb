/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/ttstream.hpp
 * - Token tree streams (for post-lex parsing)
 */
#pragma once

#include "tokentree.hpp"
#include "tokenstream.hpp"

/// Borrowed TTStream
class TTStream:
    public TokenStream
{
    ::std::vector< ::std::pair<unsigned int, const TokenTree*> > m_stack;
    Span m_parent_span;
    Position    m_last_pos;
public:
    TTStream(Span parent, const TokenTree& input_tt);
    ~TTStream();

    Position getPosition() const override;
    Span outerSpan() const override { return m_parent_span; }

protected:
    Token realGetToken() override;
};
