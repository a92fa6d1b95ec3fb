/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/tokenstream.cpp
 * - TokenStream - Parser token source interface
 */
#include "tokenstream.hpp"
#include <common.hpp>
#include "parseerror.hpp"

TokenStream::TokenStream():
    m_cache_valid(false),
    m_peek_valid(false)
{
}
TokenStream::~TokenStream()
{
}

Token TokenStream::innerGetToken()
{
    Token ret = this->realGetToken();
    if( ret != TOK_EOF && ret.get_pos().filename == "" )
        ret.set_pos( this->getPosition() );
    return ret;
}
Token TokenStream::getToken()
{
    if( m_cache_valid )
    {
        DEBUG("<= " << m_cache << " (cache)");
        m_cache_valid = false;
        return mv$(m_cache);
    }
    else if( m_peek_valid )
    {
        DEBUG("<= " << m_peek << " (lookahead)");
        m_peek_valid = false;
        return mv$(m_peek);
    }
    else
    {
        Token ret = this->innerGetToken();
        DEBUG("<= " << ret << " (new)");
        return ret;
    }
}
void TokenStream::putback(Token tok)
{
    if( m_cache_valid )
    {
        DEBUG("" << getPosition() << " - Double putback: " << tok << " but " << m_cache);
        throw ParseError::BugCheck("Double putback");
    }
    DEBUG(">>> " << tok);
    m_cache_valid = true;
    m_cache = mv$(tok);
}

eTokenType TokenStream::lookahead(unsigned int i)
{
    if( m_cache_valid )
    {
        if( i == 0 )
            return m_cache.type();
        i --;
    }
    if( i > 0 )
        throw ParseError::BugCheck(FMT("Excessive lookahead (" << i << ")"));

    if( !m_peek_valid )
    {
        m_peek = this->innerGetToken();
        m_peek_valid = true;
    }
    DEBUG("lookahead = " << m_peek);
    return m_peek.type();
}

Span TokenStream::point_span() const
{
    return Span( this->outerSpan(), this->getPosition() );
}
