/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/ttcursor.cpp
 * - Read-only token cursor over a token tree slice
 */
#include "ttcursor.hpp"
#include <common.hpp>
#include <span.hpp>

namespace {
    const Token& tree_first_token(const TokenTree& tt)
    {
        const auto& rv = tt.first_token();
        ASSERT_BUG(Span(), rv.type() != TOK_NULL, "Empty sequence nested in a token tree");
        return rv;
    }
}

TokenTreeCursor::TokenTreeCursor(TokenTreeSlice input):
    m_consume_count(0)
{
    assert(input.tree);
    m_frames.push_back(Frame { input.tree, input.begin, input.end });
}

const Token& TokenTreeCursor::next_tok() const
{
    static const Token    eof_token = TOK_EOF;

    if( m_faked_next.type() != TOK_NULL )
    {
        return m_faked_next;
    }

    const auto& f = m_frames.back();
    if( f.idx < f.end )
    {
        return tree_first_token( (*f.tree)[f.idx] );
    }
    else if( m_frames.size() > 1 )
    {
        // End of a group, yield the closing delimiter
        return (*f.tree)[f.tree->size() - 1].tok();
    }
    else
    {
        return eof_token;
    }
}
enum eTokenType TokenTreeCursor::lookahead1() const
{
    auto tmp = *this;
    if( tmp.next() == TOK_EOF )
        return TOK_EOF;
    tmp.consume();
    return tmp.next();
}

void TokenTreeCursor::consume()
{
    if( m_faked_next.type() != TOK_NULL )
    {
        m_faked_next = Token(TOK_NULL);
        return ;
    }

    auto& f = m_frames.back();
    DEBUG(m_consume_count << " " << next_tok());
    if( f.idx < f.end )
    {
        const auto& node = (*f.tree)[f.idx];
        if( node.is_token() )
        {
            f.idx ++;
        }
        else
        {
            ASSERT_BUG(Span(), node.is_group(), "Undelimited sequence nested in a token tree");
            // Enter the group, skipping the open delimiter
            m_frames.push_back(Frame { &node, 1, node.size() - 1 });
        }
    }
    else
    {
        ASSERT_BUG(Span(), m_frames.size() > 1, "Attempting to consume EOF");
        // Leave the group, consuming the close delimiter
        m_frames.pop_back();
        m_frames.back().idx ++;
    }
    m_consume_count ++;
}
void TokenTreeCursor::consume_and_push(eTokenType ty)
{
    consume();
    m_faked_next = Token(ty);
}
bool TokenTreeCursor::consume_if(eTokenType ty)
{
    if(next() == ty) {
        consume();
        return true;
    }
    else {
        return false;
    }
}

bool TokenTreeCursor::slice_since(const TokenTreeCursor& start, TokenTreeSlice& out) const
{
    if( !start.on_tree_boundary() || !this->on_tree_boundary() )
        return false;
    if( start.m_frames.size() != m_frames.size() )
        return false;
    const auto& sf = start.m_frames.back();
    const auto& ef = m_frames.back();
    if( sf.tree != ef.tree || sf.idx > ef.idx )
        return false;
    out = TokenTreeSlice(*ef.tree, sf.idx, ef.idx);
    return true;
}
