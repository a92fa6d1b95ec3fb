/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/ttcursor.hpp
 * - Read-only token cursor over a token tree slice
 */
#pragma once
#include "tokentree.hpp"

/// Flattening, read-only cursor over a TokenTreeSlice
///
/// Yields the open delimiter when positioned at a group, then the group contents, then the close
/// delimiter. Copying a cursor gives a save point.
class TokenTreeCursor
{
    struct Frame {
        const TokenTree*    tree;
        size_t  idx;
        size_t  end;
    };
    ::std::vector<Frame>    m_frames;

    // Second half of a split double-character token (e.g. `>` from `>>`)
    Token   m_faked_next;
    size_t  m_consume_count;
public:
    TokenTreeCursor(TokenTreeSlice input);

    enum eTokenType next() const {
        return next_tok().type();
    }
    const Token& next_tok() const;
    /// Token after the next one (does not look into split tokens)
    enum eTokenType lookahead1() const;

    void consume();
    /// Consume the current (double-character) token, leaving `ty` as the next token
    void consume_and_push(eTokenType ty);
    /// Consumes if the current token is `ty`, otherwise doesn't and returns false
    bool consume_if(eTokenType ty);

    /// Returns the position in the stream (number of tokens that have been consumed)
    size_t position() const {
        return m_consume_count;
    }
    /// Group nesting depth relative to the start slice
    size_t depth() const {
        return m_frames.size() - 1;
    }
    bool at_end() const {
        return m_faked_next.type() == TOK_NULL && m_frames.size() == 1 && m_frames.back().idx == m_frames.back().end;
    }
    /// True if the cursor sits between whole trees (not inside a split token)
    bool on_tree_boundary() const {
        return m_faked_next.type() == TOK_NULL;
    }

    /// Returns the trees consumed since `start`, which must be at the same nesting level
    ///
    /// Returns false if the range is not expressible as a slice (crosses a group boundary or ends
    /// within a split token).
    bool slice_since(const TokenTreeCursor& start, TokenTreeSlice& out) const;
};
