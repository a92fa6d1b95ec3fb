/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/tokentree.hpp
 * - Token Trees (groups of tokens)
 */
#ifndef TOKENTREE_HPP_INCLUDED
#define TOKENTREE_HPP_INCLUDED

#include "token.hpp"
#include <vector>

/// A single token, a delimited group, or a plain sequence
///
/// A group's children start with the open delimiter leaf and end with the matching close leaf.
/// A sequence (e.g. the root of a lexed string, or an expansion result) has no delimiters.
class TokenTree
{
    Token   m_tok;
    ::std::vector<TokenTree>    m_subtrees;
public:
    TokenTree() {}
    TokenTree(TokenTree&&) = default;
    TokenTree& operator=(TokenTree&&) = default;
    TokenTree(enum eTokenType ty):
        m_tok( Token(ty) )
    {
    }
    TokenTree(Token tok):
        m_tok( ::std::move(tok) )
    {
    }
    TokenTree(::std::vector<TokenTree> subtrees):
        m_subtrees( ::std::move(subtrees) )
    {
    }

    TokenTree clone() const;

    bool is_token() const {
        return m_tok.type() != TOK_NULL;
    }
    /// True if this is a delimited group (as opposed to a token or plain sequence)
    bool is_group() const;
    size_t size() const {
        return m_subtrees.size();
    }
    const TokenTree& operator[](size_t idx) const { assert(idx < m_subtrees.size()); return m_subtrees[idx]; }
          TokenTree& operator[](size_t idx)       { assert(idx < m_subtrees.size()); return m_subtrees[idx]; }
    const Token& tok() const { return m_tok; }
          Token& tok()       { return m_tok; }
    const ::std::vector<TokenTree>& subtrees() const { return m_subtrees; }
          ::std::vector<TokenTree>& subtrees()       { return m_subtrees; }

    /// First token of this tree (the open delimiter for groups), TOK_NULL for an empty sequence
    const Token& first_token() const;

    // NOTE: Structural equality on token spelling
    bool operator==(const TokenTree& x) const;
    bool operator!=(const TokenTree& x) const { return !(*this == x); }

    /// Source-like rendering (spaces only where tokens would otherwise merge)
    ::std::string to_str() const;

    friend ::std::ostream& operator<<(::std::ostream& os, const TokenTree& tt);
};

/// Zero-copy view of contiguous children of a tree
struct TokenTreeSlice
{
    const TokenTree*  tree;
    size_t  begin;
    size_t  end;

    TokenTreeSlice():
        tree(nullptr), begin(0), end(0)
    {}
    TokenTreeSlice(const TokenTree& tree, size_t begin, size_t end):
        tree(&tree), begin(begin), end(end)
    {
        assert(begin <= end);
        assert(end <= tree.size());
    }

    /// Children of a group excluding the delimiters (or all children of a sequence)
    static TokenTreeSlice group_inner(const TokenTree& tt);

    size_t size() const { return end - begin; }
    bool empty() const { return begin == end; }
    const TokenTree& operator[](size_t idx) const { assert(idx < size()); return (*tree)[begin + idx]; }

    /// Appends clones of the viewed trees to `out`
    void clone_into(::std::vector<TokenTree>& out) const;
    /// Clone as a plain sequence
    TokenTree to_tree() const;

    friend ::std::ostream& operator<<(::std::ostream& os, const TokenTreeSlice& x);
};

#endif // TOKENTREE_HPP_INCLUDED
