/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/tokentree.cpp
 * - Token Tree (collection of tokens)
 */
#include "tokentree.hpp"
#include <common.hpp>

namespace {
    bool is_open_delim(eTokenType ty) {
        return ty == TOK_PAREN_OPEN || ty == TOK_SQUARE_OPEN || ty == TOK_BRACE_OPEN;
    }
    // Tokens that would merge with a neighbouring token of the same class if printed without a space
    enum class PrintClass {
        Word,
        Punct,
        Separator,
    };
    PrintClass print_class(const Token& tok) {
        switch(tok.type())
        {
        case TOK_PAREN_OPEN:    case TOK_PAREN_CLOSE:
        case TOK_SQUARE_OPEN:   case TOK_SQUARE_CLOSE:
        case TOK_BRACE_OPEN:    case TOK_BRACE_CLOSE:
        case TOK_COMMA:
        case TOK_SEMICOLON:
        case TOK_STRING:
            return PrintClass::Separator;
        case TOK_HASH: case TOK_COLON: case TOK_DOUBLE_COLON: case TOK_STAR: case TOK_AMP: case TOK_PIPE:
        case TOK_FATARROW: case TOK_THINARROW: case TOK_THINARROW_LEFT:
        case TOK_PLUS: case TOK_DASH: case TOK_EXCLAM: case TOK_PERCENT: case TOK_SLASH:
        case TOK_DOT: case TOK_DOUBLE_DOT: case TOK_DOUBLE_DOT_EQUAL: case TOK_TRIPLE_DOT:
        case TOK_EQUAL: case TOK_PLUS_EQUAL: case TOK_DASH_EQUAL: case TOK_PERCENT_EQUAL:
        case TOK_SLASH_EQUAL: case TOK_STAR_EQUAL: case TOK_AMP_EQUAL: case TOK_PIPE_EQUAL:
        case TOK_DOUBLE_EQUAL: case TOK_EXCLAM_EQUAL: case TOK_GTE: case TOK_LTE: case TOK_LT: case TOK_GT:
        case TOK_DOUBLE_AMP: case TOK_DOUBLE_PIPE: case TOK_DOUBLE_LT: case TOK_DOUBLE_GT:
        case TOK_DOUBLE_LT_EQUAL: case TOK_DOUBLE_GT_EQUAL:
        case TOK_DOLLAR: case TOK_QMARK: case TOK_AT: case TOK_TILDE: case TOK_BACKSLASH:
        case TOK_CARET: case TOK_CARET_EQUAL: case TOK_BACKTICK:
            return PrintClass::Punct;
        default:
            return PrintClass::Word;
        }
    }

    void print_tokens(::std::ostream& os, const TokenTree& tt, const Token*& prev)
    {
        if( tt.is_token() )
        {
            if( prev )
            {
                auto pc = print_class(*prev);
                if( pc != PrintClass::Separator && pc == print_class(tt.tok()) )
                    os << " ";
            }
            os << tt.tok().to_str();
            prev = &tt.tok();
        }
        else
        {
            for(const auto& sub : tt.subtrees())
                print_tokens(os, sub, prev);
        }
    }
}

TokenTree TokenTree::clone() const
{
    if( m_subtrees.size() == 0 ) {
        return TokenTree(m_tok.clone());
    }
    else {
        ::std::vector< TokenTree>   ents;
        ents.reserve( m_subtrees.size() );
        for(const auto& sub : m_subtrees)
            ents.push_back( sub.clone() );
        return TokenTree( mv$(ents) );
    }
}

bool TokenTree::is_group() const
{
    return !is_token() && m_subtrees.size() >= 2
        && m_subtrees.front().is_token() && is_open_delim(m_subtrees.front().tok().type());
}

const Token& TokenTree::first_token() const
{
    if( is_token() || m_subtrees.empty() )
        return m_tok;
    return m_subtrees.front().first_token();
}

bool TokenTree::operator==(const TokenTree& x) const
{
    if( this->is_token() != x.is_token() )
        return false;
    if( this->is_token() )
        return m_tok == x.m_tok;
    if( m_subtrees.size() != x.m_subtrees.size() )
        return false;
    for(size_t i = 0; i < m_subtrees.size(); i ++)
    {
        if( m_subtrees[i] != x.m_subtrees[i] )
            return false;
    }
    return true;
}

::std::string TokenTree::to_str() const
{
    ::std::stringstream ss;
    const Token* prev = nullptr;
    print_tokens(ss, *this, prev);
    return ss.str();
}

::std::ostream& operator<<(::std::ostream& os, const TokenTree& tt)
{
    if( tt.m_subtrees.size() == 0 )
        return os << tt.m_tok;
    else {
        os << "TT([";
        bool first = true;
        for(const auto& i : tt.m_subtrees) {
            if(!first)
                os << ", ";
            os << i;
            first = false;
        }
        os << "])";
        return os;
    }
}

TokenTreeSlice TokenTreeSlice::group_inner(const TokenTree& tt)
{
    if( tt.is_group() )
        return TokenTreeSlice(tt, 1, tt.size() - 1);
    else
        return TokenTreeSlice(tt, 0, tt.size());
}

void TokenTreeSlice::clone_into(::std::vector<TokenTree>& out) const
{
    out.reserve(out.size() + this->size());
    for(size_t i = begin; i < end; i ++)
        out.push_back( (*tree)[i].clone() );
}
TokenTree TokenTreeSlice::to_tree() const
{
    ::std::vector<TokenTree>    ents;
    this->clone_into(ents);
    return TokenTree(mv$(ents));
}

::std::ostream& operator<<(::std::ostream& os, const TokenTreeSlice& x)
{
    if( !x.tree )
        return os << "[]";
    os << "[";
    for(size_t i = x.begin; i < x.end; i ++)
    {
        if( i != x.begin )
            os << " ";
        os << (*x.tree)[i].to_str();
    }
    os << "]";
    return os;
}
