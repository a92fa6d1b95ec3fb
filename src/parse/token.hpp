/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/token.hpp
 * - Lexical tokens
 */
#pragma once

#include <cstdint>
#include <rc_string.hpp>
#include <tagged_union.hpp>
#include <ident.hpp>

enum eTokenType
{
    #define _(t)    t,
    #include "eTokenType.enum.h"
    #undef _
};

struct Position
{
    RcString    filename;
    unsigned int    line;
    unsigned int    ofs;

    Position():
        filename(""),
        line(0),
        ofs(0)
    {}
    Position(RcString filename, unsigned int line, unsigned int ofs):
        filename(filename),
        line(line),
        ofs(ofs)
    {
    }
};
extern ::std::ostream& operator<<(::std::ostream& os, const Position& p);

class Token
{
    TAGGED_UNION(Data, None,
    (None, struct {}),
    (Ident, ::Ident),
    (String, ::std::string),
    (Integer, uint64_t),
    (Float, double)
    );

    enum eTokenType m_type;
    Data    m_data;
    Position    m_pos;
public:
    Token();
    Token& operator=(Token&& t)
    {
        if( &t != this )
        {
            m_type = t.m_type;  t.m_type = TOK_NULL;
            m_data = ::std::move(t.m_data);
            m_pos = ::std::move(t.m_pos);
        }
        return *this;
    }
    Token(Token&& t):
        m_type(t.m_type),
        m_data( ::std::move(t.m_data) ),
        m_pos( ::std::move(t.m_pos) )
    {
        t.m_type = TOK_NULL;
    }
    Token(const Token& t);
    Token& operator=(const Token& t)
    {
        if( &t != this )
            *this = t.clone();
        return *this;
    }
    Token clone() const;

    Token(enum eTokenType type);
    /// Identifier or lifetime
    Token(enum eTokenType type, ::Ident i);
    /// String or byte string
    Token(enum eTokenType type, ::std::string str);
    /// Integer or character literal
    Token(enum eTokenType type, uint64_t val);
    static Token make_float(double val);

    enum eTokenType type() const { return m_type; }
    const ::Ident& ident() const { return m_data.as_Ident(); }
    const ::std::string& str() const { return m_data.as_String(); }
    uint64_t intval() const { return m_data.as_Integer(); }
    double floatval() const { return m_data.as_Float(); }

    bool has_ident() const { return m_data.is_Ident(); }
    /// Copy of this token with the identifier's hygiene stamped with an expansion context
    Token with_hygiene(::Ident::Hygiene h) const;

    // NOTE: Compares spelling (type and data), identifier hygiene is ignored
    bool operator==(const Token& r) const;
    bool operator!=(const Token& r) const { return !(*this == r); }
    bool operator==(eTokenType t) const { return m_type == t; }
    bool operator!=(eTokenType t) const { return m_type != t; }

    /// Source-like text for this token
    ::std::string to_str() const;

    void set_pos(Position pos) { m_pos = pos; }
    const Position& get_pos() const { return m_pos; }

    static const char* typestr(enum eTokenType type);
    static bool type_is_rword(enum eTokenType type) { return type >= TOK_RWORD_PUB; }
    /// Source text for a fixed token type (symbols and reserved words), nullptr for value tokens
    static const char* fixed_text(enum eTokenType type);

    friend ::std::ostream&  operator<<(::std::ostream& os, const Token& tok);
};
extern ::std::ostream&  operator<<(::std::ostream& os, const Token& tok);
