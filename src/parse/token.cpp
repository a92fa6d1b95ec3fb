/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * parse/token.cpp
 * - Lexical tokens
 */
#include "token.hpp"
#include <common.hpp>
#include <span.hpp>

Token::Token():
    m_type(TOK_NULL)
{
}
Token::Token(enum eTokenType type):
    m_type(type)
{
}
Token::Token(enum eTokenType type, Ident i):
    m_type(type),
    m_data(mv$(i))
{
}
Token::Token(enum eTokenType type, ::std::string str):
    m_type(type),
    m_data(Data::make_String(mv$(str)))
{
}
Token::Token(enum eTokenType type, uint64_t val):
    m_type(type),
    m_data( Data::make_Integer(val) )
{
}
Token Token::make_float(double val)
{
    auto rv = Token(TOK_FLOAT);
    rv.m_data = Data::make_Float(val);
    return rv;
}

Token::Token(const Token& t):
    m_type(t.m_type)
    , m_data( Data::make_None({}) )
    , m_pos( t.m_pos )
{
    assert( t.m_data.tag() != Data::TAGDEAD );
    TU_MATCH_HDRA( (t.m_data), {)
    TU_ARMA(None, e) {}
    TU_ARMA(Ident,   e) { m_data = Data::make_Ident(e); }
    TU_ARMA(String,  e) { m_data = Data::make_String(e);  }
    TU_ARMA(Integer, e) { m_data = Data::make_Integer(e); }
    TU_ARMA(Float,   e) { m_data = Data::make_Float(e);   }
    }
}
Token Token::clone() const
{
    return Token(*this);
}

Token Token::with_hygiene(::Ident::Hygiene h) const
{
    ASSERT_BUG(Span(Span(), m_pos), m_data.is_Ident(), "Setting hygiene on non-identifier token " << *this);
    Token   rv(m_type, ::Ident(mv$(h), m_data.as_Ident().name));
    rv.m_pos = m_pos;
    return rv;
}

bool Token::operator==(const Token& r) const
{
    if(type() != r.type())
        return false;
    if(m_data.tag() != r.m_data.tag())
        return false;
    TU_MATCH_HDRA( (m_data, r.m_data), {)
    TU_ARMA(None, e, re) { return true; }
    TU_ARMA(Ident, e, re) { return e.name == re.name; }
    TU_ARMA(String, e, re) { return e == re; }
    TU_ARMA(Integer, e, re) { return e == re; }
    TU_ARMA(Float, e, re) { return e == re; }
    }
    return false;
}

const char* Token::typestr(enum eTokenType type)
{
    switch(type)
    {
    #define _(t)    case t: return #t;
    #include "eTokenType.enum.h"
    #undef _
    }
    return ">>BUGCHECK: BADTOK<<";
}

namespace {
    struct EscapedString {
        const ::std::string& s;
        EscapedString(const ::std::string& s): s(s) {}

        friend ::std::ostream& operator<<(::std::ostream& os, const EscapedString& x) {
            for(auto b : x.s) {
                switch(b)
                {
                case '"':
                    os << "\\\"";
                    break;
                case '\\':
                    os << "\\\\";
                    break;
                case '\n':
                    os << "\\n";
                    break;
                default:
                    if( ' ' <= b && b < 0x7F )
                        os << b;
                    else
                        os << "\\u{" << ::std::hex << (unsigned int)(uint8_t)b << ::std::dec << "}";
                    break;
                }
            }
            return os;
        }
    };
}

const char* Token::fixed_text(enum eTokenType type)
{
    switch(type)
    {
    case TOK_HASH:  return "#";
    case TOK_UNDERSCORE:return "_";
    // Symbols
    case TOK_PAREN_OPEN:    return "(";
    case TOK_PAREN_CLOSE:   return ")";
    case TOK_BRACE_OPEN:    return "{";
    case TOK_BRACE_CLOSE:   return "}";
    case TOK_LT:    return "<";
    case TOK_GT:    return ">";
    case TOK_SQUARE_OPEN:   return "[";
    case TOK_SQUARE_CLOSE:  return "]";
    case TOK_COMMA:     return ",";
    case TOK_SEMICOLON: return ";";
    case TOK_COLON:     return ":";
    case TOK_DOUBLE_COLON:  return "::";
    case TOK_STAR:  return "*";
    case TOK_AMP:   return "&";
    case TOK_PIPE:  return "|";

    case TOK_FATARROW:  return "=>";
    case TOK_THINARROW: return "->";
    case TOK_THINARROW_LEFT: return "<-";

    case TOK_PLUS:  return "+";
    case TOK_DASH:  return "-";
    case TOK_EXCLAM:    return "!";
    case TOK_PERCENT:   return "%";
    case TOK_SLASH:     return "/";

    case TOK_DOT:   return ".";
    case TOK_DOUBLE_DOT:    return "..";
    case TOK_DOUBLE_DOT_EQUAL:  return "..=";
    case TOK_TRIPLE_DOT:    return "...";

    case TOK_EQUAL: return "=";
    case TOK_PLUS_EQUAL:    return "+=";
    case TOK_DASH_EQUAL:    return "-=";
    case TOK_PERCENT_EQUAL: return "%=";
    case TOK_SLASH_EQUAL:   return "/=";
    case TOK_STAR_EQUAL:    return "*=";
    case TOK_AMP_EQUAL:     return "&=";
    case TOK_PIPE_EQUAL:    return "|=";

    case TOK_DOUBLE_EQUAL:  return "==";
    case TOK_EXCLAM_EQUAL:  return "!=";
    case TOK_GTE:    return ">=";
    case TOK_LTE:    return "<=";

    case TOK_DOUBLE_AMP:    return "&&";
    case TOK_DOUBLE_PIPE:   return "||";
    case TOK_DOUBLE_LT:     return "<<";
    case TOK_DOUBLE_GT:     return ">>";
    case TOK_DOUBLE_LT_EQUAL:   return "<<=";
    case TOK_DOUBLE_GT_EQUAL:   return ">>=";

    case TOK_DOLLAR:    return "$";

    case TOK_QMARK: return "?";
    case TOK_AT:    return "@";
    case TOK_TILDE:     return "~";
    case TOK_BACKSLASH: return "\\";
    case TOK_CARET:     return "^";
    case TOK_CARET_EQUAL:   return "^=";
    case TOK_BACKTICK:  return "`";

    // Reserved Words
    case TOK_RWORD_PUB:     return "pub";
    case TOK_RWORD_PRIV:    return "priv";
    case TOK_RWORD_MUT:     return "mut";
    case TOK_RWORD_CONST:   return "const";
    case TOK_RWORD_STATIC:  return "static";
    case TOK_RWORD_UNSAFE:  return "unsafe";
    case TOK_RWORD_EXTERN:  return "extern";

    case TOK_RWORD_CRATE:   return "crate";
    case TOK_RWORD_MOD:     return "mod";
    case TOK_RWORD_STRUCT:  return "struct";
    case TOK_RWORD_ENUM:    return "enum";
    case TOK_RWORD_TRAIT:   return "trait";
    case TOK_RWORD_FN:      return "fn";
    case TOK_RWORD_USE:     return "use";
    case TOK_RWORD_IMPL:    return "impl";
    case TOK_RWORD_TYPE:    return "type";

    case TOK_RWORD_WHERE:   return "where";
    case TOK_RWORD_AS:      return "as";

    case TOK_RWORD_LET:     return "let";
    case TOK_RWORD_MATCH:   return "match";
    case TOK_RWORD_IF:      return "if";
    case TOK_RWORD_ELSE:    return "else";
    case TOK_RWORD_LOOP:    return "loop";
    case TOK_RWORD_WHILE:   return "while";
    case TOK_RWORD_FOR:     return "for";
    case TOK_RWORD_IN:      return "in";
    case TOK_RWORD_DO:      return "do";

    case TOK_RWORD_CONTINUE:return "continue";
    case TOK_RWORD_BREAK:   return "break";
    case TOK_RWORD_RETURN:  return "return";
    case TOK_RWORD_YIELD:   return "yield";
    case TOK_RWORD_BOX:     return "box";
    case TOK_RWORD_REF:     return "ref";

    case TOK_RWORD_FALSE:   return "false";
    case TOK_RWORD_TRUE:    return "true";
    case TOK_RWORD_SELF:    return "self";
    case TOK_RWORD_SUPER:   return "super";

    case TOK_RWORD_MOVE:    return "move";

    case TOK_RWORD_ABSTRACT:return "abstract";
    case TOK_RWORD_FINAL:   return "final";
    case TOK_RWORD_OVERRIDE:return "override";
    case TOK_RWORD_VIRTUAL: return "virtual";

    case TOK_RWORD_TYPEOF:  return "typeof";

    case TOK_RWORD_BECOME:  return "become";
    case TOK_RWORD_UNSIZED: return "unsized";
    case TOK_RWORD_MACRO:   return "macro";

    case TOK_RWORD_ASYNC:   return "async";
    case TOK_RWORD_AWAIT:   return "await";
    case TOK_RWORD_DYN:     return "dyn";
    case TOK_RWORD_TRY:     return "try";
    default:
        return nullptr;
    }
}

::std::string Token::to_str() const
{
    switch(m_type)
    {
    case TOK_NULL:  return "/*null*/";
    case TOK_EOF:   return "/*eof*/";

    // Value tokens
    case TOK_IDENT:     return m_data.as_Ident().name.c_str();
    case TOK_LIFETIME:  return FMT("'" << m_data.as_Ident().name);
    case TOK_INTEGER:   return FMT(m_data.as_Integer());
    case TOK_CHAR: {
        auto v = m_data.as_Integer();
        switch(v)
        {
        case '\'': return "'\\''";
        case '\\': return "'\\\\'";
        default:
            if( v >= 0x20 && v < 0x7F )
                return FMT("'" << (char)v << "'");
            return FMT("'\\u{" << ::std::hex << v << ::std::dec << "}'");
        }
        }
    case TOK_FLOAT:     return FMT(m_data.as_Float());
    case TOK_STRING:    return FMT("\"" << EscapedString(m_data.as_String()) << "\"");
    case TOK_BYTESTRING:return FMT("b\"" << EscapedString(m_data.as_String()) << "\"");
    default:
        break;
    }
    if( const char* s = fixed_text(m_type) )
        return s;
    BUG(Span(Span(), m_pos), "Reached end of Token::to_str - " << typestr(m_type));
}


::std::ostream&  operator<<(::std::ostream& os, const Token& tok)
{
    os << Token::typestr(tok.type());
    switch(tok.type())
    {
    case TOK_STRING:
    case TOK_BYTESTRING:
        if( tok.m_data.is_String() )
            os << "\"" << EscapedString(tok.str()) << "\"";
        break;
    case TOK_IDENT:
    case TOK_LIFETIME:
        if( tok.m_data.is_Ident() )
            os << "\"" << tok.m_data.as_Ident() << "\"";
        break;
    case TOK_INTEGER:
    case TOK_CHAR:
        if( tok.m_data.is_Integer() )
            os << ":" << tok.intval();
        break;
    case TOK_FLOAT:
        if( tok.m_data.is_Float() )
            os << ":" << tok.floatval();
        break;
    default:
        break;
    }
    return os;
}
::std::ostream& operator<<(::std::ostream& os, const Position& p)
{
    return os << ::std::dec << p.filename << ":" << p.line << ":" << p.ofs;
}
