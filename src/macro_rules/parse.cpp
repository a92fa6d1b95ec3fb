/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/parse.cpp
 * - macro_rules! parsing
 */
#include <common.hpp>
#include <debug_inner.hpp>
#include "../parse/common.hpp"
#include "../parse/parseerror.hpp"
#include "../parse/ttstream.hpp"
#include "macro_rules.hpp"
#include <map>

namespace {
    const struct {
        const char* name;
        MacroPatEnt::Type   ty;
    } FRAGMENT_SPECIFIERS[] = {
        { "tt",     MacroPatEnt::PAT_TT },
        { "pat",    MacroPatEnt::PAT_PAT },
        { "pat_param",  MacroPatEnt::PAT_PAT },
        { "ident",  MacroPatEnt::PAT_IDENT },
        { "path",   MacroPatEnt::PAT_PATH },
        { "expr",   MacroPatEnt::PAT_EXPR },
        { "stmt",   MacroPatEnt::PAT_STMT },
        { "ty",     MacroPatEnt::PAT_TYPE },
        { "meta",   MacroPatEnt::PAT_META },
        { "block",  MacroPatEnt::PAT_BLOCK },
        { "item",   MacroPatEnt::PAT_ITEM },
        { "vis",    MacroPatEnt::PAT_VIS },
        { "lifetime",   MacroPatEnt::PAT_LIFETIME },
        { "literal",    MacroPatEnt::PAT_LITERAL },
    };

    bool is_close_delim(eTokenType ty) {
        return ty == TOK_PAREN_CLOSE || ty == TOK_SQUARE_CLOSE || ty == TOK_BRACE_CLOSE;
    }
    bool is_open_delim(eTokenType ty) {
        return ty == TOK_PAREN_OPEN || ty == TOK_SQUARE_OPEN || ty == TOK_BRACE_OPEN;
    }
    /// `$name` accepts identifiers and reserved words
    bool is_name_token(const Token& tok) {
        return tok.type() == TOK_IDENT || Token::type_is_rword(tok.type());
    }
    RcString name_of(const Token& tok) {
        return tok.type() == TOK_IDENT ? tok.ident().name : RcString(tok.to_str());
    }

    eTokenType closing_for(eTokenType open)
    {
        switch(open)
        {
        case TOK_PAREN_OPEN:    return TOK_PAREN_CLOSE;
        case TOK_SQUARE_OPEN:   return TOK_SQUARE_CLOSE;
        case TOK_BRACE_OPEN:    return TOK_BRACE_CLOSE;
        default:    return TOK_NULL;
        }
    }

    /// Reads an opening delimiter, returning the matching close
    eTokenType get_open_delim(TokenStream& lex)
    {
        Token   tok;
        GET_TOK(tok, lex);
        if( !is_open_delim(tok.type()) )
            throw ParseError::Unexpected(lex, tok, ::std::vector<eTokenType>{ TOK_PAREN_OPEN, TOK_SQUARE_OPEN, TOK_BRACE_OPEN });
        return closing_for(tok.type());
    }

    /// Parses one arm, metavariables are numbered in order of first declaration
    class ArmParser
    {
        struct Metavar {
            unsigned    idx;
            /// Number of enclosing repetitions
            unsigned    depth;
        };
        /// Metavariable index to the repetition depth it was declared at
        typedef ::std::map<unsigned, unsigned>  UsageMap;

        TokenStream&    lex;
        ::std::map<RcString, Metavar>   m_names;
        unsigned    m_loop_count = 0;
        unsigned    m_pattern_depth = 0;
    public:
        ArmParser(TokenStream& lex):
            lex(lex)
        {
        }

        ::std::vector<MacroPatEnt> pattern(eTokenType close);
        ::std::vector<MacroExpansionEnt> expansion(eTokenType close, unsigned depth, UsageMap* used);

        MacroRulesArm finish(Span sp, ::std::vector<MacroPatEnt> pattern, ::std::vector<MacroExpansionEnt> contents)
        {
            MacroRulesArm   arm( mv$(sp), mv$(pattern), mv$(contents) );
            arm.m_param_names.resize(m_names.size());
            for(const auto& n : m_names)
                arm.m_param_names[n.second.idx] = n.first;
            return arm;
        }
    private:
        MacroPatEnt fragment(const RcString& name);
        void check_delim(const Token& tok, eTokenType close, int& depth);
        const char* repetition_op(Token& joiner);
    };

    // Tracks nesting of `close`'s own delimiter kind, goes negative at the end of the group
    void ArmParser::check_delim(const Token& tok, eTokenType close, int& depth)
    {
        if( tok.type() == TOK_EOF )
            throw ParseError::Unexpected(lex, tok);
        if( closing_for(tok.type()) == close )
            depth ++;
        else if( tok.type() == close )
            depth --;
    }

    /// Parses the `sep? op` following a `$( ... )`, returns the operator
    const char* ArmParser::repetition_op(Token& joiner)
    {
        Token   tok;
        GET_TOK(tok, lex);
        if( tok.type() != TOK_QMARK && tok.type() != TOK_PLUS && tok.type() != TOK_STAR )
        {
            if( is_open_delim(tok.type()) || is_close_delim(tok.type()) || tok.type() == TOK_DOLLAR || tok.type() == TOK_EOF )
                ERROR(lex.point_span(), E0000, "Invalid macro separator " << tok);
            DEBUG("joiner = " << tok);
            joiner = mv$(tok);
            GET_TOK(tok, lex);
        }

        switch(tok.type())
        {
        case TOK_PLUS:  return "+";
        case TOK_STAR:  return "*";
        case TOK_QMARK: return "?";
        default:
            throw ParseError::Unexpected(lex, tok, ::std::vector<eTokenType>{ TOK_PLUS, TOK_STAR, TOK_QMARK });
        }
    }

    // `$name:spec` after the name, a repeated name shares the first declaration's slot
    // (the second binding is reported when matching)
    MacroPatEnt ArmParser::fragment(const RcString& name)
    {
        Token   tok;
        GET_CHECK_TOK(tok, lex, TOK_COLON);
        GET_TOK(tok, lex);
        if( !is_name_token(tok) )
            throw ParseError::Unexpected(lex, tok, Token(TOK_IDENT));
        auto spec = name_of(tok);
        auto sp = lex.point_span();

        const MacroPatEnt::Type* ty = nullptr;
        for(const auto& s : FRAGMENT_SPECIFIERS)
            if( spec == s.name )
                ty = &s.ty;
        if( !ty )
            ERROR(sp, E0000, "Unknown fragment type '" << spec << "'");

        if( name == "" )
            return MacroPatEnt(sp, name, NAMEDVALUE_IGNORE, *ty);

        auto it = m_names.find(name);
        if( it == m_names.end() )
        {
            Metavar v { static_cast<unsigned>(m_names.size()), m_pattern_depth };
            it = m_names.insert( ::std::make_pair(name, v) ).first;
            DEBUG("$" << name << " #" << v.idx << " depth " << v.depth);
        }
        return MacroPatEnt(sp, name, it->second.idx, *ty);
    }

    ::std::vector<MacroPatEnt> ArmParser::pattern(eTokenType close)
    {
        TRACE_FUNCTION;
        ::std::vector<MacroPatEnt>  rv;
        int depth = 0;
        for(;;)
        {
            Token   tok;
            GET_TOK(tok, lex);
            check_delim(tok, close, depth);
            if( depth < 0 )
                break;
            if( tok.type() != TOK_DOLLAR ) {
                rv.push_back( MacroPatEnt(lex.point_span(), mv$(tok)) );
                continue ;
            }

            GET_TOK(tok, lex);
            if( is_close_delim(tok.type()) )
            {
                // Lone `$` at the end of a group
                rv.push_back( MacroPatEnt(lex.point_span(), Token(TOK_DOLLAR)) );
                PUTBACK(tok, lex);
            }
            else if( tok.type() == TOK_PAREN_OPEN )
            {
                auto sp = lex.point_span();
                auto loop_idx = m_loop_count ++;
                m_pattern_depth ++;
                auto inner = pattern(TOK_PAREN_CLOSE);
                m_pattern_depth --;

                Token   joiner;
                const char* op = repetition_op(joiner);
                DEBUG("$(" << inner << ")" << op);
                rv.push_back( MacroPatEnt(sp, mv$(joiner), op, loop_idx, mv$(inner)) );
            }
            else if( tok.type() == TOK_UNDERSCORE )
            {
                rv.push_back( fragment(RcString()) );
            }
            else if( is_name_token(tok) && tok.type() != TOK_RWORD_CRATE )
            {
                rv.push_back( fragment(name_of(tok)) );
            }
            else
            {
                throw ParseError::Unexpected(lex, tok);
            }
        }
        return rv;
    }

    ::std::vector<MacroExpansionEnt> ArmParser::expansion(eTokenType close, unsigned depth, UsageMap* used)
    {
        TRACE_FUNCTION;
        ::std::vector<MacroExpansionEnt> rv;
        int nesting = 0;
        for(;;)
        {
            Token   tok;
            GET_TOK(tok, lex);
            if( tok.type() == TOK_NULL )
                continue ;
            check_delim(tok, close, nesting);
            if( nesting < 0 )
                break;
            if( tok.type() != TOK_DOLLAR ) {
                rv.push_back( MacroExpansionEnt(mv$(tok)) );
                continue ;
            }

            GET_TOK(tok, lex);
            if( tok.type() == TOK_PAREN_OPEN )
            {
                UsageMap    inner_used;
                auto content = expansion(TOK_PAREN_CLOSE, depth+1, &inner_used);
                DEBUG("loop uses " << inner_used.size() << " variables");

                Token   joiner;
                repetition_op(joiner);

                // Variables that repeat at this depth set the iteration count
                ::std::set<unsigned>    controlling_vars;
                for(const auto& v : inner_used)
                    if( v.second > depth )
                        controlling_vars.insert(v.first);
                if( controlling_vars.empty() )
                {
                    WARNING(lex.point_span(), W0000, "Macro loop doesn't contain any variables at this depth, omitting as it'll not run");
                    continue ;
                }
                if( used )
                    used->insert(inner_used.begin(), inner_used.end());

                DEBUG("joiner = " << joiner << ", controlling_vars = {" << controlling_vars << "}");
                rv.push_back( MacroExpansionEnt::make_Loop({ mv$(content), mv$(joiner), mv$(controlling_vars) }) );
            }
            else if( is_name_token(tok) )
            {
                auto name = name_of(tok);
                auto it = m_names.find(name);
                if( it == m_names.end() )
                {
                    // Not a metavariable, emitted as written
                    rv.push_back( MacroExpansionEnt(Token(TOK_DOLLAR)) );
                    rv.push_back( MacroExpansionEnt(mv$(tok)) );
                    continue ;
                }
                const auto& v = it->second;
                if( depth < v.depth )
                    ERROR(lex.point_span(), E0000, "Variable $" << name << " is still repeating at this depth (" << depth << " < " << v.depth << ")");
                if( used )
                    used->insert( ::std::make_pair(v.idx, v.depth) );
                rv.push_back( MacroExpansionEnt(v.idx) );
            }
            else if( is_close_delim(tok.type()) )
            {
                PUTBACK(tok, lex);
                rv.push_back( MacroExpansionEnt(Token(TOK_DOLLAR)) );
            }
            else
            {
                throw ParseError::Unexpected(lex, tok);
            }
        }
        return rv;
    }

    /// `(pattern) => (expansion)`
    MacroRulesArm parse_arm(TokenStream& lex)
    {
        TRACE_FUNCTION;
        Token   tok;
        ArmParser   p(lex);

        auto pat_close = get_open_delim(lex);
        auto sp = lex.point_span();
        auto pattern = p.pattern(pat_close);

        GET_CHECK_TOK(tok, lex, TOK_FATARROW);

        auto exp_close = get_open_delim(lex);
        auto contents = p.expansion(exp_close, 0, nullptr);
        DEBUG("[" << pattern << "] => " << contents);
        return p.finish(mv$(sp), mv$(pattern), mv$(contents));
    }
}

MacroRulesPtr Parse_MacroRules(TokenStream& lex)
{
    TRACE_FUNCTION_F("");
    Token   tok;

    auto rv = MacroRulesPtr(new MacroRules());
    while( lex.lookahead(0) != TOK_EOF && lex.lookahead(0) != TOK_BRACE_CLOSE )
    {
        rv->m_rules.push_back( parse_arm(lex) );
        // Rules are separated by `;`, a `,` is also accepted
        GET_TOK(tok, lex);
        if( tok.type() != TOK_SEMICOLON && tok.type() != TOK_COMMA ) {
            PUTBACK(tok, lex);
            break;
        }
    }
    GET_TOK(tok, lex);
    if( tok.type() != TOK_EOF && tok.type() != TOK_BRACE_CLOSE )
        throw ParseError::Unexpected(lex, tok, ::std::vector<eTokenType>{ TOK_EOF, TOK_BRACE_CLOSE });
    DEBUG(rv->m_rules.size() << " rules");
    if( rv->m_rules.empty() )
        ERROR(lex.point_span(), E0000, "macro_rules! with no rules");
    return rv;
}

MacroRulesPtr Parse_MacroRulesSingleArm(TokenStream& lex)
{
    TRACE_FUNCTION_F("");
    Token   tok;
    ArmParser   p(lex);

    GET_CHECK_TOK(tok, lex, TOK_PAREN_OPEN);
    auto sp = lex.point_span();
    auto pattern = p.pattern(TOK_PAREN_CLOSE);
    GET_CHECK_TOK(tok, lex, TOK_BRACE_OPEN);
    auto body = p.expansion(TOK_BRACE_CLOSE, 0, nullptr);

    auto rv = MacroRulesPtr(new MacroRules());
    rv->m_rules.push_back( p.finish(mv$(sp), mv$(pattern), mv$(body)) );
    return rv;
}

MacroRulesPtr Macro_ParseDefinition(const Span& sp, const TokenTree& body)
{
    DebugPhaseGuard dpg("Parse");
    TRACE_FUNCTION_F(body);
    TTStream    lex(sp, body);
    Token   tok;
    // A braced body is unwrapped (`macro_rules! name { ... }`), the closing brace terminates the parse
    if( body.is_group() )
        GET_CHECK_TOK(tok, lex, TOK_BRACE_OPEN);
    auto rv = Parse_MacroRules(lex);
    if( lex.lookahead(0) != TOK_EOF )
    {
        GET_TOK(tok, lex);
        throw ParseError::Unexpected(lex, tok, Token(TOK_EOF));
    }
    return rv;
}
