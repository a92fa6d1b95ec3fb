/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/fragment.cpp
 * - Rust fragment grammar
 *
 * Only measures fragments, nothing is built. Each reader returns false on a syntax error,
 * leaving the cursor wherever the error was found (the matcher uses that to tell a malformed
 * fragment from a simple mismatch).
 */
#include <common.hpp>
#include "fragment.hpp"

FragmentGrammar::~FragmentGrammar()
{
}

namespace
{
    bool is_open_delim(eTokenType ty) {
        return ty == TOK_PAREN_OPEN || ty == TOK_SQUARE_OPEN || ty == TOK_BRACE_OPEN;
    }
    bool is_close_delim(eTokenType ty) {
        return ty == TOK_PAREN_CLOSE || ty == TOK_SQUARE_CLOSE || ty == TOK_BRACE_CLOSE;
    }
    bool is_literal(eTokenType ty) {
        switch(ty)
        {
        case TOK_INTEGER:
        case TOK_FLOAT:
        case TOK_CHAR:
        case TOK_STRING:
        case TOK_BYTESTRING:
        case TOK_RWORD_TRUE:
        case TOK_RWORD_FALSE:
            return true;
        default:
            return false;
        }
    }
    bool is_path_start(eTokenType ty) {
        switch(ty)
        {
        case TOK_IDENT:
        case TOK_DOUBLE_COLON:
        case TOK_LT:
        case TOK_RWORD_SELF:
        case TOK_RWORD_SUPER:
        case TOK_RWORD_CRATE:
            return true;
        default:
            return false;
        }
    }
    bool can_begin_expr(eTokenType ty) {
        if( is_literal(ty) || is_path_start(ty) || is_open_delim(ty) )
            return true;
        switch(ty)
        {
        case TOK_DASH:  case TOK_EXCLAM:    case TOK_STAR:
        case TOK_AMP:   case TOK_DOUBLE_AMP:
        case TOK_PIPE:  case TOK_DOUBLE_PIPE:
        case TOK_DOUBLE_DOT:    case TOK_DOUBLE_DOT_EQUAL:
        case TOK_LIFETIME:
        case TOK_RWORD_IF:  case TOK_RWORD_MATCH:
        case TOK_RWORD_WHILE:   case TOK_RWORD_FOR: case TOK_RWORD_LOOP:
        case TOK_RWORD_UNSAFE:  case TOK_RWORD_ASYNC:   case TOK_RWORD_MOVE:
        case TOK_RWORD_RETURN:  case TOK_RWORD_BREAK:   case TOK_RWORD_CONTINUE:
        case TOK_RWORD_YIELD:   case TOK_RWORD_BOX:
            return true;
        default:
            return false;
        }
    }

    // Binding power of infix operators (0 = not an infix operator)
    const unsigned POWER_ASSIGN = 1;
    const unsigned POWER_RANGE = 2;
    const unsigned POWER_CAST = 12;
    unsigned infix_power(eTokenType ty)
    {
        switch(ty)
        {
        case TOK_EQUAL:
        case TOK_PLUS_EQUAL:    case TOK_DASH_EQUAL:
        case TOK_STAR_EQUAL:    case TOK_SLASH_EQUAL:   case TOK_PERCENT_EQUAL:
        case TOK_AMP_EQUAL: case TOK_PIPE_EQUAL:    case TOK_CARET_EQUAL:
        case TOK_DOUBLE_LT_EQUAL:   case TOK_DOUBLE_GT_EQUAL:
            return POWER_ASSIGN;
        case TOK_DOUBLE_DOT:
        case TOK_DOUBLE_DOT_EQUAL:
            return POWER_RANGE;
        case TOK_DOUBLE_PIPE:   return 3;
        case TOK_DOUBLE_AMP:    return 4;
        case TOK_DOUBLE_EQUAL:  case TOK_EXCLAM_EQUAL:
        case TOK_LT:    case TOK_GT:    case TOK_LTE:   case TOK_GTE:
            return 5;
        case TOK_PIPE:  return 6;
        case TOK_CARET: return 7;
        case TOK_AMP:   return 8;
        case TOK_DOUBLE_LT: case TOK_DOUBLE_GT:
            return 9;
        case TOK_PLUS:  case TOK_DASH:
            return 10;
        case TOK_STAR:  case TOK_SLASH: case TOK_PERCENT:
            return 11;
        case TOK_RWORD_AS:
            return POWER_CAST;
        default:
            return 0;
        }
    }

    class FragmentReader
    {
        TokenTreeCursor&    lex;
        bool    m_struct_literals;
    public:
        FragmentReader(TokenTreeCursor& lex, bool struct_literals):
            lex(lex),
            m_struct_literals(struct_literals)
        {
        }

        bool tree();
        bool group(eTokenType open);
        bool path(bool expr_mode);
        bool type();
        bool pattern();
        bool expr(bool allow_struct=true) { return expr_bp(allow_struct, 1); }
        bool stmt();
        bool item();
        bool vis();
        bool meta();
        bool literal();

    private:
        bool generic_args();
        bool bounds();
        bool pattern_single();
        bool expr_bp(bool allow_struct, unsigned min_power);
        bool expr_unary(bool allow_struct);
        bool expr_primary(bool allow_struct);
        bool expr_conditional(bool allow_struct);
        bool closure(bool allow_struct);
        bool trees_until(eTokenType end);
        bool item_body();
    };

    /// Single token, or an entire delimited group
    bool FragmentReader::tree()
    {
        auto ty = lex.next();
        if( ty == TOK_EOF || is_close_delim(ty) )
            return false;
        if( is_open_delim(ty) )
            return group(ty);
        lex.consume();
        return true;
    }
    /// A whole group opened by `open` (including both delimiters)
    bool FragmentReader::group(eTokenType open)
    {
        if( lex.next() != open )
            return false;
        auto depth = lex.depth();
        lex.consume();
        while( lex.depth() > depth )
            lex.consume();
        return true;
    }

    // `<...>` after a path segment, `>>` is split when it closes two lists at once
    bool FragmentReader::generic_args()
    {
        if( !lex.consume_if(TOK_LT) )
            return false;
        while( !lex.consume_if(TOK_GT) )
        {
            if( lex.next() == TOK_DOUBLE_GT ) {
                lex.consume_and_push(TOK_GT);
                return true;
            }
            switch(lex.next())
            {
            case TOK_LIFETIME:
                lex.consume();
                break;
            case TOK_BRACE_OPEN:
                group(TOK_BRACE_OPEN);
                break;
            default:
                if( is_literal(lex.next()) || lex.next() == TOK_DASH ) {
                    if( !literal() )
                        return false;
                }
                else if( !type() ) {
                    return false;
                }
                // Associated type binding or bound
                if( lex.consume_if(TOK_EQUAL) ) {
                    if( !type() )
                        return false;
                }
                else if( lex.consume_if(TOK_COLON) ) {
                    if( !bounds() )
                        return false;
                }
                break;
            }
            if( !lex.consume_if(TOK_COMMA) && lex.next() != TOK_GT && lex.next() != TOK_DOUBLE_GT )
                return false;
        }
        return true;
    }

    /// Path, `expr_mode` paths need `::<` for generics
    bool FragmentReader::path(bool expr_mode)
    {
        if( lex.next() == TOK_LT )
        {
            // Qualified path `<T as Trait>::name`
            lex.consume();
            if( !type() )
                return false;
            if( lex.consume_if(TOK_RWORD_AS) && !path(false) )
                return false;
            if( lex.next() == TOK_DOUBLE_GT )
                lex.consume_and_push(TOK_GT);
            if( !lex.consume_if(TOK_GT) )
                return false;
            if( lex.next() != TOK_DOUBLE_COLON )
                return false;
        }
        else
        {
            lex.consume_if(TOK_DOUBLE_COLON);
            switch(lex.next())
            {
            case TOK_IDENT:
            case TOK_RWORD_SELF:
            case TOK_RWORD_SUPER:
            case TOK_RWORD_CRATE:
                lex.consume();
                break;
            default:
                return false;
            }
        }

        for(;;)
        {
            if( !expr_mode && lex.next() == TOK_LT ) {
                if( !generic_args() )
                    return false;
            }
            if( !lex.consume_if(TOK_DOUBLE_COLON) )
                break;
            if( lex.next() == TOK_LT ) {
                if( !generic_args() )
                    return false;
                continue ;
            }
            if( lex.next() != TOK_IDENT && lex.next() != TOK_RWORD_SELF && lex.next() != TOK_RWORD_SUPER )
                return false;
            lex.consume();
        }
        return true;
    }

    // `Trait + 'a + ?Sized`
    bool FragmentReader::bounds()
    {
        do {
            if( lex.consume_if(TOK_LIFETIME) )
                continue ;
            lex.consume_if(TOK_QMARK);
            if( lex.next() == TOK_PAREN_OPEN ) {
                if( !group(TOK_PAREN_OPEN) )
                    return false;
            }
            else if( !path(false) ) {
                return false;
            }
        } while( lex.consume_if(TOK_PLUS) );
        return true;
    }

    bool FragmentReader::type()
    {
        TRACE_FUNCTION_F(lex.next_tok());
        switch(lex.next())
        {
        case TOK_AMP:
        case TOK_DOUBLE_AMP:
            lex.consume();
            lex.consume_if(TOK_LIFETIME);
            lex.consume_if(TOK_RWORD_MUT);
            return type();
        case TOK_STAR:
            lex.consume();
            if( !lex.consume_if(TOK_RWORD_CONST) && !lex.consume_if(TOK_RWORD_MUT) )
                return false;
            return type();
        case TOK_PAREN_OPEN:
        case TOK_SQUARE_OPEN:
            return group(lex.next());
        case TOK_EXCLAM:
        case TOK_UNDERSCORE:
            lex.consume();
            return true;
        case TOK_RWORD_FOR:
            lex.consume();
            if( !generic_args() )
                return false;
            return type();
        case TOK_RWORD_IMPL:
        case TOK_RWORD_DYN:
            lex.consume();
            return bounds();
        case TOK_RWORD_UNSAFE:
        case TOK_RWORD_EXTERN:
        case TOK_RWORD_FN:
            lex.consume_if(TOK_RWORD_UNSAFE);
            if( lex.consume_if(TOK_RWORD_EXTERN) ) {
                lex.consume_if(TOK_STRING);
            }
            if( !lex.consume_if(TOK_RWORD_FN) )
                return false;
            if( !group(TOK_PAREN_OPEN) )
                return false;
            if( lex.consume_if(TOK_THINARROW) )
                return type();
            return true;
        default:
            if( !is_path_start(lex.next()) )
                return false;
            if( !path(false) )
                return false;
            // Fn-trait sugar `Fn(A) -> B`
            if( lex.next() == TOK_PAREN_OPEN ) {
                group(TOK_PAREN_OPEN);
                if( lex.consume_if(TOK_THINARROW) )
                    return type();
            }
            return true;
        }
    }

    bool FragmentReader::pattern()
    {
        lex.consume_if(TOK_PIPE);
        do {
            if( !pattern_single() )
                return false;
        } while( lex.consume_if(TOK_PIPE) );
        return true;
    }
    bool FragmentReader::pattern_single()
    {
        switch(lex.next())
        {
        case TOK_UNDERSCORE:
        case TOK_DOUBLE_DOT:
            lex.consume();
            return true;
        case TOK_AMP:
        case TOK_DOUBLE_AMP:
            lex.consume();
            lex.consume_if(TOK_RWORD_MUT);
            return pattern_single();
        case TOK_RWORD_REF:
        case TOK_RWORD_MUT:
            lex.consume_if(TOK_RWORD_REF);
            lex.consume_if(TOK_RWORD_MUT);
            if( !lex.consume_if(TOK_IDENT) )
                return false;
            if( lex.consume_if(TOK_AT) )
                return pattern_single();
            return true;
        case TOK_PAREN_OPEN:
        case TOK_SQUARE_OPEN:
            return group(lex.next());
        default:
            break;
        }

        if( lex.next() == TOK_DASH || is_literal(lex.next()) )
        {
            if( !literal() )
                return false;
        }
        else if( is_path_start(lex.next()) )
        {
            bool is_binding = lex.next() == TOK_IDENT && lex.lookahead1() != TOK_DOUBLE_COLON;
            if( !path(true) )
                return false;
            if( is_binding && lex.consume_if(TOK_AT) )
                return pattern_single();
            switch(lex.next())
            {
            case TOK_PAREN_OPEN:
            case TOK_BRACE_OPEN:
                return group(lex.next());
            case TOK_EXCLAM:
                lex.consume();
                return is_open_delim(lex.next()) && group(lex.next());
            default:
                break;
            }
        }
        else
        {
            return false;
        }

        // Range patterns
        if( lex.consume_if(TOK_DOUBLE_DOT_EQUAL) || lex.consume_if(TOK_TRIPLE_DOT) || lex.consume_if(TOK_DOUBLE_DOT) )
        {
            if( lex.next() == TOK_DASH || is_literal(lex.next()) )
                return literal();
            if( is_path_start(lex.next()) )
                return path(true);
        }
        return true;
    }

    bool FragmentReader::literal()
    {
        if( lex.consume_if(TOK_DASH) )
        {
            if( lex.next() != TOK_INTEGER && lex.next() != TOK_FLOAT )
                return false;
        }
        if( !is_literal(lex.next()) )
            return false;
        lex.consume();
        return true;
    }

    bool FragmentReader::expr_bp(bool allow_struct, unsigned min_power)
    {
        TRACE_FUNCTION_F(lex.next_tok() << " min=" << min_power);
        switch(lex.next())
        {
        case TOK_RWORD_RETURN:
        case TOK_RWORD_BREAK:
        case TOK_RWORD_CONTINUE:
        case TOK_RWORD_YIELD:
            // Prefix keywords with an optional operand, nothing binds after them
            lex.consume();
            lex.consume_if(TOK_LIFETIME);
            if( can_begin_expr(lex.next()) && !(lex.next() == TOK_BRACE_OPEN && !allow_struct) )
                return expr_bp(allow_struct, POWER_ASSIGN);
            return true;
        case TOK_DOUBLE_DOT:
        case TOK_DOUBLE_DOT_EQUAL:
            lex.consume();
            if( can_begin_expr(lex.next()) && lex.next() != TOK_BRACE_OPEN )
                return expr_bp(allow_struct, POWER_RANGE + 1);
            return true;
        case TOK_PIPE:
        case TOK_DOUBLE_PIPE:
        case TOK_RWORD_MOVE:
            return closure(allow_struct);
        default:
            if( !expr_unary(allow_struct) )
                return false;
            break;
        }

        for(;;)
        {
            auto op = lex.next();
            auto power = infix_power(op);
            if( power == 0 || power < min_power )
                break;
            lex.consume();
            switch(power)
            {
            case POWER_CAST:
                if( !type() )
                    return false;
                break;
            case POWER_RANGE:
                // Open-ended range `a..`
                if( can_begin_expr(lex.next()) && lex.next() != TOK_BRACE_OPEN ) {
                    if( !expr_bp(allow_struct, POWER_RANGE + 1) )
                        return false;
                }
                break;
            case POWER_ASSIGN:
                if( !expr_bp(allow_struct, POWER_ASSIGN) )
                    return false;
                break;
            default:
                if( !expr_bp(allow_struct, power + 1) )
                    return false;
                break;
            }
        }
        return true;
    }

    bool FragmentReader::expr_unary(bool allow_struct)
    {
        switch(lex.next())
        {
        case TOK_DASH:
        case TOK_EXCLAM:
        case TOK_STAR:
        case TOK_RWORD_BOX:
            lex.consume();
            return expr_unary(allow_struct);
        case TOK_AMP:
        case TOK_DOUBLE_AMP:
            lex.consume();
            lex.consume_if(TOK_RWORD_MUT);
            return expr_unary(allow_struct);
        default:
            break;
        }

        if( !expr_primary(allow_struct) )
            return false;

        // Postfix operators
        for(;;)
        {
            switch(lex.next())
            {
            case TOK_QMARK:
                lex.consume();
                break;
            case TOK_PAREN_OPEN:
            case TOK_SQUARE_OPEN:
                group(lex.next());
                break;
            case TOK_DOT:
                lex.consume();
                switch(lex.next())
                {
                case TOK_IDENT:
                case TOK_INTEGER:
                case TOK_FLOAT:
                case TOK_RWORD_AWAIT:
                    lex.consume();
                    break;
                default:
                    return false;
                }
                if( lex.consume_if(TOK_DOUBLE_COLON) && !generic_args() )
                    return false;
                break;
            default:
                return true;
            }
        }
    }

    bool FragmentReader::expr_primary(bool allow_struct)
    {
        auto ty = lex.next();
        if( is_literal(ty) ) {
            lex.consume();
            return true;
        }
        switch(ty)
        {
        case TOK_PAREN_OPEN:
        case TOK_SQUARE_OPEN:
        case TOK_BRACE_OPEN:
            return group(ty);
        case TOK_RWORD_UNSAFE:
        case TOK_RWORD_ASYNC:
            lex.consume();
            lex.consume_if(TOK_RWORD_MOVE);
            return group(TOK_BRACE_OPEN);
        case TOK_LIFETIME:
            // Labelled loop or block
            lex.consume();
            if( !lex.consume_if(TOK_COLON) )
                return false;
            return expr_primary(allow_struct);
        case TOK_RWORD_IF:
        case TOK_RWORD_WHILE:
            return expr_conditional(allow_struct);
        case TOK_RWORD_FOR:
            lex.consume();
            if( !pattern() || !lex.consume_if(TOK_RWORD_IN) || !expr(false) )
                return false;
            return group(TOK_BRACE_OPEN);
        case TOK_RWORD_LOOP:
            lex.consume();
            return group(TOK_BRACE_OPEN);
        case TOK_RWORD_MATCH:
            lex.consume();
            if( !expr(false) )
                return false;
            return group(TOK_BRACE_OPEN);
        default:
            break;
        }

        if( !is_path_start(ty) )
            return false;
        if( !path(true) )
            return false;
        if( lex.next() == TOK_EXCLAM && is_open_delim(lex.lookahead1()) )
        {
            // Macro invocation
            lex.consume();
            return group(lex.next());
        }
        if( lex.next() == TOK_BRACE_OPEN && allow_struct )
        {
            if( !m_struct_literals ) {
                DEBUG("Struct literal not allowed");
                return false;
            }
            return group(TOK_BRACE_OPEN);
        }
        return true;
    }

    // `if`/`while` with an optional `let` condition, and `else` chains
    bool FragmentReader::expr_conditional(bool allow_struct)
    {
        bool is_if = lex.next() == TOK_RWORD_IF;
        lex.consume();
        if( lex.consume_if(TOK_RWORD_LET) )
        {
            if( !pattern() || !lex.consume_if(TOK_EQUAL) )
                return false;
        }
        if( !expr(false) )
            return false;
        if( !group(TOK_BRACE_OPEN) )
            return false;
        if( is_if && lex.consume_if(TOK_RWORD_ELSE) )
        {
            if( lex.next() == TOK_RWORD_IF )
                return expr_conditional(allow_struct);
            return group(TOK_BRACE_OPEN);
        }
        return true;
    }

    bool FragmentReader::closure(bool allow_struct)
    {
        lex.consume_if(TOK_RWORD_MOVE);
        if( !lex.consume_if(TOK_DOUBLE_PIPE) )
        {
            if( !lex.consume_if(TOK_PIPE) )
                return false;
            if( !trees_until(TOK_PIPE) )
                return false;
        }
        if( lex.consume_if(TOK_THINARROW) )
        {
            // An explicit return type needs a block body
            if( !type() )
                return false;
            return group(TOK_BRACE_OPEN);
        }
        return expr_bp(allow_struct, POWER_ASSIGN);
    }

    /// Consumes trees up to and including `end`
    bool FragmentReader::trees_until(eTokenType end)
    {
        while( !lex.consume_if(end) )
        {
            if( !tree() )
                return false;
        }
        return true;
    }

    bool FragmentReader::stmt()
    {
        if( lex.consume_if(TOK_RWORD_LET) )
        {
            if( !pattern() )
                return false;
            if( lex.consume_if(TOK_COLON) && !type() )
                return false;
            if( lex.consume_if(TOK_EQUAL) && !expr() )
                return false;
            if( lex.consume_if(TOK_RWORD_ELSE) )
                return group(TOK_BRACE_OPEN);
            return true;
        }
        switch(lex.next())
        {
        case TOK_HASH:
        case TOK_RWORD_PUB:
        case TOK_RWORD_FN:
        case TOK_RWORD_STRUCT:
        case TOK_RWORD_ENUM:
        case TOK_RWORD_TRAIT:
        case TOK_RWORD_IMPL:
        case TOK_RWORD_MOD:
        case TOK_RWORD_USE:
        case TOK_RWORD_TYPE:
        case TOK_RWORD_STATIC:
        case TOK_RWORD_CONST:
        case TOK_RWORD_EXTERN:
            return item();
        case TOK_RWORD_UNSAFE:
            if( lex.lookahead1() != TOK_BRACE_OPEN )
                return item();
            break;
        default:
            break;
        }
        return expr();
    }

    bool FragmentReader::vis()
    {
        if( !lex.consume_if(TOK_RWORD_PUB) )
            return true;
        if( lex.next() == TOK_PAREN_OPEN )
        {
            // Only `pub(crate)`, `pub(self)`, `pub(super)` and `pub(in path)` belong to the visibility
            auto inner = lex;
            inner.consume();
            switch(inner.next())
            {
            case TOK_RWORD_CRATE:
            case TOK_RWORD_SELF:
            case TOK_RWORD_SUPER:
            case TOK_RWORD_IN:
                return group(TOK_PAREN_OPEN);
            default:
                break;
            }
        }
        return true;
    }

    bool FragmentReader::meta()
    {
        if( lex.consume_if(TOK_RWORD_UNSAFE) )
            return group(TOK_PAREN_OPEN);
        if( !path(true) )
            return false;
        if( is_open_delim(lex.next()) )
            return group(lex.next());
        if( lex.consume_if(TOK_EQUAL) )
            return expr();
        return true;
    }

    // Header trees then either `;` or a braced body
    bool FragmentReader::item_body()
    {
        for(;;)
        {
            switch(lex.next())
            {
            case TOK_SEMICOLON:
                lex.consume();
                return true;
            case TOK_BRACE_OPEN:
                return group(TOK_BRACE_OPEN);
            default:
                if( !tree() )
                    return false;
                break;
            }
        }
    }

    bool FragmentReader::item()
    {
        TRACE_FUNCTION_F(lex.next_tok());
        while( lex.next() == TOK_HASH )
        {
            lex.consume();
            lex.consume_if(TOK_EXCLAM);
            if( !group(TOK_SQUARE_OPEN) )
                return false;
        }
        vis();

        // Function qualifiers, `const` is only a qualifier when more of them follow
        for(;;)
        {
            auto ty = lex.next();
            if( ty == TOK_RWORD_UNSAFE || ty == TOK_RWORD_ASYNC ) {
                lex.consume();
            }
            else if( ty == TOK_RWORD_CONST && lex.lookahead1() != TOK_IDENT && lex.lookahead1() != TOK_UNDERSCORE ) {
                lex.consume();
            }
            else if( ty == TOK_RWORD_EXTERN ) {
                lex.consume();
                lex.consume_if(TOK_STRING);
                if( lex.next() == TOK_BRACE_OPEN )
                    return group(TOK_BRACE_OPEN);
                if( lex.next() == TOK_RWORD_CRATE )
                    return trees_until(TOK_SEMICOLON);
            }
            else {
                break;
            }
        }

        switch(lex.next())
        {
        case TOK_RWORD_FN:
        case TOK_RWORD_STRUCT:
        case TOK_RWORD_ENUM:
        case TOK_RWORD_TRAIT:
        case TOK_RWORD_IMPL:
        case TOK_RWORD_MOD:
            lex.consume();
            return item_body();
        case TOK_RWORD_USE:
        case TOK_RWORD_TYPE:
        case TOK_RWORD_STATIC:
        case TOK_RWORD_CONST:
            // May contain braced expressions, only `;` ends these
            lex.consume();
            return trees_until(TOK_SEMICOLON);
        case TOK_IDENT:
            if( lex.next_tok().ident().name == "union" && lex.lookahead1() == TOK_IDENT ) {
                lex.consume();
                return item_body();
            }
            // Macro invocation item, e.g. `macro_rules! name { ... }` or `foo!(...);`
            if( !path(true) || !lex.consume_if(TOK_EXCLAM) )
                return false;
            lex.consume_if(TOK_IDENT);
            if( lex.next() == TOK_BRACE_OPEN )
                return group(TOK_BRACE_OPEN);
            if( !is_open_delim(lex.next()) || !group(lex.next()) )
                return false;
            lex.consume_if(TOK_SEMICOLON);
            return true;
        default:
            return false;
        }
    }
}

bool RustFragmentGrammar::consume(TokenTreeCursor& lex, MacroPatEnt::Type type) const
{
    TRACE_FUNCTION_F(type << " @ " << lex.next_tok());
    FragmentReader  r(lex, m_struct_literals);
    switch(type)
    {
    case MacroPatEnt::PAT_TOKEN:
    case MacroPatEnt::PAT_LOOP:
        BUG(Span(), "Encountered " << type << " in RustFragmentGrammar::consume");
    case MacroPatEnt::PAT_TT:       return r.tree();
    case MacroPatEnt::PAT_BLOCK:    return r.group(TOK_BRACE_OPEN);
    case MacroPatEnt::PAT_PATH:     return r.path(false);
    case MacroPatEnt::PAT_TYPE:     return r.type();
    case MacroPatEnt::PAT_EXPR:     return r.expr();
    case MacroPatEnt::PAT_STMT:     return r.stmt();
    case MacroPatEnt::PAT_PAT:      return r.pattern();
    case MacroPatEnt::PAT_META:     return r.meta();
    case MacroPatEnt::PAT_ITEM:     return r.item();
    case MacroPatEnt::PAT_VIS:      return r.vis();
    case MacroPatEnt::PAT_LITERAL:  return r.literal();
    case MacroPatEnt::PAT_LIFETIME: return lex.consume_if(TOK_LIFETIME);
    case MacroPatEnt::PAT_IDENT:
        if( lex.next() == TOK_IDENT || Token::type_is_rword(lex.next()) ) {
            lex.consume();
            return true;
        }
        return false;
    }
    return false;
}
