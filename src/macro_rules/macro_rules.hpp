/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/macro_rules.hpp
 * - Parsed `macro_rules!` definitions
 */
#ifndef MACROS_HPP_INCLUDED
#define MACROS_HPP_INCLUDED

#include "parse/tokenstream.hpp"
#include "parse/tokentree.hpp"
#include <common.hpp>
#include <set>
#include "macro_rules_ptr.hpp"

/// Metavariable index of `$_:frag` (matched, never bound)
static const unsigned int NAMEDVALUE_IGNORE = ~0u;

/// One element of a rule's pattern
///
/// Depending on `type`:
/// - PAT_TOKEN: `tok` must appear literally (delimiters are stored this way too)
/// - PAT_LOOP: `$( subpats ) tok name`, `tok` is the separator (TOK_NULL if none) and `name` is
///   the operator (`*`, `+` or `?`), `name_index` numbers the repetition
/// - otherwise `$name:type`, `name_index` is the metavariable's slot
struct MacroPatEnt
{
    enum Type {
        PAT_TOKEN,
        PAT_LOOP,

        PAT_TT,
        PAT_PAT,
        PAT_IDENT,
        PAT_PATH,
        PAT_TYPE,
        PAT_EXPR,
        PAT_STMT,
        PAT_BLOCK,
        PAT_META,
        PAT_ITEM,
        PAT_VIS,
        PAT_LIFETIME,
        PAT_LITERAL,
    };

    Span    sp;
    Type    type = PAT_TOKEN;
    Token   tok;
    RcString    name;
    unsigned int    name_index = 0;
    ::std::vector<MacroPatEnt>  subpats;

    MacroPatEnt():
        tok(TOK_NULL)
    {
    }
    MacroPatEnt(Span sp, Token tok):
        sp(mv$(sp)),
        tok(mv$(tok))
    {
    }
    MacroPatEnt(Span sp, RcString name, unsigned int name_index, Type type):
        sp(mv$(sp)),
        type(type),
        name(mv$(name)),
        name_index(name_index)
    {
    }
    MacroPatEnt(Span sp, Token sep, const char* op, unsigned index, ::std::vector<MacroPatEnt> ents):
        sp(mv$(sp)),
        type(PAT_LOOP),
        tok(mv$(sep)),
        name(op),
        name_index(index),
        subpats(mv$(ents))
    {
    }

    bool is_fragment() const { return type != PAT_TOKEN && type != PAT_LOOP; }

    /// Specifier spelling (`expr`, `ty`, ...)
    static const char* type_name(Type ty);

    friend ::std::ostream& operator<<(::std::ostream& os, const MacroPatEnt& x);
    friend ::std::ostream& operator<<(::std::ostream& os, const MacroPatEnt::Type& x);
};

TAGGED_UNION(MacroExpansionEnt, Token,
    /// Emitted as-is (delimiters included, groups are rebuilt on output)
    (Token, Token),
    /// Metavariable slot
    (NamedValue, unsigned int),
    /// `$( entries ) joiner op`, runs once per iteration of `controlling_vars`
    (Loop, struct {
        ::std::vector< MacroExpansionEnt>   entries;
        Token   joiner;
        ::std::set<unsigned int>    controlling_vars;
        })
    );
extern ::std::ostream& operator<<(::std::ostream& os, const MacroExpansionEnt& x);

/// A `pattern => expansion` rule
struct MacroRulesArm
{
    Span    m_span;
    /// Metavariable names, indexed by slot
    ::std::vector<RcString>   m_param_names;
    ::std::vector<MacroPatEnt> m_pattern;
    ::std::vector<MacroExpansionEnt> m_contents;

    MacroRulesArm() {}
    MacroRulesArm(Span sp, ::std::vector<MacroPatEnt> pattern, ::std::vector<MacroExpansionEnt> contents):
        m_span(mv$(sp)),
        m_pattern(mv$(pattern)),
        m_contents(mv$(contents))
    {}
    ~MacroRulesArm();

    MacroRulesArm(MacroRulesArm&&) = default;
    MacroRulesArm& operator=(MacroRulesArm&&) = default;
    MacroRulesArm(const MacroRulesArm&) = delete;
    MacroRulesArm& operator=(const MacroRulesArm&) = delete;
};

/// A whole definition, rules are tried in order
class MacroRules
{
public:
    ::std::vector<MacroRulesArm>  m_rules;

    MacroRules() {}
    MacroRules(MacroRules&&) = default;
    virtual ~MacroRules();
};

/// Rule list up to EOF or a closing `}`
extern MacroRulesPtr    Parse_MacroRules(TokenStream& lex);
/// Single rule written as `(pattern) { expansion }`
extern MacroRulesPtr    Parse_MacroRulesSingleArm(TokenStream& lex);
/// Definition from a token tree, either the `{ ... }` group or a bare rule list
extern MacroRulesPtr    Macro_ParseDefinition(const Span& sp, const TokenTree& body);

#endif // MACROS_HPP_INCLUDED
