/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/macro_error.hpp
 * - Expansion failures and diagnostics
 */
#pragma once
#include <compile_error.hpp>
#include <span.hpp>
#include <parse/token.hpp>
#include <vector>
#include <string>

enum class MacroErrorKind
{
    NotFound,
    DuplicateDefinition,
    NoMatchingRule,
    DuplicateMetavariableBinding,
    RepetitionCountMismatch,
    RecursionLimitExceeded,
    MalformedFragment,
};
extern const char* MacroErrorKind_name(MacroErrorKind k);
extern ::std::ostream& operator<<(::std::ostream& os, const MacroErrorKind& k);

/// One active macro expansion
struct ExpansionFrame
{
    RcString    macro_name;
    Span    invocation_span;
    /// Index of the arm that matched (~0 while matching)
    unsigned int    arm_index;

    ExpansionFrame(RcString name, Span sp):
        macro_name(::std::move(name)),
        invocation_span(::std::move(sp)),
        arm_index(~0u)
    {
    }

    friend ::std::ostream& operator<<(::std::ostream& os, const ExpansionFrame& x);
};

/// Failure raised within the engine (caught by `MacroExpander`)
class MacroError:
    public CompileError::Base
{
public:
    MacroErrorKind  m_kind;
    Span    m_span;
    /// Offending token (TOK_NULL if there is none)
    Token   m_token;
    /// Description of what was expected at `m_token`
    ::std::string   m_expected;
    ::std::string   m_detail;
    /// Active expansions, oldest first (filled in by the expander)
    ::std::vector<ExpansionFrame>   m_frames;

    MacroError(MacroErrorKind kind, Span sp, ::std::string detail);
    MacroError(MacroErrorKind kind, Span sp, Token tok, ::std::string expected, ::std::string detail);
    virtual ~MacroError() throw();

    MacroErrorKind kind() const { return m_kind; }
    const Span& span() const { return m_span; }
    const Token& token() const { return m_token; }
private:
    void format_message();
};

/// User-facing diagnostic for a failed expansion
struct MacroDiagnostic
{
    MacroErrorKind  kind;
    Span    span;
    ::std::string   message;
    Token   token;
    ::std::string   expected;
    ::std::vector<ExpansionFrame>   frames;

    MacroDiagnostic(MacroError e);

    /// Prints the error followed by a note for each active expansion
    void render(::std::ostream& os) const;

    friend ::std::ostream& operator<<(::std::ostream& os, const MacroDiagnostic& x) {
        x.render(os);
        return os;
    }
};
