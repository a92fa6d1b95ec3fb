/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * include/span.hpp
 * - Spans and error handling
 */
#pragma once

#include <rc_string.hpp>
#include <functional>
#include <memory>
#include <stdexcept>

enum ErrorType
{
    E0000,
};
enum WarningType
{
    W0000,
};

struct Position;

/// Source location, chained through the macro expansions that produced it
struct Span
{
    struct Node;
private:
    ::std::shared_ptr<const Node>   m_node;
public:
    Span() {}
    Span(Span parent, RcString filename, unsigned int start_line, unsigned int start_ofs,  unsigned int end_line, unsigned int end_ofs);
    Span(Span parent, const Position& position);
    /// Span for code produced by expanding `macro_name`, `parent` is the invocation
    Span(Span parent, RcString macro_name);

    operator bool() const { return static_cast<bool>(m_node); }
    bool operator==(const Span& x) const { return m_node == x.m_node; }
    bool operator!=(const Span& x) const { return m_node != x.m_node; }

    /// Enclosing span (the invocation for macro spans), null at the outermost level
    Span parent() const;

    /// Throws `CompileError::BugCheck` carrying the message
    void bug(::std::function<void(::std::ostream&)> msg) const;
    /// Throws `CompileError::Generic` carrying the message
    void error(ErrorType tag, ::std::function<void(::std::ostream&)> msg) const;
    /// Prints the message (and the expansion chain) to stderr
    void warning(WarningType tag, ::std::function<void(::std::ostream&)> msg) const;

    friend ::std::ostream& operator<<(::std::ostream& os, const Span& sp);
};

#define ERROR(span, code, msg)  do { ::Span(span).error(code, [&](::std::ostream& os) { os << msg; }); throw ::std::runtime_error("Error fell through" #code); } while(0)
#define WARNING(span, code, msg)  do { ::Span(span).warning(code, [&](::std::ostream& os) { os << msg; }); } while(0)
#define BUG(span, msg)  do { ::Span(span).bug([&](::std::ostream& os) { os << __FILE__ << ":" << __LINE__ << ": " << msg; }); throw ::std::runtime_error("Bug fell through"); } while(0)

#define ASSERT_BUG(span, cnd, msg)  do { if( !(cnd) ) { ::Span(span).bug([&](::std::ostream& os) { os << "ASSERT FAIL: " << __FILE__ << ":" << __LINE__ << ":" #cnd << ": " << msg; }); throw ::std::runtime_error("Bug fell through"); } } while(0)
