/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * include/compile_error.hpp
 * - Error exception classes
 */
#ifndef _COMPILE_ERROR_H_
#define _COMPILE_ERROR_H_

#include <exception>
#include <string>

class TokenStream;

namespace CompileError {

class Base:
    public ::std::exception
{
protected:
    ::std::string   m_message;
public:
    Base() {}
    Base(::std::string message): m_message(::std::move(message)) {}
    virtual ~Base() throw();

    const char* what() const throw() override { return m_message.c_str(); }
    const ::std::string& message() const { return m_message; }
};

class Generic:
    public Base
{
public:
    Generic(::std::string message);
    Generic(const TokenStream& lex, ::std::string message);
    virtual ~Generic() throw () {}
};

class BugCheck:
    public Base
{
public:
    BugCheck(::std::string message);
    virtual ~BugCheck() throw () {}
};

}

#endif
