/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * rc_string.cpp
 * - Reference-counted string
 */
#include <rc_string.hpp>
#include <cstring>
#include <new>
#include <string>
#include <iostream>
#include <algorithm>    // std::min

struct RcString::Inner
{
    ::std::atomic<unsigned int> refcount;
    ::std::string   text;

    Inner(const char* s, size_t len):
        refcount(1),
        text(s, len)
    {
    }
};

RcString::RcString(const char* s, size_t len):
    m_ptr(len > 0 ? new Inner(s, len) : nullptr)
{
}
void RcString::acquire()
{
    if( m_ptr )
        m_ptr->refcount += 1;
}
void RcString::release()
{
    if( m_ptr && --m_ptr->refcount == 0 )
        delete m_ptr;
    m_ptr = nullptr;
}

size_t RcString::size() const
{
    return m_ptr ? m_ptr->text.size() : 0;
}
const char* RcString::c_str() const
{
    return m_ptr ? m_ptr->text.c_str() : "";
}

Ordering RcString::ord(const char* s, size_t len) const
{
    auto cmp_len = ::std::min(len, this->size());
    int cmp = cmp_len > 0 ? memcmp(this->c_str(), s, cmp_len) : 0;
    if( cmp != 0 )
        return ::ord(cmp, 0);
    // Equal prefix, the shorter one sorts first
    return ::ord(this->size(), len);
}

::std::ostream& operator<<(::std::ostream& os, const RcString& x)
{
    os.write(x.c_str(), x.size());
    return os;
}
