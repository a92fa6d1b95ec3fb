/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * include/rc_string.hpp
 * - Reference-counted string (used for identifiers and spans)
 */
#pragma once

#include <atomic>
#include <cstring>
#include <ostream>
#include "../common.hpp"

/// Immutable string with a shared (atomic) reference count, copies are a pointer copy
class RcString
{
    struct Inner;
    Inner*  m_ptr;

    void acquire();
    void release();
public:
    RcString(): m_ptr(nullptr) {}
    RcString(const char* s, size_t len);
    RcString(const char* s): RcString(s, ::std::strlen(s)) {}
    explicit RcString(const ::std::string& s): RcString(s.data(), s.size()) {}

    RcString(const RcString& x): m_ptr(x.m_ptr) { acquire(); }
    RcString(RcString&& x): m_ptr(x.m_ptr) { x.m_ptr = nullptr; }
    ~RcString() { release(); }

    RcString& operator=(RcString x) {
        ::std::swap(m_ptr, x.m_ptr);
        return *this;
    }

    size_t size() const;
    const char* c_str() const;
    const char* begin() const { return c_str(); }
    const char* end() const { return c_str() + size(); }

    Ordering ord(const char* s, size_t l) const;
    Ordering ord(const RcString& s) const {
        return m_ptr == s.m_ptr ? OrdEqual : ord(s.c_str(), s.size());
    }
    Ordering ord(const ::std::string& s) const { return ord(s.data(), s.size()); }
    Ordering ord(const char* s) const { return ord(s, ::std::strlen(s)); }

    template<typename T>
    bool operator==(const T& s) const { return this->ord(s) == OrdEqual; }
    template<typename T>
    bool operator!=(const T& s) const { return this->ord(s) != OrdEqual; }
    bool operator<(const RcString& s) const { return this->ord(s) == OrdLess; }
    bool operator>(const RcString& s) const { return this->ord(s) == OrdGreater; }

    friend ::std::ostream& operator<<(::std::ostream& os, const RcString& x);

    friend bool operator==(const char* a, const RcString& b) { return b == a; }
    friend bool operator!=(const char* a, const RcString& b) { return b != a; }
};

namespace std {
    static inline bool operator==(const string& a, const ::RcString& b) {
        return b == a;
    }
    static inline bool operator!=(const string& a, const ::RcString& b) {
        return b != a;
    }
}
