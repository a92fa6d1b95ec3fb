/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * common.hpp
 * - Library-global common header
 */
#ifndef COMMON_HPP_INCLUDED
#define COMMON_HPP_INCLUDED

#include <iostream>
#include <vector>
#include <set>
#include <cassert>
#include <sstream>
#include <memory>

#define FMT(ss)    (static_cast<::std::ostringstream&&>(::std::ostringstream() << ss).str())
// Short alias for ::std::move
#define mv$(...) ::std::move(__VA_ARGS__)

#include "include/debug.hpp"
#include "include/compile_error.hpp"

enum Ordering
{
    OrdLess = -1,
    OrdEqual,
    OrdGreater,
};

namespace ord_helpers {
    template<typename T>
    Ordering by_less(const T& l, const T& r) {
        if( l < r )   return OrdLess;
        if( r < l )   return OrdGreater;
        return OrdEqual;
    }
}
static inline Ordering ord(int l, int r) { return ord_helpers::by_less(l, r); }
static inline Ordering ord(unsigned l, unsigned r) { return ord_helpers::by_less(l, r); }
static inline Ordering ord(unsigned long l, unsigned long r) { return ord_helpers::by_less(l, r); }
static inline Ordering ord(unsigned long long l, unsigned long long r) { return ord_helpers::by_less(l, r); }
static inline Ordering ord(const ::std::string& l, const ::std::string& r) { return ord_helpers::by_less(l, r); }
/// Class types provide their own `ord` method
template<typename T>
Ordering ord(const T& l, const T& r)
{
    return l.ord(r);
}
/// Lexicographic, a prefix sorts first
template<typename T>
Ordering ord(const ::std::vector<T>& l, const ::std::vector<T>& r)
{
    for(size_t i = 0; i < l.size() && i < r.size(); i ++)
    {
        auto rv = ::ord(l[i], r[i]);
        if( rv != OrdEqual )
            return rv;
    }
    return ::ord(l.size(), r.size());
}
#define ORD(a,b)    do { Ordering ORD_rv = ::ord(a,b); if( ORD_rv != ::OrdEqual )   return ORD_rv; } while(0)

namespace fmt_helpers {
    template <typename C>
    ::std::ostream& print_comma_list(::std::ostream& os, const C& c) {
        const char* sep = "";
        for( const auto& e : c ) {
            os << sep << e;
            sep = ", ";
        }
        return os;
    }
}

namespace std {

template <typename T>
inline ::std::ostream& operator<<(::std::ostream& os, const ::std::vector<T>& v) {
    return ::fmt_helpers::print_comma_list(os, v);
}
template <typename T>
inline ::std::ostream& operator<<(::std::ostream& os, const ::std::set<T>& v) {
    return ::fmt_helpers::print_comma_list(os, v);
}

}   // namespace std

#endif
