/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * include/ident.hpp
 * - Identifiers with hygiene
 */
#pragma once
#include <atomic>
#include <vector>
#include <string>
#include <memory>
#include <rc_string.hpp>

struct Ident
{
    /// Ordered list of the expansion contexts an identifier was introduced under
    class Hygiene
    {
        static ::std::atomic<unsigned> g_next_scope;

        struct Inner {
            ::std::vector<unsigned int> contexts;
        };
        // NOTE: Use a unique pointer to reduce the size to 1 pointer
        ::std::unique_ptr<Inner>    m_inner;

        Hygiene(unsigned int index):
            m_inner(new Inner())
        {
            m_inner->contexts.push_back(index);
        }
              Inner* operator->()       { return &*m_inner; }
        const Inner* operator->() const { return &*m_inner; }
    public:
        Hygiene():
            m_inner(new Inner())
        {}
        Hygiene(const Hygiene& x):
            m_inner(new Inner(*x.m_inner))
        {
        }
        Hygiene& operator=(const Hygiene& x) {
            *this = Hygiene(x);
            return *this;
        }

        Hygiene(Hygiene&& x): m_inner(std::move(x.m_inner)) {
        }
        Hygiene& operator=(Hygiene&& x) {
            m_inner.reset(x.m_inner.release());
            return *this;
        }

        /// Allocates a fresh context number (thread-safe)
        static unsigned new_context()
        {
            return ++g_next_scope;
        }
        /// Hygiene for a fresh top-level scope (e.g. one source file)
        static Hygiene new_scope()
        {
            return Hygiene(new_context());
        }
        /// Copy of this hygiene with `context` appended
        Hygiene stamped(unsigned context) const
        {
            Hygiene rv;
            rv->contexts.reserve( m_inner->contexts.size() + 1 );
            rv->contexts.insert( rv->contexts.begin(),  m_inner->contexts.begin(), m_inner->contexts.end() );
            rv->contexts.push_back( context );
            return rv;
        }
        const ::std::vector<unsigned>& contexts() const { return m_inner->contexts; }

        // Returns true if an ident with hygine `source` can see an ident with this hygine
        bool is_visible(const Hygiene& source) const;
        Ordering ord(const Hygiene& x) const { ORD(m_inner->contexts, x->contexts); return OrdEqual; }
        bool operator==(const Hygiene& x) const { return ord(x) == OrdEqual; }
        bool operator!=(const Hygiene& x) const { return ord(x) != OrdEqual; }
        bool operator<(const Hygiene& x) const { return ord(x) == OrdLess; }

        friend ::std::ostream& operator<<(::std::ostream& os, const Hygiene& v);
    };

    Hygiene hygiene;
    RcString   name;

    Ident(const char* name):
        hygiene(),
        name(name)
    { }
    Ident(RcString name):
        hygiene(),
        name(::std::move(name))
    { }
    Ident(Hygiene hygiene, RcString name):
        hygiene(::std::move(hygiene)), name(::std::move(name))
    { }

    Ident(Ident&& x) = default;
    Ident(const Ident& x) = default;
    Ident& operator=(Ident&& x) = default;
    Ident& operator=(const Ident& x) = default;

    bool operator==(const char* s) const {
        return this->name == s;
    }

    // NOTE: Spelling only, hygiene is ignored (see `same_binding`)
    bool operator==(const Ident& x) const {
        return this->name == x.name;
    }
    bool operator!=(const Ident& x) const {
        return !(*this == x);
    }
    bool operator<(const Ident& x) const {
        if(this->name != x.name)
            return this->name < x.name;
        if(this->hygiene != x.hygiene)
            return this->hygiene < x.hygiene;
        return false;
    }
    /// True if both identifiers would resolve to the same binding (same spelling and hygiene)
    bool same_binding(const Ident& x) const {
        return this->name == x.name && this->hygiene == x.hygiene;
    }

    friend ::std::ostream& operator<<(::std::ostream& os, const Ident& x);
};
