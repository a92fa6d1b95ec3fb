/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/bindings.hpp
 * - Metavariable bindings captured by the matcher
 */
#pragma once
#include "macro_rules.hpp"
#include <tagged_union.hpp>

/// Tokens captured by one `$name:frag`
struct CapturedFragment
{
    MacroPatEnt::Type   type;
    /// View into the invocation's argument tree
    TokenTreeSlice  slice;

    CapturedFragment(MacroPatEnt::Type type, TokenTreeSlice slice):
        type(type),
        slice(slice)
    {
    }

    friend ::std::ostream& operator<<(::std::ostream& os, const CapturedFragment& x);
};

TAGGED_UNION(Binding, Unbound,
    (Unbound, struct {}),
    (Fragment, CapturedFragment),
    /// One entry per iteration of the enclosing repetition
    (Repeat, ::std::vector<Binding>)
    );
extern ::std::ostream& operator<<(::std::ostream& os, const Binding& x);

/// Binding environment for one macro arm (one slot per parameter name)
class ParameterMappings
{
    ::std::vector<Binding>  m_slots;
public:
    ParameterMappings()
    {
    }
    ParameterMappings(size_t count);

    ParameterMappings(ParameterMappings&&) = default;
    ParameterMappings& operator=(ParameterMappings&&) = default;

    size_t size() const { return m_slots.size(); }

    /// Bind the fragment captured by `ent`, errors if the name is already bound
    void bind(const MacroPatEnt& ent, CapturedFragment frag);
    /// Bind the names declared within the repetition `loop_ent`, one iteration per entry of `iterations`
    void bind_repetition(const MacroPatEnt& loop_ent, ::std::vector<ParameterMappings> iterations);

    /// Obtain the fragment for a name, descending through repetitions using `iterations`
    const CapturedFragment& get(unsigned int name_index, const ::std::vector<unsigned int>& iterations) const;
    /// Number of iterations the name repeats at the depth of `iterations`
    ///
    /// Returns false if the name doesn't repeat at that depth
    bool repeat_count(unsigned int name_index, const ::std::vector<unsigned int>& iterations, size_t& out_count) const;

    const Binding& slot(unsigned int name_index) const { return m_slots.at(name_index); }

    /// Enumerate the name indexes declared directly or indirectly within a pattern
    static void enumerate_names(const ::std::vector<MacroPatEnt>& pats, ::std::vector<const MacroPatEnt*>& out);

    friend ::std::ostream& operator<<(::std::ostream& os, const ParameterMappings& x);
};
