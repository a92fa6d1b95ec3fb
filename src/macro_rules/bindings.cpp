/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * macro_rules/bindings.cpp
 * - Metavariable bindings captured by the matcher
 */
#include <common.hpp>
#include "bindings.hpp"
#include "macro_error.hpp"

::std::ostream& operator<<(::std::ostream& os, const CapturedFragment& x)
{
    return os << MacroPatEnt::type_name(x.type) << ":" << x.slice;
}
::std::ostream& operator<<(::std::ostream& os, const Binding& x)
{
    TU_MATCH_HDRA( (x), {)
    TU_ARMA(Unbound, e) {
        os << "-";
        }
    TU_ARMA(Fragment, e) {
        os << e;
        }
    TU_ARMA(Repeat, e) {
        os << "[" << e << "]";
        }
    }
    return os;
}

ParameterMappings::ParameterMappings(size_t count):
    m_slots(count)
{
}

void ParameterMappings::bind(const MacroPatEnt& ent, CapturedFragment frag)
{
    assert(ent.is_fragment());
    if( ent.name_index == NAMEDVALUE_IGNORE )
        return ;
    ASSERT_BUG(ent.sp, ent.name_index < m_slots.size(), "Name index out of range - " << ent.name_index << " >= " << m_slots.size());
    DEBUG("$" << ent.name << " #" << ent.name_index << " = " << frag);
    auto& slot = m_slots[ent.name_index];
    if( !slot.is_Unbound() )
    {
        Token   tok = frag.slice.empty() ? Token() : frag.slice[0].first_token();
        throw MacroError(MacroErrorKind::DuplicateMetavariableBinding, ent.sp, mv$(tok), "",
            FMT("Duplicate binding for metavariable $" << ent.name));
    }
    slot = Binding::make_Fragment(mv$(frag));
}

void ParameterMappings::bind_repetition(const MacroPatEnt& loop_ent, ::std::vector<ParameterMappings> iterations)
{
    assert(loop_ent.type == MacroPatEnt::PAT_LOOP);
    ::std::vector<const MacroPatEnt*>   names;
    enumerate_names(loop_ent.subpats, names);
    DEBUG("loop #" << loop_ent.name_index << " x" << iterations.size());

    for(const auto* ent : names)
    {
        auto& slot = m_slots[ent->name_index];
        if( !slot.is_Unbound() )
        {
            throw MacroError(MacroErrorKind::DuplicateMetavariableBinding, ent->sp,
                FMT("Duplicate binding for metavariable $" << ent->name << " (repeated at a different depth)"));
        }
        ::std::vector<Binding>  ents;
        ents.reserve(iterations.size());
        for(auto& it : iterations)
        {
            assert(it.m_slots.size() == m_slots.size());
            ents.push_back( mv$(it.m_slots[ent->name_index]) );
            // Leave a marker so a second declaration of the same name is not moved twice
            it.m_slots[ent->name_index] = Binding::make_Unbound({});
        }
        slot = Binding::make_Repeat(mv$(ents));
    }
}

const CapturedFragment& ParameterMappings::get(unsigned int name_index, const ::std::vector<unsigned int>& iterations) const
{
    ASSERT_BUG(Span(), name_index < m_slots.size(), "Name index out of range - " << name_index);
    const Binding* b = &m_slots[name_index];
    for(auto idx : iterations)
    {
        if( !b->is_Repeat() )
            break;
        const auto& r = b->as_Repeat();
        ASSERT_BUG(Span(), idx < r.size(), "Iteration " << idx << " out of range for #" << name_index << " (" << r.size() << ")");
        b = &r[idx];
    }
    if( !b->is_Fragment() )
        BUG(Span(), "Metavariable #" << name_index << " [" << iterations << "] is " << b->tag_str() << ", not a fragment");
    return b->as_Fragment();
}

bool ParameterMappings::repeat_count(unsigned int name_index, const ::std::vector<unsigned int>& iterations, size_t& out_count) const
{
    ASSERT_BUG(Span(), name_index < m_slots.size(), "Name index out of range - " << name_index);
    const Binding* b = &m_slots[name_index];
    for(auto idx : iterations)
    {
        if( !b->is_Repeat() )
            return false;
        const auto& r = b->as_Repeat();
        if( idx >= r.size() )
            return false;
        b = &r[idx];
    }
    if( !b->is_Repeat() )
        return false;
    out_count = b->as_Repeat().size();
    return true;
}

void ParameterMappings::enumerate_names(const ::std::vector<MacroPatEnt>& pats, ::std::vector<const MacroPatEnt*>& out)
{
    for(const auto& pat : pats)
    {
        if( pat.type == MacroPatEnt::PAT_LOOP ) {
            enumerate_names(pat.subpats, out);
        }
        else if( pat.is_fragment() && pat.name_index != NAMEDVALUE_IGNORE ) {
            bool seen = false;
            for(const auto* e : out)
                seen |= (e->name_index == pat.name_index);
            if( !seen )
                out.push_back(&pat);
        }
    }
}

::std::ostream& operator<<(::std::ostream& os, const ParameterMappings& x)
{
    for(size_t i = 0; i < x.m_slots.size(); i ++)
    {
        os << "#" << i << "=" << x.m_slots[i] << " ";
    }
    return os;
}
