/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * include/debug_inner.hpp
 * - Debug phase control
 */
#pragma once
#include <initializer_list>
#include <string>

/// Disable the listed phases unless named in the (colon separated) environment variable
extern void debug_init_phases(const char* env_var_name, std::initializer_list<const char*> il);

/// Sets the current phase, restoring the previous on drop
class DebugPhaseGuard
{
    ::std::string   m_saved_phase;
public:
    DebugPhaseGuard(const char* name);
    ~DebugPhaseGuard();
};
