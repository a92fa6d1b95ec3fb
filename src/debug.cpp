/*
 * DeclMacro - Declarative macro expansion engine
 * - By John Hodge (Mutabah/thePowersGang)
 *
 * debug.cpp
 * - Debug printing (with indenting)
 */
#include <debug_inner.hpp>
#include <debug.hpp>
#include <set>
#include <iostream>
#include <atomic>
#include <cstring>	// strchr
#include <cstdlib>	// getenv

thread_local int g_debug_indent_level = 0;
thread_local bool g_debug_phase_enabled = true;
thread_local ::std::string g_cur_phase;
// Populated by `debug_init_phases` before any expansion starts, read-only afterwards
::std::set< ::std::string>    g_debug_disable_map;
::std::atomic<bool> g_debug_output_enabled { false };

TraceLog::TraceLog(const char* tag, ::std::function<void(::std::ostream&)> info_cb):
    m_tag(tag)
{
    if(debug_enabled() && m_tag) {
        auto& os = debug_output(g_debug_indent_level, m_tag);
        os << ">> (";
        info_cb(os);
        os << ")" << ::std::endl;
    }
    INDENT();
}
TraceLog::TraceLog(const char* tag):
    m_tag(tag)
{
    if(debug_enabled() && m_tag) {
        auto& os = debug_output(g_debug_indent_level, m_tag);
        os << ">>" << ::std::endl;
    }
    INDENT();
}
TraceLog::~TraceLog() {
    UNINDENT();
    if(debug_enabled() && m_tag) {
        auto& os = debug_output(g_debug_indent_level, m_tag);
        os << "<<" << ::std::endl;
    }
}


namespace {
    bool debug_phase_update() {
        return g_debug_disable_map.count(g_cur_phase) == 0;
    }
}
bool debug_enabled()
{
    return g_debug_phase_enabled && g_debug_output_enabled.load(::std::memory_order_relaxed);
}
void debug_set_output(bool enabled)
{
    g_debug_output_enabled = enabled;
}
::std::ostream& debug_output(int indent, const char* function)
{
    return ::std::cout << g_cur_phase << "- " << RepeatLitStr { " ", indent } << function << ": ";
}

DebugPhaseGuard::DebugPhaseGuard(const char* name):
    m_saved_phase(g_cur_phase)
{
    g_cur_phase = name;
    g_debug_phase_enabled = debug_phase_update();
}
DebugPhaseGuard::~DebugPhaseGuard()
{
    g_cur_phase = m_saved_phase;
    g_debug_phase_enabled = debug_phase_update();
}

extern void debug_init_phases(const char* env_var_name, std::initializer_list<const char*> il)
{
    for(const char* e : il)
    {
        g_debug_disable_map.insert(e);
    }

    // Mutate this map using an environment variable
    const char* debug_string = ::std::getenv(env_var_name);
    if( debug_string )
    {
        while( debug_string[0] )
        {
            const char* end = strchr(debug_string, ':');

            ::std::string   s;
            if( end )
            {
                s = ::std::string { debug_string, end };
                debug_string = end + 1;
            }
            else
            {
                s = debug_string;
            }
            if( g_debug_disable_map.erase(s) == 0 )
            {
                ::std::cerr << "WARN: Unknown phase '" << s << "' in $" << env_var_name << ::std::endl;
            }
            if( !end ) {
                break;
            }
        }
    }
    g_debug_phase_enabled = debug_phase_update();
}
