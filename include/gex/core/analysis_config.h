#pragma once

// Graph Explorer - Configuration
// Injectable configuration for the analysis pipeline. Hosts hook their own
// logging and profiling in here; everything is optional.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace gex {

// -----------------------------------------------------------------------------
// Profiling Interface (optional)
// -----------------------------------------------------------------------------
// Applications can inject profiling by implementing this interface.
// If not provided, profiling is a no-op.
class Profiler
{
public:
    virtual ~Profiler() = default;
    virtual void begin_scope(const char* name) = 0;
    virtual void end_scope() = 0;
};

// RAII scope guard for profiling
class Profile_scope
{
public:
    Profile_scope(Profiler* profiler, const char* name)
    :
        m_profiler(profiler)
    {
        if (m_profiler) {
            m_profiler->begin_scope(name);
        }
    }

    ~Profile_scope()
    {
        if (m_profiler) {
            m_profiler->end_scope();
        }
    }

    Profile_scope(const Profile_scope&) = delete;
    Profile_scope& operator=(const Profile_scope&) = delete;

private:
    Profiler* m_profiler;
};

// Macro helpers for proper __LINE__ expansion
#define GEX_CONCAT_IMPL(a, b) a##b
#define GEX_CONCAT(a, b) GEX_CONCAT_IMPL(a, b)

// Macro for scoped profiling (no-op if profiler is null)
#define GEX_PROFILE_SCOPE(profiler, name) \
    ::gex::Profile_scope GEX_CONCAT(gex_profile_scope_, __LINE__)((profiler), (name))

// -----------------------------------------------------------------------------
// Analysis Configuration
// -----------------------------------------------------------------------------
struct Analysis_config
{
    // --- Local slope ---
    // Neighbors taken on each side of the sample nearest to the centroid.
    std::size_t slope_window = 3;

    // --- Highlighted samples ---
    std::size_t highlight_count = 2;
    // When set, highlight selection is reproducible. Unset means a fresh
    // nondeterministic seed per session.
    std::optional<std::uint64_t> seed;

    // --- Input limits ---
    int         min_point_count = 10;  // equation mode domain
    std::size_t min_draw_points = 2;   // point mode

    // --- Logging (optional) ---
    std::function<void(const std::string&)> log_debug;
    std::function<void(const std::string&)> log_error;

    // --- Profiling (optional) ---
    std::shared_ptr<Profiler> profiler;

    void debug(const std::string& message) const
    {
        if (log_debug) {
            log_debug(message);
        }
    }

    void error(const std::string& message) const
    {
        if (log_error) {
            log_error(message);
        }
    }

    static Analysis_config make_default()
    {
        Analysis_config cfg;
        cfg.slope_window = 3;
        cfg.highlight_count = 2;
        cfg.min_point_count = 10;
        cfg.min_draw_points = 2;
        return cfg;
    }
};

} // namespace gex
