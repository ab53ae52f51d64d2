#pragma once
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <mpi.h>
#include <mutex>
#include <string>
#include <utility>

/**
 * @file Log.hpp
 * @brief Leveled printf-style logging with an optional host sink.
 *
 * @details
 * Messages go to stderr with a level tag unless a sink has been installed with
 * :cpp:func:`set_sink`, in which case the formatted message and its level are handed to the
 * sink instead. A host runtime uses this to fold the core's events into its own logger.
 * Verbosity comes from :cpp:struct:`Config` or the ``WAVEGRID_LOG`` environment variable.
 */

namespace wavegrid::master::logx
{

enum class Level : int
{
    Quiet = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

struct Config
{
    Level level = Level::Info; // default verbosity (overridden by WAVEGRID_LOG if level==Info)
    bool rank0_only = false;   // gate INFO/DEBUG to rank 0
};

using Sink = std::function<void(Level, const std::string&)>;

inline int g_rank = 0;
inline std::atomic<Level> g_level{Level::Info};
inline std::atomic<bool> g_rank0_only{false};

inline std::mutex& sink_mutex()
{
    static std::mutex m;
    return m;
}

inline Sink& sink_slot()
{
    static Sink s;
    return s;
}

inline Level level_from_string(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "quiet")
        return Level::Quiet;
    if (s == "error")
        return Level::Error;
    if (s == "warn" || s == "warning")
        return Level::Warn;
    if (s == "debug" || s == "full")
        return Level::Debug;
    return Level::Info;
}

inline Level level_from_env()
{
    const char* v = std::getenv("WAVEGRID_LOG");
    if (!v)
        return Level::Info;
    return level_from_string(v);
}

inline void init(const Config& cfg = {})
{
    int inited = 0;
    MPI_Initialized(&inited);
    if (inited)
        MPI_Comm_rank(MPI_COMM_WORLD, &g_rank);

    g_level.store(cfg.level == Level::Info ? level_from_env() : cfg.level);
    g_rank0_only.store(cfg.rank0_only);
}

// Route messages to a host logger; an empty function restores stderr.
inline void set_sink(Sink s)
{
    std::lock_guard<std::mutex> lk(sink_mutex());
    sink_slot() = std::move(s);
}

inline const char* level_tag(Level L)
{
    switch (L)
    {
    case Level::Error:
        return "[error] ";
    case Level::Warn:
        return "[warn ] ";
    case Level::Info:
        return "[info ] ";
    case Level::Debug:
        return "[debug] ";
    default:
        return "";
    }
}

inline bool gate(Level L)
{
    if (L > g_level.load())
        return true; // filtered by level
    if (g_rank0_only.load() && g_rank != 0 && L >= Level::Info)
        return true;
    return false;
}

inline void vprint(Level L, const char* fmt, va_list ap)
{
    if (gate(L))
        return;

    Sink sink;
    {
        std::lock_guard<std::mutex> lk(sink_mutex());
        sink = sink_slot();
    }
    if (sink)
    {
        va_list aq;
        va_copy(aq, ap);
        const int n = std::vsnprintf(nullptr, 0, fmt, aq);
        va_end(aq);
        std::string msg(n > 0 ? static_cast<std::size_t>(n) : 0u, '\0');
        if (n > 0)
            std::vsnprintf(msg.data(), msg.size() + 1, fmt, ap);
        sink(L, msg);
        return;
    }

    std::fputs(level_tag(L), stderr);
    if (g_rank != 0 && L >= Level::Info)
        std::fprintf(stderr, "[r%d] ", g_rank);
    std::vfprintf(stderr, fmt, ap);
    std::fflush(stderr);
}

inline void print(Level L, const char* fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    vprint(L, fmt, ap);
    va_end(ap);
}

// Convenience
#define LOGD(...) ::wavegrid::master::logx::print(::wavegrid::master::logx::Level::Debug, __VA_ARGS__)
#define LOGI(...) ::wavegrid::master::logx::print(::wavegrid::master::logx::Level::Info, __VA_ARGS__)
#define LOGW(...) ::wavegrid::master::logx::print(::wavegrid::master::logx::Level::Warn, __VA_ARGS__)
#define LOGE(...) ::wavegrid::master::logx::print(::wavegrid::master::logx::Level::Error, __VA_ARGS__)

} // namespace wavegrid::master::logx
