#include <Strata/Diagnostics.hpp>

#include <atomic>
#include <iostream>

namespace Strata::Diagnostics
{
    namespace
    {
        std::atomic<Sink> g_sink {nullptr};

        void WriteToStandardError(Severity severity, std::string_view component, std::string_view message) noexcept
        {
            std::cerr << '[' << component << "] ";
            if (severity == Severity::Error)
                std::cerr << "error: ";
            std::cerr << message << std::endl;
        }
    }// namespace

    Sink SetSink(Sink sink) noexcept
    {
        return g_sink.exchange(sink, std::memory_order_acq_rel);
    }

    void Write(Severity severity, std::string_view component, std::string_view message) noexcept
    {
        if (const Sink sink = g_sink.load(std::memory_order_acquire))
        {
            sink(severity, component, message);
            return;
        }
        WriteToStandardError(severity, component, message);
    }
}// namespace Strata::Diagnostics
