module;
#include <cstdint>
#include <source_location>
#include <chrono>

export module Core:Profiling;

import :Logging;

export namespace Core::Profiling
{
    // Scope timer for tick phases. Reports through Log::Debug; a scope that runs
    // past its budget is always reported as a warning, even in release builds.
    struct ScopedTimer
    {
        const char* Name;
        std::source_location Loc;
        std::chrono::steady_clock::time_point Start;
        uint64_t BudgetUs;

        ScopedTimer(const char* name, uint64_t budgetUs = 0,
                    std::source_location loc = std::source_location::current())
            : Name(name),
              Loc(loc),
              Start(std::chrono::steady_clock::now()),
              BudgetUs(budgetUs)
        {
        }

        ~ScopedTimer()
        {
            const auto end = std::chrono::steady_clock::now();
            const auto dur = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::microseconds>(end - Start).count());

            if (BudgetUs != 0 && dur > BudgetUs)
            {
                Log::Warn("[PROFILE] {} took {} us (budget {} us) at {}:{}",
                          Name, dur, BudgetUs, Loc.file_name(), Loc.line());
                return;
            }
            Log::Debug("[PROFILE] {} took {} us", Name, dur);
        }
    };
}
