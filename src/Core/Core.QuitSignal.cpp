module;
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>

module Core:QuitSignal.Impl;
import :QuitSignal;
import :Logging;

namespace Core
{
    namespace
    {
        std::atomic<std::atomic<bool>*> s_InterruptFlag{nullptr};

        static_assert(std::atomic<bool>::is_always_lock_free,
                      "Interrupt handler requires a lock-free flag");

        void OnInterrupt(int)
        {
            if (std::atomic<bool>* flag = s_InterruptFlag.load(std::memory_order_acquire))
            {
                flag->store(true, std::memory_order_release);
            }
        }
    }

    QuitSignal::~QuitSignal()
    {
        RemoveInterruptHandler();
    }

    void QuitSignal::Request()
    {
        {
            std::lock_guard lock(m_WaitMutex);
            m_Requested.store(true, std::memory_order_release);
        }
        m_WaitCv.notify_all();
    }

    void QuitSignal::Reset()
    {
        std::lock_guard lock(m_WaitMutex);
        m_Requested.store(false, std::memory_order_release);
    }

    bool QuitSignal::WaitFor(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(m_WaitMutex);
        return m_WaitCv.wait_for(lock, timeout, [this]
        {
            return m_Requested.load(std::memory_order_acquire);
        });
    }

    void QuitSignal::InstallInterruptHandler()
    {
        s_InterruptFlag.store(&m_Requested, std::memory_order_release);
        std::signal(SIGINT, OnInterrupt);
        std::signal(SIGTERM, OnInterrupt);
        m_HandlerInstalled = true;
        Log::Debug("QuitSignal: interrupt handler installed");
    }

    void QuitSignal::RemoveInterruptHandler()
    {
        if (!m_HandlerInstalled) return;

        std::atomic<bool>* expected = &m_Requested;
        if (s_InterruptFlag.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel))
        {
            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
        }
        m_HandlerInstalled = false;
    }
}
