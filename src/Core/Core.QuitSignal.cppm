module;
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

export module Core:QuitSignal;

export namespace Core
{
    // -------------------------------------------------------------------------
    // QuitSignal - explicit cancellation token for the tick loop
    // -------------------------------------------------------------------------
    // Owned by the application and shared by reference with the session driver
    // and whoever reacts to external lifecycle events (interrupt handler,
    // platform Destroy event). Once requested it stays requested until Reset().
    //
    // WaitFor() is the only blocking call: a bounded sleep that returns early when
    // Request() is called from another thread. A request coming from the
    // interrupt handler only sets the flag (signal-safe), so it is observed at the
    // latest when the current bounded wait times out.
    // -------------------------------------------------------------------------
    class QuitSignal
    {
    public:
        QuitSignal() = default;
        ~QuitSignal();

        QuitSignal(const QuitSignal&) = delete;
        QuitSignal& operator=(const QuitSignal&) = delete;

        void Request();
        void Reset();

        [[nodiscard]] bool IsRequested() const noexcept
        {
            return m_Requested.load(std::memory_order_acquire);
        }

        // Returns true if quit was requested before or during the wait.
        bool WaitFor(std::chrono::milliseconds timeout);

        // Routes SIGINT/SIGTERM into this signal. Only one QuitSignal can be the
        // interrupt target at a time; installing again retargets the handler.
        void InstallInterruptHandler();
        void RemoveInterruptHandler();

    private:
        std::atomic<bool> m_Requested{false};
        std::mutex m_WaitMutex;
        std::condition_variable m_WaitCv;
        bool m_HandlerInstalled = false;
    };
}
