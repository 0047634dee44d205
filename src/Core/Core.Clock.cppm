module;
#include <chrono>

export module Core:Clock;

export namespace Core
{
    // Monotonic stopwatch. Elapsed() only advances on Update() so a whole frame
    // observes one consistent timestamp.
    class Clock
    {
    public:
        void Start();
        void Update();
        void Stop();

        [[nodiscard]] double Elapsed() const { return m_Elapsed; }
        [[nodiscard]] bool IsRunning() const { return m_Running; }

        // Seconds since an arbitrary fixed epoch, independent of Start/Stop.
        [[nodiscard]] static double Now();

    private:
        std::chrono::steady_clock::time_point m_StartTime{};
        double m_Elapsed = 0.0;
        bool m_Running = false;
    };
}
