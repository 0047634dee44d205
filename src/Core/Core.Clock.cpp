module;
#include <chrono>

module Core;

namespace Core
{
    void Clock::Start()
    {
        m_StartTime = std::chrono::steady_clock::now();
        m_Elapsed = 0.0;
        m_Running = true;
    }

    void Clock::Update()
    {
        if (!m_Running) return;
        m_Elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - m_StartTime).count();
    }

    void Clock::Stop()
    {
        m_Running = false;
    }

    double Clock::Now()
    {
        return std::chrono::duration<double>(std::chrono::steady_clock::now().time_since_epoch()).count();
    }
}
