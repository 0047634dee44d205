module;
#include <cstddef>
#include <expected>
#include <utility>
#include <vector>

export module Core:RingQueue;
import :Error;

export namespace Core
{
    // Fixed-capacity FIFO over a single allocation. Not synchronized; owners that
    // share one across threads guard it themselves (see Tasks::JobSystem results).
    template <typename T>
    class RingQueue
    {
    public:
        explicit RingQueue(size_t capacity)
            : m_Buffer(capacity), m_Capacity(capacity)
        {
        }

        [[nodiscard]] Result Enqueue(T item)
        {
            if (IsFull()) return Err(ErrorCode::QueueFull);

            m_Buffer[m_Tail] = std::move(item);
            m_Tail = (m_Tail + 1) % m_Capacity;
            ++m_Count;
            return Ok();
        }

        [[nodiscard]] Expected<T> Dequeue()
        {
            if (IsEmpty()) return std::unexpected(ErrorCode::QueueEmpty);

            T item = std::move(m_Buffer[m_Head]);
            m_Head = (m_Head + 1) % m_Capacity;
            --m_Count;
            return item;
        }

        [[nodiscard]] Expected<T*> Peek()
        {
            if (IsEmpty()) return std::unexpected(ErrorCode::QueueEmpty);
            return &m_Buffer[m_Head];
        }

        [[nodiscard]] bool IsEmpty() const noexcept { return m_Count == 0; }
        [[nodiscard]] bool IsFull() const noexcept { return m_Count == m_Capacity; }
        [[nodiscard]] size_t Size() const noexcept { return m_Count; }
        [[nodiscard]] size_t Capacity() const noexcept { return m_Capacity; }

    private:
        std::vector<T> m_Buffer;
        size_t m_Capacity = 0;
        size_t m_Head = 0;
        size_t m_Tail = 0;
        size_t m_Count = 0;
    };
}
