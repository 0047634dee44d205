module;

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

export module Core:Tasks;
import :Error;

export namespace Core::Tasks
{
    // A fixed-size, non-allocating job entry wrapper. The callable reports success.
    class LocalTask
    {
        static constexpr size_t STORAGE_SIZE = 120;

        struct Concept
        {
            virtual ~Concept() = default;
            virtual bool Execute() = 0;
            virtual void MoveTo(void* dest) = 0;
        };

        template <typename T>
        struct Model final : Concept
        {
            T payload;

            explicit Model(T&& p) : payload(std::move(p))
            {
            }

            bool Execute() override { return payload(); }

            void MoveTo(void* dest) override
            {
                std::construct_at(static_cast<Model<T>*>(dest), std::move(payload));
            }
        };

        alignas(8) std::byte m_Storage[STORAGE_SIZE];
        Concept* m_VTable = nullptr;

    public:
        LocalTask() = default;

        template <typename F>
            requires (!std::is_same_v<std::decay_t<F>, LocalTask> && std::is_invocable_r_v<bool, std::decay_t<F>&>)
        LocalTask(F&& f)
        {
            using Type = std::decay_t<F>;
            static_assert(sizeof(Model<Type>) <= STORAGE_SIZE,
                          "Job entry capture is too big! Capture a pointer to shared state instead.");
            static_assert(alignof(Model<Type>) <= alignof(std::max_align_t),
                          "Job entry alignment requirement too strict.");

            auto* ptr = reinterpret_cast<Model<Type>*>(m_Storage);
            std::construct_at(ptr, Type(std::forward<F>(f)));
            m_VTable = ptr;
        }

        ~LocalTask();

        LocalTask(LocalTask&& other) noexcept;
        LocalTask& operator=(LocalTask&& other) noexcept;

        LocalTask(const LocalTask&) = delete;
        LocalTask& operator=(const LocalTask&) = delete;

        // Returns false for an empty task.
        bool operator()();

        [[nodiscard]] bool Valid() const { return m_VTable != nullptr; }
    };

    // Bit flags; a worker thread accepts every job whose type is in its mask.
    enum class JobType : uint8_t
    {
        General = 0x02,
        ResourceLoad = 0x04,
        GpuResource = 0x08,
    };

    [[nodiscard]] constexpr uint8_t ToMask(JobType type) { return static_cast<uint8_t>(type); }

    enum class JobPriority : uint8_t
    {
        Low,
        Normal,
        High,
    };

    struct JobInfo
    {
        JobType Type = JobType::General;
        JobPriority Priority = JobPriority::Normal;
        LocalTask Entry;
        // Both run on the thread that calls JobSystem::Update(), never on a worker.
        std::function<void()> OnSuccess;
        std::function<void()> OnFailure;
    };

    inline constexpr size_t MAX_JOB_RESULTS = 512;

    struct JobSystemConfig
    {
        // 0 picks hardware_concurrency - 1 (at least one).
        uint32_t ThreadCount = 0;
        // A single-threaded backend pins GPU work to worker 0 alongside resource loads.
        bool BackendIsMultithreaded = false;
        // Explicit per-thread masks; overrides the two fields above when non-empty.
        std::vector<uint8_t> TypeMasks;
    };

    class JobSystem
    {
    public:
        explicit JobSystem(const JobSystemConfig& config = {});
        ~JobSystem();

        JobSystem(const JobSystem&) = delete;
        JobSystem& operator=(const JobSystem&) = delete;

        // Fails with InvalidState after Shutdown(), InvalidArgument when no worker takes the job type.
        [[nodiscard]] Result Submit(JobInfo job);

        // Runs the completion callbacks of finished jobs on the calling thread.
        void Update();

        // Blocks until every submitted job has executed its entry.
        void WaitForIdle();

        void Shutdown();

        [[nodiscard]] uint32_t GetThreadCount() const;
        [[nodiscard]] uint8_t GetThreadMask(uint32_t threadIndex) const;
        [[nodiscard]] size_t GetPendingResultCount() const;

    private:
        struct Context;
        std::unique_ptr<Context> m_Ctx;

        void WorkerEntry(uint32_t threadIndex);
    };
}
