#pragma once

#include <functional>
#include <queue>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>

#include <WatchAnnotator/Messages.hpp>

namespace watchannotator::bus
{
    struct BusConfig
    {
        bool dropOnOverflow = false;
        std::size_t maxQueueSizePerType = 1024;
    };

    class CommunicationBus
    {
    public:
        using ProgressUpdateHandler = std::function<void(const ProgressUpdate &)>;
        using TaskCompletedHandler = std::function<void(const TaskCompleted &)>;
        using SystemEventHandler = std::function<void(const SystemEvent &)>;
        using WindowViewHandler = std::function<void(const WindowView &)>;

        explicit CommunicationBus(const BusConfig &config = {});
        ~CommunicationBus();

        CommunicationBus(const CommunicationBus &) = delete;
        CommunicationBus &operator=(const CommunicationBus &) = delete;

        void start();
        // Delivers whatever is still queued, then joins the worker.
        void stop();

        // Publish API - thread-safe
        void publish(const ProgressUpdate &update);
        void publish(const TaskCompleted &completed);
        void publish(const SystemEvent &event);
        void publish(const WindowView &view);

        // Subscription API - call before start()
        void subscribe(ProgressUpdateHandler handler);
        void subscribe(TaskCompletedHandler handler);
        void subscribe(SystemEventHandler handler);
        void subscribe(WindowViewHandler handler);

        [[nodiscard]] std::size_t droppedCount() const noexcept { return m_dropped.load(); }

    private:
        template <typename Message>
        void enqueue(std::queue<Message> &queue, const Message &message);

        template <typename Message, typename Handler>
        static void dispatch(std::queue<Message> &pending, const std::vector<Handler> &handlers);

        // Single worker, deterministic fan-out per message type
        void workerLoop(std::stop_token st);

        BusConfig m_config{};

        std::queue<ProgressUpdate> m_progressQueue;
        std::queue<TaskCompleted> m_completedQueue;
        std::queue<SystemEvent> m_systemEventQueue;
        std::queue<WindowView> m_windowViewQueue;

        std::vector<ProgressUpdateHandler> m_progressHandlers;
        std::vector<TaskCompletedHandler> m_completedHandlers;
        std::vector<SystemEventHandler> m_systemEventHandlers;
        std::vector<WindowViewHandler> m_windowViewHandlers;

        // Synchronization
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_hasWork{false};

        std::atomic<bool> m_running{false};
        std::atomic<std::size_t> m_dropped{0};
        std::jthread m_worker;
    }; // class CommunicationBus
} // namespace watchannotator::bus
