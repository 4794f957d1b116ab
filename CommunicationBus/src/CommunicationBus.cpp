#include <CommunicationBus/CommunicationBus.hpp>

namespace watchannotator::bus
{
    CommunicationBus::CommunicationBus(const BusConfig &config) : m_config(config) {}

    CommunicationBus::~CommunicationBus()
    {
        stop();
    }

    void CommunicationBus::start()
    {
        bool expected = false;

        // Only the first caller flips m_running and spawns the worker.
        if (!m_running.compare_exchange_strong(expected, true))
        {
            return;
        }

        m_worker = std::jthread([this](std::stop_token st)
                                { workerLoop(st); });
    }

    void CommunicationBus::stop()
    {
        if (!m_worker.joinable())
            return;

        m_worker.request_stop();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hasWork = true; // wake up worker to exit
        }
        m_cv.notify_one();
        m_worker.join();
        m_running = false;
    }

    template <typename Message>
    void CommunicationBus::enqueue(std::queue<Message> &queue, const Message &message)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_config.dropOnOverflow && queue.size() >= m_config.maxQueueSizePerType)
            {
                ++m_dropped;
            }
            else
            {
                queue.push(message);
            }

            m_hasWork = true;
        }
        m_cv.notify_one();
    }

    void CommunicationBus::publish(const ProgressUpdate &update)
    {
        enqueue(m_progressQueue, update);
    }

    void CommunicationBus::publish(const TaskCompleted &completed)
    {
        enqueue(m_completedQueue, completed);
    }

    void CommunicationBus::publish(const SystemEvent &event)
    {
        enqueue(m_systemEventQueue, event);
    }

    void CommunicationBus::publish(const WindowView &view)
    {
        enqueue(m_windowViewQueue, view);
    }

    void CommunicationBus::subscribe(ProgressUpdateHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_progressHandlers.emplace_back(std::move(handler));
    }
    void CommunicationBus::subscribe(TaskCompletedHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_completedHandlers.emplace_back(std::move(handler));
    }
    void CommunicationBus::subscribe(SystemEventHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_systemEventHandlers.emplace_back(std::move(handler));
    }
    void CommunicationBus::subscribe(WindowViewHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_windowViewHandlers.emplace_back(std::move(handler));
    }

    template <typename Message, typename Handler>
    void CommunicationBus::dispatch(std::queue<Message> &pending, const std::vector<Handler> &handlers)
    {
        while (!pending.empty())
        {
            const auto &msg = pending.front();
            for (const auto &h : handlers)
            {
                if (h)
                {
                    h(msg);
                }
            }
            pending.pop();
        }
    }

    void CommunicationBus::workerLoop(std::stop_token st)
    {
        while (true)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&]
                      { return m_hasWork || st.stop_requested(); });

            std::queue<ProgressUpdate> progress;
            std::queue<TaskCompleted> completed;
            std::queue<SystemEvent> systemEvents;
            std::queue<WindowView> windowViews;

            progress.swap(m_progressQueue);
            completed.swap(m_completedQueue);
            systemEvents.swap(m_systemEventQueue);
            windowViews.swap(m_windowViewQueue);

            m_hasWork = false;
            lock.unlock();

            dispatch(progress, m_progressHandlers);
            dispatch(completed, m_completedHandlers);
            dispatch(systemEvents, m_systemEventHandlers);
            dispatch(windowViews, m_windowViewHandlers);

            if (st.stop_requested())
            {
                std::lock_guard<std::mutex> relock(m_mutex);
                if (m_progressQueue.empty() && m_completedQueue.empty() && m_systemEventQueue.empty() &&
                    m_windowViewQueue.empty())
                    break;
            }
        }
    }
} // namespace watchannotator::bus
