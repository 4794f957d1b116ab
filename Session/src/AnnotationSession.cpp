#include <Session/AnnotationSession.hpp>
#include <Reconciliation/Reconciler.hpp>
#include <TabularIO/TabularReader.hpp>
#include <Timestamp/StampCodec.hpp>
#include <iostream>

namespace watchannotator::session
{
    namespace
    {
        // Clears the busy flag when a task leaves scope, however it leaves.
        struct BusyReset
        {
            std::atomic<bool> &busy;
            ~BusyReset() { busy = false; }
        };

        std::chrono::steady_clock::time_point now()
        {
            return std::chrono::steady_clock::now();
        }
    } // namespace

    AnnotationSession::AnnotationSession(bus::CommunicationBus &bus, const config::ViewerConfig &config)
        : m_bus(bus), m_config(config), m_sensors(config.sensors), m_gps(config.gps)
    {
    }

    AnnotationSession::~AnnotationSession()
    {
        wait();
    }

    ViewMode AnnotationSession::mode() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_mode;
    }

    bool AnnotationSession::setMode(ViewMode mode)
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mode == mode)
            return true;

        m_mode = mode;
        publishEvent(SystemEventType::ModeChanged, std::string("mode ") + toString(mode));
        publishView();
        return true;
    }

    nav::WindowCursor &AnnotationSession::activeCursor()
    {
        return m_mode == ViewMode::Sensors ? m_sensors.cursor() : m_gps.cursor();
    }

    bool AnnotationSession::navigate(bool (nav::WindowCursor::*move)())
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!(activeCursor().*move)())
            return false;

        publishView();
        return true;
    }

    bool AnnotationSession::stepForward()
    {
        return navigate(&nav::WindowCursor::stepForward);
    }

    bool AnnotationSession::stepBackward()
    {
        return navigate(&nav::WindowCursor::stepBackward);
    }

    bool AnnotationSession::growWindow()
    {
        return navigate(&nav::WindowCursor::growWindow);
    }

    bool AnnotationSession::shrinkWindow()
    {
        return navigate(&nav::WindowCursor::shrinkWindow);
    }

    bool AnnotationSession::gotoFraction(double fraction)
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!activeCursor().gotoFraction(fraction))
            return false;

        publishView();
        return true;
    }

    bool AnnotationSession::annotate(const std::string &label)
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mode != ViewMode::Sensors)
            return false;
        return m_sensors.annotate(label);
    }

    bool AnnotationSession::annotateWithKey(char key)
    {
        const auto label = labelForKey(key);
        if (!label)
            return false;
        return annotate(*label);
    }

    bool AnnotationSession::removeAnnotation()
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mode != ViewMode::Sensors)
            return false;
        return m_sensors.removeAnnotation();
    }

    bool AnnotationSession::addNote(const std::string &text)
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mode != ViewMode::Sensors)
            return false;
        return m_sensors.addNote(text);
    }

    data::TextSummary AnnotationSession::labelText() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mode != ViewMode::Sensors)
            return data::placeholderSummary();
        return m_sensors.labelText(m_config.labelLines, m_config.searchHorizon);
    }

    data::TextSummary AnnotationSession::noteText() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mode != ViewMode::Sensors)
            return data::placeholderSummary();
        return m_sensors.noteText(m_config.noteLines, m_config.searchHorizon);
    }

    bool AnnotationSession::annotate(const data::DataWindow &window)
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sensors.annotate(window);
    }

    bool AnnotationSession::removeAnnotation(const data::DataWindow &window)
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sensors.removeAnnotation(window);
    }

    bool AnnotationSession::markWindowValid()
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mode != ViewMode::Gps || !m_gps.markWindowValid())
            return false;

        publishView();
        return true;
    }

    bool AnnotationSession::markWindowInvalid()
    {
        if (m_busy)
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_mode != ViewMode::Gps || !m_gps.markWindowInvalid())
            return false;

        publishView();
        return true;
    }

    std::optional<std::string> AnnotationSession::labelForKey(char key) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.labelForKey(key);
    }

    bool AnnotationSession::load(const std::string &path)
    {
        bool expected = false;
        if (!m_busy.compare_exchange_strong(expected, true))
            return false;

        BusyReset reset{m_busy};
        runLoad(path);
        return true;
    }

    bool AnnotationSession::save(const std::string &path)
    {
        bool expected = false;
        if (!m_busy.compare_exchange_strong(expected, true))
            return false;

        BusyReset reset{m_busy};
        return runSave(path);
    }

    bool AnnotationSession::startLoad(const std::string &path)
    {
        return startTask(TaskKind::Load, path);
    }

    bool AnnotationSession::startSave(const std::string &path)
    {
        return startTask(TaskKind::Save, path);
    }

    bool AnnotationSession::startTask(TaskKind task, const std::string &path)
    {
        bool expected = false;
        if (!m_busy.compare_exchange_strong(expected, true))
            return false;

        // The previous worker has already released the busy flag; reap it.
        if (m_worker.joinable())
            m_worker.join();

        m_worker = std::jthread([this, task, path]
                                {
                                    BusyReset reset{m_busy};
                                    try
                                    {
                                        if (task == TaskKind::Load)
                                            runLoad(path);
                                        else
                                            runSave(path);
                                    }
                                    catch (const std::exception &e)
                                    {
                                        std::cerr << "[AnnotationSession] " << toString(task) << " of '" << path
                                                  << "' failed: " << e.what() << "\n";
                                    } });
        return true;
    }

    void AnnotationSession::wait()
    {
        if (m_worker.joinable())
            m_worker.join();
    }

    void AnnotationSession::runLoad(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        // The previous file is gone whether or not the new one opens.
        m_sensors.unload(m_gps);
        m_dataPath.clear();
        try
        {
            io::TabularReader reader(path);
            m_sensors.load(reader, m_gps, callbacksFor(TaskKind::Load));
        }
        catch (const std::exception &e)
        {
            publishFailure(TaskKind::Load, e.what());
            throw;
        }

        m_dataPath = path;
        publishEvent(SystemEventType::DataLoaded,
                     path + ": " + std::to_string(m_sensors.size()) + " records, " + std::to_string(m_gps.size()) + " GPS runs");
        publishView();
    }

    bool AnnotationSession::runSave(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::string target = path.empty() ? m_dataPath : path;

        bool wrote = false;
        try
        {
            merge::Reconciler::merge(m_sensors, m_gps, callbacksFor(TaskKind::Merge));
            wrote = m_sensors.save(target, callbacksFor(TaskKind::Save));
        }
        catch (const std::exception &e)
        {
            publishFailure(TaskKind::Save, e.what());
            throw;
        }

        if (wrote)
            publishEvent(SystemEventType::DataSaved, target + ": " + std::to_string(m_sensors.size()) + " records");
        else
            publishEvent(SystemEventType::NoChanges, "nothing to save");
        return wrote;
    }

    std::optional<config::ViewerConfig> AnnotationSession::applyConfig(const config::ViewerConfig &config)
    {
        if (m_busy)
            return std::nullopt;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;

        config::ViewerConfig effective = config;
        effective.sensors = m_sensors.applyWindowSettings(config.sensors);
        effective.gps = m_gps.applyWindowSettings(config.gps);

        publishEvent(SystemEventType::ConfigApplied,
                     "sensors window " + std::to_string(effective.sensors.length) + ", gps window " +
                         std::to_string(effective.gps.length));
        publishView();
        return effective;
    }

    config::ViewerConfig AnnotationSession::config() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    bool AnnotationSession::hasUnsavedChanges() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sensors.isDirty() || m_gps.isDirty();
    }

    WindowView AnnotationSession::windowView() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return makeView();
    }

    std::string AnnotationSession::dataPath() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dataPath;
    }

    ProgressCallbacks AnnotationSession::callbacksFor(TaskKind task)
    {
        ProgressCallbacks callbacks;
        callbacks.onProgress = [this, task](const std::string &message)
        {
            m_bus.publish(ProgressUpdate{now(), task, message});
        };
        callbacks.onComplete = [this, task]
        {
            m_bus.publish(TaskCompleted{now(), task, true, {}});
        };
        return callbacks;
    }

    void AnnotationSession::publishEvent(SystemEventType type, const std::string &description)
    {
        m_bus.publish(SystemEvent{now(), type, description});
    }

    void AnnotationSession::publishFailure(TaskKind task, const std::string &error)
    {
        m_bus.publish(TaskCompleted{now(), task, false, error});
    }

    void AnnotationSession::publishView()
    {
        m_bus.publish(makeView());
    }

    WindowView AnnotationSession::makeView() const
    {
        WindowView view;
        view.timestamp = now();
        view.mode = m_mode;
        view.first_stamp = "...";
        view.last_stamp = "...";

        if (m_mode == ViewMode::Sensors)
        {
            const nav::WindowCursor &cursor = m_sensors.cursor();
            view.size = m_sensors.size();
            if (!cursor.isActive())
                return view;

            view.start_index = cursor.startIndex();
            view.length = cursor.length();
            view.first_row = cursor.startIndex();
            view.last_row = cursor.lastIndex();
            view.first_stamp = time::StampCodec::format(m_sensors.stampAt(view.first_row));
            view.last_stamp = time::StampCodec::format(m_sensors.stampAt(view.last_row));
            for (std::size_t i = view.first_row; i <= view.last_row; ++i)
            {
                if (!m_sensors.isGpsValid(i))
                    ++view.invalid_count;
            }
            return view;
        }

        const nav::WindowCursor &cursor = m_gps.cursor();
        view.size = m_gps.size();
        const auto rows = m_gps.windowRowRange();
        if (!cursor.isActive() || !rows)
            return view;

        view.start_index = cursor.startIndex();
        view.length = cursor.length();
        view.first_row = rows->first;
        view.last_row = rows->second;
        view.first_stamp = time::StampCodec::format(m_gps.run(cursor.startIndex()).start_stamp);
        view.last_stamp = time::StampCodec::format(m_gps.run(cursor.lastIndex()).last_stamp);
        for (std::size_t i = cursor.startIndex(); i <= cursor.lastIndex(); ++i)
        {
            if (!m_gps.run(i).is_valid)
                ++view.invalid_count;
        }
        return view;
    }
} // namespace watchannotator::session
