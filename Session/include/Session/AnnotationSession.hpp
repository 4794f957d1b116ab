#pragma once

#include <CommunicationBus/CommunicationBus.hpp>
#include <Config/ViewerConfig.hpp>
#include <GpsIndex/GpsTrack.hpp>
#include <RowStore/SensorStore.hpp>
#include <WatchAnnotator/Messages.hpp>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace watchannotator::session
{
    /// One review session over a data file: the sensor store, its GPS track and the active mode.
    ///
    /// Navigation acts on the cursor of the active mode and publishes a WindowView after every
    /// change. Label and note edits need Sensors mode, validity marking needs Gps mode. Load and
    /// save publish ProgressUpdate and TaskCompleted on the bus, and can run on a worker thread;
    /// while one is in flight every mutating call returns false.
    class AnnotationSession
    {
    public:
        AnnotationSession(bus::CommunicationBus &bus, const config::ViewerConfig &config = {});
        ~AnnotationSession();

        AnnotationSession(const AnnotationSession &) = delete;
        AnnotationSession &operator=(const AnnotationSession &) = delete;

        [[nodiscard]] ViewMode mode() const;
        bool setMode(ViewMode mode);

        bool stepForward();
        bool stepBackward();
        bool growWindow();
        bool shrinkWindow();
        bool gotoFraction(double fraction);

        // Sensors mode only.
        bool annotate(const std::string &label);
        bool annotateWithKey(char key);
        bool removeAnnotation();
        bool addNote(const std::string &text);
        [[nodiscard]] data::TextSummary labelText() const;
        [[nodiscard]] data::TextSummary noteText() const;

        // Explicit windows, any mode.
        bool annotate(const data::DataWindow &window);
        bool removeAnnotation(const data::DataWindow &window);

        // Gps mode only.
        bool markWindowValid();
        bool markWindowInvalid();

        [[nodiscard]] std::optional<std::string> labelForKey(char key) const;

        /// Loads `path` on the calling thread. Returns false if a task is already running;
        /// load failures propagate after a failed TaskCompleted has been published.
        bool load(const std::string &path);

        /// Merges GPS edits, then writes to `path` (or the loaded file when empty).
        /// Returns whether anything was written.
        bool save(const std::string &path = {});

        // Same work on the session worker thread; false if a task is already running.
        bool startLoad(const std::string &path);
        bool startSave(const std::string &path = {});
        void wait();
        [[nodiscard]] bool isBusy() const noexcept { return m_busy.load(); }

        /// Pushes the window settings to both cursors and returns the settings in effect.
        std::optional<config::ViewerConfig> applyConfig(const config::ViewerConfig &config);
        [[nodiscard]] config::ViewerConfig config() const;

        [[nodiscard]] bool hasUnsavedChanges() const;
        [[nodiscard]] WindowView windowView() const;
        [[nodiscard]] std::string dataPath() const;

        // Direct access for inspection; not to be used while a task is running.
        [[nodiscard]] const data::SensorStore &sensors() const noexcept { return m_sensors; }
        [[nodiscard]] const gps::GpsTrack &gps() const noexcept { return m_gps; }

    private:
        bool navigate(bool (nav::WindowCursor::*move)());
        [[nodiscard]] nav::WindowCursor &activeCursor();

        void runLoad(const std::string &path);
        bool runSave(const std::string &path);
        bool startTask(TaskKind task, const std::string &path);

        [[nodiscard]] ProgressCallbacks callbacksFor(TaskKind task);
        void publishEvent(SystemEventType type, const std::string &description);
        void publishFailure(TaskKind task, const std::string &error);
        void publishView();
        [[nodiscard]] WindowView makeView() const;

        bus::CommunicationBus &m_bus;
        config::ViewerConfig m_config;

        data::SensorStore m_sensors;
        gps::GpsTrack m_gps;
        ViewMode m_mode{ViewMode::Sensors};
        std::string m_dataPath;

        mutable std::mutex m_mutex;
        std::atomic<bool> m_busy{false};
        std::jthread m_worker;
    };
} // namespace watchannotator::session
