#pragma once

#include <GpsIndex/GpsTrack.hpp>
#include <RowStore/SensorSchema.hpp>
#include <TabularIO/RecordStream.hpp>
#include <WatchAnnotator/Progress.hpp>
#include <WindowCursor/WindowCursor.hpp>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace watchannotator::data
{
    // Explicit inclusive row range, optionally carrying the label to apply.
    struct DataWindow
    {
        std::size_t first{0};
        std::size_t last{0};
        std::string label;
    };

    enum class SummaryEntryKind
    {
        Value,
        Ellipsis // the preceding value repeats up to row_index
    };

    struct SummaryEntry
    {
        SummaryEntryKind kind{SummaryEntryKind::Ellipsis};
        std::size_t row_index{0};
        time::Stamp stamp{};
        std::optional<std::string> text;
        bool is_anchor{false};
    };

    using TextSummary = std::vector<SummaryEntry>;

    /// The "nothing to show" summary: a single ellipsis entry.
    [[nodiscard]] TextSummary placeholderSummary();

    /// Owns every loaded sensor record and the sensor navigation window.
    class SensorStore
    {
    public:
        static constexpr std::size_t kLoadProgressInterval = 1000;
        static constexpr std::size_t kSaveProgressInterval = 500;

        explicit SensorStore(const nav::WindowSettings &settings = {});

        /// Replaces the current data with the rows of `source`, feeding `gps` as it goes.
        /// Exceptions from the source propagate; the store and track are left empty.
        void load(io::RecordSource &source, gps::GpsTrack &gps, const ProgressCallbacks &callbacks = {});

        /// Drops all records and edits, leaving the store and `gps` empty.
        void unload(gps::GpsTrack &gps);

        /// Writes all records to `sink` when there are unsaved changes. Returns whether it wrote.
        bool save(io::RecordSink &sink, const ProgressCallbacks &callbacks = {});
        /// Same, writing a tabular file. The file is only opened (and truncated) when there is
        /// something to write.
        bool save(const std::string &path, const ProgressCallbacks &callbacks = {});

        // Current window [start, start + length).
        bool annotate(const std::string &label);
        bool removeAnnotation();
        // Explicit window, both ends inclusive.
        bool annotate(const DataWindow &window);
        bool removeAnnotation(const DataWindow &window);

        /// Attaches `text` to the last record of the current window; empty text clears the note.
        bool addNote(const std::string &text);

        [[nodiscard]] TextSummary labelText(std::size_t maxLines, std::chrono::microseconds horizon) const;
        [[nodiscard]] TextSummary labelText(const DataWindow &window, std::size_t maxLines, std::chrono::microseconds horizon) const;
        [[nodiscard]] TextSummary labelTextAt(std::size_t anchor, std::size_t maxLines, std::chrono::microseconds horizon) const;
        [[nodiscard]] TextSummary noteText(std::size_t maxLines, std::chrono::microseconds horizon) const;
        [[nodiscard]] TextSummary noteText(const DataWindow &window, std::size_t maxLines, std::chrono::microseconds horizon) const;
        [[nodiscard]] TextSummary noteTextAt(std::size_t anchor, std::size_t maxLines, std::chrono::microseconds horizon) const;

        /// Writes the validity flag into rows [first, last]. Used by the reconciler.
        bool setGpsValid(std::size_t first, std::size_t last, bool valid);

        void markDirty() noexcept { m_dirty = true; }
        [[nodiscard]] bool isDirty() const noexcept { return m_dirty; }

        nav::WindowSettings applyWindowSettings(const nav::WindowSettings &settings) noexcept;

        [[nodiscard]] nav::WindowCursor &cursor() noexcept { return m_cursor; }
        [[nodiscard]] const nav::WindowCursor &cursor() const noexcept { return m_cursor; }

        [[nodiscard]] bool hasData() const noexcept { return m_cursor.isActive(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_records.size(); }
        [[nodiscard]] const SensorSchema &schema() const noexcept { return m_schema; }
        [[nodiscard]] const io::Row &record(std::size_t index) const { return m_records.at(index); }
        [[nodiscard]] const std::set<std::string> &knownLabels() const noexcept { return m_knownLabels; }

        /// Lookup by field name; std::nullopt when the field does not exist.
        [[nodiscard]] std::optional<io::Value> value(std::size_t index, std::string_view field) const;

        [[nodiscard]] time::Stamp stampAt(std::size_t index) const;
        [[nodiscard]] std::optional<std::string> labelAt(std::size_t index) const;
        [[nodiscard]] std::optional<std::string> noteAt(std::size_t index) const;
        [[nodiscard]] bool isGpsValid(std::size_t index) const;

        [[nodiscard]] std::string firstStamp() const;
        [[nodiscard]] std::string currentStamp() const;
        [[nodiscard]] std::string lastStamp() const;

    private:
        void clear() noexcept;
        static void reportNoChanges(const ProgressCallbacks &callbacks);
        bool assignLabel(std::size_t first, std::size_t last, const std::optional<std::string> &label);
        [[nodiscard]] std::optional<std::string> textAt(std::size_t column, std::size_t index) const;
        [[nodiscard]] TextSummary summarize(std::size_t column, std::size_t anchor, std::size_t maxLines,
                                            std::chrono::microseconds horizon) const;
        [[nodiscard]] gps::GpsSample gpsSample(const io::Row &row) const;

        SensorSchema m_schema;
        std::vector<io::Row> m_records;
        nav::WindowCursor m_cursor;
        std::set<std::string> m_knownLabels;
        bool m_dirty{false};
    };
} // namespace watchannotator::data
