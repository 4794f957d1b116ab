#include <RowStore/SensorStore.hpp>
#include <TabularIO/TabularWriter.hpp>
#include <Timestamp/StampCodec.hpp>
#include <algorithm>

namespace watchannotator::data
{
    namespace
    {
        const std::string kNoStamp = "...";

        struct TextRun
        {
            std::size_t first;
            std::size_t last;
        };

        std::size_t entriesOf(const TextRun &run) noexcept
        {
            return run.first == run.last ? 1 : 2;
        }
    } // namespace

    TextSummary placeholderSummary()
    {
        return TextSummary{SummaryEntry{}};
    }

    SensorStore::SensorStore(const nav::WindowSettings &settings) : m_cursor(nav::CursorPolicy::sensor(), settings) {}

    void SensorStore::clear() noexcept
    {
        m_schema = SensorSchema{};
        m_records.clear();
        m_knownLabels.clear();
        m_cursor.reset();
        m_dirty = false;
    }

    void SensorStore::unload(gps::GpsTrack &gps)
    {
        clear();
        gps.loadInit();
    }

    void SensorStore::load(io::RecordSource &source, gps::GpsTrack &gps, const ProgressCallbacks &callbacks)
    {
        clear();
        gps.loadInit();

        try
        {
            m_schema = SensorSchema::resolve(source.schema());

            io::Row row;
            std::size_t count = 0;
            while (source.next(row))
            {
                m_schema.fillDefaults(row);

                const auto *stamp = std::get_if<time::Stamp>(&row[m_schema.stamp]);
                if (stamp == nullptr)
                    throw io::ParseError("record " + std::to_string(count + 1) + " has no stamp");

                if (count % kLoadProgressInterval == 0)
                {
                    callbacks.progress("Loading file...\n" + std::to_string(count) + " rows loaded\nAt stamp: " +
                                       time::StampCodec::format(*stamp));
                }

                if (const auto *label = std::get_if<std::string>(&row[m_schema.activityLabel]))
                    m_knownLabels.insert(*label);

                gps.extend(gpsSample(row), count);
                m_records.push_back(std::move(row));
                row = io::Row{};
                ++count;
            }
        }
        catch (...)
        {
            clear();
            gps.loadInit();
            throw;
        }

        if (!m_records.empty())
        {
            gps.loadEnd();
            m_cursor.activate(m_records.size());
        }
        m_dirty = false;
        callbacks.complete();
    }

    void SensorStore::reportNoChanges(const ProgressCallbacks &callbacks)
    {
        callbacks.progress("No changes to sensor data, nothing to save");
        callbacks.complete();
    }

    bool SensorStore::save(const std::string &path, const ProgressCallbacks &callbacks)
    {
        if (!m_dirty)
        {
            reportNoChanges(callbacks);
            return false;
        }

        io::TabularWriter writer(path);
        return save(writer, callbacks);
    }

    bool SensorStore::save(io::RecordSink &sink, const ProgressCallbacks &callbacks)
    {
        if (!m_dirty)
        {
            reportNoChanges(callbacks);
            return false;
        }

        sink.writeHeader(m_schema.columns);
        for (std::size_t i = 0; i < m_records.size(); ++i)
        {
            if (i % kSaveProgressInterval == 0)
                callbacks.progress("Saving to data file...\nAt " + formatPercent(i, m_records.size()) + "% of the data...");
            sink.writeRow(m_records[i]);
        }
        sink.finish();

        m_dirty = false;
        callbacks.complete();
        return true;
    }

    bool SensorStore::annotate(const std::string &label)
    {
        if (label.empty() || !m_cursor.isActive())
            return false;
        return assignLabel(m_cursor.startIndex(), m_cursor.lastIndex(), label);
    }

    bool SensorStore::removeAnnotation()
    {
        if (!m_cursor.isActive())
            return false;
        return assignLabel(m_cursor.startIndex(), m_cursor.lastIndex(), std::nullopt);
    }

    bool SensorStore::annotate(const DataWindow &window)
    {
        if (window.label.empty())
            return false;
        return assignLabel(window.first, window.last, window.label);
    }

    bool SensorStore::removeAnnotation(const DataWindow &window)
    {
        return assignLabel(window.first, window.last, std::nullopt);
    }

    bool SensorStore::assignLabel(std::size_t first, std::size_t last, const std::optional<std::string> &label)
    {
        if (first > last || last >= m_records.size())
            return false;

        for (std::size_t i = first; i <= last; ++i)
        {
            if (label)
                m_records[i][m_schema.activityLabel] = *label;
            else
                m_records[i][m_schema.activityLabel] = std::monostate{};
        }

        if (label)
            m_knownLabels.insert(*label);
        m_dirty = true;
        return true;
    }

    bool SensorStore::addNote(const std::string &text)
    {
        if (!m_cursor.isActive())
            return false;

        io::Value &note = m_records[m_cursor.lastIndex()][m_schema.notes];
        if (text.empty())
            note = std::monostate{};
        else
            note = text;

        m_dirty = true;
        return true;
    }

    TextSummary SensorStore::labelText(std::size_t maxLines, std::chrono::microseconds horizon) const
    {
        if (!m_cursor.isActive())
            return placeholderSummary();
        return summarize(m_schema.activityLabel, m_cursor.lastIndex(), maxLines, horizon);
    }

    TextSummary SensorStore::labelText(const DataWindow &window, std::size_t maxLines, std::chrono::microseconds horizon) const
    {
        return labelTextAt(window.last, maxLines, horizon);
    }

    TextSummary SensorStore::labelTextAt(std::size_t anchor, std::size_t maxLines, std::chrono::microseconds horizon) const
    {
        return summarize(m_schema.activityLabel, anchor, maxLines, horizon);
    }

    TextSummary SensorStore::noteText(std::size_t maxLines, std::chrono::microseconds horizon) const
    {
        if (!m_cursor.isActive())
            return placeholderSummary();
        return summarize(m_schema.notes, m_cursor.lastIndex(), maxLines, horizon);
    }

    TextSummary SensorStore::noteText(const DataWindow &window, std::size_t maxLines, std::chrono::microseconds horizon) const
    {
        return noteTextAt(window.last, maxLines, horizon);
    }

    TextSummary SensorStore::noteTextAt(std::size_t anchor, std::size_t maxLines, std::chrono::microseconds horizon) const
    {
        return summarize(m_schema.notes, anchor, maxLines, horizon);
    }

    TextSummary SensorStore::summarize(std::size_t column, std::size_t anchor, std::size_t maxLines,
                                       std::chrono::microseconds horizon) const
    {
        if (anchor >= m_records.size())
            return placeholderSummary();

        maxLines = std::max<std::size_t>(maxLines, 1);
        const time::Stamp anchorStamp = stampAt(anchor);

        std::size_t lo = anchor;
        while (lo > 0 && stampAt(lo - 1) >= anchorStamp - horizon)
            --lo;
        std::size_t hi = anchor;
        while (hi + 1 < m_records.size() && stampAt(hi + 1) <= anchorStamp + horizon)
            ++hi;

        std::vector<TextRun> runs;
        std::size_t anchorRun = 0;
        for (std::size_t i = lo; i <= hi; ++i)
        {
            if (runs.empty() || textAt(column, i) != textAt(column, runs.back().first))
                runs.push_back(TextRun{i, i});
            else
                runs.back().last = i;

            if (i == anchor)
                anchorRun = runs.size() - 1;
        }

        // Grow outwards from the anchor run, backward first, while whole runs still fit.
        const std::size_t anchorEntries = std::min(entriesOf(runs[anchorRun]), maxLines);
        std::size_t used = anchorEntries;
        std::size_t begin = anchorRun;
        std::size_t end = anchorRun + 1;
        bool backwardOpen = true;
        bool forwardOpen = true;
        while (backwardOpen || forwardOpen)
        {
            if (backwardOpen)
            {
                if (begin > 0 && used + entriesOf(runs[begin - 1]) <= maxLines)
                {
                    --begin;
                    used += entriesOf(runs[begin]);
                }
                else
                {
                    backwardOpen = false;
                }
            }

            if (forwardOpen)
            {
                if (end < runs.size() && used + entriesOf(runs[end]) <= maxLines)
                {
                    used += entriesOf(runs[end]);
                    ++end;
                }
                else
                {
                    forwardOpen = false;
                }
            }
        }

        TextSummary summary;
        for (std::size_t r = begin; r < end; ++r)
        {
            const TextRun &run = runs[r];
            const bool isAnchor = r == anchorRun;
            summary.push_back(SummaryEntry{SummaryEntryKind::Value, run.first, stampAt(run.first),
                                           textAt(column, run.first), isAnchor});

            const bool showEllipsis = run.first != run.last && (!isAnchor || anchorEntries == 2);
            if (showEllipsis)
                summary.push_back(SummaryEntry{SummaryEntryKind::Ellipsis, run.last, stampAt(run.last), std::nullopt, isAnchor});
        }
        return summary;
    }

    bool SensorStore::setGpsValid(std::size_t first, std::size_t last, bool valid)
    {
        if (first > last || last >= m_records.size())
            return false;

        const io::Value flag = validityValue(valid, m_schema.columns.field(m_schema.gpsValid).type);
        for (std::size_t i = first; i <= last; ++i)
            m_records[i][m_schema.gpsValid] = flag;
        return true;
    }

    nav::WindowSettings SensorStore::applyWindowSettings(const nav::WindowSettings &settings) noexcept
    {
        return m_cursor.applyWindowSizePolicy(settings);
    }

    std::optional<io::Value> SensorStore::value(std::size_t index, std::string_view field) const
    {
        const auto column = m_schema.columns.indexOf(field);
        if (!column)
            return std::nullopt;
        return m_records.at(index)[*column];
    }

    time::Stamp SensorStore::stampAt(std::size_t index) const
    {
        return std::get<time::Stamp>(m_records.at(index)[m_schema.stamp]);
    }

    std::optional<std::string> SensorStore::labelAt(std::size_t index) const
    {
        return textAt(m_schema.activityLabel, index);
    }

    std::optional<std::string> SensorStore::noteAt(std::size_t index) const
    {
        return textAt(m_schema.notes, index);
    }

    bool SensorStore::isGpsValid(std::size_t index) const
    {
        return validityOf(m_records.at(index)[m_schema.gpsValid]);
    }

    std::optional<std::string> SensorStore::textAt(std::size_t column, std::size_t index) const
    {
        if (const auto *text = std::get_if<std::string>(&m_records.at(index)[column]))
            return *text;
        return std::nullopt;
    }

    gps::GpsSample SensorStore::gpsSample(const io::Row &row) const
    {
        gps::GpsSample sample;
        sample.stamp = std::get<time::Stamp>(row[m_schema.stamp]);
        sample.is_gps_valid = validityOf(row[m_schema.gpsValid]);

        if (m_schema.latitude)
        {
            if (const auto *lat = std::get_if<double>(&row[*m_schema.latitude]))
                sample.latitude = *lat;
        }
        if (m_schema.longitude)
        {
            if (const auto *lon = std::get_if<double>(&row[*m_schema.longitude]))
                sample.longitude = *lon;
        }
        return sample;
    }

    std::string SensorStore::firstStamp() const
    {
        if (!m_cursor.isActive())
            return kNoStamp;
        return time::StampCodec::format(stampAt(m_cursor.length() - 1));
    }

    std::string SensorStore::currentStamp() const
    {
        if (!m_cursor.isActive())
            return kNoStamp;
        return time::StampCodec::format(stampAt(m_cursor.lastIndex()));
    }

    std::string SensorStore::lastStamp() const
    {
        if (!m_cursor.isActive())
            return kNoStamp;
        return time::StampCodec::format(stampAt(m_records.size() - 1));
    }
} // namespace watchannotator::data
