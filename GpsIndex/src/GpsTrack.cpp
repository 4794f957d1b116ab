#include <GpsIndex/GpsTrack.hpp>
#include <cmath>

namespace watchannotator::gps
{
    namespace
    {
        constexpr double kDegToRad = 3.14159265358979323846 / 180.0;
        const std::string kNoStamp = "...";
    } // namespace

    GpsTrack::GpsTrack(const nav::WindowSettings &settings) : m_cursor(nav::CursorPolicy::gps(), settings) {}

    void GpsTrack::loadInit()
    {
        m_runs.clear();
        m_projection.resize(2, 0);
        m_cursor.reset();
        m_dirty = false;
    }

    void GpsTrack::extend(const GpsSample &sample, std::size_t rowIndex)
    {
        if (!sample.latitude || !sample.longitude)
            return;

        const Eigen::Vector2d coordinate(*sample.longitude, *sample.latitude);
        if (m_runs.empty() || m_runs.back().coordinate != coordinate)
        {
            GpsRun run;
            run.coordinate = coordinate;
            run.start_stamp = sample.stamp;
            run.last_stamp = sample.stamp;
            run.count = 1;
            run.is_valid = sample.is_gps_valid;
            run.first_row_index = rowIndex;
            run.last_row_index = rowIndex;
            m_runs.push_back(run);
            return;
        }

        GpsRun &current = m_runs.back();
        ++current.count;
        current.last_stamp = sample.stamp;
        current.last_row_index = rowIndex;
    }

    void GpsTrack::loadEnd()
    {
        m_cursor.activate(m_runs.size());
        m_dirty = false;
        rebuildProjection();
    }

    bool GpsTrack::markWindow(bool valid)
    {
        if (!m_cursor.isActive())
            return false;

        for (std::size_t i = m_cursor.startIndex(); i <= m_cursor.lastIndex(); ++i)
            m_runs[i].is_valid = valid;

        m_dirty = true;
        return true;
    }

    nav::WindowSettings GpsTrack::applyWindowSettings(const nav::WindowSettings &settings) noexcept
    {
        return m_cursor.applyWindowSizePolicy(settings);
    }

    std::optional<std::pair<std::size_t, std::size_t>> GpsTrack::windowRowRange() const
    {
        if (!m_cursor.isActive())
            return std::nullopt;
        return std::make_pair(m_runs[m_cursor.startIndex()].first_row_index,
                              m_runs[m_cursor.lastIndex()].last_row_index);
    }

    Eigen::Matrix2Xd GpsTrack::windowProjection() const
    {
        if (!m_cursor.isActive())
            return Eigen::Matrix2Xd(2, 0);
        return m_projection.middleCols(static_cast<Eigen::Index>(m_cursor.startIndex()),
                                       static_cast<Eigen::Index>(m_cursor.length()));
    }

    Eigen::AlignedBox2d GpsTrack::windowBounds() const
    {
        Eigen::AlignedBox2d box;
        const Eigen::Matrix2Xd points = windowProjection();
        for (Eigen::Index i = 0; i < points.cols(); ++i)
            box.extend(points.col(i));
        return box;
    }

    std::string GpsTrack::firstStamp() const
    {
        if (!m_cursor.isActive())
            return kNoStamp;
        return time::StampCodec::format(m_runs[m_cursor.length() - 1].start_stamp);
    }

    std::string GpsTrack::currentStamp() const
    {
        if (!m_cursor.isActive())
            return kNoStamp;
        return time::StampCodec::format(m_runs[m_cursor.lastIndex()].start_stamp);
    }

    std::string GpsTrack::lastStamp() const
    {
        if (!m_cursor.isActive())
            return kNoStamp;
        return time::StampCodec::format(m_runs.back().last_stamp);
    }

    void GpsTrack::rebuildProjection()
    {
        const auto n = static_cast<Eigen::Index>(m_runs.size());
        if (n == 0)
        {
            m_projection.resize(2, 0);
            return;
        }

        Eigen::Matrix2Xd degrees(2, n);
        for (Eigen::Index i = 0; i < n; ++i)
            degrees.col(i) = m_runs[static_cast<std::size_t>(i)].coordinate;

        // Equirectangular approximation around the first fix.
        const Eigen::Vector2d origin = degrees.col(0);
        const Eigen::Vector2d scale(kEarthRadiusMeters * kDegToRad * std::cos(origin.y() * kDegToRad),
                                    kEarthRadiusMeters * kDegToRad);
        m_projection = scale.asDiagonal() * (degrees.colwise() - origin);
    }
} // namespace watchannotator::gps
