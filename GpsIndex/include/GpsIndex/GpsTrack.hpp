#pragma once

#include <Timestamp/StampCodec.hpp>
#include <WindowCursor/WindowCursor.hpp>
#include <Eigen/Core>
#include <Eigen/Geometry>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace watchannotator::gps
{
    // One maximal run of consecutive rows sharing the same fix.
    struct GpsRun
    {
        Eigen::Vector2d coordinate{Eigen::Vector2d::Zero()}; // (longitude, latitude) in degrees
        time::Stamp start_stamp{};
        time::Stamp last_stamp{};
        std::size_t count{0};
        bool is_valid{true};

        // Inclusive row range in the sensor store.
        std::size_t first_row_index{0};
        std::size_t last_row_index{0};

        [[nodiscard]] double longitude() const noexcept { return coordinate.x(); }
        [[nodiscard]] double latitude() const noexcept { return coordinate.y(); }
    };

    // GPS fields of one sensor row, as fed during ingestion.
    struct GpsSample
    {
        std::optional<double> latitude;
        std::optional<double> longitude;
        time::Stamp stamp{};
        bool is_gps_valid{true};
    };

    /// Run-length compacted GPS track with its own navigation window.
    class GpsTrack
    {
    public:
        static constexpr double kEarthRadiusMeters = 6371000.0;

        explicit GpsTrack(const nav::WindowSettings &settings = {50, 5, 5});

        // Ingestion, driven by the sensor store.
        void loadInit();
        void extend(const GpsSample &sample, std::size_t rowIndex);
        void loadEnd();

        /// Sets is_valid on every run in the current window. No-op while empty.
        bool markWindow(bool valid);
        bool markWindowValid() { return markWindow(true); }
        bool markWindowInvalid() { return markWindow(false); }

        nav::WindowSettings applyWindowSettings(const nav::WindowSettings &settings) noexcept;

        [[nodiscard]] nav::WindowCursor &cursor() noexcept { return m_cursor; }
        [[nodiscard]] const nav::WindowCursor &cursor() const noexcept { return m_cursor; }

        [[nodiscard]] bool hasData() const noexcept { return m_cursor.isActive(); }
        [[nodiscard]] std::size_t size() const noexcept { return m_runs.size(); }
        [[nodiscard]] const std::vector<GpsRun> &runs() const noexcept { return m_runs; }
        [[nodiscard]] const GpsRun &run(std::size_t index) const { return m_runs.at(index); }

        [[nodiscard]] bool isDirty() const noexcept { return m_dirty; }
        void clearDirty() noexcept { m_dirty = false; }

        /// Sensor rows spanned by the runs of the current window.
        [[nodiscard]] std::optional<std::pair<std::size_t, std::size_t>> windowRowRange() const;

        /// Run positions in local east/north metres around the first fix, one column per run.
        [[nodiscard]] const Eigen::Matrix2Xd &projection() const noexcept { return m_projection; }
        [[nodiscard]] Eigen::Matrix2Xd windowProjection() const;
        [[nodiscard]] Eigen::AlignedBox2d windowBounds() const;

        [[nodiscard]] std::string firstStamp() const;
        [[nodiscard]] std::string currentStamp() const;
        [[nodiscard]] std::string lastStamp() const;

    private:
        void rebuildProjection();

        std::vector<GpsRun> m_runs;
        nav::WindowCursor m_cursor;
        Eigen::Matrix2Xd m_projection;
        bool m_dirty{false};
    };
} // namespace watchannotator::gps
