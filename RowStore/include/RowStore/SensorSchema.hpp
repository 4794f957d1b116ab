#pragma once

#include <TabularIO/Schema.hpp>
#include <optional>
#include <string_view>

namespace watchannotator::data
{
    inline constexpr std::string_view kStampField = "stamp";
    inline constexpr std::string_view kLatitudeField = "latitude";
    inline constexpr std::string_view kLongitudeField = "longitude";
    inline constexpr std::string_view kGpsValidField = "is_gps_valid";
    inline constexpr std::string_view kActivityLabelField = "activity_label";
    inline constexpr std::string_view kUserActivityLabelField = "user_activity_label";
    inline constexpr std::string_view kNotesField = "notes";
    inline constexpr std::string_view kBatteryStateField = "battery_state";

    /// File schema extended to the fixed superset of reserved fields. Reserved fields missing
    /// from the file are appended (as strings) so every loaded record carries them, and the
    /// presence flags remember which ones came from the file.
    struct SensorSchema
    {
        io::Schema columns;

        std::size_t stamp{0};
        std::optional<std::size_t> latitude;
        std::optional<std::size_t> longitude;
        std::optional<std::size_t> batteryState;
        std::size_t gpsValid{0};
        std::size_t activityLabel{0};
        std::size_t userActivityLabel{0};
        std::size_t notes{0};

        bool hasGpsValid{false};
        bool hasActivityLabel{false};
        bool hasUserActivityLabel{false};
        bool hasNotes{false};

        // Values appended to each incoming row for the reserved fields the file lacks.
        io::Row appendedDefaults;

        /// Throws io::SchemaError when `stamp` is missing or a reserved field has the wrong type.
        [[nodiscard]] static SensorSchema resolve(const io::Schema &fileSchema);

        /// Number of columns present in the file itself.
        [[nodiscard]] std::size_t fileColumnCount() const noexcept { return columns.size() - appendedDefaults.size(); }

        /// Extends a row read from the file to the full column set.
        void fillDefaults(io::Row &row) const;
    };

    [[nodiscard]] bool validityOf(const io::Value &value) noexcept;
    [[nodiscard]] io::Value validityValue(bool valid, io::FieldType type);
} // namespace watchannotator::data
