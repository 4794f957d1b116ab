#include <RowStore/SensorSchema.hpp>
#include <initializer_list>
#include <string>

namespace watchannotator::data
{
    namespace
    {
        void requireType(const io::Schema &schema, std::size_t index, std::initializer_list<io::FieldType> allowed)
        {
            const io::FieldSpec &field = schema.field(index);
            for (auto type : allowed)
            {
                if (field.type == type)
                    return;
            }
            throw io::SchemaError("field '" + field.name + "' has unsupported type '" +
                                  std::string(io::typeTag(field.type)) + "'");
        }

        // Index of a reserved string field, appending it with `fallback` when absent.
        std::size_t resolveOrAppend(SensorSchema &schema, std::string_view name, io::Value fallback, bool &present)
        {
            if (auto index = schema.columns.indexOf(name))
            {
                present = true;
                return *index;
            }

            present = false;
            schema.columns.append(io::FieldSpec{std::string(name), io::FieldType::String});
            schema.appendedDefaults.push_back(std::move(fallback));
            return schema.columns.size() - 1;
        }
    } // namespace

    SensorSchema SensorSchema::resolve(const io::Schema &fileSchema)
    {
        SensorSchema schema;
        schema.columns = fileSchema;

        const auto stamp = fileSchema.indexOf(kStampField);
        if (!stamp)
            throw io::SchemaError("required field 'stamp' is missing");
        requireType(fileSchema, *stamp, {io::FieldType::DateTime});
        schema.stamp = *stamp;

        schema.latitude = fileSchema.indexOf(kLatitudeField);
        if (schema.latitude)
            requireType(fileSchema, *schema.latitude, {io::FieldType::Float});

        schema.longitude = fileSchema.indexOf(kLongitudeField);
        if (schema.longitude)
            requireType(fileSchema, *schema.longitude, {io::FieldType::Float});

        schema.batteryState = fileSchema.indexOf(kBatteryStateField);

        schema.activityLabel = resolveOrAppend(schema, kActivityLabelField, std::monostate{}, schema.hasActivityLabel);
        schema.userActivityLabel = resolveOrAppend(schema, kUserActivityLabelField, std::monostate{}, schema.hasUserActivityLabel);
        schema.gpsValid = resolveOrAppend(schema, kGpsValidField, validityValue(true, io::FieldType::String), schema.hasGpsValid);
        schema.notes = resolveOrAppend(schema, kNotesField, std::monostate{}, schema.hasNotes);

        requireType(schema.columns, schema.activityLabel, {io::FieldType::String});
        requireType(schema.columns, schema.userActivityLabel, {io::FieldType::String});
        requireType(schema.columns, schema.notes, {io::FieldType::String});
        requireType(schema.columns, schema.gpsValid, {io::FieldType::String, io::FieldType::Float});

        return schema;
    }

    void SensorSchema::fillDefaults(io::Row &row) const
    {
        if (row.size() != fileColumnCount())
        {
            throw io::SchemaError("row has " + std::to_string(row.size()) + " values, expected " +
                                  std::to_string(fileColumnCount()));
        }
        row.insert(row.end(), appendedDefaults.begin(), appendedDefaults.end());
    }

    bool validityOf(const io::Value &value) noexcept
    {
        if (const auto *text = std::get_if<std::string>(&value))
            return !(*text == "0" || *text == "False" || *text == "false");
        if (const auto *number = std::get_if<double>(&value))
            return *number != 0.0;
        return true;
    }

    io::Value validityValue(bool valid, io::FieldType type)
    {
        if (type == io::FieldType::Float)
            return valid ? 1.0 : 0.0;
        return std::string(valid ? "1" : "0");
    }
} // namespace watchannotator::data
