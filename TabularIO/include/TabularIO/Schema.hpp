#pragma once

#include <Timestamp/StampCodec.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace watchannotator::io
{
    // Raised for malformed header structure or rows that do not match it.
    struct SchemaError : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    // Raised when a cell cannot be converted to its declared type.
    struct ParseError : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    // Raised when a data file cannot be opened, read or written.
    struct IoError : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    enum class FieldType
    {
        Float,
        String,
        DateTime
    };

    struct FieldSpec
    {
        std::string name;
        FieldType type{FieldType::String};

        bool operator==(const FieldSpec &) const = default;
    };

    /// A null cell is std::monostate.
    using Value = std::variant<std::monostate, double, std::string, time::Stamp>;
    using Row = std::vector<Value>;

    /// Ordered field list of a data file. Field order is the column order on disk.
    class Schema
    {
    public:
        Schema() = default;
        explicit Schema(std::vector<FieldSpec> fields);

        /// Throws SchemaError if a field with the same name already exists.
        void append(FieldSpec field);

        [[nodiscard]] std::optional<std::size_t> indexOf(std::string_view name) const noexcept;
        [[nodiscard]] const FieldSpec &field(std::size_t index) const { return m_fields.at(index); }
        [[nodiscard]] const std::vector<FieldSpec> &fields() const noexcept { return m_fields; }
        [[nodiscard]] std::size_t size() const noexcept { return m_fields.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_fields.empty(); }

        bool operator==(const Schema &) const = default;

    private:
        std::vector<FieldSpec> m_fields;
    };

    /// Short tag written to the second header line: "f", "s" or "dt".
    [[nodiscard]] std::string_view typeTag(FieldType type) noexcept;

    /// Accepts the short tags and the long forms "float", "string", "datetime".
    [[nodiscard]] std::optional<FieldType> parseTypeTag(std::string_view tag) noexcept;

    /// Empty text is null. Throws ParseError for cells that do not convert.
    [[nodiscard]] Value parseValue(std::string_view text, FieldType type);

    [[nodiscard]] std::string formatValue(const Value &value);

    [[nodiscard]] inline bool isNull(const Value &value) noexcept
    {
        return std::holds_alternative<std::monostate>(value);
    }
} // namespace watchannotator::io
