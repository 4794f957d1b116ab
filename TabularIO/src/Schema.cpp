#include <TabularIO/Schema.hpp>
#include <algorithm>
#include <charconv>
#include <cctype>

namespace watchannotator::io
{
    namespace
    {
        std::string_view trim(std::string_view text) noexcept
        {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
                text.remove_prefix(1);
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
                text.remove_suffix(1);
            return text;
        }

        double parseFloat(std::string_view text)
        {
            std::string_view t = trim(text);
            if (!t.empty() && t.front() == '+')
                t.remove_prefix(1);

            double value = 0.0;
            const auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
            if (t.empty() || ec != std::errc{} || ptr != t.data() + t.size())
                throw ParseError("cannot parse '" + std::string(text) + "' as float");
            return value;
        }

        struct ValueFormatter
        {
            std::string operator()(std::monostate) const { return {}; }
            std::string operator()(const std::string &s) const { return s; }
            std::string operator()(time::Stamp stamp) const { return time::StampCodec::format(stamp); }
            std::string operator()(double v) const
            {
                char buffer[32];
                const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), v);
                if (ec != std::errc{})
                    return std::to_string(v);
                return std::string(buffer, ptr);
            }
        };
    } // namespace

    Schema::Schema(std::vector<FieldSpec> fields)
    {
        for (auto &field : fields)
            append(std::move(field));
    }

    void Schema::append(FieldSpec field)
    {
        if (indexOf(field.name))
            throw SchemaError("duplicate field name '" + field.name + "'");
        m_fields.push_back(std::move(field));
    }

    std::optional<std::size_t> Schema::indexOf(std::string_view name) const noexcept
    {
        const auto it = std::find_if(m_fields.begin(), m_fields.end(),
                                     [&](const FieldSpec &f)
                                     { return f.name == name; });
        if (it == m_fields.end())
            return std::nullopt;
        return static_cast<std::size_t>(it - m_fields.begin());
    }

    std::string_view typeTag(FieldType type) noexcept
    {
        switch (type)
        {
        case FieldType::Float:
            return "f";
        case FieldType::DateTime:
            return "dt";
        case FieldType::String:
            break;
        }
        return "s";
    }

    std::optional<FieldType> parseTypeTag(std::string_view tag) noexcept
    {
        tag = trim(tag);
        if (tag == "f" || tag == "float")
            return FieldType::Float;
        if (tag == "s" || tag == "string")
            return FieldType::String;
        if (tag == "dt" || tag == "datetime")
            return FieldType::DateTime;
        return std::nullopt;
    }

    Value parseValue(std::string_view text, FieldType type)
    {
        if (text.empty())
            return std::monostate{};

        switch (type)
        {
        case FieldType::Float:
            return parseFloat(text);
        case FieldType::DateTime:
        {
            auto stamp = time::StampCodec::parse(trim(text));
            if (!stamp)
                throw ParseError("cannot parse '" + std::string(text) + "' as datetime");
            return *stamp;
        }
        case FieldType::String:
            break;
        }
        return std::string(text);
    }

    std::string formatValue(const Value &value)
    {
        return std::visit(ValueFormatter{}, value);
    }
} // namespace watchannotator::io
