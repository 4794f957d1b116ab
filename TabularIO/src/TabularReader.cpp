#include <TabularIO/TabularReader.hpp>

namespace watchannotator::io
{
    TabularReader::TabularReader(const std::string &path) : m_file(path), m_in(&m_file)
    {
        if (!m_file.is_open())
            throw IoError("cannot open data file '" + path + "'");
        readHeaders();
    }

    TabularReader::TabularReader(std::istream &in) : m_in(&in)
    {
        readHeaders();
    }

    void TabularReader::readHeaders()
    {
        if (!readCells(*m_in, m_cells))
            throw SchemaError("missing field name header line");
        const std::vector<std::string> names = m_cells;

        if (!readCells(*m_in, m_cells))
            throw SchemaError("missing field type header line");

        if (names.size() != m_cells.size())
        {
            throw SchemaError(std::to_string(names.size()) + " field names were given, but " +
                              std::to_string(m_cells.size()) + " types");
        }

        for (std::size_t i = 0; i < names.size(); ++i)
        {
            if (names[i].empty())
                throw SchemaError("field " + std::to_string(i + 1) + " has an empty name");

            const auto type = parseTypeTag(m_cells[i]);
            if (!type)
                throw SchemaError("the field type '" + m_cells[i] + "' is unknown");

            m_schema.append(FieldSpec{names[i], *type});
        }
    }

    bool TabularReader::next(Row &row)
    {
        while (readCells(*m_in, m_cells))
        {
            // blank line
            if (m_cells.size() == 1 && m_cells.front().empty())
                continue;

            const std::size_t recordNo = m_records + 1;
            if (m_cells.size() != m_schema.size())
            {
                throw SchemaError("record " + std::to_string(recordNo) + ": expected " +
                                  std::to_string(m_schema.size()) + " fields, got " +
                                  std::to_string(m_cells.size()));
            }

            row.clear();
            row.reserve(m_cells.size());
            for (std::size_t i = 0; i < m_cells.size(); ++i)
            {
                const FieldSpec &field = m_schema.field(i);
                try
                {
                    row.push_back(parseValue(m_cells[i], field.type));
                }
                catch (const ParseError &e)
                {
                    throw ParseError("record " + std::to_string(recordNo) + ", field '" + field.name +
                                     "': " + e.what());
                }
            }

            ++m_records;
            return true;
        }

        if (m_in->bad())
            throw IoError("read failure after record " + std::to_string(m_records));
        return false;
    }

    bool TabularReader::readCells(std::istream &in, std::vector<std::string> &cells)
    {
        cells.clear();
        std::string cell;
        bool inQuotes = false;
        bool sawInput = false;

        char c = 0;
        while (in.get(c))
        {
            sawInput = true;

            if (inQuotes)
            {
                if (c != '"')
                {
                    cell.push_back(c);
                }
                else if (in.peek() == '"')
                {
                    in.get(c);
                    cell.push_back('"');
                }
                else
                {
                    inQuotes = false;
                }
                continue;
            }

            if (c == '"')
            {
                inQuotes = true;
            }
            else if (c == ',')
            {
                cells.push_back(std::move(cell));
                cell.clear();
            }
            else if (c == '\r')
            {
                if (in.peek() == '\n')
                    in.get(c);
                break;
            }
            else if (c == '\n')
            {
                break;
            }
            else
            {
                cell.push_back(c);
            }
        }

        if (!sawInput)
            return false;

        cells.push_back(std::move(cell));
        return true;
    }
} // namespace watchannotator::io
