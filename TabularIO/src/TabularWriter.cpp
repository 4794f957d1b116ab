#include <TabularIO/TabularWriter.hpp>
#include <vector>

namespace watchannotator::io
{
    TabularWriter::TabularWriter(const std::string &path)
        : m_path(path), m_file(path, std::ios::out | std::ios::trunc), m_out(&m_file)
    {
        if (!m_file.is_open())
            throw IoError("cannot open '" + path + "' for writing");
    }

    TabularWriter::TabularWriter(std::ostream &out) : m_path("<stream>"), m_out(&out) {}

    void TabularWriter::writeHeader(const Schema &schema)
    {
        if (m_headerWritten)
            throw std::logic_error("headers have already been written to " + m_path);

        std::vector<std::string> names;
        std::vector<std::string> tags;
        for (const auto &field : schema.fields())
        {
            names.push_back(field.name);
            tags.emplace_back(typeTag(field.type));
        }

        writeLine(names);
        writeLine(tags);
        m_fieldCount = schema.size();
        m_headerWritten = true;
    }

    void TabularWriter::writeRow(const Row &row)
    {
        if (!m_headerWritten)
            throw std::logic_error("writeHeader() must be called before writeRow()");

        if (row.size() != m_fieldCount)
        {
            throw SchemaError(std::to_string(row.size()) + " values given in row, but there are " +
                              std::to_string(m_fieldCount) + " fields");
        }

        std::vector<std::string> cells;
        cells.reserve(row.size());
        for (const auto &value : row)
            cells.push_back(formatValue(value));

        writeLine(cells);
        ++m_rows;
    }

    void TabularWriter::finish()
    {
        m_out->flush();
        checkStream();
    }

    std::string TabularWriter::quote(const std::string &cell)
    {
        if (cell.find_first_of(",\"\r\n") == std::string::npos)
            return cell;

        std::string quoted;
        quoted.reserve(cell.size() + 2);
        quoted.push_back('"');
        for (char c : cell)
        {
            if (c == '"')
                quoted.push_back('"');
            quoted.push_back(c);
        }
        quoted.push_back('"');
        return quoted;
    }

    void TabularWriter::writeLine(const std::vector<std::string> &cells)
    {
        for (std::size_t i = 0; i < cells.size(); ++i)
        {
            if (i > 0)
                *m_out << ',';
            *m_out << quote(cells[i]);
        }
        *m_out << '\n';
        checkStream();
    }

    void TabularWriter::checkStream() const
    {
        if (!*m_out)
            throw IoError("write failure on " + m_path);
    }
} // namespace watchannotator::io
