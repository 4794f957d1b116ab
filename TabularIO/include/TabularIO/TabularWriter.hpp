#pragma once

#include <TabularIO/RecordStream.hpp>
#include <fstream>
#include <ostream>
#include <string>

namespace watchannotator::io
{
    /// Writes the format read by TabularReader. Cells are quoted only when they contain a
    /// comma, quote or line break. The target file is truncated on construction.
    class TabularWriter : public RecordSink
    {
    public:
        explicit TabularWriter(const std::string &path);
        explicit TabularWriter(std::ostream &out);

        TabularWriter(const TabularWriter &) = delete;
        TabularWriter &operator=(const TabularWriter &) = delete;

        void writeHeader(const Schema &schema) override;
        void writeRow(const Row &row) override;
        void finish() override;

        [[nodiscard]] std::size_t rowsWritten() const noexcept { return m_rows; }

        [[nodiscard]] static std::string quote(const std::string &cell);

    private:
        void writeLine(const std::vector<std::string> &cells);
        void checkStream() const;

        std::string m_path;
        std::ofstream m_file;
        std::ostream *m_out{nullptr};
        std::size_t m_fieldCount{0};
        bool m_headerWritten{false};
        std::size_t m_rows{0};
    };
} // namespace watchannotator::io
