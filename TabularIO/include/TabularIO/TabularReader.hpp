#pragma once

#include <TabularIO/RecordStream.hpp>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

namespace watchannotator::io
{
    /// Reads the two-header-line data format:
    ///   line 1: field names
    ///   line 2: one type tag per field (f, s, dt)
    ///   then one comma-separated record per line, empty cell = null.
    /// Headers are read on construction; SchemaError is thrown if they are malformed.
    class TabularReader : public RecordSource
    {
    public:
        explicit TabularReader(const std::string &path);
        explicit TabularReader(std::istream &in);

        TabularReader(const TabularReader &) = delete;
        TabularReader &operator=(const TabularReader &) = delete;

        [[nodiscard]] const Schema &schema() const override { return m_schema; }
        bool next(Row &row) override;

        /// Number of data records returned so far.
        [[nodiscard]] std::size_t recordsRead() const noexcept { return m_records; }

        /// Splits one CSV record (quoted cells may span lines). Returns false at end of input.
        static bool readCells(std::istream &in, std::vector<std::string> &cells);

    private:
        void readHeaders();

        std::ifstream m_file;
        std::istream *m_in{nullptr};
        Schema m_schema;
        std::vector<std::string> m_cells;
        std::size_t m_records{0};
    };
} // namespace watchannotator::io
