#pragma once

#include <TabularIO/Schema.hpp>

namespace watchannotator::io
{
    // Producer of typed rows, e.g. a data file being loaded.
    class RecordSource
    {
    public:
        virtual ~RecordSource() = default;

        [[nodiscard]] virtual const Schema &schema() const = 0;

        /// Fills `row` with the next record (one value per schema field).
        /// Returns false once the source is exhausted.
        virtual bool next(Row &row) = 0;
    };

    // Consumer of typed rows, e.g. a data file being saved.
    class RecordSink
    {
    public:
        virtual ~RecordSink() = default;

        virtual void writeHeader(const Schema &schema) = 0;
        virtual void writeRow(const Row &row) = 0;
        virtual void finish() = 0;
    };
} // namespace watchannotator::io
