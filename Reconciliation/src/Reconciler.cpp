#include <Reconciliation/Reconciler.hpp>
#include <Timestamp/StampCodec.hpp>
#include <stdexcept>
#include <string>

namespace watchannotator::merge
{
    bool Reconciler::merge(data::SensorStore &store, gps::GpsTrack &track, const ProgressCallbacks &callbacks)
    {
        if (!track.isDirty())
        {
            callbacks.progress("No changes to GPS labels, nothing to merge");
            callbacks.complete();
            return false;
        }

        store.markDirty();

        const auto &runs = track.runs();
        for (std::size_t i = 0; i < runs.size(); ++i)
        {
            const gps::GpsRun &run = runs[i];
            callbacks.progress("Merging GPS data changes to Sensor data...\nAt " +
                               formatPercent(run.first_row_index, store.size()) + "% of data.\n" +
                               time::StampCodec::format(run.start_stamp));

            if (!store.setGpsValid(run.first_row_index, run.last_row_index, run.is_valid))
            {
                throw std::logic_error("GPS run " + std::to_string(i) + " covers rows [" +
                                       std::to_string(run.first_row_index) + ", " + std::to_string(run.last_row_index) +
                                       "] outside the " + std::to_string(store.size()) + " loaded records");
            }
        }

        track.clearDirty();
        callbacks.complete();
        return true;
    }
} // namespace watchannotator::merge
