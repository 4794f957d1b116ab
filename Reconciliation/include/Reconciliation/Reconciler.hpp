#pragma once

#include <GpsIndex/GpsTrack.hpp>
#include <RowStore/SensorStore.hpp>
#include <WatchAnnotator/Progress.hpp>

namespace watchannotator::merge
{
    /// Pushes GPS run validity back into the sensor rows each run covers.
    class Reconciler
    {
    public:
        /// Returns false (and reports it through `callbacks`) when the track has no pending
        /// changes. Otherwise writes every run's validity into rows [first, last], marks the
        /// store dirty and clears the track's dirty flag.
        static bool merge(data::SensorStore &store, gps::GpsTrack &track, const ProgressCallbacks &callbacks = {});
    };
} // namespace watchannotator::merge
