#ifndef TIMELAPSE_PIPELINE_H
#define TIMELAPSE_PIPELINE_H

#include "timelapse/timeParse.h"
#include "timelapse/renderSettings.h"
#include "timelapse/compositor.h"
#include "imgio/frameSink.h"

#include <boost/optional.hpp>
#include <string>

struct RenderParams
{
	instant_t  startTime;
	instant_t  endTime;
	interval_t sampleFreq;
	boost::optional< CropBounds > bounds;
	std::string imageDir;
};

//
// Render the time-lapse: index imageDir, then for every point of the sample grid
// pick the nearest image, composite it and write it to sink, strictly in grid order.
//
// Returns the number of frames written. Any failure throws straight out; the
// sink is left for the caller to close.
//
size_t RenderTimeSeries( const RenderParams &params, const RenderSettings &settings, FrameSink &sink );

#endif
