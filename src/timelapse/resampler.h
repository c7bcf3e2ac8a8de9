#ifndef TIMELAPSE_RESAMPLER_H
#define TIMELAPSE_RESAMPLER_H

#include "timelapse/timestampIndex.h"

#include <vector>

//
// The regular time grid we want output frames for.
// start, start+interval, start+2*interval ... up to and including end if it lands on the grid.
//
typedef std::vector< instant_t > SampleGrid;

// throws std::invalid_argument if interval isn't positive. start > end gives an empty grid.
SampleGrid MakeSampleGrid( const instant_t &start, const instant_t &end, const interval_t &interval );

//
// Position of the index entry closest in time to t.
// When t is exactly half way between two entries, the earlier one wins.
// Before the first entry gives the first, after the last gives the last.
//
// throws EmptyIndex if there is nothing to choose from.
//
size_t FindNearest( const TimeIndex &index, const instant_t &t );


class FrameResampler
{
public:
	FrameResampler( const TimeIndex &in_index, const instant_t &start, const instant_t &end, const interval_t &interval );
	
	const SampleGrid& GetGrid() const
	{
		return grid;
	}
	
	// which image should be shown for time t?
	const TimestampedImage& Resolve( const instant_t &t ) const;
	
protected:
	const TimeIndex &index;
	SampleGrid grid;
};

#endif
