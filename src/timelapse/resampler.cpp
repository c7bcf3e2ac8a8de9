#include "timelapse/resampler.h"
#include "timelapse/timelapseErrors.h"

#include <algorithm>
#include <stdexcept>

#include <iostream>
using std::cout;
using std::endl;

SampleGrid MakeSampleGrid( const instant_t &start, const instant_t &end, const interval_t &interval )
{
	if( interval.ticks() <= 0 )
		throw std::invalid_argument("Sample interval must be positive.");
	
	SampleGrid grid;
	for( instant_t t = start; t <= end; t += interval )
	{
		grid.push_back(t);
	}
	return grid;
}

static bool EntryBefore( const TimestampedImage &e, const instant_t &t )
{
	return e.timestamp < t;
}

size_t FindNearest( const TimeIndex &index, const instant_t &t )
{
	if( index.empty() )
	{
		throw EmptyIndex("No images to select from for " + boost::posix_time::to_iso_extended_string(t) );
	}
	
	// first entry that is not earlier than t.
	TimeIndex::const_iterator i = std::lower_bound( index.begin(), index.end(), t, EntryBefore );
	size_t after = i - index.begin();
	
	if( after == 0 )
		return 0;
	if( after == index.size() )
		return index.size() - 1;
	
	size_t before = after - 1;
	interval_t dBefore = t - index[before].timestamp;
	interval_t dAfter  = index[after].timestamp - t;
	
	if( dBefore <= dAfter )
		return before;
	return after;
}


FrameResampler::FrameResampler( const TimeIndex &in_index, const instant_t &start, const instant_t &end, const interval_t &interval ) :
	index( in_index )
{
	grid = MakeSampleGrid( start, end, interval );
	cout << "sample grid: " << grid.size() << " frames, every " << interval << " from " << start << " to " << end << endl;
}

const TimestampedImage& FrameResampler::Resolve( const instant_t &t ) const
{
	return index[ FindNearest( index, t ) ];
}
