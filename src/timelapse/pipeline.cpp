#include "timelapse/pipeline.h"
#include "timelapse/timestampIndex.h"
#include "timelapse/resampler.h"

#include <iostream>
using std::cout;
using std::endl;

size_t RenderTimeSeries( const RenderParams &params, const RenderSettings &settings, FrameSink &sink )
{
	TimeIndex index = BuildTimeIndex( params.imageDir, settings.imageExtension );
	
	FrameResampler resampler( index, params.startTime, params.endTime, params.sampleFreq );
	const SampleGrid &grid = resampler.GetGrid();
	
	FrameCompositor compositor;
	if( params.bounds )
		compositor = FrameCompositor( *params.bounds );
	
	RenderContext ctx( settings );
	
	for( size_t gc = 0; gc < grid.size(); ++gc )
	{
		const TimestampedImage &ti = resampler.Resolve( grid[gc] );
		cout << "\r" << gc + 1 << " / " << grid.size() << " : " << grid[gc] << " <- " << ti.path << "        " << std::flush;
		compositor.Emit( ctx, grid[gc], ti.path, sink );
	}
	cout << endl;
	
	return grid.size();
}
