#ifndef TIMELAPSE_FRAMESINK_H
#define TIMELAPSE_FRAMESINK_H

#include <opencv2/core.hpp>

//
// Something that consumes finished frames, in order, one at a time.
// Normally that's a video file, but anything append-only will do.
//
class FrameSink
{
public:
	FrameSink(){};
	virtual ~FrameSink(){};
	
	// append the next frame. throws SinkWriteFailure if it can't.
	virtual void Write( const cv::Mat &img )=0;
	
	// no more frames are coming. Flush and close whatever is underneath.
	virtual void Finish()=0;
};

#endif
