#ifndef TIMELAPSE_TEST_RECORDINGSINK_H
#define TIMELAPSE_TEST_RECORDINGSINK_H

#include "imgio/frameSink.h"
#include "timelapse/timelapseErrors.h"

#include <vector>

// keeps a copy of everything written to it, in order.
class RecordingSink : public FrameSink
{
public:
	RecordingSink() : finished(false), failAfter(-1) {}
	
	void Write( const cv::Mat &img )
	{
		if( failAfter >= 0 && (int)frames.size() >= failAfter )
			throw SinkWriteFailure("recording sink full");
		frames.push_back( img.clone() );
	}
	
	void Finish()
	{
		finished = true;
	}
	
	std::vector< cv::Mat > frames;
	bool finished;
	
	// refuse frames once this many have been written, if >= 0
	int failAfter;
};

#endif
