#ifndef TIMELAPSE_VIDWRITER
#define TIMELAPSE_VIDWRITER

//
// We don't fight with the ffmpeg API to write a video - that's
// too much like hard work.
// Instead we _pipe_ raw frames to the ffmpeg command which
// we assume is somewhere on the system (see CommonConfig::ffmpegPath).
//

#include "imgio/frameSink.h"

#include <opencv2/core.hpp>
#include <cstdio>
#include <string>


class VidWriter : public FrameSink
{
public:
	//
	// Create the VidWriter to write to the specified filename, using the specified codec,
	// for an image of the format typified by typicalImage, and with the expected fps as listed.
	//
	// codecStr can be one of the shortcuts h264, h265 or vp9, or any ffmpeg encoder name.
	// crf is the constant rate factor, 18 is said to be visually lossless for h264.
	//
	VidWriter( std::string filename, std::string codecStr, cv::Mat typicalImage, int fps, int crf, std::string pixfmt );
	
	// as above, but run ffmpegPath instead of the one from CommonConfig.
	VidWriter( std::string filename, std::string codecStr, cv::Mat typicalImage, int fps, int crf, std::string pixfmt, std::string ffmpegPath );
	
	//
	// Write the next image to the video file.
	// It must have the same size and type as typicalImage.
	// SIGPIPE is ignored once a VidWriter exists, so an encoder that has
	// gone away shows up here as a SinkWriteFailure.
	//
	void Write( const cv::Mat &img );
	
	//
	// Close the pipe and wait for ffmpeg to finish.
	// throws SinkWriteFailure if ffmpeg didn't exit cleanly.
	//
	void Finish();
	
	int GetNumWritten() const
	{
		return fnum;
	}
	
	// closes the pipe if Finish() never got called, e.g. because we're unwinding from an error.
	~VidWriter();
	
protected:
	
	std::string filename;
	cv::Size frameSize;
	int frameType;
	size_t frameBytes;
	int fnum;
	int fps;
	FILE *outPipe;
};

#endif
