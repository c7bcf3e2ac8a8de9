#include "imgio/vidWriter.h"
#include "timelapse/timelapseErrors.h"
#include "commonConfig/commonConfig.h"

#include <boost/algorithm/string.hpp>

#include <sys/wait.h>
#include <csignal>

#include <sstream>
#include <iostream>
using std::cout;
using std::endl;

// wrap s in single quotes for sh, so nothing in it gets expanded.
static std::string ShellQuote( const std::string &s )
{
	std::string q = "'";
	for( unsigned c = 0; c < s.size(); ++c )
	{
		if( s[c] == '\'' )
			q += "'\\''";
		else
			q += s[c];
	}
	return q + "'";
}

VidWriter::VidWriter( std::string in_filename, std::string codecStr, cv::Mat typicalImage, int in_fps, int in_crf, std::string pixfmt) :
	VidWriter( in_filename, codecStr, typicalImage, in_fps, in_crf, pixfmt, CommonConfig().ffmpegPath )
{
}

VidWriter::VidWriter( std::string in_filename, std::string codecStr, cv::Mat typicalImage, int in_fps, int in_crf, std::string pixfmt, std::string ffmpegPath)
{
	filename = in_filename;
	fnum = 0;
	outPipe = NULL;
	
	// a dead ffmpeg should give us a failed write, not kill the process.
	signal( SIGPIPE, SIG_IGN );
	
	// build up our ffmpeg command into a stringstream
	std::stringstream ss;
	
	// start with the basics - the actual ffmpeg executable.
	ss << ShellQuote( ffmpegPath ) << " ";
	
	// we'll just go with overwriting existing files rather than have to handle a failed ffmpeg open.
	ss << "-y -loglevel error ";
	
	// now we specify the codec for the input
	ss << "-f rawvideo -vcodec rawvideo ";
	
	// now the input shape and format.
	ss << "-s " << typicalImage.cols << "x" << typicalImage.rows << " ";
	
	frameSize = typicalImage.size();
	frameType = typicalImage.type();
	if( typicalImage.type() == CV_8UC3 )
	{
		frameBytes = typicalImage.rows * typicalImage.cols * 3;
		ss << "-pix_fmt bgr24 ";
	}
	else if( typicalImage.type() == CV_8UC1 )
	{
		frameBytes = typicalImage.rows * typicalImage.cols * 1;
		ss << "-pix_fmt gray8 ";
	}
	else
	{
		throw SinkWriteFailure("Vid writer expects typical image to be CV_8UC1 or CV_8UC3");
	}
	
	// input framerate.
	fps = in_fps;
	ss << "-r " << fps;
	
	// and that the input comes from stdin
	ss << " -i - ";
	
	
	// now we specify the output codec.
	// we'll allow a few common shortcuts.
	std::string cstring;
	ss << " -c:v " ;
	boost::algorithm::to_lower(codecStr);
	if( codecStr.compare("h264") == 0 )
	{
		cstring = "libx264";
	}
	else if( codecStr.compare("h265") == 0 )
	{
		cstring = "libx265";
	}
	else if( codecStr.compare("vp9") == 0 )
	{
		cstring = "libvpx-vp9";
	}
	else
	{
		cstring = codecStr;
	}
	
	ss << cstring << " ";
	
	// yuv420p is the safe choice, most players won't touch anything else.
	ss << " -pix_fmt " << pixfmt << " ";
	
	// the crf quality - only really valid for x264, x265 and vp9
	ss << "-crf " << in_crf << " ";
	
	// finally, the output file
	ss << ShellQuote( filename );
	
	cout << ss.str() << endl;
	
	
	// open the pipe...
	if( !(outPipe = popen(ss.str().c_str(), "w")) )
	{
		throw SinkWriteFailure("Could not start ffmpeg to write " + filename );
	}
}


void VidWriter::Write( const cv::Mat &img )
{
	if( !outPipe )
	{
		throw SinkWriteFailure("Write to " + filename + " after it was finished");
	}
	
	if( img.size() != frameSize || img.type() != frameType )
	{
		std::stringstream ss;
		ss << "Frame " << fnum << " for " << filename << " is " << img.cols << "x" << img.rows
		   << " but the video is " << frameSize.width << "x" << frameSize.height;
		throw SinkWriteFailure( ss.str() );
	}
	
	// roi views aren't contiguous, so give ffmpeg a packed copy.
	cv::Mat packed = img.isContinuous() ? img : img.clone();
	
	size_t written = fwrite( packed.data, 1, frameBytes, outPipe );
	if( written != frameBytes )
	{
		std::stringstream ss;
		ss << "ffmpeg pipe rejected frame " << fnum << " for " << filename
		   << " (" << written << " of " << frameBytes << " bytes written)";
		throw SinkWriteFailure( ss.str() );
	}
	++fnum;
}

void VidWriter::Finish()
{
	if( !outPipe )
		return;
	
	fflush(outPipe);
	int status = pclose(outPipe);
	outPipe = NULL;
	
	if( status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0 )
	{
		std::stringstream ss;
		ss << "ffmpeg did not finish cleanly writing " << filename << " (status " << status << ")";
		throw SinkWriteFailure( ss.str() );
	}
	
	cout << "wrote " << fnum << " frames to " << filename << endl;
}



VidWriter::~VidWriter()
{
	if( outPipe )
	{
		fflush(outPipe);
		pclose(outPipe);
		outPipe = NULL;
	}
}
