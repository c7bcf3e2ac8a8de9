#include "timelapse/pipeline.h"
#include "timelapse/timelapseErrors.h"
#include "imgio/vidWriter.h"

#include <opencv2/core.hpp>

#include <cstdlib>
#include <stdexcept>

#include <iostream>
using std::cout;
using std::endl;

int main(int argc, char* argv[])
{
	if( argc != 6 && argc != 7 && argc != 8 )
	{
		cout << "Render a directory of timestamped images to a time-lapse video." << endl;
		cout << endl;
		cout << "Images must be named YYYYMMDDHHMM<anything>.jpg (UTC). For every" << endl;
		cout << "<sample freq> step between <start> and <end> the image nearest in" << endl;
		cout << "time is drawn with the time written on it." << endl;
		cout << endl;
		cout << "Usage: " << endl;
		cout << "\t  " << argv[0] << " <start> <end> <sample freq> <image dir> <output vid> [bounds] [render cfg]" << endl;
		cout << endl;
		cout << "\t  start, end  : ISO 8601, e.g. 2024-01-01T00:00Z" << endl;
		cout << "\t  sample freq : e.g. 5min, 1H, 30S, 1h30min" << endl;
		cout << "\t  bounds      : crop (x0,y0,x1,y1) applied to every image, or \"none\"" << endl;
		cout << "\t  render cfg  : libconfig file to change fps, size, label colour, codec..." << endl;
		cout << endl;
		exit(0);
	}
	
	//
	// Parse args
	//
	RenderParams params;
	RenderSettings settings;
	try
	{
		params.startTime  = ParseIsoTime( argv[1] );
		params.endTime    = ParseIsoTime( argv[2] );
		params.sampleFreq = ParseSampleFreq( argv[3] );
		params.imageDir   = argv[4];
		
		if( argc >= 7 && std::string(argv[6]) != "none" )
			params.bounds = ParseCropBounds( argv[6] );
		
		if( argc == 8 )
			settings = LoadRenderSettings( argv[7] );
	}
	catch( std::invalid_argument &e )
	{
		cout << "Bad argument: " << e.what() << endl;
		return 1;
	}
	catch( TimelapseError &e )
	{
		cout << e.what() << endl;
		return 1;
	}
	catch( std::exception &e )
	{
		cout << "Bad argument: " << e.what() << endl;
		return 1;
	}
	
	try
	{
		cv::Mat typical( settings.height, settings.width, CV_8UC3 );
		VidWriter vo( argv[5], settings.codec, typical, settings.fps, settings.crf, settings.pixfmt );
		
		RenderTimeSeries( params, settings, vo );
		
		vo.Finish();
	}
	catch( TimelapseError &e )
	{
		cout << endl << "Render failed: " << e.what() << endl;
		return 1;
	}
	catch( std::exception &e )
	{
		cout << endl << "Unexpected error: " << e.what() << endl;
		return 1;
	}
	
	return 0;
}
