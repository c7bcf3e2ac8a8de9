#include "imgio/loadsave.h"
#include "timelapse/timelapseErrors.h"
#include "Magick++.h"

#include <opencv2/imgcodecs.hpp>

static bool magickIsInitted = false;

// Sometimes, it's quicker or just nicer to have a custom wrapper
// for loading images and using Magick++ rather than opencv.
cv::Mat LoadImage(std::string filename)
{
	if( !magickIsInitted )
	{
		Magick::InitializeMagick(NULL);
		magickIsInitted = true;
	}
	
	Magick::Image mimg;
	try
	{
		// don't let warnings from slightly odd jpegs turn into exceptions.
		mimg.quiet(true);
		mimg.read(filename);
	}
	catch( Magick::Exception &e )
	{
		throw DecodeFailure("Could not decode image " + filename + ": " + e.what() );
	}
	
	if( mimg.rows() == 0 || mimg.columns() == 0 )
	{
		throw DecodeFailure("Decoded image is empty: " + filename );
	}
	
	cv::Mat cvimg( mimg.rows(), mimg.columns(), CV_8UC3 );
	mimg.write(0,0, mimg.columns(), mimg.rows(), "BGR", Magick::CharPixel, cvimg.data );
	return cvimg;
}

void SaveImage(cv::Mat &img, std::string filename)
{
	if( img.type() != CV_8UC3 && img.type() != CV_8UC1 )
	{
		throw std::runtime_error("SaveImage: Image had neither 1 nor 3 8-bit channels.");
	}
	
	if( !cv::imwrite(filename, img) )
	{
		throw std::runtime_error("SaveImage: could not write " + filename );
	}
}
