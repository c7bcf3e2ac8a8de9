#include "timelapse/compositor.h"
#include "timelapse/timelapseErrors.h"
#include "imgio/loadsave.h"
#include "misc/tokeniser.h"

#include <opencv2/imgproc.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>

CropBounds::CropBounds( int in_x0, int in_y0, int in_x1, int in_y1 )
{
	if( in_x0 >= in_x1 || in_y0 >= in_y1 )
	{
		std::stringstream ss;
		ss << "Crop bounds (" << in_x0 << "," << in_y0 << "," << in_x1 << "," << in_y1 << ") need x0 < x1 and y0 < y1";
		throw std::invalid_argument( ss.str() );
	}
	x0 = in_x0;
	y0 = in_y0;
	x1 = in_x1;
	y1 = in_y1;
}

CropBounds ParseCropBounds( const std::string &s )
{
	std::vector<std::string> toks = SplitLine( s, "(), \t" );
	if( toks.size() != 4 )
	{
		throw std::invalid_argument("Crop bounds should be (x0,y0,x1,y1), got: " + s );
	}
	
	int v[4];
	for( unsigned c = 0; c < 4; ++c )
	{
		char *end;
		errno = 0;
		long l = std::strtol( toks[c].c_str(), &end, 10 );
		if( *end != '\0' )
		{
			throw std::invalid_argument("Crop bound '" + toks[c] + "' is not an integer in: " + s );
		}
		if( errno == ERANGE || l < INT_MIN || l > INT_MAX )
		{
			throw std::invalid_argument("Crop bound '" + toks[c] + "' is out of range in: " + s );
		}
		v[c] = (int)l;
	}
	
	return CropBounds( v[0], v[1], v[2], v[3] );
}

cv::Mat ApplyCrop( const cv::Mat &img, const CropBounds &bounds, const std::string &path )
{
	if( bounds.x0 < 0 || bounds.y0 < 0 || bounds.x1 > img.cols || bounds.y1 > img.rows )
	{
		std::stringstream ss;
		ss << "Crop (" << bounds.x0 << "," << bounds.y0 << "," << bounds.x1 << "," << bounds.y1 << ")"
		   << " does not fit inside " << img.cols << "x" << img.rows << " image " << path;
		throw CropOutOfBounds( ss.str() );
	}
	
	return img( cv::Range(bounds.y0, bounds.y1), cv::Range(bounds.x0, bounds.x1) );
}


RenderContext::RenderContext( const RenderSettings &in_settings ) : settings( in_settings )
{
	canvas = cv::Mat( settings.height, settings.width, CV_8UC3, cv::Scalar(0,0,0) );
}

void RenderContext::Clear()
{
	canvas.setTo( cv::Scalar(0,0,0) );
}


FrameCompositor::FrameCompositor()
{
}

FrameCompositor::FrameCompositor( const CropBounds &in_crop ) : crop( in_crop )
{
}

const cv::Mat& FrameCompositor::Compose( RenderContext &ctx, const instant_t &t, const std::string &path ) const
{
	ctx.Clear();
	
	cv::Mat img = LoadImage( path );
	
	if( ctx.sourceSize.area() == 0 )
	{
		ctx.sourceSize = img.size();
	}
	else if( img.size() != ctx.sourceSize )
	{
		std::stringstream ss;
		ss << "Image " << path << " is " << img.cols << "x" << img.rows
		   << " but earlier images were " << ctx.sourceSize.width << "x" << ctx.sourceSize.height;
		throw DimensionMismatch( ss.str() );
	}
	
	if( crop )
	{
		img = ApplyCrop( img, *crop, path );
	}
	
	// the image fills the whole canvas, whatever its aspect.
	cv::resize( img, ctx.canvas, ctx.canvas.size(), 0, 0, cv::INTER_AREA );
	
	DrawLabel( ctx, t );
	
	return ctx.canvas;
}

void FrameCompositor::Emit( RenderContext &ctx, const instant_t &t, const std::string &path, FrameSink &sink ) const
{
	sink.Write( Compose( ctx, t, path ) );
}

void FrameCompositor::DrawLabel( RenderContext &ctx, const instant_t &t ) const
{
	const RenderSettings &rs = ctx.settings;
	
	std::vector< std::string > lines;
	lines.push_back( "Datetime" );
	lines.push_back( FormatTimestampLabel(t) );
	
	int font = cv::FONT_HERSHEY_SIMPLEX;
	int baseline;
	cv::Size lineSize = cv::getTextSize( lines.back(), font, rs.fontScale, rs.thickness, &baseline );
	int lineStep = (int)(lineSize.height * 1.6f);
	
	// work up from the last line, which sits on labelBaseY
	int y = (int)(rs.labelBaseY * ctx.canvas.rows);
	for( int lc = (int)lines.size() - 1; lc >= 0; --lc )
	{
		cv::Size ls = cv::getTextSize( lines[lc], font, rs.fontScale, rs.thickness, &baseline );
		int x = (int)(rs.labelCentreX * ctx.canvas.cols) - ls.width / 2;
		cv::putText( ctx.canvas, lines[lc], cv::Point(x, y), font, rs.fontScale, rs.labelColour, rs.thickness, cv::LINE_AA );
		y -= lineStep;
	}
}
