#ifndef TIMELAPSE_COMPOSITOR_H
#define TIMELAPSE_COMPOSITOR_H

#include "timelapse/timeParse.h"
#include "timelapse/renderSettings.h"
#include "imgio/frameSink.h"

#include <opencv2/core.hpp>
#include <boost/optional.hpp>

#include <string>

//
// Pixel rectangle to cut out of each source image before it goes onto the canvas.
// x1 and y1 are exclusive.
//
struct CropBounds
{
	// throws std::invalid_argument unless x0 < x1 and y0 < y1
	CropBounds( int in_x0, int in_y0, int in_x1, int in_y1 );
	
	int x0, y0;
	int x1, y1;
	
	int Width() const  { return x1 - x0; }
	int Height() const { return y1 - y0; }
};

//
// Parse bounds given as "(x0,y0,x1,y1)". The brackets and any spaces are optional.
// throws std::invalid_argument on anything else.
//
CropBounds ParseCropBounds( const std::string &s );

//
// Cut bounds out of img (rows y0:y1, cols x0:x1). The result is a view into img.
// There is no clamping: bounds that don't fit inside img throw CropOutOfBounds,
// with path used to say which image it was.
//
cv::Mat ApplyCrop( const cv::Mat &img, const CropBounds &bounds, const std::string &path );


//
// All the drawing state for a render. Made once before the first frame and
// handed to every Compose() call, rather than having a canvas lying around globally.
//
class RenderContext
{
public:
	RenderContext( const RenderSettings &in_settings );
	
	// blank the canvas ready for the next frame.
	void Clear();
	
	RenderSettings settings;
	cv::Mat canvas;
	
	// size of the first source image, which every other source image must match.
	cv::Size sourceSize;
};


class FrameCompositor
{
public:
	FrameCompositor();
	FrameCompositor( const CropBounds &in_crop );
	
	//
	// Build the frame for time t from the image at path: decode, crop, scale to
	// fill the canvas and draw the timestamp. Returns the context's canvas, which
	// is only valid until the next call.
	//
	// throws DecodeFailure, DimensionMismatch or CropOutOfBounds.
	//
	const cv::Mat& Compose( RenderContext &ctx, const instant_t &t, const std::string &path ) const;
	
	// Compose() then hand the result to the sink.
	void Emit( RenderContext &ctx, const instant_t &t, const std::string &path, FrameSink &sink ) const;
	
	void DrawLabel( RenderContext &ctx, const instant_t &t ) const;
	
protected:
	boost::optional< CropBounds > crop;
};

#endif
