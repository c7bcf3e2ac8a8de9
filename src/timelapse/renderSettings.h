#ifndef TIMELAPSE_RENDER_SETTINGS_H
#define TIMELAPSE_RENDER_SETTINGS_H

#include <opencv2/core.hpp>
#include <string>

//
// How the output video looks. The defaults give a 1024x1024, 12 fps h264 video
// of the .jpg images with a tomato coloured timestamp near the bottom middle.
//
struct RenderSettings
{
	RenderSettings();
	
	int fps;
	int width;
	int height;
	
	// which files in the image directory are frames.
	std::string imageExtension;
	
	// label colour is BGR, like everything else that touches OpenCV.
	cv::Scalar labelColour;
	double fontScale;
	int thickness;
	
	// label position as a fraction of the canvas size. The label is
	// horizontally centred on labelCentreX and its last line sits on labelBaseY.
	float labelCentreX;
	float labelBaseY;
	
	std::string codec;
	std::string pixfmt;
	int crf;
};

//
// Read a libconfig render config file. Anything not in the file keeps its default.
//
//   fps            = 12;
//   width          = 1024;
//   height         = 1024;
//   imageExtension = ".jpg";
//   labelColour    = (255, 99, 71);       # r, g, b
//   fontScale      = 1.6;
//   thickness      = 2;
//   labelCentreX   = 0.47;
//   labelBaseY     = 0.945;
//   codec          = "h264";
//   pixfmt         = "yuv420p";
//   crf            = 18;
//
// Whole numbers and decimals are not interchangeable: fps = 12.5 or fontScale = 2
// are settings of the wrong type.
//
// throws TimelapseError on parse errors or settings of the wrong type.
//
RenderSettings LoadRenderSettings( const std::string &cfgFile );

#endif
