#ifndef TIMELAPSE_LOADSAVE_H
#define TIMELAPSE_LOADSAVE_H

#include <string>
#include <opencv2/core.hpp>

//
// Load any image Magick++ can read as an 8-bit, 3 channel BGR cv::Mat.
// Greyscale and palette images are expanded to 3 channels so that every
// frame we hand on has the same layout.
//
// throws DecodeFailure if the file can't be read.
//
cv::Mat LoadImage(std::string filename);

void SaveImage(cv::Mat &img, std::string filename);

#endif
