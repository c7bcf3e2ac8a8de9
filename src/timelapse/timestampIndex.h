#ifndef TIMELAPSE_TIMESTAMP_INDEX_H
#define TIMELAPSE_TIMESTAMP_INDEX_H

#include "timelapse/timeParse.h"

#include <string>
#include <vector>

struct TimestampedImage
{
	TimestampedImage() {}
	TimestampedImage( instant_t t, std::string p ) : timestamp(t), path(p) {}
	
	instant_t   timestamp;
	std::string path;
};

//
// All the images of a directory, sorted by the time encoded in their names.
// Built once per run and never changed afterwards.
//
typedef std::vector< TimestampedImage > TimeIndex;

//
// Interpret the first 12 characters of a filename as YYYYMMDDHHMM (UTC).
// Anything after those 12 characters is ignored.
// Throws MalformedFilename if that isn't possible.
//
instant_t ParseFilenameTimestamp( const std::string &filename );

//
// Scan dir for files with the given extension (e.g. ".jpg", case-insensitive)
// and build the time index. Files are stable-sorted on timestamp, so images
// sharing a timestamp keep the order the directory listing gave us.
//
// Any badly named image aborts the whole thing with MalformedFilename.
//
TimeIndex BuildTimeIndex( const std::string &dir, const std::string &extension );

#endif
