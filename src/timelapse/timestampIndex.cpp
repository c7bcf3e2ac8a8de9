#include "timelapse/timestampIndex.h"
#include "timelapse/timelapseErrors.h"

#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>

#include <iostream>
using std::cout;
using std::endl;

instant_t ParseFilenameTimestamp( const std::string &filename )
{
	if( filename.size() < 12 )
		throw MalformedFilename("Filename too short for a YYYYMMDDHHMM timestamp: " + filename );
	
	for( unsigned c = 0; c < 12; ++c )
	{
		if( !std::isdigit( (unsigned char)filename[c] ) )
			throw MalformedFilename("Filename does not start with YYYYMMDDHHMM: " + filename );
	}
	
	int year   = std::stoi( filename.substr(0,4) );
	int month  = std::stoi( filename.substr(4,2) );
	int day    = std::stoi( filename.substr(6,2) );
	int hour   = std::stoi( filename.substr(8,2) );
	int minute = std::stoi( filename.substr(10,2) );
	
	if( hour > 23 || minute > 59 )
		throw MalformedFilename("Filename has an invalid time of day: " + filename );
	
	try
	{
		return instant_t( boost::gregorian::date(year, month, day),
		                  boost::posix_time::hours(hour) + boost::posix_time::minutes(minute) );
	}
	catch( std::out_of_range &e )
	{
		throw MalformedFilename("Filename has an invalid date: " + filename + " (" + e.what() + ")" );
	}
}

static bool TimestampLess( const TimestampedImage &a, const TimestampedImage &b )
{
	return a.timestamp < b.timestamp;
}

TimeIndex BuildTimeIndex( const std::string &dir, const std::string &extension )
{
	boost::filesystem::path p(dir);
	if( !boost::filesystem::exists(p) || !boost::filesystem::is_directory(p) )
	{
		throw TimelapseError("Could not find image source directory: " + dir );
	}
	
	std::string ext = boost::algorithm::to_lower_copy( extension );
	
	TimeIndex index;
	boost::filesystem::directory_iterator di(p), endi;
	for( ; di != endi; ++di )
	{
		if( !boost::filesystem::is_regular_file( di->path() ) )
			continue;
		
		if( boost::algorithm::to_lower_copy( di->path().extension().string() ) != ext )
			continue;
		
		std::string fn = di->path().filename().string();
		index.push_back( TimestampedImage( ParseFilenameTimestamp(fn), di->path().string() ) );
	}
	
	std::stable_sort( index.begin(), index.end(), TimestampLess );
	
	cout << "indexed " << index.size() << " " << ext << " images from " << dir << endl;
	if( index.size() > 0 )
	{
		cout << "\t" << index.front().timestamp << " -> " << index.back().timestamp << endl;
	}
	
	return index;
}
