#include "timelapse/timeParse.h"

#include <cctype>
#include <limits>
#include <stdexcept>

using namespace boost::posix_time;
using boost::gregorian::date;

// read exactly n digits starting at pos, advancing pos.
static bool ReadDigits( const std::string &s, size_t &pos, unsigned n, int &out )
{
	if( pos + n > s.size() )
		return false;
	out = 0;
	for( unsigned c = 0; c < n; ++c )
	{
		char ch = s[pos+c];
		if( !std::isdigit( (unsigned char)ch ) )
			return false;
		out = out * 10 + (ch - '0');
	}
	pos += n;
	return true;
}

static bool Expect( const std::string &s, size_t &pos, char ch )
{
	if( pos < s.size() && s[pos] == ch )
	{
		++pos;
		return true;
	}
	return false;
}

instant_t ParseIsoTime( const std::string &s )
{
	std::string err = "Could not parse ISO 8601 time: '" + s + "'";
	
	size_t pos = 0;
	int year, month, day;
	if( !ReadDigits(s, pos, 4, year)   || !Expect(s, pos, '-') ||
	    !ReadDigits(s, pos, 2, month)  || !Expect(s, pos, '-') ||
	    !ReadDigits(s, pos, 2, day) )
	{
		throw std::invalid_argument(err);
	}
	
	int hour = 0, minute = 0, second = 0;
	long micro = 0;
	if( pos < s.size() && (s[pos] == 'T' || s[pos] == ' ') )
	{
		++pos;
		if( !ReadDigits(s, pos, 2, hour) || !Expect(s, pos, ':') || !ReadDigits(s, pos, 2, minute) )
			throw std::invalid_argument(err);
		
		if( Expect(s, pos, ':') )
		{
			if( !ReadDigits(s, pos, 2, second) )
				throw std::invalid_argument(err);
			
			if( Expect(s, pos, '.') || Expect(s, pos, ',') )
			{
				// keep microsecond precision, ignore anything finer.
				long scale = 100000;
				size_t start = pos;
				while( pos < s.size() && std::isdigit( (unsigned char)s[pos] ) )
				{
					micro += (s[pos] - '0') * scale;
					scale /= 10;
					++pos;
				}
				if( pos == start )
					throw std::invalid_argument(err);
			}
		}
	}
	
	if( hour > 23 || minute > 59 || second > 59 )
		throw std::invalid_argument(err);
	
	// zone designator
	time_duration offset(0,0,0);
	if( pos < s.size() )
	{
		if( s[pos] == 'Z' )
		{
			++pos;
		}
		else if( s[pos] == '+' || s[pos] == '-' )
		{
			int sign = (s[pos] == '-') ? -1 : 1;
			++pos;
			int oh, om = 0;
			if( !ReadDigits(s, pos, 2, oh) )
				throw std::invalid_argument(err);
			if( pos < s.size() )
			{
				Expect(s, pos, ':');
				if( !ReadDigits(s, pos, 2, om) )
					throw std::invalid_argument(err);
			}
			if( oh > 23 || om > 59 )
				throw std::invalid_argument(err);
			offset = hours(oh) + minutes(om);
			if( sign < 0 )
				offset = offset.invert_sign();
		}
		
		if( pos != s.size() )
			throw std::invalid_argument(err);
	}
	
	try
	{
		instant_t local( date(year, month, day), time_duration(hour, minute, second) + microseconds(micro) );
		return local - offset;
	}
	catch( std::out_of_range &e )
	{
		throw std::invalid_argument(err + " (" + e.what() + ")");
	}
}

interval_t ParseSampleFreq( const std::string &s )
{
	typedef interval_t::tick_type tick_t;
	
	// well short of the largest tick count, so the grid can still add it to a ptime.
	const tick_t maxTicks = std::numeric_limits<tick_t>::max() / 4;
	const tick_t tps = interval_t::ticks_per_second();
	
	std::string tooBig = "Sample frequency is too long: '" + s + "'";
	
	tick_t total = 0;
	size_t pos = 0;
	
	if( s.empty() )
		throw std::invalid_argument("Empty sample frequency");
	
	while( pos < s.size() )
	{
		tick_t count = 1;
		if( pos < s.size() && std::isdigit( (unsigned char)s[pos] ) )
		{
			count = 0;
			while( pos < s.size() && std::isdigit( (unsigned char)s[pos] ) )
			{
				int d = s[pos] - '0';
				if( count > (maxTicks - d) / 10 )
					throw std::invalid_argument(tooBig);
				count = count * 10 + d;
				++pos;
			}
		}
		
		size_t unitStart = pos;
		while( pos < s.size() && std::isalpha( (unsigned char)s[pos] ) )
			++pos;
		std::string unit = s.substr( unitStart, pos - unitStart );
		
		tick_t unitTicks;
		if( unit == "D" )
			unitTicks = tps * 86400;
		else if( unit == "H" || unit == "h" )
			unitTicks = tps * 3600;
		else if( unit == "T" || unit == "min" )
			unitTicks = tps * 60;
		else if( unit == "S" || unit == "s" )
			unitTicks = tps;
		else if( unit == "L" || unit == "ms" )
			unitTicks = tps / 1000;
		else if( unit == "U" || unit == "us" )
			unitTicks = tps / 1000000;
		else
			throw std::invalid_argument("Unknown unit '" + unit + "' in sample frequency '" + s + "'");
		
		if( count > 0 && unitTicks > (maxTicks - total) / count )
			throw std::invalid_argument(tooBig);
		total += count * unitTicks;
	}
	
	if( total <= 0 )
		throw std::invalid_argument("Sample frequency must be a positive interval: '" + s + "'");
	
	return interval_t( 0, 0, 0, total );
}

std::string FormatTimestampLabel( const instant_t &t )
{
	std::string s = to_iso_extended_string(t);
	size_t tpos = s.find('T');
	if( tpos != std::string::npos )
		s[tpos] = ' ';
	return s + "+00:00";
}
