#include "misc/tokeniser.h"

static bool IsDelimitor( char c, const std::string& delimitors )
{
	return delimitors.find(c) != std::string::npos;
}

std::vector<std::string> SplitLine(const std::string& input, const std::string& delimitors)
{
	std::vector<std::string> result;
	
	size_t tokenStart = 0;
	while( tokenStart < input.size() )
	{
		while( tokenStart < input.size() && IsDelimitor( input[ tokenStart ], delimitors ) )
		{
			++tokenStart;
		}
		
		size_t tokenEnd = tokenStart;
		while( tokenEnd < input.size() && !IsDelimitor( input[tokenEnd], delimitors ) )
		{
			++tokenEnd;
		}
		
		if( tokenEnd > tokenStart )
		{
			result.push_back( std::string( input.begin()+tokenStart, input.begin()+tokenEnd ) );
		}
		tokenStart = tokenEnd;
	}
	
	return result;      
}
