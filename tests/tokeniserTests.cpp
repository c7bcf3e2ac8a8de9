#include "misc/tokeniser.h"

#include <gtest/gtest.h>

TEST( SplitLine, DropsDelimitors )
{
	std::vector<std::string> t = SplitLine( " < biscuits are delicious! Especially with chocolate > ", " <!>" );
	ASSERT_EQ( t.size(), 6u );
	EXPECT_EQ( t[0], "biscuits" );
	EXPECT_EQ( t[5], "chocolate" );
}

TEST( SplitLine, EdgeCases )
{
	EXPECT_TRUE( SplitLine( "", "," ).empty() );
	EXPECT_TRUE( SplitLine( ",,,", "," ).empty() );
	std::vector<std::string> t = SplitLine( "a", "," );
	ASSERT_EQ( t.size(), 1u );
	EXPECT_EQ( t[0], "a" );
}
