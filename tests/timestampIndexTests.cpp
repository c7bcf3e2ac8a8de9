#include "timelapse/timestampIndex.h"
#include "timelapse/timelapseErrors.h"
#include "tempDir.h"

#include <gtest/gtest.h>

using namespace boost::posix_time;
using boost::gregorian::date;

TEST( ParseFilenameTimestamp, ReadsLeadingTwelveDigits )
{
	EXPECT_EQ( ParseFilenameTimestamp("202401020304.jpg"), ptime( date(2024,1,2), time_duration(3,4,0) ) );
	EXPECT_EQ( ParseFilenameTimestamp("202312312359_GOES16-ABI-CONUS.jpg"), ptime( date(2023,12,31), time_duration(23,59,0) ) );
}

TEST( ParseFilenameTimestamp, RejectsMalformedNames )
{
	EXPECT_THROW( ParseFilenameTimestamp("image.jpg"), MalformedFilename );
	EXPECT_THROW( ParseFilenameTimestamp("20240102.jpg"), MalformedFilename );
	EXPECT_THROW( ParseFilenameTimestamp("2024010203x4.jpg"), MalformedFilename );
	EXPECT_THROW( ParseFilenameTimestamp("202413020304.jpg"), MalformedFilename );
	EXPECT_THROW( ParseFilenameTimestamp("202402300304.jpg"), MalformedFilename );
	EXPECT_THROW( ParseFilenameTimestamp("202401022404.jpg"), MalformedFilename );
	EXPECT_THROW( ParseFilenameTimestamp("202401020360.jpg"), MalformedFilename );
}

TEST( BuildTimeIndex, SortedRegardlessOfListingOrder )
{
	TempDir td;
	td.Touch("202401010030.jpg");
	td.Touch("202401010000.jpg");
	td.Touch("202312312350.jpg");
	td.Touch("202401010010.jpg");
	td.Touch("202401010010_dup.jpg");
	
	TimeIndex index = BuildTimeIndex( td.Str(), ".jpg" );
	ASSERT_EQ( index.size(), 5u );
	for( size_t c = 1; c < index.size(); ++c )
		EXPECT_LE( index[c-1].timestamp, index[c].timestamp );
	
	EXPECT_EQ( index.front().timestamp, ptime( date(2023,12,31), time_duration(23,50,0) ) );
	EXPECT_EQ( index.back().path, td.File("202401010030.jpg") );
	
	// both images at 00:10 are kept
	EXPECT_EQ( index[2].timestamp, index[3].timestamp );
}

TEST( BuildTimeIndex, OnlyPicksUpTheImageExtension )
{
	TempDir td;
	td.Touch("202401010000.jpg");
	td.Touch("202401010005.JPG");
	td.Touch("notes.txt");
	td.Touch("202401010010.png");
	boost::filesystem::create_directories( td.path / "202401010015.jpg" );
	
	TimeIndex index = BuildTimeIndex( td.Str(), ".jpg" );
	ASSERT_EQ( index.size(), 2u );
	EXPECT_EQ( index[0].path, td.File("202401010000.jpg") );
	EXPECT_EQ( index[1].path, td.File("202401010005.JPG") );
}

TEST( BuildTimeIndex, MalformedNameAbortsIndexing )
{
	TempDir td;
	td.Touch("202401010000.jpg");
	td.Touch("latest.jpg");
	
	EXPECT_THROW( BuildTimeIndex( td.Str(), ".jpg" ), MalformedFilename );
}

TEST( BuildTimeIndex, EmptyDirectoryGivesEmptyIndex )
{
	TempDir td;
	EXPECT_TRUE( BuildTimeIndex( td.Str(), ".jpg" ).empty() );
}

TEST( BuildTimeIndex, MissingDirectoryThrows )
{
	TempDir td;
	EXPECT_THROW( BuildTimeIndex( td.File("nope"), ".jpg" ), TimelapseError );
}
