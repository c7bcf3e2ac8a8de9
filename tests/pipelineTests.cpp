#include "timelapse/pipeline.h"
#include "timelapse/timelapseErrors.h"
#include "imgio/loadsave.h"
#include "tempDir.h"
#include "recordingSink.h"

#include <gtest/gtest.h>

using namespace boost::posix_time;
using boost::gregorian::date;

static instant_t At( int h, int m )
{
	return instant_t( date(2024,1,1), hours(h) + minutes(m) );
}

class PipelineTest : public ::testing::Test
{
protected:
	void SetUp()
	{
		settings.width  = 128;
		settings.height = 128;
		settings.fontScale = 0.3;
		settings.thickness = 1;
		settings.imageExtension = ".png";
		
		params.imageDir   = td.Str();
		params.startTime  = At(0,0);
		params.endTime    = At(0,30);
		params.sampleFreq = minutes(5);
	}
	
	// every image a different shade so we can tell which one made each frame.
	void AddImage( const std::string &name, int shade )
	{
		cv::Mat img( 16, 16, CV_8UC3, cv::Scalar(shade, 0, 0) );
		SaveImage( img, td.File(name) );
	}
	
	static int ShadeOf( const cv::Mat &frame )
	{
		return frame.at<cv::Vec3b>(1,1)[0];
	}
	
	TempDir td;
	RenderSettings settings;
	RenderParams params;
};

TEST_F( PipelineTest, FramesFollowTheGridInOrder )
{
	AddImage( "202401010020.png", 30 );
	AddImage( "202401010000.png", 10 );
	AddImage( "202401010010.png", 20 );
	
	RecordingSink sink;
	size_t n = RenderTimeSeries( params, settings, sink );
	
	// 00:00 .. 00:30 every 5 minutes
	ASSERT_EQ( n, 7u );
	ASSERT_EQ( sink.frames.size(), 7u );
	
	// 00:05 and 00:15 are ties, and go to the earlier image.
	int expected[] = { 10, 10, 20, 20, 30, 30, 30 };
	for( size_t c = 0; c < sink.frames.size(); ++c )
	{
		EXPECT_EQ( sink.frames[c].size(), cv::Size(128,128) );
		EXPECT_EQ( ShadeOf(sink.frames[c]), expected[c] ) << "frame " << c;
	}
	
	// finishing the sink is up to the caller.
	EXPECT_FALSE( sink.finished );
}

TEST_F( PipelineTest, SingleInstantGivesSingleFrame )
{
	AddImage( "202401010000.png", 10 );
	AddImage( "202401010010.png", 20 );
	params.startTime = At(0,7);
	params.endTime   = At(0,7);
	
	RecordingSink sink;
	EXPECT_EQ( RenderTimeSeries( params, settings, sink ), 1u );
	ASSERT_EQ( sink.frames.size(), 1u );
	EXPECT_EQ( ShadeOf(sink.frames[0]), 20 );
}

TEST_F( PipelineTest, EmptyDirectoryFailsWithEmptyIndex )
{
	RecordingSink sink;
	EXPECT_THROW( RenderTimeSeries( params, settings, sink ), EmptyIndex );
	EXPECT_TRUE( sink.frames.empty() );
}

TEST_F( PipelineTest, CropIsUsedForEveryFrame )
{
	AddImage( "202401010000.png", 10 );
	params.bounds = CropBounds(0,0,32,32);
	
	RecordingSink sink;
	EXPECT_THROW( RenderTimeSeries( params, settings, sink ), CropOutOfBounds );
	EXPECT_TRUE( sink.frames.empty() );
	
	params.bounds = CropBounds(4,4,12,12);
	EXPECT_EQ( RenderTimeSeries( params, settings, sink ), 7u );
}

TEST_F( PipelineTest, SinkFailureStopsTheRun )
{
	AddImage( "202401010000.png", 10 );
	
	RecordingSink sink;
	sink.failAfter = 3;
	EXPECT_THROW( RenderTimeSeries( params, settings, sink ), SinkWriteFailure );
	EXPECT_EQ( sink.frames.size(), 3u );
}

TEST_F( PipelineTest, MalformedNameFailsBeforeAnyFrame )
{
	AddImage( "202401010000.png", 10 );
	AddImage( "thumbnail.png", 10 );
	
	RecordingSink sink;
	EXPECT_THROW( RenderTimeSeries( params, settings, sink ), MalformedFilename );
	EXPECT_TRUE( sink.frames.empty() );
}
