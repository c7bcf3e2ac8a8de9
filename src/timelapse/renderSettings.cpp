#include "timelapse/renderSettings.h"
#include "timelapse/timelapseErrors.h"

#include "libconfig.h++"

#include <sstream>
#include <iostream>
using std::cout;
using std::endl;

RenderSettings::RenderSettings()
{
	fps    = 12;
	width  = 1024;
	height = 1024;
	
	imageExtension = ".jpg";
	
	// tomato
	labelColour = cv::Scalar( 71, 99, 255 );
	fontScale   = 1.6;
	thickness   = 2;
	
	labelCentreX = 0.47f;
	labelBaseY   = 0.945f;
	
	codec  = "h264";
	pixfmt = "yuv420p";
	crf    = 18;
}

// set out from the config if the setting is there. A setting of the wrong
// type is an error, not something to quietly ignore.
template< typename T >
static void LookupIfSet( const libconfig::Config &cfg, const char *name, T &out, const std::string &cfgFile )
{
	if( cfg.exists(name) && !cfg.lookupValue(name, out) )
	{
		throw TimelapseError("Setting '" + std::string(name) + "' in " + cfgFile + " has the wrong type");
	}
}

RenderSettings LoadRenderSettings( const std::string &cfgFile )
{
	RenderSettings rs;
	
	libconfig::Config cfg;
	try
	{
		cfg.readFile( cfgFile.c_str() );
		
		LookupIfSet(cfg, "fps", rs.fps, cfgFile);
		LookupIfSet(cfg, "width", rs.width, cfgFile);
		LookupIfSet(cfg, "height", rs.height, cfgFile);
		
		if( cfg.exists("imageExtension") )
			rs.imageExtension = (const char*)cfg.lookup("imageExtension");
		
		if( cfg.exists("labelColour") )
		{
			libconfig::Setting &c = cfg.lookup("labelColour");
			if( c.getLength() != 3 )
				throw TimelapseError("labelColour in " + cfgFile + " should be (r, g, b)");
			int r = c[0];
			int g = c[1];
			int b = c[2];
			rs.labelColour = cv::Scalar( b, g, r );
		}
		
		LookupIfSet(cfg, "fontScale", rs.fontScale, cfgFile);
		LookupIfSet(cfg, "thickness", rs.thickness, cfgFile);
		LookupIfSet(cfg, "labelCentreX", rs.labelCentreX, cfgFile);
		LookupIfSet(cfg, "labelBaseY", rs.labelBaseY, cfgFile);
		
		if( cfg.exists("codec") )
			rs.codec = (const char*)cfg.lookup("codec");
		if( cfg.exists("pixfmt") )
			rs.pixfmt = (const char*)cfg.lookup("pixfmt");
		LookupIfSet(cfg, "crf", rs.crf, cfgFile);
	}
	catch( libconfig::FileIOException &e )
	{
		throw TimelapseError("Could not read render config file: " + cfgFile );
	}
	catch( libconfig::SettingException &e)
	{
		throw TimelapseError("Setting error in " + cfgFile + ": " + e.what() + " at " + e.getPath() );
	}
	catch( libconfig::ParseException &e )
	{
		std::stringstream ss;
		ss << "Parse error in render config " << cfgFile << ":" << e.getLine() << ": " << e.getError();
		throw TimelapseError( ss.str() );
	}
	
	if( rs.fps <= 0 || rs.width <= 0 || rs.height <= 0 )
	{
		throw TimelapseError("fps, width and height in " + cfgFile + " must be positive");
	}
	
	cout << "render settings from " << cfgFile << ": " << rs.width << "x" << rs.height << " @ " << rs.fps << " fps" << endl;
	
	return rs;
}
