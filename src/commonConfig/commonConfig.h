#ifndef TIMELAPSE_COMMON_CONFIG
#define TIMELAPSE_COMMON_CONFIG

#include "libconfig.h++"
#include "timelapse/timelapseErrors.h"

#include <cstdlib>
#include <sstream>
#include <boost/filesystem.hpp>

#if defined(__APPLE__) || defined(  __gnu_linux__  )
#include <unistd.h>
#include <sys/types.h>
#include "pwd.h"
#endif

#include <iostream>
using std::cout;
using std::endl;

// certain things are more usefully specified once in a 
// user's common config file, ~/.timelapse.common.cfg
//
//   ffmpegPath = "/usr/local/bin/ffmpeg";
//
// If there's no such file we just go with the defaults.

class CommonConfig
{
public:
	std::string ffmpegPath;
	
	CommonConfig()
	{
		ffmpegPath = "/usr/bin/ffmpeg";
		
		std::string userHome;
#if defined(__APPLE__) || defined( __gnu_linux__ )
		struct passwd* pwd = getpwuid(getuid());
		if (pwd)
		{
			userHome = pwd->pw_dir;
		}
		else if( getenv("HOME") )
		{
			// try the $HOME environment variable
			userHome = getenv("HOME");
		}
#elif defined(_WIN32)
		// assume we're in a run directory, just use current dir.
		userHome = "./";
#else
		throw std::runtime_error("unknown platform, common config home dir");
#endif
		
		std::stringstream ss;
		ss << userHome << "/.timelapse.common.cfg";
		boost::filesystem::path p(ss.str());
		if( userHome.empty() || !boost::filesystem::exists(p) )
			return;
		
		try
		{
			libconfig::Config cfg;
			cfg.readFile( ss.str().c_str() );
			
			if( cfg.exists("ffmpegPath") )
				ffmpegPath = (const char*) cfg.lookup("ffmpegPath");
		}
		catch( libconfig::SettingException &e)
		{
			throw TimelapseError("Error reading common config file: " + ss.str() + ": " + e.what() + " at " + e.getPath() );
		}
		catch( libconfig::ParseException &e )
		{
			std::stringstream es;
			es << "Error parsing common config file: " << e.getFile() << ":" << e.getLine() << ": " << e.getError();
			throw TimelapseError( es.str() );
		}
	};
};


#endif
