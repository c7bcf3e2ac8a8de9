#ifndef TIMELAPSE_TEST_TEMPDIR_H
#define TIMELAPSE_TEST_TEMPDIR_H

#include <boost/filesystem.hpp>
#include <fstream>
#include <string>

// a scratch directory that is removed again when the test is done.
class TempDir
{
public:
	TempDir()
	{
		path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("timelapse-test-%%%%-%%%%-%%%%");
		boost::filesystem::create_directories(path);
	}
	
	~TempDir()
	{
		boost::system::error_code ec;
		boost::filesystem::remove_all(path, ec);
	}
	
	std::string Str() const
	{
		return path.string();
	}
	
	std::string File( const std::string &name ) const
	{
		return (path / name).string();
	}
	
	// an empty file, for when only the name matters.
	std::string Touch( const std::string &name ) const
	{
		std::string fn = File(name);
		std::ofstream f( fn.c_str() );
		return fn;
	}
	
	boost::filesystem::path path;
};

#endif
