//
//
// The MIT License (MIT)
//
// Copyright (c) 2023  Michael J. Wouters
// 
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
// 
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
// 
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include <getopt.h>

#include <cstdlib>

#include <iomanip>
#include <iostream>
#include <fstream>
#include <string>

#include <boost/lexical_cast.hpp>

#include <configurator.h>

#include "Application.h"
#include "Debug.h"
#include "Troposphere.h"
#include "Utility.h"

extern Application *app;

Application *app;

static struct option longOptions[] = {
		{"configuration",required_argument, 0,  0 },
		{"debug",        required_argument, 0,  0 },
		{"help",         no_argument, 0, 0 },
		{"mjd",          required_argument, 0,  0 },
		{"verbosity",    required_argument, 0,  0 },
		{"version",      no_argument, 0,  0 },
		{"shorten",no_argument, 0,  0 },
		{"licence",no_argument, 0,  0 },
		{"doy",          required_argument, 0,  0 },
		{"seasonal",     no_argument, 0,  0 },
		{"annual",       no_argument, 0,  0 },
		{"user-height",  required_argument, 0,  0 },
		{0,0,0,0}
};

using boost::lexical_cast;
using boost::bad_lexical_cast;

//
//	Public members
//

Application::Application(int argc,char **argv)
{
	app = this;
	
	init();

	// Process the command line options
	// These override anything in the configuration file, default or specified
	int longIndex;
	int c;
	
	while ((c=getopt_long(argc,argv,"c:d:hm:y:sa",longOptions,&longIndex)) != -1)
	{
		
		switch(c)
		{
			
			case 0: // long options
				{
					switch (longIndex)
					{
						case 0: // --configuration
							configurationFile=optarg;
							break;
						case 1: // --debug
							setDebugStream(optarg);
							break;
						case 2: // --help
							showHelp();
							exit(EXIT_SUCCESS);
							break;
						case 3: // --mjd
							mjd = parseInt("--mjd",optarg);
							mjdSet = true;
							break;
						case 4: // --verbosity
							verbosity = parseInt("--verbosity",optarg);
							break;
						case 5: // --version
							showVersion();
							exit(EXIT_SUCCESS);
							break;
						case 6:// --shorten
							shortDebugMessage=true;
							break;
						case 7:// --licence
							showLicence();
							exit(EXIT_SUCCESS);
							break;
						case 8:// --doy
							doy = parseInt("--doy",optarg);
							doySet = true;
							break;
						case 9:// --seasonal
							seasonal = true;
							seasonalOverride = true;
							break;
						case 10:// --annual
							seasonal = false;
							seasonalOverride = true;
							break;
						case 11:// --user-height
							userHeight = parseDouble("--user-height",optarg);
							userHeightOverride = true;
							break;
						default:
							showHelp();
							exit(EXIT_FAILURE);
							break;
					}
				}
				break;
			case 'c':
				configurationFile = optarg;
				break;
			case 'd':
				setDebugStream(optarg);
				break;
			case 'h':
				showHelp();
				exit(EXIT_SUCCESS);
				break;
			case 'm':
				mjd = parseInt("--mjd",optarg);
				mjdSet = true;
				break;
			case 'y':
				doy = parseInt("--doy",optarg);
				doySet = true;
				break;
			case 's':
				seasonal = true;
				seasonalOverride = true;
				break;
			case 'a':
				seasonal = false;
				seasonalOverride = true;
				break;
			default:
				showHelp();
				exit(EXIT_FAILURE);
				break;
		}
	}

	if (!loadConfig()){
		fatalError("Error! Configuration failed");
	}
	
	if (userHeightOverride)
		userCoor.height = userHeight;
}

Application::~Application()
{
	
}

void Application::run()
{
	int dayOfYear = Utility::resolveDOY(doySet,doy,mjdSet,mjd,cfgDOYSet,cfgDOY,Utility::currentMJD());
	
	DBGMSG(debugStream,INFO,"Running for DOY " << dayOfYear << (seasonal ? " (seasonal model)" : " (annual mean model)"));
	DBGMSG(debugStream,TRACE,"base ZTD - (ZHD + ZWD) = " << baseTrop.ztd - (baseTrop.zhd + baseTrop.zwd) << " mm");
	
	ZenithDelay userTrop;
	int err = Troposphere::heightCorrection(baseTrop,baseCoor,userCoor,dayOfYear,seasonal,&userTrop);
	if (err != Troposphere::NoError){
		std::string msg = std::string(APP_NAME) + ": " + Troposphere::errorString(err);
		logMessage(msg);
		fatalError("Error! " + msg);
	}
	
	DBGMSG(debugStream,TRACE,"user ZTD - (ZHD + ZWD) = " << userTrop.ztd - (userTrop.zhd + userTrop.zwd) << " mm");
	
	std::cout << "Corrected tropospheric delays:" << std::endl;
	std::cout << std::fixed << std::setprecision(2);
	std::cout << "ZHD = " << userTrop.zhd << " mm" << std::endl;
	std::cout << "ZWD = " << userTrop.zwd << " mm" << std::endl;
	std::cout << "ZTD = " << userTrop.ztd << " mm" << std::endl;
}

void Application::logMessage(std::string msg)
{
	std::ofstream ofs;
	ofs.open(logFile.c_str(),std::ios::app);
	if (ofs.is_open()){
		ofs << msg << std::endl;
		ofs.close();
	}
	else{
		DBGMSG(debugStream,WARNING,"unable to open " << logFile);
	}
	
	DBGMSG(debugStream,INFO,msg);
}

//
//	Private members
//

void Application::init()
{
	mjd = doy = cfgDOY = 0;
	mjdSet = doySet = cfgDOYSet = false;
	seasonal = true;
	seasonalOverride = false;
	userHeightOverride = false;
	userHeight = 0.0;
	
	char *penv;
	homeDir="";
	if ((penv = getenv("HOME"))){
		homeDir=penv;
	}
	rootDir=homeDir;
	
	configurationFile = rootDir + "/etc/" + APP_CONFIG;
	logFile = rootDir + "/logs/" + APP_NAME + ".log";
}

std::string Application::relativeToAbsolutePath(std::string path)
{
	std::string absPath=path;
	if (path.size() > 0){ 
		if (path.at(0) == '/')
			absPath = path;
		else 
			absPath=rootDir+"/"+path;
	}
	return absPath;
}

void Application::fatalError(std::string msg,bool displayHelp){
	if (displayHelp){
		showHelp();
	}
	std::cerr << msg << std::endl;
	exit(EXIT_FAILURE);
}

void Application::setDebugStream(const char *opt)
{
	std::string dbgout = opt;
	if ((std::string::npos != dbgout.find("stderr"))){
		debugStream = & std::cerr;
	}
	else{
		debugFileName = dbgout;
		debugLog.open(debugFileName.c_str(),std::ios_base::out);
		if (!debugLog.is_open()){
			fatalError("Error! Unable to open " + dbgout);
		}
		debugStream = & debugLog;
	}
}

int Application::parseInt(const char *opt,const char *val)
{
	int ival=0;
	try{
		ival = lexical_cast<int>(val);
	}
	catch(const bad_lexical_cast &){
		fatalError(std::string("Error! Bad value for option ") + opt,true);
	}
	return ival;
}

double Application::parseDouble(const char *opt,const char *val)
{
	double dval=0.0;
	try{
		dval = lexical_cast<double>(val);
	}
	catch(const bad_lexical_cast &){
		fatalError(std::string("Error! Bad value for option ") + opt,true);
	}
	return dval;
}

void Application::showHelp()
{
	std::cout << std::endl << APP_NAME << " version " << APP_VERSION << std::endl;
	std::cout << "Usage: " << APP_NAME << " [options]" << std::endl;
	std::cout << "Available options are" << std::endl;
	std::cout << "-a,--annual               use the annual mean model" << std::endl;
	std::cout << "-c,--configuration <file> full path to the configuration file" << std::endl;
	std::cout << "-d,--debug <file>         turn on debugging to <file> (use 'stderr' for output to stderr)" << std::endl;
	std::cout << "-h,--help                 print this help message" << std::endl;
	std::cout << "-m,--mjd <n>              set the DOY from an MJD" << std::endl;
	std::cout << "-s,--seasonal             use the seasonal model" << std::endl;
	std::cout << "-y,--doy <n>              set the DOY" << std::endl;
	std::cout << "--user-height <m>         set the user station height" << std::endl;
	std::cout << "--shorten                 shorten debugging messages" << std::endl;
	std::cout << "--verbosity <n>           set debugging verbosity" << std::endl;
	std::cout << "--version                 show version" << std::endl;
	std::cout << "--licence                 show licence" << std::endl;

}

void Application::showVersion()
{
	std::cout << APP_NAME <<  " version " << APP_VERSION << std::endl;
	std::cout << "Written by " << APP_AUTHORS << std::endl;
}

void Application::showLicence()
{

std::cout <<  " The MIT License (MIT)" << std::endl;
std::cout << std::endl;
std::cout <<  " Copyright (c) 2023  Michael J. Wouters" << std::endl;
std::cout << std::endl; 
std::cout <<  " Permission is hereby granted, free of charge, to any person obtaining a copy" << std::endl;
std::cout <<  " of this software and associated documentation files (the \"Software\"), to deal" << std::endl;
std::cout <<  " in the Software without restriction, including without limitation the rights" << std::endl;
std::cout <<  " to use, copy, modify, merge, publish, distribute, sublicense, and/or sell" << std::endl;
std::cout <<  " copies of the Software, and to permit persons to whom the Software is" << std::endl;
std::cout <<  " furnished to do so, subject to the following conditions:" << std::endl;
std::cout << std::endl;
std::cout <<  " The above copyright notice and this permission notice shall be included in" << std::endl;
std::cout <<  " all copies or substantial portions of the Software." << std::endl;
std::cout << std::endl;
std::cout <<  " THE SOFTWARE IS PROVIDED \"AS IS\", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR" << std::endl;
std::cout <<  " IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY," << std::endl;
std::cout <<  " FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE" << std::endl;
std::cout <<  " AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER" << std::endl;
std::cout <<  " LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM," << std::endl;
std::cout <<  " OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN" << std::endl;
std::cout <<  " THE SOFTWARE." << std::endl;
}


bool Application::loadConfig()
{
	
	ListEntry *last;
	if (!configfile_parse_as_list(&last,configurationFile.c_str())){
		std::cerr << "Unable to open the configuration file " << configurationFile << " - exiting" << std::endl;
		exit(EXIT_FAILURE);
	}
	
	bool configOK=true;
	std::string stmp;
	
	//
	// Paths
	//
	std::string path="";	
	
	// Parse root path first so that other paths can be constructed correctly
	if (setConfig(last,"paths","root",path,&configOK,false)){
		rootDir=path;
		if (rootDir.at(0) != '/') // not an absolute path so make it relative to the home directory
			rootDir=homeDir+"/"+rootDir;
		logFile = rootDir + "/logs/" + APP_NAME + ".log";
	}
	
	if (setConfig(last,"paths","log",path,&configOK,false))
		logFile=relativeToAbsolutePath(path);
	DBGMSG(debugStream,TRACE,"log file: " << logFile);
	
	//
	// Stations
	//
	if (!setStation(last,"base station",&baseCoor))
		configOK=false;
	
	setConfig(last,"base station","zhd",&(baseTrop.zhd),&configOK);
	setConfig(last,"base station","zwd",&(baseTrop.zwd),&configOK);
	setConfig(last,"base station","ztd",&(baseTrop.ztd),&configOK);
	
	if (!setStation(last,"user station",&userCoor))
		configOK=false;
	
	//
	// Model
	//
	if (setConfig(last,"model","seasonal",stmp,&configOK,false)){
		if (!seasonalOverride){
			if (!Utility::parseYesNo(stmp,&seasonal)){
				std::cerr << "unknown value for model::seasonal " << stmp << std::endl;
				configOK=false;
			}
		}
	}
	
	cfgDOYSet = setConfig(last,"model","doy",&cfgDOY,&configOK,false);
	
	DBGMSG(debugStream,TRACE,"parsed config ");
	
	return configOK;
}

bool Application::setStation(ListEntry *last,const char *section,StationCoordinate *coor)
{
	bool configOK=true;
	setConfig(last,section,"latitude",&(coor->latitude),&configOK);
	setConfig(last,section,"longitude",&(coor->longitude),&configOK);
	setConfig(last,section,"height",&(coor->height),&configOK);
	DBGMSG(debugStream,TRACE,section << " " << coor->latitude << " " << coor->longitude << " " << coor->height);
	return configOK;
}

bool Application::setConfig(ListEntry *last,const char *section,const char *token,std::string &val,bool *ok,bool required)
{
	char *stmp;
	if (list_get_string(last,section,token,&stmp)){
		val=stmp;
	}
	else{
		int err = config_file_get_last_error(NULL,0);
		if ((err==TokenNotFound || err==SectionNotFound) && required){
			std::cerr << "Missing entry for " << section << "::" << token << std::endl;
			*ok = false;
			return false;
		}
		else if (err==TokenNotFound || err==SectionNotFound){
			return false;
		}
		else if (err==ParseFailed){
			std::cerr << "Syntax error in " << section << "::" << token << std::endl;
			*ok = false;
			return false;
		}
		else{
			std::cerr << "Error reading " << section << "::" << token << std::endl;
			*ok = false;
			return false;
		}
	}
	return true;
}

bool Application::setConfig(ListEntry *last,const char *section,const char *token,double *val,bool *ok,bool required)
{
	double dtmp;
	if (list_get_double(last,section,token,&dtmp)){
		*val=dtmp;
		return true;
	}
	else{
		int err = config_file_get_last_error(NULL,0);
		if ((err==TokenNotFound || err==SectionNotFound) && required){
			std::cerr << "Missing entry for " << section << "::" << token << std::endl;
			*ok = false;
			return false;
		}
		else if (err==TokenNotFound || err==SectionNotFound){
			return false;
		}
		else if (err==ParseFailed){
			std::cerr << "Syntax error in " << section << "::" << token << std::endl;
			*ok=false;
			return false;
		}
		else{
			std::cerr << "Error reading " << section << "::" << token << std::endl;
			*ok = false;
			return false;
		}
	}
	return true;
}

bool Application::setConfig(ListEntry *last,const char *section,const char *token,int *val,bool *ok,bool required)
{
	int itmp;
	if (list_get_int(last,section,token,&itmp)){
		*val=itmp;
		return true;
	}
	else{
		int err = config_file_get_last_error(NULL,0);
		if ((err==TokenNotFound || err==SectionNotFound) && required){
			std::cerr << "Missing entry for " << section << "::" << token << std::endl;
			*ok = false;
			return false;
		}
		else if (err==TokenNotFound || err==SectionNotFound){
			return false;
		}
		else if (err==ParseFailed){
			std::cerr << "Syntax error in " << section << "::" << token << std::endl;
			*ok = false;
			return false;
		}
		else{
			std::cerr << "Error reading " << section << "::" << token << std::endl;
			*ok = false;
			return false;
		}
	}
	return true;
}
