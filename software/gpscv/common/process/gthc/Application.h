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

#ifndef __APPLICATION_H_
#define __APPLICATION_H_

#include <string>

#include <configurator.h>

#include "StationCoordinate.h"
#include "ZenithDelay.h"

#define APP_NAME "gthc"
#define APP_AUTHORS "Michael Wouters"
#define APP_VERSION "0.1.0"
#define APP_CONFIG "gthc.conf"

class Application
{
	public:
		
		Application(int argc,char **argv);
		~Application();
		
		void run();
		
		void logMessage(std::string msg);
		
	private:
		
		int mjd;      // set on the command line
		int doy;      // set on the command line
		int cfgDOY;   // set in the configuration file
		bool mjdSet,doySet,cfgDOYSet;
		bool seasonal;
		bool seasonalOverride; // seasonal model selected on the command line
		bool userHeightOverride;
		double userHeight;
		
		std::string homeDir;
		std::string rootDir;
		std::string configurationFile;
		std::string logFile;
		
		ZenithDelay       baseTrop;
		StationCoordinate baseCoor;
		StationCoordinate userCoor;
		
		void init();
		std::string relativeToAbsolutePath(std::string);
		
		void fatalError(std::string msg,bool displayHelp=false);
		void setDebugStream(const char *);
		int  parseInt(const char *opt,const char *val);
		double parseDouble(const char *opt,const char *val);
		
		void showHelp();
		void showVersion();
		void showLicence();
		
		bool loadConfig();
		bool setConfig(ListEntry *,const char *,const char *,std::string &,bool *ok,bool required=true);
		bool setConfig(ListEntry *,const char *,const char *,double *,bool *ok,bool required=true);
		bool setConfig(ListEntry *,const char *,const char *,int *,bool *ok,bool required=true);
		bool setStation(ListEntry *,const char *,StationCoordinate *);
		
};
#endif
