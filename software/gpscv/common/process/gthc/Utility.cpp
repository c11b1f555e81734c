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

#include <ctime>

#include <boost/algorithm/string.hpp>

#include "Debug.h"
#include "Utility.h"

#define MJD_UNIX_EPOCH 40587 // MJD of 1970-01-01

void Utility::MJDtoDate(int mjd,int *year,int *mon, int *mday, int *yday)
{
	time_t tt = (time_t)(mjd - MJD_UNIX_EPOCH)*86400;
	struct tm utc;
	gmtime_r(&tt,&utc);
	*year = 1900 + utc.tm_year;
	*mon  = utc.tm_mon+1;
	*mday = utc.tm_mday;
	*yday = utc.tm_yday+1;
}


int Utility::DateToMJD(int year, int month, int day)
{
	// from TVB at leapsecond.com
	long Y = year, M = month, D = day;
	long mjd =
		367 * Y
		- 7 * (Y + (M + 9) / 12) / 4
		- 3 * ((Y + (M - 9) / 7) / 100 + 1) / 4
		+ 275 * M / 9
		+ D + 1721029 - 2400001;
	return mjd;
}

int Utility::MJDtoDOY(int mjd)
{
	int year,mon,mday,yday;
	MJDtoDate(mjd,&year,&mon,&mday,&yday);
	return yday;
}

int Utility::currentMJD()
{
	return int(time(0)/86400) + MJD_UNIX_EPOCH;
}

int Utility::resolveDOY(bool doySet,int doy,bool mjdSet,int mjd,bool cfgDOYSet,int cfgDOY,int todayMJD)
{
	if (doySet){
		DBGMSG(debugStream,TRACE,"DOY from the command line");
		return doy;
	}
	if (mjdSet){
		DBGMSG(debugStream,TRACE,"DOY from MJD " << mjd);
		return MJDtoDOY(mjd);
	}
	if (cfgDOYSet){
		DBGMSG(debugStream,TRACE,"DOY from the configuration file");
		return cfgDOY;
	}
	DBGMSG(debugStream,TRACE,"DOY from today's MJD " << todayMJD);
	return MJDtoDOY(todayMJD);
}

bool Utility::parseYesNo(std::string str,bool *val)
{
	boost::trim(str);
	boost::to_upper(str);
	if (str=="YES" or str=="TRUE"){
		*val = true;
		return true;
	}
	else if (str=="NO" or str=="FALSE"){
		*val = false;
		return true;
	}
	return false;
}
