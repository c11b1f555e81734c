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

#ifndef __UTILITY_H_
#define __UTILITY_H_

#include <string>

namespace Utility{
	
	void MJDtoDate(int mjd,int *year,int *mon, int *mday, int *yday);
	int  DateToMJD(int year, int month, int day);
	int  MJDtoDOY(int mjd);
	int  currentMJD();
	
	// DOY precedence: command line DOY, command line MJD, configured DOY, today's MJD
	// A supplied DOY is returned as is, so that out of range values are caught by the model
	int  resolveDOY(bool doySet,int doy,bool mjdSet,int mjd,bool cfgDOYSet,int cfgDOY,int todayMJD);
	
	// Accepts yes/true/no/false, case insensitive
	bool parseYesNo(std::string str,bool *val);
}
#endif
