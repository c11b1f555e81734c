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

#ifndef __TROPOSPHERE_H_
#define __TROPOSPHERE_H_

#include <string>

class StationCoordinate;
class ZenithDelay;

// Regional tropospheric height correction model for Hong Kong (GTHC-HK).
// Transfers zenith delays estimated at a reference station to a user station
// at a different height, using scale heights fitted to Hong Kong CORS data.

class Troposphere
{
	public:
		
		enum Errors {NoError=0, RangeError, DomainError};
		
		// Returns NoError and fills userTrop on success.
		// On error, userTrop is not modified.
		static int heightCorrection(const ZenithDelay &baseTrop,
			const StationCoordinate &baseCoor,const StationCoordinate &userCoor,
			int doy,bool seasonal,ZenithDelay *userTrop);
		
		static bool isInHongKong(double lat,double lon);
		
		// t is the day of year normalized to the year ie DOY/365.25
		static double seasonalZTDScaleHeight(double t);
		static double seasonalZWDScaleHeight(double t);
		
		static std::string errorString(int err);
		
		static const double ZHDScaleHeight;
		static const double annualZTDScaleHeight;
		static const double annualZWDScaleHeight;
		
	private:
	
		static double scale(double delay,double hgtDiff,double beta);
		
};

#endif
