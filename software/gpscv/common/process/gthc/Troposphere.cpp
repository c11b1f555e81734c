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

#include <cmath>
#include <iostream>

#include "Debug.h"
#include "StationCoordinate.h"
#include "Troposphere.h"
#include "ZenithDelay.h"

// Hong Kong bounding box, degrees
#define HK_LAT_MIN 22.1
#define HK_LAT_MAX 22.6
#define HK_LON_MIN 113.8
#define HK_LON_MAX 114.5

#define DOY_MIN 1
#define DOY_MAX 366

#define DAYS_PER_YEAR 365.25

// Scale heights, in metres
const double Troposphere::ZHDScaleHeight = 8431.2;
const double Troposphere::annualZTDScaleHeight = 7228.8;
const double Troposphere::annualZWDScaleHeight = 3254.1;

// Seasonal model coefficients, fitted to Hong Kong CORS data
static const double A_ZTD[3] = {336.744129380450, 40.0468935232165, 7222.97084384999};
static const double A_ZWD[5] = {-16.7865051683731, 36218.6610049341, -130.895834349628,
	-36297.5776200211, 3253.60038161059};

int Troposphere::heightCorrection(const ZenithDelay &baseTrop,
	const StationCoordinate &baseCoor,const StationCoordinate &userCoor,
	int doy,bool seasonal,ZenithDelay *userTrop)
{
	if (doy < DOY_MIN || doy > DOY_MAX){
		DBGMSG(debugStream,WARNING,"bad DOY " << doy);
		return RangeError;
	}
	
	if (!isInHongKong(baseCoor.latitude,baseCoor.longitude) || 
		  !isInHongKong(userCoor.latitude,userCoor.longitude)){
		DBGMSG(debugStream,WARNING,"base (" << baseCoor.latitude << "," << baseCoor.longitude << ") user (" 
			<< userCoor.latitude << "," << userCoor.longitude << ") outside region");
		return DomainError;
	}
	
	double hgtDiff = userCoor.height - baseCoor.height;
	
	double betaZTD,betaZWD;
	if (seasonal){
		double t = doy/DAYS_PER_YEAR;
		betaZTD = seasonalZTDScaleHeight(t);
		betaZWD = seasonalZWDScaleHeight(t);
	}
	else{
		betaZTD = annualZTDScaleHeight;
		betaZWD = annualZWDScaleHeight;
	}
	
	DBGMSG(debugStream,TRACE,"height difference " << hgtDiff << " m, scale heights ZHD " << ZHDScaleHeight 
		<< " ZWD " << betaZWD << " ZTD " << betaZTD);
	
	userTrop->ztd = scale(baseTrop.ztd,hgtDiff,betaZTD);
	userTrop->zwd = scale(baseTrop.zwd,hgtDiff,betaZWD);
	userTrop->zhd = scale(baseTrop.zhd,hgtDiff,ZHDScaleHeight);
	
	return NoError;
}

bool Troposphere::isInHongKong(double lat,double lon)
{
	return (lat >= HK_LAT_MIN && lat <= HK_LAT_MAX) && 
	       (lon >= HK_LON_MIN && lon <= HK_LON_MAX);
}

double Troposphere::seasonalZTDScaleHeight(double t)
{
	return A_ZTD[0] * cos(2 * M_PI * t) + A_ZTD[1] * sin(2 * M_PI * t) + A_ZTD[2];
}

double Troposphere::seasonalZWDScaleHeight(double t)
{
	// NB the cos(4 pi t) term appears twice in the fitted model
	return A_ZWD[0] * cos(2 * M_PI * t) + A_ZWD[1] * cos(4 * M_PI * t) +
	       A_ZWD[2] * sin(2 * M_PI * t) + A_ZWD[3] * cos(4 * M_PI * t) + A_ZWD[4];
}

std::string Troposphere::errorString(int err)
{
	switch (err){
		case NoError:
			return "no error";
		case RangeError:
			return "DOY must be between 1 and 366";
		case DomainError:
			return "station coordinates outside Hong Kong region (Lat: 22.1-22.6, Lon: 113.8-114.5)";
		default:
			break;
	}
	return "unknown error";
}

//
//	Private
//

double Troposphere::scale(double delay,double hgtDiff,double beta)
{
	// Keep this evaluation order so that results are bit-reproducible
	return delay / exp(-hgtDiff / beta);
}
