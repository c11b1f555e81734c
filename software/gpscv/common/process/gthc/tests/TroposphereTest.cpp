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
#include <string>

#include "StationCoordinate.h"
#include "Troposphere.h"
#include "ZenithDelay.h"

namespace
{

int expect_true(bool cond,const std::string &message)
{
	if (!cond){
		std::cerr << "[troposphere] FAIL: " << message << std::endl;
		return 1;
	}
	return 0;
}

// relative tolerance
int expect_close(double actual,double expected,const std::string &label,double tol=1.0e-9)
{
	if (fabs(actual - expected) > tol*fabs(expected)){
		std::cerr.precision(17);
		std::cerr << "[troposphere] FAIL: " << label
			<< " actual=" << actual
			<< " expected=" << expected
			<< " tol=" << tol << std::endl;
		return 1;
	}
	return 0;
}

const ZenithDelay       BASE_TROP(2200,150,2350);
const StationCoordinate BASE_COOR(22.3,114.2,50);
const StationCoordinate USER_COOR(22.35,114.15,200);

int test_reference_scenario_seasonal()
{
	int failures=0;
	ZenithDelay user;
	int err = Troposphere::heightCorrection(BASE_TROP,BASE_COOR,USER_COOR,150,true,&user);
	failures += expect_true(err == Troposphere::NoError,"seasonal scenario succeeds");
	failures += expect_close(user.zhd,2239.4905839740068,"seasonal ZHD");
	failures += expect_close(user.zwd,157.2826604760416,"seasonal ZWD");
	failures += expect_close(user.ztd,2401.2022268815617,"seasonal ZTD");
	failures += expect_close(user.zhd,2200.0*exp(150.0/8431.2),"ZHD closed form",1.0e-6);
	return failures;
}

int test_reference_scenario_annual()
{
	int failures=0;
	ZenithDelay user;
	int err = Troposphere::heightCorrection(BASE_TROP,BASE_COOR,USER_COOR,150,false,&user);
	failures += expect_true(err == Troposphere::NoError,"annual scenario succeeds");
	failures += expect_close(user.zhd,2239.4905839740068,"annual ZHD");
	failures += expect_close(user.zwd,157.07619227750027,"annual ZWD");
	failures += expect_close(user.ztd,2399.272724953758,"annual ZTD");
	return failures;
}

int test_zero_height_difference_is_identity()
{
	int failures=0;
	StationCoordinate user(22.5,114.4,BASE_COOR.height);
	for (int doy=1;doy<=366;doy+=73){
		for (int s=0;s<2;s++){
			ZenithDelay out;
			int err = Troposphere::heightCorrection(BASE_TROP,BASE_COOR,user,doy,s==1,&out);
			failures += expect_true(err == Troposphere::NoError,"zero height difference succeeds");
			failures += expect_true(out.zhd == BASE_TROP.zhd && out.zwd == BASE_TROP.zwd && out.ztd == BASE_TROP.ztd,
				"zero height difference leaves delays unchanged");
		}
	}
	return failures;
}

int test_monotonic_in_height_difference()
{
	int failures=0;
	ZenithDelay prev;
	StationCoordinate user = USER_COOR;
	user.height = -500.0;
	Troposphere::heightCorrection(BASE_TROP,BASE_COOR,user,200,true,&prev);
	for (double h=-400.0;h<=1000.0;h+=100.0){
		user.height = h;
		ZenithDelay curr;
		Troposphere::heightCorrection(BASE_TROP,BASE_COOR,user,200,true,&curr);
		failures += expect_true(curr.zhd > prev.zhd,"ZHD increases with height difference");
		failures += expect_true(curr.zwd > prev.zwd,"ZWD increases with height difference");
		failures += expect_true(curr.ztd > prev.ztd,"ZTD increases with height difference");
		prev = curr;
	}
	return failures;
}

int test_seasonal_models_are_periodic()
{
	int failures=0;
	failures += expect_close(Troposphere::seasonalZTDScaleHeight(0.0),Troposphere::seasonalZTDScaleHeight(1.0),"ZTD scale height t=0,1",1.0e-12);
	failures += expect_close(Troposphere::seasonalZWDScaleHeight(0.0),Troposphere::seasonalZWDScaleHeight(1.0),"ZWD scale height t=0,1",1.0e-12);
	failures += expect_close(Troposphere::seasonalZTDScaleHeight(0.3),Troposphere::seasonalZTDScaleHeight(1.3),"ZTD scale height t=0.3,1.3",1.0e-12);
	failures += expect_close(Troposphere::seasonalZWDScaleHeight(0.3),Troposphere::seasonalZWDScaleHeight(1.3),"ZWD scale height t=0.3,1.3",1.0e-12);
	return failures;
}

int test_seasonal_model_values()
{
	int failures=0;
	failures += expect_close(Troposphere::seasonalZTDScaleHeight(150/365.25),6959.1967679791205,"ZTD scale height DOY 150");
	failures += expect_close(Troposphere::seasonalZWDScaleHeight(150/365.25),3163.9376780312164,"ZWD scale height DOY 150");
	failures += expect_close(Troposphere::seasonalZTDScaleHeight(1/365.25),7560.354018886859,"ZTD scale height DOY 1");
	failures += expect_close(Troposphere::seasonalZWDScaleHeight(1/365.25),3155.6948324240825,"ZWD scale height DOY 1");
	// at t=0 the models reduce to the sum of the cosine coefficients and the offset
	failures += expect_close(Troposphere::seasonalZTDScaleHeight(0.0),336.744129380450 + 7222.97084384999,"ZTD scale height t=0");
	return failures;
}

int test_doy_bounds()
{
	int failures=0;
	ZenithDelay out;
	failures += expect_true(Troposphere::heightCorrection(BASE_TROP,BASE_COOR,USER_COOR,1,true,&out) == Troposphere::NoError,"DOY 1 accepted");
	failures += expect_true(Troposphere::heightCorrection(BASE_TROP,BASE_COOR,USER_COOR,366,true,&out) == Troposphere::NoError,"DOY 366 accepted");
	failures += expect_true(Troposphere::heightCorrection(BASE_TROP,BASE_COOR,USER_COOR,0,true,&out) == Troposphere::RangeError,"DOY 0 rejected");
	failures += expect_true(Troposphere::heightCorrection(BASE_TROP,BASE_COOR,USER_COOR,367,false,&out) == Troposphere::RangeError,"DOY 367 rejected");
	
	// the range check comes before the region check
	StationCoordinate outside(0.0,0.0,0.0);
	failures += expect_true(Troposphere::heightCorrection(BASE_TROP,outside,USER_COOR,0,true,&out) == Troposphere::RangeError,
		"DOY checked before region");
	return failures;
}

int test_region_bounds()
{
	int failures=0;
	failures += expect_true(Troposphere::isInHongKong(22.1,113.8),"south west corner accepted");
	failures += expect_true(Troposphere::isInHongKong(22.6,114.5),"north east corner accepted");
	failures += expect_true(!Troposphere::isInHongKong(22.09,113.8),"south of the region rejected");
	failures += expect_true(!Troposphere::isInHongKong(22.61,114.0),"north of the region rejected");
	failures += expect_true(!Troposphere::isInHongKong(22.3,113.79),"west of the region rejected");
	failures += expect_true(!Troposphere::isInHongKong(22.3,114.51),"east of the region rejected");
	
	ZenithDelay out;
	StationCoordinate corner(22.1,113.8,10.0);
	StationCoordinate south(22.09,113.8,10.0);
	failures += expect_true(Troposphere::heightCorrection(BASE_TROP,corner,USER_COOR,100,true,&out) == Troposphere::NoError,
		"base station on the boundary accepted");
	failures += expect_true(Troposphere::heightCorrection(BASE_TROP,south,USER_COOR,100,true,&out) == Troposphere::DomainError,
		"base station outside rejected");
	failures += expect_true(Troposphere::heightCorrection(BASE_TROP,BASE_COOR,south,100,true,&out) == Troposphere::DomainError,
		"user station outside rejected");
	return failures;
}

int test_error_leaves_output_untouched()
{
	int failures=0;
	ZenithDelay out(-1.0,-2.0,-3.0);
	StationCoordinate kowloonTong(22.33,114.17,0.0);
	StationCoordinate macau(22.19,113.54,0.0);
	
	Troposphere::heightCorrection(BASE_TROP,BASE_COOR,macau,100,true,&out);
	failures += expect_true(out.zhd == -1.0 && out.zwd == -2.0 && out.ztd == -3.0,"output unchanged after DomainError");
	Troposphere::heightCorrection(BASE_TROP,BASE_COOR,kowloonTong,400,true,&out);
	failures += expect_true(out.zhd == -1.0 && out.zwd == -2.0 && out.ztd == -3.0,"output unchanged after RangeError");
	return failures;
}

int test_error_strings()
{
	int failures=0;
	failures += expect_true(Troposphere::errorString(Troposphere::RangeError).find("DOY") != std::string::npos,"RangeError message");
	failures += expect_true(Troposphere::errorString(Troposphere::DomainError).find("Hong Kong") != std::string::npos,"DomainError message");
	failures += expect_true(Troposphere::errorString(99) == "unknown error","unknown error message");
	return failures;
}

} // namespace

int main()
{
	int failures=0;
	failures += test_reference_scenario_seasonal();
	failures += test_reference_scenario_annual();
	failures += test_zero_height_difference_is_identity();
	failures += test_monotonic_in_height_difference();
	failures += test_seasonal_models_are_periodic();
	failures += test_seasonal_model_values();
	failures += test_doy_bounds();
	failures += test_region_bounds();
	failures += test_error_leaves_output_untouched();
	failures += test_error_strings();
	
	if (failures != 0){
		std::cerr << "[troposphere] " << failures << " check(s) failed" << std::endl;
		return 1;
	}
	std::cout << "Troposphere tests passed." << std::endl;
	return 0;
}
