
//    --------------------------------------------------------------------
//
//    This file is part of specdec.
//
//    specdec is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    specdec is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with specdec. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include <catch2/catch.hpp>

#include "cwt/cwt.h"
#include "helper/errors.h"

#include <cmath>

TEST_CASE( "Ricker wavelet closed form", "[cwt]" )
{
  const double a = 2;
  std::vector<double> w = ricker_t::wavelet( 11 , a );
  REQUIRE( w.size() == 11 );
  
  const double A = 2.0 / ( sqrt( 3 * a ) * pow( M_PI , 0.25 ) );
  CHECK( w[5] == Approx( A ) );

  // symmetric, with zero crossings at t = +/- a
  for (int i=0; i<5; i++)
    CHECK( w[i] == Approx( w[10-i] ) );
  CHECK( w[3] == Approx( 0 ).margin( 1e-12 ) );
  CHECK( w[7] == Approx( 0 ).margin( 1e-12 ) );

  // t = 4
  CHECK( w[9] == Approx( A * ( 1 - 16 / 4.0 ) * exp( -16 / 8.0 ) ) );

  // even lengths are centred between samples
  std::vector<double> w2 = ricker_t::wavelet( 4 , 1 );
  CHECK( w2[1] == Approx( w2[2] ) );
}

TEST_CASE( "FFT convolution matches direct convolution", "[cwt]" )
{
  const int n = 300;
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = sin( 0.07 * i ) + 0.3 * cos( 0.9 * i ) + ( i % 7 ) * 0.01;

  std::vector<double> scales = { 1 , 3.5 , 12 , 40 };
  cwt_t cwt( scales );
  cwt.transform( x );
  REQUIRE( cwt.size() == 4 );
  
  for (int s=0; s<cwt.size(); s++)
    {
      int points = floor( 10 * scales[s] );
      if ( points > n ) points = n;
      std::vector<double> direct = cwt_t::convolve_same( x , ricker_t::wavelet( points , scales[s] ) );
      const std::vector<double> & c = cwt.coefficients( s );
      REQUIRE( c.size() == n );
      for (int i=0; i<n; i++)
	CHECK( c[i] == Approx( direct[i] ).margin( 1e-9 ) );
    }
}

TEST_CASE( "same-mode convolution alignment", "[cwt]" )
{
  // an impulse returns the (centred) kernel
  std::vector<double> x( 9 , 0 );
  x[4] = 1;
  std::vector<double> w = { 1 , 2 , 3 };
  std::vector<double> y = cwt_t::convolve_same( x , w );
  REQUIRE( y.size() == 9 );
  CHECK( y[3] == 1 );
  CHECK( y[4] == 2 );
  CHECK( y[5] == 3 );
  CHECK( y[0] == 0 );
}

TEST_CASE( "CWT responds most at the scale matched to the period", "[cwt]" )
{
  // Ricker peak response near a = sqrt(2.5) / omega
  const int n = 1000;
  const double sr = 100;
  const double omega = sqrt( 2.0 ) / 10.0; 
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = sin( omega * i );

  std::vector<double> scales = { 2 , 11 , 50 };
  cwt_t cwt( scales );
  cwt.transform( x );
  
  cwt_summary_t s0 = cwt.summary( 0 , sr );
  cwt_summary_t s1 = cwt.summary( 1 , sr );
  cwt_summary_t s2 = cwt.summary( 2 , sr );
  
  CHECK( s1.scale == 11 );
  CHECK( s1.mean > s0.mean );
  CHECK( s1.mean > s2.mean );
  CHECK( s1.max >= s1.mean );
  CHECK( s1.tmax >= 0 );
  CHECK( s1.tmax < n / sr );
}

TEST_CASE( "scales below one are rejected", "[cwt]" )
{
  std::vector<double> scales = { 0.5 };
  CHECK_THROWS_AS( cwt_t( scales ) , invalid_config_error );
}
