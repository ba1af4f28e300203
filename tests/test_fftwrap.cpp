
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

#include "fftw/fftwrap.h"

#include <cmath>

TEST_CASE( "real DFT amplitude of a whole-cycle cosine", "[fftw]" )
{
  const int n = 64;
  const double fs = 128;
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = 3.0 * cos( 2 * M_PI * 8 * i / (double)n );
  
  real_FFT fft( n , n , fs );
  fft.apply( x );
  
  std::vector<double> a = fft.amplitude();
  REQUIRE( a.size() == n / 2 );
  CHECK( a[8] == Approx( 3.0 ) );
  CHECK( a[7] == Approx( 0 ).margin( 1e-9 ) );
  CHECK( a[9] == Approx( 0 ).margin( 1e-9 ) );
  
  // bin 8 is 8 * fs / n Hz
  CHECK( fft.frq[8] == Approx( 16.0 ) );
  CHECK( fft.cutoff == n / 2 + 1 );
}

TEST_CASE( "complex forward then scaled inverse recovers the input", "[fftw]" )
{
  const int n = 30;
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = sin( 0.3 * i ) + 0.1 * i;
  
  FFT fwd( n , n , 1 , FFT_FORWARD );
  fwd.apply( x );
  std::vector<dcomp> X = fwd.transform();
  REQUIRE( X.size() == n );

  FFT inv( n , n , 1 , FFT_INVERSE );
  inv.apply( X );
  std::vector<dcomp> y = inv.scaled_transform();
  
  for (int i=0; i<n; i++)
    {
      CHECK( std::real( y[i] ) == Approx( x[i] ).margin( 1e-10 ) );
      CHECK( std::imag( y[i] ) == Approx( 0 ).margin( 1e-10 ) );
    }
}

TEST_CASE( "zero-padding to a larger transform", "[fftw]" )
{
  std::vector<double> x( 10 , 1.0 );
  FFT fft( 10 , 16 , 1 );
  fft.apply( x );
  std::vector<dcomp> X = fft.transform();
  REQUIRE( X.size() == 16 );
  // DC is the sum of the (unpadded) data
  CHECK( std::real( X[0] ) == Approx( 10 ) );
  CHECK( fft.mag[0] == Approx( 10 ) );
}

TEST_CASE( "FFT objects can be re-initialised", "[fftw]" )
{
  real_FFT fft;
  std::vector<double> x( 16 , 2.0 );
  fft.init( 16 , 16 , 16 );
  fft.apply( x );
  CHECK( fft.mag[0] == Approx( 32 ) );

  std::vector<double> x2( 8 , 1.0 );
  fft.init( 8 , 8 , 8 );
  fft.apply( x2 );
  CHECK( fft.mag[0] == Approx( 8 ) );
  CHECK( fft.mag.size() == 5 );
}
