
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

#include "dsp/hilbert.h"
#include "miscmath/miscmath.h"

#include <cmath>

TEST_CASE( "analytic signal of a cosine", "[hilbert]" )
{
  const int n = 256;
  const double sr = 256;
  const double f = 8;
  
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = cos( 2 * M_PI * f * i / sr );
  
  hilbert_t hilbert( x );

  const std::vector<double> & mag = *hilbert.magnitude();
  const std::vector<double> & ph = *hilbert.phase();
  REQUIRE( mag.size() == n );
  REQUIRE( ph.size() == n );

  for (int i=0; i<n; i++)
    {
      CHECK( mag[i] == Approx( 1.0 ).epsilon( 1e-9 ) );
      const double expected = atan2( sin( 2 * M_PI * f * i / sr ) , cos( 2 * M_PI * f * i / sr ) );
      // compare on the circle
      CHECK( fabs( remainder( ph[i] - expected , 2 * M_PI ) ) < 1e-9 );
    }

  // real part is the input
  const std::vector<dcomp> & a = hilbert.get_complex();
  CHECK( std::real( a[10] ) == Approx( x[10] ).margin( 1e-12 ) );
  CHECK( std::imag( a[0] ) == Approx( 0 ).margin( 1e-9 ) );
}

TEST_CASE( "unwrapped phase accumulates and gives instantaneous frequency", "[hilbert]" )
{
  const int n = 500;
  const double sr = 100;
  const double f = 5;
  
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = cos( 2 * M_PI * f * i / sr );

  hilbert_t hilbert( x );
  std::vector<double> uw = hilbert.unwrapped_phase();
  REQUIRE( uw.size() == n );

  for (int i=0; i<n; i++)
    CHECK( uw[i] == Approx( 2 * M_PI * f * i / sr ).margin( 1e-6 ) );
  
  std::vector<double> fi = hilbert.instantaneous_frequency( sr );
  REQUIRE( fi.size() == n - 1 );
  CHECK( MiscMath::mean( fi ) == Approx( f ).epsilon( 1e-6 ) );
}

TEST_CASE( "unwrap removes jumps larger than pi", "[hilbert]" )
{
  std::vector<double> p;
  for (int i=0; i<100; i++) p.push_back( MiscMath::wrap_2pi( 0.4 * i ) - M_PI );
  
  std::vector<double> u = p;
  hilbert_t::unwrap( &u );

  REQUIRE( u.size() == p.size() );
  CHECK( u[0] == p[0] );
  for (int i=1; i<u.size(); i++)
    {
      CHECK( fabs( u[i] - u[i-1] ) < M_PI );
      CHECK( u[i] - u[i-1] == Approx( 0.4 ).margin( 1e-9 ) );
      // differs from the input by a multiple of 2pi
      const double k = ( u[i] - p[i] ) / ( 2 * M_PI );
      CHECK( k == Approx( round( k ) ).margin( 1e-9 ) );
    }

  // a jump down then back up
  std::vector<double> d = { 3.0 , -3.0 , 3.0 };
  hilbert_t::unwrap( &d );
  CHECK( d[1] == Approx( 2 * M_PI - 3.0 ) );
  CHECK( d[2] == Approx( 3.0 ) );
}

TEST_CASE( "short inputs", "[hilbert]" )
{
  std::vector<double> one( 1 , 2.0 );
  hilbert_t h( one );
  CHECK( h.phase()->size() == 1 );
  CHECK( h.instantaneous_frequency( 10 ).size() == 0 );

  std::vector<double> empty;
  hilbert_t::unwrap( &empty );
  CHECK( empty.size() == 0 );
}
