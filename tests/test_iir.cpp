
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

#include "dsp/iir.h"
#include "helper/errors.h"
#include "miscmath/miscmath.h"

#include <cmath>
#include <algorithm>

static std::vector<double> tone( double f , double sr , int n )
{
  std::vector<double> x( n );
  for (int i=0; i<n; i++) x[i] = sin( 2 * M_PI * f * i / sr );
  return x;
}

TEST_CASE( "Butterworth bandpass has one section per order", "[iir]" )
{
  for (int order = 1 ; order <= 6 ; order++ )
    {
      iir_t iir;
      iir.init_butterworth_bandpass( order , 256 , 8 , 12 );
      CHECK( iir.sections() == order );
      CHECK( iir.coefficients().cols() == 6 );
      // a0 == 1 and zeros at DC and Nyquist
      CHECK( iir.coefficients()(0,3) == 1 );
      CHECK( iir.coefficients()(0,1) == 0 );
      CHECK( iir.coefficients()(0,2) == Approx( - iir.coefficients()(0,0) ) );
    }
}

TEST_CASE( "Butterworth bandpass response", "[iir]" )
{
  iir_t iir;
  iir.init_butterworth_bandpass( 4 , 256 , 8 , 12 );

  // half-power at the band edges
  CHECK( iir.gain( 8 ) == Approx( sqrt( 0.5 ) ).epsilon( 1e-6 ) );
  CHECK( iir.gain( 12 ) == Approx( sqrt( 0.5 ) ).epsilon( 1e-6 ) );

  // flat near the centre
  CHECK( iir.gain( 10 ) == Approx( 1.0 ).epsilon( 1e-4 ) );

  // attenuated an octave or more away
  CHECK( iir.gain( 2 ) < 0.001 );
  CHECK( iir.gain( 40 ) < 0.001 );
  CHECK( iir.gain( 0 ) < 1e-9 );
}

TEST_CASE( "invalid passbands throw", "[iir]" )
{
  iir_t iir;
  CHECK_THROWS_AS( iir.init_butterworth_bandpass( 4 , 256 , 0 , 12 ) , filter_design_error );
  CHECK_THROWS_AS( iir.init_butterworth_bandpass( 4 , 256 , -1 , 12 ) , filter_design_error );
  CHECK_THROWS_AS( iir.init_butterworth_bandpass( 4 , 256 , 8 , 128 ) , filter_design_error );
  CHECK_THROWS_AS( iir.init_butterworth_bandpass( 4 , 256 , 12 , 8 ) , filter_design_error );
  CHECK_THROWS_AS( iir.init_butterworth_bandpass( 0 , 256 , 8 , 12 ) , filter_design_error );
  CHECK_THROWS_AS( iir.init_butterworth_bandpass( 4 , 0 , 8 , 12 ) , filter_design_error );
  
  // all are decomp errors
  CHECK_THROWS_AS( iir.init_butterworth_bandpass( 4 , 256 , 12 , 8 ) , decomp_error );
}

TEST_CASE( "wide passbands design and keep half-power edges", "[iir]" )
{
  iir_t iir;
  iir.init_butterworth_bandpass( 5 , 1000 , 1 , 200 );
  CHECK( iir.sections() == 5 );
  CHECK( iir.gain( 1 ) == Approx( sqrt( 0.5 ) ).epsilon( 1e-6 ) );
  CHECK( iir.gain( 200 ) == Approx( sqrt( 0.5 ) ).epsilon( 1e-6 ) );
}

TEST_CASE( "filtfilt is zero-phase inside the passband", "[iir]" )
{
  const double sr = 256;
  const int n = 2560;
  std::vector<double> x = tone( 10 , sr , n );
  
  iir_t iir;
  iir.init_butterworth_bandpass( 4 , sr , 8 , 12 );
  
  std::vector<double> y = iir.filtfilt( x );
  REQUIRE( y.size() == n );

  double maxerr = 0;
  for (int i = n/4 ; i < 3*n/4 ; i++ )
    maxerr = std::max( maxerr , fabs( y[i] - x[i] ) );
  CHECK( maxerr < 1e-3 );
  
  // whereas the causal filter lags
  std::vector<double> z = iir.apply( x );
  double maxerr2 = 0;
  for (int i = n/4 ; i < 3*n/4 ; i++ )
    maxerr2 = std::max( maxerr2 , fabs( z[i] - x[i] ) );
  CHECK( maxerr2 > 0.1 );
}

TEST_CASE( "filtfilt removes a constant offset from the first sample", "[iir]" )
{
  iir_t iir;
  iir.init_butterworth_bandpass( 4 , 256 , 8 , 12 );
  std::vector<double> x( 500 , 3.0 );
  std::vector<double> y = iir.filtfilt( x );
  for (int i=0; i<y.size(); i++)
    CHECK( y[i] == Approx( 0 ).margin( 1e-9 ) );
}

TEST_CASE( "filtfilt leaves the input untouched and handles short signals", "[iir]" )
{
  iir_t iir;
  iir.init_butterworth_bandpass( 2 , 100 , 5 , 15 );
  
  CHECK( iir.padlen( 1000 ) == 15 );
  CHECK( iir.padlen( 10 ) == 9 );
  
  std::vector<double> x = tone( 10 , 100 , 10 );
  const std::vector<double> x0 = x;
  std::vector<double> y = iir.filtfilt( x );
  CHECK( y.size() == 10 );
  CHECK( x == x0 );
  for (int i=0; i<y.size(); i++)
    CHECK( std::isfinite( y[i] ) );
}

TEST_CASE( "steady-state initial conditions", "[iir]" )
{
  iir_t iir;
  iir.init_butterworth_bandpass( 3 , 200 , 10 , 20 );
  Eigen::MatrixXd zi = iir.initial_conditions();
  REQUIRE( zi.rows() == 3 );
  REQUIRE( zi.cols() == 2 );

  // bandpass: zero DC gain, so only the first section carries state
  const Eigen::MatrixXd & sos = iir.coefficients();
  CHECK( zi(0,0) == Approx( - sos(0,0) ) );
  CHECK( zi(0,1) == Approx( sos(0,2) ) );
  CHECK( zi(1,0) == Approx( 0 ).margin( 1e-12 ) );
  CHECK( zi(2,1) == Approx( 0 ).margin( 1e-12 ) );
}
