
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

#include "cwt/cwt.h"

#include "fftw/fftwrap.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <cmath>

extern logger_t logger;

std::vector<double> ricker_t::wavelet( const int points , const double a )
{
  std::vector<double> w( points , 0 );
  
  const double A = 2.0 / ( sqrt( 3.0 * a ) * pow( M_PI , 0.25 ) );
  const double wsq = a * a;
  const double mid = ( points - 1.0 ) / 2.0;

  for (int i=0; i<points; i++)
    {
      const double t = i - mid;
      const double tsq = t * t;
      w[i] = A * ( 1 - tsq / wsq ) * exp( -tsq / ( 2 * wsq ) );
    }
  
  return w;
}


cwt_t::cwt_t( const std::vector<double> & s ) : scales(s) 
{
  for (int i=0; i<scales.size(); i++)
    if ( scales[i] < 1 ) 
      throw invalid_config_error( "CWT scales must be 1 or greater" );
}


void cwt_t::transform( const std::vector<double> & x )
{

  const int n = x.size();

  coef.clear();
  coef.resize( scales.size() );

  if ( n == 0 ) return;

  for (int s=0; s<scales.size(); s++)
    {
      
      int points = floor( 10 * scales[s] );
      if ( points > n ) points = n;
      if ( points < 1 ) points = 1;
      
      std::vector<double> w = ricker_t::wavelet( points , scales[s] );

      //
      // convolution in the frequency domain
      //

      const int n_convolution = n + points - 1;
      const int n_conv_pow2 = MiscMath::nextpow2( n_convolution );
      
      FFT fft1( n , n_conv_pow2 , 1 );
      fft1.apply( x );
      std::vector<dcomp> xt = fft1.transform();

      FFT fft2( points , n_conv_pow2 , 1 );
      fft2.apply( w );
      std::vector<dcomp> wt = fft2.transform();
      
      std::vector<dcomp> y( n_conv_pow2 );
      for (int i=0; i<n_conv_pow2; i++) y[i] = xt[i] * wt[i];
      
      FFT ifft( n_conv_pow2 , n_conv_pow2 , 1 , FFT_INVERSE );
      ifft.apply( y );
      std::vector<dcomp> conv = ifft.scaled_transform();

      //
      // trim to the central n points ('same')
      //

      const int offset = ( points - 1 ) / 2;
      coef[s].resize( n );
      for (int i=0; i<n; i++)
	coef[s][i] = std::real( conv[ i + offset ] );
      
    }

  if ( globals::verbose )
    logger << "  computed Ricker CWT for " << scales.size() << " scale(s), " << n << " samples\n";
  
}


cwt_summary_t cwt_t::summary( const int s , const double sr ) const
{
  if ( s < 0 || s >= coef.size() ) 
    Helper::halt( "bad scale index in cwt_t::summary()" );

  cwt_summary_t r;
  r.scale = scales[s];
  
  const std::vector<double> & c = coef[s];
  if ( c.size() == 0 ) return r;
  
  int imax = 0;
  double sum = 0;
  for (int i=0; i<c.size(); i++)
    {
      const double a = fabs( c[i] );
      sum += a;
      if ( a > r.max ) { r.max = a; imax = i; }
    }

  r.tmax = imax / sr;
  r.mean = sum / (double)c.size();
  return r;
}


std::vector<double> cwt_t::convolve_same( const std::vector<double> & x , 
					  const std::vector<double> & w )
{
  const int n = x.size();
  const int m = w.size();
  std::vector<double> r( n , 0 );
  if ( n == 0 || m == 0 ) return r;
  
  const int offset = ( m - 1 ) / 2;
  for (int i=0; i<n; i++)
    {
      // full-convolution index i + offset
      const int k = i + offset;
      double acc = 0;
      for (int j=0; j<m; j++)
	{
	  const int xi = k - j;
	  if ( xi >= 0 && xi < n ) acc += x[xi] * w[j];
	}
      r[i] = acc;
    }
  return r;
}
