
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

#include "dsp/hilbert.h"

#include "fftw/fftwrap.h"
#include "helper/helper.h"

#include <cmath>


hilbert_t::hilbert_t( const std::vector<double> & d ) : input(d)
{
  // this mode assumes we've already BPF the input
  proc();
}

      
void hilbert_t::proc()
{

  const int n = input.size();

  ph.clear();
  mag.clear();
  analytic.clear();
  
  if ( n == 0 ) return;
  
  // 1) take FFT
  FFT fft( n , n , 1 , FFT_FORWARD );
  fft.apply( input );
  std::vector<dcomp> f = fft.transform();
  if ( f.size() != n ) Helper::halt( "internal error in hilbert()" );

  // 2) Adjusted postive/negative frequencies
  //    (DC and, for even n, the Nyquist bin are left as is)
  
  int pos_idx = floor(n/2.0) + ( n % 2 ) - 1;
  int neg_idx = ceil(n/2.0) + ( ! ( n % 2 ) );
  
  for (int i = 1 ; i <= pos_idx ; i++ ) f[i] *= 2;
  for (int i = neg_idx ; i < n ; i++ ) f[i] = 0;

  // 3) Inverse FFT of the rotated coefficients 
  FFT ifft( n , n , 1 , FFT_INVERSE );
  ifft.apply( f );
  analytic = ifft.scaled_transform();
  
  if ( analytic.size() != n ) Helper::halt( "problem in hilbert()" );

  // 4) Store phase, magnitude

  ph.resize( n );
  mag.resize( n );

  for(int i=0;i<n;i++)
    {
      double a = std::real( analytic[i] ) ;
      double b = std::imag( analytic[i] ) ;
      ph[i] = atan2( b , a );
      mag[i] = sqrt( a*a + b*b );     
    }
}

const std::vector<double> * hilbert_t::phase() const
{
  return & ph;
}

const std::vector<double> * hilbert_t::magnitude() const
{
  return & mag;
}

const std::vector<double> * hilbert_t::signal() const
{
  return & input;
}

std::vector<double> hilbert_t::unwrapped_phase() const
{
  std::vector<double> angles = ph;
  unwrap( &angles );
  return angles;
}

std::vector<double> hilbert_t::instantaneous_frequency( double Fs ) const
{
  std::vector<double> angles = unwrapped_phase();
  if ( angles.size() < 2 ) return std::vector<double>();
  const int nm1 = angles.size() - 1;
  std::vector<double> f( nm1 );
  for (int i=0;i<nm1;i++)
    f[i] = Fs / ( 2.0 * M_PI ) * ( angles[i+1] - angles[i] ) ;
  return f;
}


void hilbert_t::unwrap( std::vector<double> * p )
{
  
  // http://homepages.cae.wisc.edu/~brodskye/mr/phaseunwrap/unwrap.c

  const int n = p->size();

  if ( n < 2 ) return;
  
  std::vector<double> dp( n );
  std::vector<double> dps( n );
  std::vector<double> dp_corr( n );
  std::vector<double> cumsum( n );

  // default tol in matlab
  double cutoff = M_PI;   
  
  // incremental phase variation 
  // MATLAB: dp = diff(p, 1, 1);
  for (int j = 0; j < n-1; j++)
    dp[j] = (*p)[j+1] - (*p)[j];
  
  // equivalent phase variation in [-pi, pi]
  // MATLAB: dps = mod(dp+dp,2*pi) - pi;
  for (int j = 0; j < n-1; j++)
    dps[j] = (dp[j]+M_PI) - floor((dp[j]+M_PI) / (2*M_PI))*(2*M_PI) - M_PI;
  
  // preserve variation sign for +pi vs. -pi
  // MATLAB: dps(dps==pi & dp>0,:) = pi;
  for (int j = 0; j < n-1; j++)
    if ((dps[j] == -M_PI) && (dp[j] > 0))
      dps[j] = M_PI;
  
  // incremental phase correction
  // MATLAB: dp_corr = dps - dp;
  for (int j = 0; j < n-1; j++)
    dp_corr[j] = dps[j] - dp[j];
      
  // Ignore correction when incremental variation is smaller than cutoff
  // MATLAB: dp_corr(abs(dp)<cutoff,:) = 0;
  for (int j = 0; j < n-1; j++)
    if (fabs(dp[j]) < cutoff)
      dp_corr[j] = 0;

  // Find cumulative sum of deltas
  // MATLAB: cumsum = cumsum(dp_corr, 1);
  cumsum[0] = dp_corr[0];
  for (int j = 1; j < n-1; j++)
    cumsum[j] = cumsum[j-1] + dp_corr[j];

  // Integrate corrections and add to P to produce smoothed phase values
  // MATLAB: p(2:m,:) = p(2:m,:) + cumsum(dp_corr,1);
  for (int j = 1; j < n; j++)
    (*p)[j] += cumsum[j-1];
}
