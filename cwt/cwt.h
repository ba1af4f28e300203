
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

#ifndef __SPECDEC_CWT_H__
#define __SPECDEC_CWT_H__

#include <vector>

//
// Ricker (Mexican hat) wavelet
//

struct ricker_t {

  // A (1 - t^2/a^2) exp( -t^2 / 2a^2 ),  A = 2 / ( sqrt(3a) pi^1/4 )
  // sampled at t = i - (points-1)/2
  static std::vector<double> wavelet( const int points , const double a );
  
};


//
// per-scale summary of |coefficients|
//

struct cwt_summary_t {
  cwt_summary_t() : scale(0) , max(0) , tmax(0) , mean(0) { } 
  double scale;
  double max;
  double tmax;   // seconds, from the first sample
  double mean;
};


//
// continuous wavelet transform, one row of coefficients per scale
//

class cwt_t {

 public:

  cwt_t( const std::vector<double> & scales );

  // 'same' convolution of x with a min( 10a , n ) point Ricker wavelet, each scale a
  void transform( const std::vector<double> & x );

  int size() const { return scales.size(); }
  
  double scale( const int s ) const { return scales[s]; }
  
  const std::vector<double> & coefficients( const int s ) const { return coef[s]; }

  const std::vector<std::vector<double> > & coefficients() const { return coef; }

  cwt_summary_t summary( const int s , const double sr ) const;
  
  // direct-form 'same' convolution, for short kernels
  static std::vector<double> convolve_same( const std::vector<double> & x , 
					    const std::vector<double> & w );
  
 private:

  std::vector<double> scales;

  std::vector<std::vector<double> > coef;

};

#endif
