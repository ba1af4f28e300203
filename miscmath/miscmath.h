
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

#ifndef __SPECDEC_MISCMATH_H__
#define __SPECDEC_MISCMATH_H__

#include <vector>
#include <cstddef>
#include <complex>
#include <algorithm>

namespace MiscMath
{
  
  // next pow2
  long int nextpow2( const int a );

  std::vector<double> linspace(double a, double b, int n);
  
  double rms( const std::vector<double> & );
  
  // differences 
  std::vector<double> diff( const std::vector<double> & x );

  // mean/variance  
  double mean( const std::vector<double> & x );
  double variance( const std::vector<double> & x );  
  double variance( const std::vector<double> & x , double m );
  double sdev( const std::vector<double> & x );
  double sdev( const std::vector<double> & x , double m );
  double sum( const std::vector<double> & x );

  double max(const std::vector<double> & x );
  double min(const std::vector<double> & x );
  void minmax( const std::vector<double> & x , double * mn , double * mx);

  // angles/phases

  // wrap to [0, 2pi)
  double wrap_2pi( const double r );

  // circular mean angle (radians, [0,2pi)) and mean resultant length,
  // optionally restricted to [start,stop)
  void circular_mean( const std::vector<double> & ph , 
		      double * angle , double * resultant ,
		      int start = 0 , int stop = -1 );
  
}

#endif
