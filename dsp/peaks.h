
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

#ifndef __SPECDEC_PEAKS_H__
#define __SPECDEC_PEAKS_H__

#include <vector>

//
// Local maxima of a 1D series, filtered by height, separation and
// prominence (applied in that order)
//
  
struct peaks_t {
  
 peaks_t()
  {
    // option defaults: no filtering
    min_height = 0;
    use_height = false;
    min_distance = 1;
    min_prominence = 0;
    use_prominence = false;
  }

  void set_height( double h ) { min_height = h; use_height = true; } 
  void set_distance( int d ) { min_distance = d < 1 ? 1 : d; } 
  void set_prominence( double p ) { min_prominence = p; use_prominence = true; } 
  
  // find peaks
  void detect( const std::vector<double> * x );

  // indices of peaks, sorted by descending prominence (ties: lower index first)
  std::vector<int> by_prominence() const;
  
  // all local maxima (flat tops represented by their middle sample)
  static std::vector<int> local_maxima( const std::vector<double> & x );

  // prominence of the peak at p, and the left/right bases
  static double prominence( const std::vector<double> & x , int p , int * lb = 0 , int * rb = 0 );
  
  // options
  double min_height;
  bool use_height;
  int min_distance;
  double min_prominence;
  bool use_prominence;
  
  // peak locations/values
  std::vector<int> pk;
  std::vector<double> values;
  std::vector<double> prominences;
  std::vector<int> left_base;
  std::vector<int> right_base;

 private:

  void select_by_distance( const std::vector<double> & x );
  
};

#endif
