
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

#include "dsp/peaks.h"

#include <algorithm>
#include <numeric>


std::vector<int> peaks_t::local_maxima( const std::vector<double> & x )
{
  std::vector<int> m;
  
  const int n = x.size();
  
  // the first and last points can never be peaks
  int i = 1;
  const int i_max = n - 1;

  while ( i < i_max )
    {
      if ( x[i-1] < x[i] )
	{
	  // walk over any plateau
	  int i_ahead = i + 1;
	  while ( i_ahead < i_max && x[i_ahead] == x[i] ) ++i_ahead;

	  // a maximum if the plateau ends by falling
	  if ( x[i_ahead] < x[i] )
	    {
	      const int left = i;
	      const int right = i_ahead - 1;
	      m.push_back( ( left + right ) / 2 );
	      i = i_ahead;
	    }
	}
      ++i;
    }
  
  return m;
}


double peaks_t::prominence( const std::vector<double> & x , int p , int * lb , int * rb )
{
  
  const int n = x.size();
  const double h = x[p];
  
  // search left until a higher sample, tracking the minimum
  int i = p;
  int left_min_idx = p;
  double left_min = h;
  while ( i >= 0 && x[i] <= h )
    {
      if ( x[i] < left_min ) { left_min = x[i]; left_min_idx = i; }
      --i;
    }

  // and the same to the right
  i = p;
  int right_min_idx = p;
  double right_min = h;
  while ( i < n && x[i] <= h )
    {
      if ( x[i] < right_min ) { right_min = x[i]; right_min_idx = i; }
      ++i;
    }
  
  if ( lb ) *lb = left_min_idx;
  if ( rb ) *rb = right_min_idx;

  // relative to the higher of the two bases
  return h - std::max( left_min , right_min );
}


void peaks_t::select_by_distance( const std::vector<double> & x )
{

  const int np = pk.size();
  if ( np == 0 || min_distance <= 1 ) return;
  
  // visit peaks from highest to lowest; a kept peak removes any
  // lower-priority neighbours closer than min_distance

  std::vector<int> order( np );
  std::iota( order.begin() , order.end() , 0 );
  std::stable_sort( order.begin() , order.end() , 
		    [&]( int a , int b ) { return x[ pk[a] ] < x[ pk[b] ]; } );
  
  std::vector<bool> keep( np , true );

  for (int i = np - 1 ; i >= 0 ; i-- )
    {
      const int j = order[i];
      if ( ! keep[j] ) continue;

      int k = j - 1;
      while ( k >= 0 && pk[j] - pk[k] < min_distance )
	{
	  keep[k] = false;
	  --k;
	}

      k = j + 1;
      while ( k < np && pk[k] - pk[j] < min_distance )
	{
	  keep[k] = false;
	  ++k;
	}
    }
  
  std::vector<int> pk2;
  for (int i=0; i<np; i++)
    if ( keep[i] ) pk2.push_back( pk[i] );
  pk = pk2;
}


void peaks_t::detect( const std::vector<double> * x )
{

  pk.clear();
  values.clear();
  prominences.clear();
  left_base.clear();
  right_base.clear();
  
  std::vector<int> m = local_maxima( *x );

  // height
  for (int i=0; i<m.size(); i++)
    if ( ( ! use_height ) || (*x)[ m[i] ] >= min_height )
      pk.push_back( m[i] );

  // distance
  select_by_distance( *x );

  // prominence
  std::vector<int> pk2;
  for (int i=0; i<pk.size(); i++)
    {
      int lb = 0 , rb = 0;
      const double prom = prominence( *x , pk[i] , &lb , &rb );
      if ( use_prominence && prom < min_prominence ) continue;

      pk2.push_back( pk[i] );
      values.push_back( (*x)[ pk[i] ] );
      prominences.push_back( prom );
      left_base.push_back( lb );
      right_base.push_back( rb );
    }

  pk = pk2;
  
}


std::vector<int> peaks_t::by_prominence() const
{
  std::vector<int> order( pk.size() );
  std::iota( order.begin() , order.end() , 0 );
  std::stable_sort( order.begin() , order.end() , 
		    [&]( int a , int b ) { return prominences[a] > prominences[b]; } );
  return order;
}
