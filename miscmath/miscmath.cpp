
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

#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>

long int MiscMath::nextpow2( const int a )
{
  // for now, just go up to 2^31
  for (int i=1;i<32;i++)
    {
      long int t = pow(2,i);
      if ( a <= t ) return t;
    }
  Helper::halt("value too large in nextpow2()");
  return 0;
}

std::vector<double> MiscMath::linspace(double a, double b, int n)
{
  if ( n < 2 ) Helper::halt( "linspace requires at least two values" );
  const double st = (b-a)/(double)(n-1);
  std::vector<double> r(n);
  r[0] = a; r[n-1] = b;
  for (int i=1;i<n-1;i++) r[i] = a + i*st ;
  return r;
}

std::vector<double> MiscMath::diff( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n < 2 ) return std::vector<double>();
  std::vector<double> d( n - 1 );
  for (int i=1;i<n;i++) d[i-1] = x[i] - x[i-1];
  return d;
}

double MiscMath::rms( const std::vector<double> & x)
{
  const int N = x.size();
  if ( N == 0 ) return 0;
  double d = 0;  
  for (int i=0;i<N;i++) d += x[i] * x[i];
  return sqrt( d / (double)N );
}

double MiscMath::mean( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return 0; // silently fail here
  double s = 0;
  for (int i=0;i<n;i++) s += x[i];
  return s/(double)n;
}

double MiscMath::sum( const std::vector<double> & x )
{
  double s = 0;
  for (int i=0;i<x.size();i++) s += x[i];
  return s;
}

double MiscMath::variance( const std::vector<double> & x )
{
  return variance( x , mean( x ) );
}

double MiscMath::variance( const std::vector<double> & x , double m )
{
  const int n = x.size();
  if ( n < 2 ) return 0;
  double ss = 0;
  for (int i=0;i<n;i++)
    {
      const double t = x[i] - m;
      ss += t*t;      
    }
  return ss/(double)(n-1);
}

double MiscMath::sdev( const std::vector<double> & x )
{
  return sqrt( variance( x ) );
}

double MiscMath::sdev( const std::vector<double> & x , double m )
{
  return sqrt( variance( x , m ) );
}

void MiscMath::minmax( const std::vector<double> & x , double * mn , double * mx )
{
  const int n = x.size();
  if ( n == 0 ) { *mn = *mx = 0; return; }
  *mn = *mx = x[0];
  for (int i=1;i<n;i++)
    {
      if ( x[i] < *mn ) *mn = x[i];
      else if ( x[i] > *mx ) *mx = x[i];
    }
}

double MiscMath::max(const std::vector<double> & x )
{
  double mn, mx;
  minmax( x , &mn , &mx );
  return mx;
}

double MiscMath::min(const std::vector<double> & x )
{
  double mn, mx;
  minmax( x , &mn , &mx );
  return mn;
}

double MiscMath::wrap_2pi( const double r )
{
  const double twopi = 2 * M_PI;
  double a = fmod( r , twopi );
  if ( a < 0 ) a += twopi;
  // fmod() + 2pi can round up to exactly 2pi
  if ( a >= twopi ) a = 0;
  return a;
}

void MiscMath::circular_mean( const std::vector<double> & ph , 
			      double * angle , double * resultant , 
			      int start , int stop )
{
  
  if ( stop < 0 || stop > ph.size() ) stop = ph.size();
  if ( start < 0 ) start = 0;
  
  const int n = stop - start;
  
  if ( n <= 0 ) 
    {
      *angle = 0;
      *resultant = 0;
      return;
    }
  
  double c = 0 , s = 0;
  for (int i=start; i<stop; i++)
    {
      c += cos( ph[i] );
      s += sin( ph[i] );
    }
  
  c /= (double)n;
  s /= (double)n;
  
  *resultant = sqrt( c*c + s*s );
  *angle = wrap_2pi( atan2( s , c ) );
}
