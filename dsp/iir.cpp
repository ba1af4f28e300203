
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

#include "dsp/iir.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <algorithm>

extern logger_t logger;


// Butterworth bandpass design:
//   1) analog lowpass prototype (unit cutoff) poles on the unit circle
//   2) lowpass -> bandpass transform around the pre-warped band edges
//   3) bilinear transform to the z-plane
//   4) conjugate pole pairs -> second-order sections, each with zeros at
//      z = +1 and z = -1, scaled for unit gain at the band centre

void iir_t::init_butterworth_bandpass( int order_ , double sr_ , double f1_ , double f2_ )
{

  order = order_;
  sr = sr_;
  f1 = f1_;
  f2 = f2_;

  if ( order < 1 )
    throw filter_design_error( "filter order must be a positive integer" );

  if ( sr <= 0 )
    throw filter_design_error( "sample rate must be positive" );
  
  const double nyq = sr / 2.0;
  
  if ( f1 <= 0 || f2 >= nyq || f1 >= f2 ) 
    throw filter_design_error( "invalid passband " 
			       + Helper::dbl2str( f1 ) + " - " + Helper::dbl2str( f2 ) 
			       + " Hz (Nyquist " + Helper::dbl2str( nyq ) + " Hz)" );
  
  //
  // normalised (Nyquist = 1) band edges, pre-warped for a bilinear
  // transform with a nominal fs of 2
  //
  
  const double fs2 = 4.0;

  const double w1 = fs2 * tan( M_PI * ( f1 / nyq ) / 2.0 );
  const double w2 = fs2 * tan( M_PI * ( f2 / nyq ) / 2.0 );

  const double bw = w2 - w1;
  const double w0 = sqrt( w1 * w2 );

  //
  // analog prototype, then bandpass; each prototype pole gives two poles
  //
  
  std::vector<dcomp> zp;
  zp.reserve( 2 * order );
  
  for (int k=0; k<order; k++)
    {
      const int m = - order + 1 + 2 * k;
      const dcomp proto = - std::exp( dcomp( 0 , M_PI * m / ( 2.0 * order ) ) );
      const dcomp lp = proto * ( bw / 2.0 );
      const dcomp d = std::sqrt( lp * lp - dcomp( w0 * w0 , 0 ) );
      
      // bilinear transform
      zp.push_back( ( fs2 + ( lp + d ) ) / ( fs2 - ( lp + d ) ) );
      zp.push_back( ( fs2 + ( lp - d ) ) / ( fs2 - ( lp - d ) ) );
    }
  
  //
  // pair poles into sections: complex poles with their conjugate, then
  // any real poles two at a time
  //

  const double eps = 1e-10;
  
  std::vector<dcomp> cpx;
  std::vector<double> rl;
  
  for (int i=0; i<zp.size(); i++)
    {
      if ( std::imag( zp[i] ) > eps ) cpx.push_back( zp[i] );
      else if ( fabs( std::imag( zp[i] ) ) <= eps ) rl.push_back( std::real( zp[i] ) );
    }
  
  std::sort( rl.begin() , rl.end() );
  
  const int ns = cpx.size() + rl.size() / 2;
  
  if ( ns != order || rl.size() % 2 ) 
    throw filter_design_error( "could not pair filter poles into second-order sections" );
  
  sos = Eigen::MatrixXd::Zero( ns , 6 );

  int s = 0;

  for (int i=0; i<cpx.size(); i++)
    {
      sos(s,3) = 1;
      sos(s,4) = -2.0 * std::real( cpx[i] );
      sos(s,5) = std::norm( cpx[i] );
      ++s;
    }

  for (int i=0; i+1<rl.size(); i+=2)
    {
      sos(s,3) = 1;
      sos(s,4) = - ( rl[i] + rl[i+1] );
      sos(s,5) = rl[i] * rl[i+1];
      ++s;
    }
  
  // zeros: (1 - z^-1)(1 + z^-1) = 1 - z^-2  for every section
  for (int k=0; k<ns; k++)
    {
      sos(k,0) = 1;
      sos(k,1) = 0;
      sos(k,2) = -1;
    }

  //
  // unit gain at the (digital) band centre, spread evenly over sections
  //

  const double fc = sr * atan( w0 / fs2 ) / M_PI;
  
  const double g = gain( fc );

  if ( g <= 0 || ! Helper::realnum( g ) )
    throw filter_design_error( "degenerate filter gain for passband " 
			       + Helper::dbl2str( f1 ) + " - " + Helper::dbl2str( f2 ) + " Hz" );

  const double scale = pow( 1.0 / g , 1.0 / (double)ns );

  for (int k=0; k<ns; k++)
    for (int j=0; j<3; j++)
      sos(k,j) *= scale;

  if ( globals::verbose )
    logger << "  designed " << order << "-order Butterworth bandpass " 
	   << f1 << " - " << f2 << " Hz (" << ns << " sections, centre " << fc << " Hz)\n";
  
}


double iir_t::gain( double f ) const
{
  if ( sos.rows() == 0 ) return 0;

  // z^-1 on the unit circle
  const dcomp zi = std::exp( dcomp( 0 , - 2.0 * M_PI * f / sr ) );
  const dcomp zi2 = zi * zi;
  
  dcomp h( 1 , 0 );
  for (int s=0; s<sos.rows(); s++)
    {
      const dcomp num = sos(s,0) + sos(s,1) * zi + sos(s,2) * zi2;
      const dcomp den = sos(s,3) + sos(s,4) * zi + sos(s,5) * zi2;
      h *= num / den;
    }
  return std::abs( h );
}


Eigen::MatrixXd iir_t::initial_conditions() const
{

  // for each section (transposed direct form II):
  //   steady-state output g = sum(b) / sum(a) for a unit step,
  //   z1 = g - b0 ,  z2 = b2 - a2 * g 
  // scaled by the DC gain of all preceding sections
  
  const int ns = sos.rows();
  Eigen::MatrixXd zi = Eigen::MatrixXd::Zero( ns , 2 );

  double scale = 1.0;
  
  for (int s=0; s<ns; s++)
    {
      const double b0 = sos(s,0) , b1 = sos(s,1) , b2 = sos(s,2);
      const double a1 = sos(s,4) , a2 = sos(s,5);
      const double g = ( b0 + b1 + b2 ) / ( 1.0 + a1 + a2 );
      
      zi(s,0) = scale * ( g - b0 );
      zi(s,1) = scale * ( b2 - a2 * g );
      
      scale *= g;
    }
  
  return zi;
}


int iir_t::padlen( const int n ) const
{
  // 3 x (number of taps of the equivalent single filter), less any
  // trailing zero coefficients
  const int ns = sos.rows();
  int bz = 0 , az = 0;
  for (int s=0; s<ns; s++)
    {
      if ( sos(s,2) == 0 ) ++bz;
      if ( sos(s,5) == 0 ) ++az;
    }
  int pl = 3 * ( 2 * ns + 1 - std::min( bz , az ) );
  if ( pl > n - 1 ) pl = n - 1;
  if ( pl < 0 ) pl = 0;
  return pl;
}


std::vector<double> iir_t::sosfilt( const std::vector<double> & x , Eigen::MatrixXd * zi ) const
{
  const int n = x.size();
  const int ns = sos.rows();
  
  std::vector<double> y = x;
  
  for (int s=0; s<ns; s++)
    {
      const double b0 = sos(s,0) , b1 = sos(s,1) , b2 = sos(s,2);
      const double a1 = sos(s,4) , a2 = sos(s,5);
      
      double z1 = (*zi)(s,0);
      double z2 = (*zi)(s,1);
      
      for (int i=0; i<n; i++)
	{
	  const double xi = y[i];
	  const double yi = b0 * xi + z1;
	  z1 = b1 * xi - a1 * yi + z2;
	  z2 = b2 * xi - a2 * yi;
	  y[i] = yi;
	}
      
      (*zi)(s,0) = z1;
      (*zi)(s,1) = z2;
    }
  
  return y;
}


std::vector<double> iir_t::apply( const std::vector<double> & x ) const
{
  if ( sos.rows() == 0 ) Helper::halt( "iir_t::apply() called before filter design" );
  Eigen::MatrixXd zi = Eigen::MatrixXd::Zero( sos.rows() , 2 );
  return sosfilt( x , &zi );
}


std::vector<double> iir_t::filtfilt( const std::vector<double> & x ) const
{

  if ( sos.rows() == 0 ) Helper::halt( "iir_t::filtfilt() called before filter design" );
  
  const int n = x.size();
  if ( n == 0 ) return x;
  
  //
  // odd extension at both ends
  //
  
  const int pl = padlen( n );
  
  std::vector<double> ext( n + 2 * pl );

  for (int i=0; i<pl; i++)
    ext[i] = 2 * x[0] - x[ pl - i ];
  
  for (int i=0; i<n; i++)
    ext[ pl + i ] = x[i];
  
  for (int i=0; i<pl; i++)
    ext[ pl + n + i ] = 2 * x[n-1] - x[ n - 2 - i ];
  
  //
  // forward pass, from the steady state implied by the first sample
  //
  
  const Eigen::MatrixXd zi = initial_conditions();

  Eigen::MatrixXd z = zi * ext[0];
  
  std::vector<double> y = sosfilt( ext , &z );

  //
  // backward pass
  //
  
  std::reverse( y.begin() , y.end() );

  z = zi * y[0];
  
  y = sosfilt( y , &z );

  std::reverse( y.begin() , y.end() );
  
  // strip padding
  return std::vector<double>( y.begin() + pl , y.begin() + pl + n );
  
}
