
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

#include "dsp/siggen.h"

#include "param.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

#include <cmath>
#include <random>

extern logger_t logger;

std::vector<double> dsptools::siggen( double sr , double dur , 
				      const std::vector<sine_t> & sines , 
				      double noise_sd , 
				      uint32_t seed )
{
  
  if ( sr <= 0 ) 
    throw invalid_signal_error( "requires positive sample rate" );
  
  if ( dur <= 0 )
    throw invalid_signal_error( "requires positive duration" );
  
  if ( noise_sd < 0 )
    throw invalid_signal_error( "noise SD cannot be negative" );

  for (int j=0; j<sines.size(); j++)
    {
      if ( sines[j].frq <= 0 ) throw invalid_signal_error( "frq must be positive" );
      if ( sines[j].frq >= sr / 2.0 ) throw invalid_signal_error( "frq not under Nyquist frequency, given sample rate" );
      if ( sines[j].amp <= 0 ) throw invalid_signal_error( "amp should be positive, non-zero" );
    }
  
  //
  // make synthetic signal
  //

  const int np = floor( sr * dur + 1e-9 );
    
  std::vector<double> d( np , 0 );

  for ( int p=0 ; p<np; p++ )
    {
      // time in seconds
      const double t = p / sr;
      for (int j=0; j<sines.size(); j++)
	d[p] += sines[j].amp * sin( 2 * M_PI * sines[j].frq * t + sines[j].phase );
    }

  //
  // additive Gaussian noise (seeded, so reproducible)
  //
  
  if ( noise_sd > 0 )
    {
      std::mt19937 rng( seed );
      std::normal_distribution<double> norm( 0 , noise_sd );
      for ( int p=0 ; p<np; p++ )
	d[p] += norm( rng );
    }
  
  return d;
}


std::vector<double> dsptools::siggen( const param_t & param )
{

  const double sr = param.requires_dbl( "sr" );

  const double dur = param.requires_dbl( "dur" );

  // sine=f,a,f,a,...   or with ph=T,  sine=f,a,p,f,a,p,...
  const bool with_phase = param.yesno( "ph" );
  const int step = with_phase ? 3 : 2;
  
  std::vector<double> sp = param.dblvector( "sine" );
  if ( sp.size() % step != 0 ) 
    Helper::halt( with_phase ? "expecting sine=frq,amp,phase,..." : "expecting sine=frq,amp,..." );
  
  std::vector<sine_t> sines;
  for (int i=0; i<sp.size(); i+=step)
    sines.push_back( sine_t( sp[i] , sp[i+1] , with_phase ? sp[i+2] : 0 ) );

  const double noise = param.has( "noise" ) ? param.requires_dbl( "noise" ) : 0 ;
  
  const int seed = param.has( "seed" ) ? param.requires_int( "seed" ) : 0 ;
  if ( seed < 0 ) Helper::halt( "seed must be a non-negative integer" );

  logger << "  generating " << dur << " seconds at " << sr << " Hz, " 
	 << sines.size() << " sinusoid(s)";
  if ( noise > 0 ) logger << ", noise SD " << noise << " (seed " << seed << ")";
  logger << "\n";
  
  return siggen( sr , dur , sines , noise , (uint32_t)seed );
  
}
