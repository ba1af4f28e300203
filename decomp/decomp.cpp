
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

#include "decomp/decomp.h"

#include "dsp/peaks.h"
#include "dsp/iir.h"
#include "dsp/hilbert.h"
#include "fftw/fftwrap.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"
#include "param.h"
#include "defs/defs.h"

#include <cmath>
#include <algorithm>

extern logger_t logger;


decomp_param_t::decomp_param_t()
{
  max_components = 5;
  peak_height_fraction = 0.05;
  peak_distance_fraction = 0.01;
  peak_prominence_fraction = 0.05;
  filter_order = 5;
  min_bandwidth = 0.5;
  bandwidth_fraction = 0.2;
  min_frequency = 0;
  phase_ratio = false;
  edge_fraction = 0.1;
}


void decomp_param_t::set( const param_t & param )
{
  if ( param.has( "k" ) ) max_components = param.requires_int( "k" );
  if ( param.has( "height" ) ) peak_height_fraction = param.requires_dbl( "height" );
  if ( param.has( "distance" ) ) peak_distance_fraction = param.requires_dbl( "distance" );
  if ( param.has( "prominence" ) ) peak_prominence_fraction = param.requires_dbl( "prominence" );
  if ( param.has( "order" ) ) filter_order = param.requires_int( "order" );
  if ( param.has( "min-bw" ) ) min_bandwidth = param.requires_dbl( "min-bw" );
  if ( param.has( "bw-frac" ) ) bandwidth_fraction = param.requires_dbl( "bw-frac" );
  if ( param.has( "min-frq" ) ) min_frequency = param.requires_dbl( "min-frq" );
  if ( param.has( "ratio" ) ) phase_ratio = param.yesno( "ratio" );
  if ( param.has( "edge" ) ) edge_fraction = param.requires_dbl( "edge" );
}


void decomp_param_t::validate() const
{

  if ( max_components < 1 ) 
    throw invalid_config_error( "k (max. components) must be 1 or greater" );

  if ( peak_height_fraction <= 0 || peak_height_fraction > 1 ) 
    throw invalid_config_error( "height should be a fraction in (0,1]" );

  if ( peak_distance_fraction <= 0 || peak_distance_fraction > 1 )
    throw invalid_config_error( "distance should be a fraction in (0,1]" );

  if ( peak_prominence_fraction <= 0 || peak_prominence_fraction > 1 )
    throw invalid_config_error( "prominence should be a fraction in (0,1]" );

  if ( filter_order < 1 ) 
    throw invalid_config_error( "order must be 1 or greater" );

  if ( ! ( min_bandwidth > 0 ) ) 
    throw invalid_config_error( "min-bw must be positive" );

  if ( bandwidth_fraction <= 0 || bandwidth_fraction > 1 ) 
    throw invalid_config_error( "bw-frac should be a fraction in (0,1]" );

  if ( min_frequency < 0 ) 
    throw invalid_config_error( "min-frq cannot be negative" );

  if ( edge_fraction < 0 || edge_fraction >= 0.5 ) 
    throw invalid_config_error( "edge should be in [0,0.5)" );
  
}


decomp_t::decomp_t( const decomp_param_t & param ) : par( param ) 
{
  par.validate();
}


void decomp_t::validate_signal( const std::vector<double> & x , double sr , int min_n ) const
{

  if ( ! ( sr > 0 ) ) 
    throw invalid_signal_error( "sample rate must be positive" );
  
  if ( min_n < 2 ) min_n = 2;
  
  if ( x.size() < min_n ) 
    throw invalid_signal_error( "signal too short: " + Helper::int2str( (int)x.size() ) 
				+ " samples, requires at least " + Helper::int2str( min_n ) );
  
  for (int i=0; i<x.size(); i++)
    if ( ! Helper::realnum( x[i] ) ) 
      throw invalid_signal_error( "non-finite value at sample " + Helper::int2str( i + 1 ) );
  
}


std::vector<double> decomp_t::spectrum( const std::vector<double> & x , double sr , 
					std::vector<double> * frq )
{
  const int n = x.size();

  if ( frq != NULL ) frq->clear();
  
  if ( n == 0 ) return std::vector<double>();
  
  real_FFT fft( n , n , sr );
  fft.apply( x );
  
  std::vector<double> a = fft.amplitude();

  if ( frq != NULL ) 
    {
      frq->resize( a.size() );
      for (int k=0; k<a.size(); k++) 
	(*frq)[k] = k * sr / (double)n;
    }
  
  return a;
}


void decomp_t::find_dominant_frequencies( const std::vector<double> & x , double sr , 
					  std::vector<double> * frq , 
					  std::vector<double> * mag ) const
{

  validate_signal( x , sr );
  
  frq->clear();
  mag->clear();

  const int n = x.size();
  
  std::vector<double> bins;
  std::vector<double> spec = spectrum( x , sr , &bins );

  const double mx = MiscMath::max( spec );

  //
  // peak selection
  //

  peaks_t peaks;
  peaks.set_height( par.peak_height_fraction * mx );
  peaks.set_distance( (int)ceil( par.peak_distance_fraction * n ) );
  peaks.set_prominence( par.peak_prominence_fraction * mx );
  peaks.detect( &spec );
  
  std::vector<int> ranked = peaks.by_prominence();

  const int k = (int)ranked.size() < par.max_components ? (int)ranked.size() : par.max_components ;

  for (int i=0; i<k; i++)
    {
      const int p = peaks.pk[ ranked[i] ];
      frq->push_back( bins[p] );
      mag->push_back( spec[p] );
    }

  logger << "  " << peaks.pk.size() << " spectral peak(s) passed thresholds, retaining " << k << "\n";
  
}


void decomp_t::passband( double f , double sr , double * lwr , double * upr ) const
{

  const double bw = std::max( par.min_bandwidth , par.bandwidth_fraction * f );
  
  *lwr = f - bw / 2.0;
  *upr = f + bw / 2.0;

  const double nyq = sr / 2.0;

  if ( f < par.min_frequency ) 
    throw filter_design_error( "frequency " + Helper::dbl2str( f ) 
			       + " Hz is below min-frq " + Helper::dbl2str( par.min_frequency ) );
  
  if ( *lwr <= 0 ) 
    throw filter_design_error( "lower passband edge " + Helper::dbl2str( *lwr ) + " Hz is not positive" );
  
  if ( *upr >= nyq ) 
    throw filter_design_error( "upper passband edge " + Helper::dbl2str( *upr ) 
			       + " Hz is not below Nyquist (" + Helper::dbl2str( nyq ) + " Hz)" );
  
  if ( *lwr >= *upr ) 
    throw filter_design_error( "empty passband" );
  
}


std::map<double,component_t> decomp_t::extract_components( const std::vector<double> & x , 
							   const std::vector<double> & frqs , 
							   double sr ) const
{
  
  std::map<double,component_t> comps;
  
  for (int i=0; i<frqs.size(); i++)
    {
      
      component_t c;
      c.frq = frqs[i];
      
      try 
	{	  
	  passband( c.frq , sr , &c.lwr , &c.upr );

	  iir_t iir;
	  iir.init_butterworth_bandpass( par.filter_order , sr , c.lwr , c.upr );
	  
	  c.x = iir.filtfilt( x );
	  c.okay = true;
	}
      catch ( const filter_design_error & e ) 
	{
	  c.okay = false;
	  c.error = e.what();
	  c.x.clear();
	  logger.warning( "skipping " + Helper::dbl2str( c.frq ) + " Hz: " + c.error );
	}
      
      comps[ c.frq ] = c;
    }
  
  return comps;
}


std::map<double,std::vector<double> > decomp_t::analyze_phases( const std::map<double,component_t> & comps , 
								double * reference ) const
{

  std::map<double,std::vector<double> > phases;

  //
  // reference: the lowest frequency, filtered component
  //

  std::map<double,component_t>::const_iterator rr = comps.begin();
  while ( rr != comps.end() && ! rr->second.okay ) ++rr;

  if ( rr == comps.end() ) return phases;
  
  const double fref = rr->first;

  if ( reference != NULL ) *reference = fref;
  
  hilbert_t ref_hilbert( rr->second.x );
  const std::vector<double> ref_ph = ref_hilbert.unwrapped_phase();
  const int n = ref_ph.size();
  
  std::map<double,component_t>::const_iterator cc = comps.begin();
  while ( cc != comps.end() )
    {
      
      if ( cc == rr || ! cc->second.okay ) { ++cc; continue; } 
      
      if ( cc->second.x.size() != n ) 
	throw invalid_signal_error( "component lengths differ" );
      
      hilbert_t hilbert( cc->second.x );
      const std::vector<double> ph = hilbert.unwrapped_phase();
      
      const double m = par.phase_ratio ? cc->first / fref : 1.0 ;
      
      std::vector<double> & rel = phases[ cc->first ];
      rel.resize( n );
      for (int i=0; i<n; i++)
	rel[i] = MiscMath::wrap_2pi( ph[i] - m * ref_ph[i] );

      ++cc;
    }
  
  return phases;
}


phase_summary_t decomp_t::summarize( const std::vector<double> & ph ) const
{
  const int n = ph.size();
  const int edge = floor( par.edge_fraction * n );

  phase_summary_t s;
  MiscMath::circular_mean( ph , &s.mean , &s.plv , edge , n - edge );
  return s;
}


decomp_results_t decomp_t::analyze_signal( const std::vector<double> & x , double sr ) const
{

  validate_signal( x , sr , 2 * par.filter_order );

  decomp_results_t res;
  
  //
  // dominant frequencies
  //

  find_dominant_frequencies( x , sr , &res.frequencies , &res.magnitudes );
  
  if ( res.frequencies.size() == 0 ) 
    {
      logger << "  no dominant frequencies found\n";
      return res;
    }
  
  //
  // bandpass components
  //
  
  std::map<double,component_t> comps = extract_components( x , res.frequencies , sr );

  std::map<double,component_t>::const_iterator cc = comps.begin();
  while ( cc != comps.end() )
    {
      if ( cc->second.okay ) 
	res.components[ cc->first ] = cc->second;
      else
	res.failures.push_back( cc->second );
      ++cc;
    }
  
  logger << "  extracted " << res.components.size() << " component(s)";
  if ( res.failures.size() != 0 ) logger << ", " << res.failures.size() << " failed";
  logger << "\n";
  
  //
  // relative phases
  //
  
  res.phases = analyze_phases( res.components , &res.reference );
  res.has_reference = res.components.size() != 0;

  std::map<double,std::vector<double> >::const_iterator pp = res.phases.begin();
  while ( pp != res.phases.end() )
    {
      res.summaries[ pp->first ] = summarize( pp->second );
      ++pp;
    }

  if ( res.has_reference ) 
    logger << "  phases relative to " << res.reference << " Hz"
	   << ( par.phase_ratio ? " (n:m)" : "" ) << "\n";
  
  return res;
}
