
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

#include "dsp/wrappers.h"

#include "decomp/decomp.h"
#include "cwt/cwt.h"
#include "db/db.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"
#include "defs/defs.h"

extern writer_t writer;
extern logger_t logger;


decomp_results_t dsptools::decompose( const std::vector<double> & x , const param_t & param )
{

  const double sr = param.requires_dbl( "sr" );
  
  decomp_param_t par;
  par.set( param );
  
  decomp_t decomp( par );

  logger << "  decomposing " << x.size() << " samples at " << sr << " Hz\n";
  
  decomp_results_t res = decomp.analyze_signal( x , sr );
  
  const bool show_comps = param.has( "comps" );
  const bool show_phases = param.has( "phases" );
  const bool show_spectrum = param.has( "spectrum" );
  
  //
  // spectral peaks
  //

  writer.cmd( "PEAKS" );

  writer.value( "NPEAKS" , (int)res.frequencies.size() );

  for (int i=0; i<res.frequencies.size(); i++)
    {
      writer.level( res.frequencies[i] , globals::freq_strat );
      writer.value( "MAG" , res.magnitudes[i] );
      writer.value( "RANK" , i + 1 );
    }
  writer.unlevel( globals::freq_strat );

  //
  // components (including failures)
  //

  writer.cmd( "COMP" );
  
  for (int i=0; i<res.frequencies.size(); i++)
    {
      
      const double f = res.frequencies[i];
      
      std::map<double,component_t>::const_iterator cc = res.components.find( f );
      
      const component_t * c = NULL;
      if ( cc != res.components.end() ) 
	c = &(cc->second);
      else
	{
	  for (int j=0; j<res.failures.size(); j++)
	    if ( res.failures[j].frq == f ) { c = &(res.failures[j]); break; }
	}
      
      if ( c == NULL ) continue;

      writer.level( f , globals::freq_strat );
      writer.value( "LWR" , c->lwr );
      writer.value( "UPR" , c->upr );
      writer.value( "OKAY" , (int)c->okay );

      if ( c->okay ) 
	{
	  writer.value( "RMS" , MiscMath::rms( c->x ) );
	  
	  if ( show_comps ) 
	    {
	      for (int p=0; p<c->x.size(); p++)
		{
		  writer.level( p , globals::sample_strat );
		  writer.value( "X" , c->x[p] );
		}
	      writer.unlevel( globals::sample_strat );
	    }
	}
      
      writer.unlevel( globals::freq_strat );
    }

  //
  // relative phases
  //

  writer.cmd( "PHASE" );

  if ( res.has_reference ) 
    writer.value( "REF" , res.reference );

  std::map<double,std::vector<double> >::const_iterator pp = res.phases.begin();
  while ( pp != res.phases.end() )
    {
      writer.level( pp->first , globals::freq_strat );

      const phase_summary_t & s = res.summaries[ pp->first ];
      writer.value( "MEAN" , s.mean );
      writer.value( "PLV" , s.plv );

      if ( show_phases ) 
	{
	  for (int p=0; p<pp->second.size(); p++)
	    {
	      writer.level( p , globals::sample_strat );
	      writer.value( "PH" , pp->second[p] );
	    }
	  writer.unlevel( globals::sample_strat );
	}
      
      writer.unlevel( globals::freq_strat );
      ++pp;
    }

  //
  // full amplitude spectrum
  //

  if ( show_spectrum ) 
    {
      writer.cmd( "SPEC" );
      std::vector<double> frq;
      std::vector<double> mag = decomp_t::spectrum( x , sr , &frq );
      for (int k=0; k<mag.size(); k++)
	{
	  writer.level( frq[k] , globals::freq_strat );
	  writer.value( "MAG" , mag[k] );
	}
      writer.unlevel( globals::freq_strat );
    }
  
  return res;
}


void dsptools::ricker_cwt( const std::vector<double> & x , const param_t & param )
{

  const double sr = param.requires_dbl( "sr" );

  std::vector<double> scales = param.dblvector( "cwt" );
  
  cwt_t cwt( scales );

  cwt.transform( x );

  writer.cmd( "CWT" );
  
  for (int s=0; s<cwt.size(); s++)
    {
      cwt_summary_t r = cwt.summary( s , sr );
      writer.level( r.scale , globals::scale_strat );
      writer.value( "MAX" , r.max );
      writer.value( "TMAX" , r.tmax );
      writer.value( "MEAN" , r.mean );
    }
  writer.unlevel( globals::scale_strat );
  
}
