
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

#include "fftw/fftwrap.h"

#include "helper/helper.h"

#include <mutex>

// only fftw_execute() is thread-safe: plan creation and destruction
// must be serialized across all FFT objects

static std::mutex fftw_planner_mutex;


//
// Complex FFT
//

void FFT::reset() 
{
  if ( p != NULL ) 
    {
      std::lock_guard<std::mutex> lock( fftw_planner_mutex );
      fftw_destroy_plan(p);
    }
  if ( in != NULL ) fftw_free(in);
  if ( out != NULL ) fftw_free(out);
  p = NULL;
  in = out = NULL;
}

FFT::~FFT() 
{    
  reset();
}


void FFT::init( int Ndata_, int Nfft_, double Fs_ , fft_t type_ )
{

  // allow re-use of the same object
  reset();
  
  Ndata = Ndata_;
  Nfft = Nfft_;
  Fs = Fs_;
  type = type_;

  if ( Ndata > Nfft ) Helper::halt( "Ndata cannot be larger than Nfft" );
  if ( Nfft < 1 ) Helper::halt( "FFT requires at least one point" );
  
  // Allocate storage for input/output
  in = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * Nfft);
  if ( in == NULL ) Helper::halt( "FFT failed to allocate input buffer" );
  
  out = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * Nfft);
  if ( out == NULL ) Helper::halt( "FFT failed to allocate output buffer" );

  // Initialise (probably not necessary, but do anyway)
  for (int i=0;i<Nfft;i++) { in[i][0] = in[i][1] = 0; }
  
  // Generate plan
  {
    std::lock_guard<std::mutex> lock( fftw_planner_mutex );
    p = fftw_plan_dft_1d( Nfft, in, out , type == FFT_FORWARD ? FFTW_FORWARD : FFTW_BACKWARD , FFTW_ESTIMATE );
  }
  if ( p == NULL ) Helper::halt( "FFTW could not create a plan" );

  //
  // We want to return only the positive spectrum, so set the cut-off
  //
  
  cutoff = Nfft % 2 == 0 ? Nfft/2+1 : (Nfft+1)/2 ;
  mag.resize(cutoff,0);
  frq.resize(cutoff,0);

  //
  // Scale frequencies appropriately (not used in calculation, just for output)
  //

  double T = Nfft/(double)Fs;

  for (int i=0;i<cutoff;i++) frq[i] = i/T;
  
} 

bool FFT::apply( const std::vector<double> & x )
{
  return apply( &(x[0]) , x.size() );
}
  

bool FFT::apply( const double * x , const int n )
{

  if ( n < Ndata ) Helper::halt( "too few points passed to FFT" );

  for (int i=0;i<Ndata;i++) { in[i][0] = x[i];  in[i][1] = 0; } 
  
  // zero-pad any remainder
  for (int i=Ndata;i<Nfft;i++) { in[i][0] = 0;  in[i][1] = 0;  } 
  
  //
  // Execute actual FFT
  // 
  
  fftw_execute(p);
  
  for (int i=0;i<cutoff;i++)
    {
      double a = out[i][0];
      double b = out[i][1];
      mag[i] = sqrt( a*a + b*b );
    }
  
  return true;

}


bool FFT::apply( const std::vector<std::complex<double> > & x )
{

  const int n = x.size();
  
  if ( n > Nfft || n < Ndata ) Helper::halt( "error in FFT" );
  
  for (int i=0;i<Ndata;i++)
    {
      in[i][0] = std::real( x[i] );
      in[i][1] = std::imag( x[i] );	
    }    

  // zero-pad any remainder
  for (int i=Ndata;i<Nfft;i++)
    {
      in[i][0] =  in[i][1] = 0;
    }

  fftw_execute(p);

  for (int i=0;i<cutoff;i++)
    {
      double a = out[i][0];
      double b = out[i][1];
      mag[i] = sqrt( a*a + b*b );
    }
  
  return true;

}


std::vector<std::complex<double> > FFT::transform() const
{
  std::vector<std::complex<double> > r(Nfft);
  for (int i=0;i<Nfft;i++) 
    r[i] = std::complex<double>( out[i][0] , out[i][1] );
  return r;
}

std::vector<std::complex<double> > FFT::scaled_transform() const
{
  const double fac = 1.0 / (double)Nfft;
  std::vector<std::complex<double> > r(Nfft);
  for (int i=0;i<Nfft;i++) 
    r[i] = std::complex<double>( out[i][0] * fac , out[i][1] * fac );
  return r;
}



// --------------------------------------------------------------------------
//
// Real 1D DFT (real to complex) 
//
// --------------------------------------------------------------------------

void real_FFT::reset() 
{
  if ( p != NULL ) 
    {
      std::lock_guard<std::mutex> lock( fftw_planner_mutex );
      fftw_destroy_plan(p);
    }
  if ( in != NULL ) fftw_free(in);
  if ( out != NULL ) fftw_free(out);
  p = NULL;
  in = NULL;
  out = NULL;
}

real_FFT::~real_FFT() 
{    
  reset();
}


void real_FFT::init( int Ndata_, int Nfft_, double Fs_ )
{

  reset();
  
  Ndata = Ndata_;
  Nfft = Nfft_;
  Fs = Fs_;

  if ( Ndata > Nfft ) Helper::halt( "Ndata cannot be larger than Nfft" );
  if ( Nfft < 1 ) Helper::halt( "FFT requires at least one point" );
  
  // Allocate storage for input/output
  in = (double*) fftw_malloc(sizeof(double) * Nfft);
  if ( in == NULL ) Helper::halt( "FFT failed to allocate input buffer" );

  // r2c only fills the first N/2+1 outputs
  out = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * ( Nfft/2 + 1 ) );
  if ( out == NULL ) Helper::halt( "FFT failed to allocate output buffer" );

  for (int i=0;i<Nfft;i++) { in[i] = 0; }
  
  // Generate plan: nb. r2c 1D plan
  {
    std::lock_guard<std::mutex> lock( fftw_planner_mutex );
    p = fftw_plan_dft_r2c_1d( Nfft, in, out , FFTW_ESTIMATE ) ;
  }
  if ( p == NULL ) Helper::halt( "FFTW could not create a plan" );

  // We want to return only the positive spectrum, so set the cut-off  
  cutoff = Nfft % 2 == 0 ? Nfft/2+1 : (Nfft+1)/2 ;
  mag.resize(cutoff,0);
  frq.resize(cutoff,0);

  //
  // Scale frequencies appropriately (not used in calculation, just for output)
  //

  double T = Nfft/(double)Fs;

  for (int i=0;i<cutoff;i++) frq[i] = i/T;
      
} 

bool real_FFT::apply( const std::vector<double> & x )
{
  return apply( &(x[0]) , x.size() );
}
  

bool real_FFT::apply( const double * x , const int n )
{

  if ( n < Ndata ) Helper::halt( "too few points passed to FFT" );
  
  for (int i=0;i<Ndata;i++) in[i] = x[i];  

  // zero-padding
  for (int i=Ndata;i<Nfft;i++) in[i] = 0;  
  
  //
  // Execute actual FFT
  // 
  
  fftw_execute(p);
  
  for (int i=0;i<cutoff;i++)
    {
      double a = out[i][0];
      double b = out[i][1];
      mag[i] = sqrt( a*a + b*b );
    }
  
  return true;

}


std::vector<std::complex<double> > real_FFT::transform() const
{
  std::vector<std::complex<double> > r(cutoff);
  for (int i=0;i<cutoff;i++) 
    r[i] = std::complex<double>( out[i][0] , out[i][1] );
  return r;
}

std::vector<double> real_FFT::amplitude() const
{
  // nb. scaled by the number of data points, not Nfft
  const int nb = Nfft / 2;
  const double fac = 2.0 / (double)Ndata;
  std::vector<double> a( nb );
  for (int i=0;i<nb;i++) a[i] = fac * mag[i];
  return a;
}
