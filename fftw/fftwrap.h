
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

#ifndef __SPECDEC_FFTWRAP_H__
#define __SPECDEC_FFTWRAP_H__

#include <fftw3.h>

#include <vector>
#include <cmath>
#include <complex>

#include "defs/defs.h"


//
// Complex FFT
//

class FFT
{
  
 public:

  FFT() : in(NULL) , out(NULL) , p(NULL) , Ndata(0) , Nfft(0) , Fs(0) , cutoff(0) { } 

  FFT( int Ndata , int Nfft , double Fs , fft_t type = FFT_FORWARD ) 
    : in(NULL) , out(NULL) , p(NULL) 
    {
      init( Ndata , Nfft , Fs , type );
    }

  void init( int Ndata , int Nfft , double Fs , fft_t type = FFT_FORWARD );

  void reset();
  
  ~FFT();
  
 private:

  // plans and buffers are owned
  FFT( const FFT & );
  FFT & operator=( const FFT & );

  // Input signal
  fftw_complex *in;

  // Output signal
  fftw_complex *out;
  
  // FFT plan from FFTW3
  fftw_plan p;
  
  // Size of data 
  int Ndata;

  // Size (NFFT)
  int Nfft;
  
  // Sampling rate, so we can construct the appropriate Hz 
  double Fs;

  // Forward or inverse FFT?
  fft_t type;
  
 public:
  
  int cutoff;

  // one-sided |X| and frequency (Hz) of each bin
  std::vector<double> mag;
  std::vector<double> frq;
  
 public:
  
  bool apply( const std::vector<double> & x );
  bool apply( const double * x , const int n );
  bool apply( const std::vector<std::complex<double> > & x );

  // Extract the raw transform
  std::vector<std::complex<double> > transform() const;

  // Extract the raw transform scaled by 1/n
  std::vector<std::complex<double> > scaled_transform() const;
  
};



//
// Real 1D DFT
//

class real_FFT
{
  
 public:
  
  real_FFT() : in(NULL) , out(NULL) , p(NULL) , Ndata(0) , Nfft(0) , Fs(0) , cutoff(0) { } 

  real_FFT( int Ndata , int Nfft , double Fs ) 
    : in(NULL) , out(NULL) , p(NULL) 
    {
      init( Ndata , Nfft , Fs );
    }
  
  void init( int Ndata , int Nfft , double Fs );

  void reset() ;
  
  ~real_FFT();
  
 private:

  real_FFT( const real_FFT & );
  real_FFT & operator=( const real_FFT & );

  // Input signal (real)
  double * in;

  // Output signal
  fftw_complex *out;
  
  // FFT plan from FFTW3
  fftw_plan p;
  
  // Size of data 
  int Ndata;

  // Size (NFFT)
  int Nfft;
  
  // Sampling rate
  double Fs;
  
 public:
  
  int cutoff;
  std::vector<double> mag;
  std::vector<double> frq;
  
 public:
  
  bool apply( const std::vector<double> & x );
  bool apply( const double * x , const int n );
    
  // Extract the raw (one-sided, cutoff-length) transform
  std::vector<std::complex<double> > transform() const;

  // Amplitude spectrum: 2/N |X| for the first N/2 bins 
  std::vector<double> amplitude() const;
  
};


#endif
