
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

#ifndef __SPECDEC_DSP_IIR_H__
#define __SPECDEC_DSP_IIR_H__

#include <vector>
#include <cmath>
#include <complex>

#include <Eigen/Dense>

#include "defs/defs.h"
#include "helper/errors.h"

//
// Butterworth bandpass IIR filter, as cascaded second-order sections
//
// Each row of the section matrix is { b0 b1 b2 a0 a1 a2 }, with a0 == 1
//

struct iir_t {

  iir_t() : order(0) , sr(0) , f1(0) , f2(0) { } 
  
  // throws filter_design_error unless 0 < f1 < f2 < sr/2 
  void init_butterworth_bandpass( int order , double sr , double f1 , double f2 );

  // causal filtering, zero initial state
  std::vector<double> apply( const std::vector<double> & x ) const;

  // zero-phase forward-backward filtering
  std::vector<double> filtfilt( const std::vector<double> & x ) const;

  // |H(f)| at frequency f (Hz)
  double gain( double f ) const;
  
  int sections() const { return sos.rows(); } 

  const Eigen::MatrixXd & coefficients() const { return sos; } 

  // steady-state section states for a unit step input (sosfilt_zi)
  Eigen::MatrixXd initial_conditions() const;

  // edge padding used by filtfilt() for a signal of length n
  int padlen( const int n ) const;
  
private:

  std::vector<double> sosfilt( const std::vector<double> & x , Eigen::MatrixXd * zi ) const;
  
  int order;
  double sr;
  double f1, f2;
  
  Eigen::MatrixXd sos;
  
};


#endif
