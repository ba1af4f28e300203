
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

#ifndef __SPECDEC_HILBERT_H__
#define __SPECDEC_HILBERT_H__

#include <vector>
#include "defs/defs.h"

//
// Analytic signal via the FFT: zero negative frequencies, double
// positive ones, inverse transform
//

struct hilbert_t
{
  
  hilbert_t() { } 
  
  // Hilbert transform (assumes the input is already band-limited)
  explicit hilbert_t( const std::vector<double> & d );
  
  // extract instantaneous phase (-pi..pi), magnitude
  const std::vector<double> * phase() const;
  const std::vector<double> * magnitude() const;
  const std::vector<double> * signal() const;

  // continuous phase (multiples of 2pi accumulated)
  std::vector<double> unwrapped_phase() const;

  std::vector<double> instantaneous_frequency(double) const;

  const std::vector<dcomp> & get_complex() const { return analytic; } 
  
  static void unwrap(std::vector<double> * );

private:
  
  void proc();
  
  std::vector<double> input;
  std::vector<double> ph;
  std::vector<double> mag;
  std::vector<dcomp> analytic;
  
};


#endif
