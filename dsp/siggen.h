
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

#ifndef __SPECDEC_SIGGEN_H__
#define __SPECDEC_SIGGEN_H__

#include <vector>
#include <stdint.h>

struct param_t;

//
// one sinusoidal term of a synthetic signal
//

struct sine_t {
  sine_t( double frq , double amp , double phase = 0 ) : frq(frq) , amp(amp) , phase(phase) { } 
  double frq;
  double amp;
  double phase;
};

namespace dsptools 
{
  
  // sum of sines plus N(0,noise_sd^2), over t = 0, 1/sr, ... < dur
  std::vector<double> siggen( double sr , double dur , 
			      const std::vector<sine_t> & sines , 
			      double noise_sd = 0 , 
			      uint32_t seed = 0 );

  // sr=, dur=, sine=f,a{,ph},... noise=, seed=  (sine triplets need ph=)
  std::vector<double> siggen( const param_t & param );
  
}

#endif
