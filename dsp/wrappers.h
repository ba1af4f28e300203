
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

#ifndef __SPECDEC_WRAPPERS_H__
#define __SPECDEC_WRAPPERS_H__

struct param_t;

#include "decomp/decomp.h"

#include <vector>

//
// command-level wrappers: run with command options, report via the writer
//

namespace dsptools 
{

  // PEAKS, COMP and PHASE (and optionally SPEC) output 
  decomp_results_t decompose( const std::vector<double> & x , const param_t & param );

  // CWT output, scales from cwt=
  void ricker_cwt( const std::vector<double> & x , const param_t & param );
  
}

#endif
