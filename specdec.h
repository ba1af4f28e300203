
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

#ifndef __SPECDEC_H__
#define __SPECDEC_H__

#include <cstddef>

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/errors.h"
#include "helper/logger.h"

#include "miscmath/miscmath.h"

#include "fftw/fftwrap.h"

#include "dsp/peaks.h"
#include "dsp/iir.h"
#include "dsp/hilbert.h"
#include "dsp/siggen.h"

#include "cwt/cwt.h"

#include "decomp/decomp.h"
#include "dsp/wrappers.h"

#include "db/db.h"

#include "param.h"

#endif
