
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


#ifndef __SPECDEC_MAIN_H__
#define __SPECDEC_MAIN_H__

#include <string>
#include <vector>

struct param_t;

// misc helper: version string (incl. libraries)
std::string specdec_version();

// misc helper: manage memory resource issues
void NoMem();

// misc helper: build options from argv[], returning any input file name
std::string parse_cmdline( int argc , char ** argv , int start , param_t * param );

#endif
