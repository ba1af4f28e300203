
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

#ifndef __SPECDEC_ERRORS_H__
#define __SPECDEC_ERRORS_H__

#include <stdexcept>
#include <string>

//
// Exceptions thrown by the library; the command-line driver reports
// these via Helper::halt()
//

struct decomp_error : public std::runtime_error {
  explicit decomp_error( const std::string & msg ) : std::runtime_error( msg ) { }
};

// signal too short, bad sample rate, non-finite samples
struct invalid_signal_error : public decomp_error {
  explicit invalid_signal_error( const std::string & msg ) : decomp_error( msg ) { }
};

// passband cannot be realised by a stable bandpass filter
struct filter_design_error : public decomp_error {
  explicit filter_design_error( const std::string & msg ) : decomp_error( msg ) { }
};

// out-of-range configuration values
struct invalid_config_error : public decomp_error {
  explicit invalid_config_error( const std::string & msg ) : decomp_error( msg ) { }
};

#endif
