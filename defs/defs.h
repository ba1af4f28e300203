
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

#ifndef __SPECDEC_DEFS_H__
#define __SPECDEC_DEFS_H__

#include <map>
#include <set>
#include <string>
#include <complex>
#include <stdint.h>
#include <vector>

typedef std::complex<double> dcomp;

enum fft_t 
  {
    FFT_FORWARD ,
    FFT_INVERSE 
  };


struct globals
{
  
  static std::string version;
  static std::string date;

  // return code 
  static int retcode;

  // output common stratifier labels
  static std::string freq_strat;
  static std::string sample_strat;
  static std::string scale_strat;

  // default individual ID for output (if no id=)
  static std::string default_id;
  
  // number of decimal places for output values
  static int value_dp;
  
  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // optional redirect of all logger output
  static void (*logger_function) ( const std::string & msg );

  // cache log messages (retrievable via logger.print_buffer())
  static bool cache_log;
  
  // no log output
  static bool silent;

  // verbose logging
  static bool verbose;

  // library mode: no banner, no log file
  static bool api_mode;
  
  // if F, halt() returns rather than exit()
  static bool bail_on_fail;
  
  // global functions: primary initiation of all globals
  void init_defs();
  
  // modes
  void api();

};

#endif
