
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

#include "defs/defs.h"

std::string globals::version;
std::string globals::date;

int globals::retcode;

std::string globals::freq_strat;
std::string globals::sample_strat;
std::string globals::scale_strat;

std::string globals::default_id;
int globals::value_dp;

void (*globals::bail_function) ( const std::string & );
void (*globals::logger_function) ( const std::string & );

bool globals::cache_log;
bool globals::silent;
bool globals::verbose;
bool globals::api_mode;
bool globals::bail_on_fail;


void globals::api()
{
  api_mode = true;
  silent = true;
}

void globals::init_defs()
{

  //
  // Version
  //
  
  version = "v0.4.1";
  
  date    = "19-Oct-2026";

  //
  // Return code
  //

  retcode = 0;

  //
  // Output stratifiers
  //

  freq_strat   = "F";
  sample_strat = "SP";
  scale_strat  = "SCALE";

  default_id = ".";

  value_dp = -1; // i.e. default stream precision
  
  //
  // Optional bail function after halt() is called
  //
  
  bail_function = NULL;

  //
  // Optional redirect of logger?
  //
  
  logger_function = NULL; 

  cache_log = false;
  
  silent = false;

  verbose = false;

  api_mode = false;
  
  bail_on_fail = true;
    
}

