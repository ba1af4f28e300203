
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

#include "db/db.h"

#include <iomanip>

std::string value_t::str( const int dp ) const 
{
  std::stringstream ss;
  if ( missing ) ss << "NA";    
  else if ( numeric ) 
    {
      if ( dp >= 0 ) ss << std::fixed << std::setprecision( dp );
      ss << d;
    }
  else if ( integer ) ss << i;
  else ss << s;
  return ss.str();
}

std::string strata_t::print() const
{
  if ( levels.size() == 0 ) return ".";
  std::stringstream ss;
  std::map<std::string,std::string>::const_iterator aa = levels.begin();
  while ( aa != levels.end() )
    {
      if ( aa != levels.begin() ) ss << ";";
      ss << aa->first << "/" << aa->second ; 
      ++aa;
    }
  return ss.str();
}

bool writer_t::to_stdout( const std::string & var_name , const value_t & x )  
{
  *out << curr_indiv << "\t"
       << curr_command << "\t"
       << curr_strata.print() << "\t"
       << var_name << "\t"
       << x.str( globals::value_dp ) 
       << "\n";
  return true;
}
