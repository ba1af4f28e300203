
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

#ifndef __SPECDEC_DB_H__
#define __SPECDEC_DB_H__

#include <string>
#include <map>
#include <iostream>
#include <sstream>

#include "helper/helper.h"
#include "defs/defs.h"

//
// A single output value: numeric, integer, string or missing
//

struct value_t { 

  value_t() : numeric(false), integer(false), missing(true) { } 
  
  explicit value_t( double d ) : d(d) , numeric(true) , integer(false) , missing( ! Helper::realnum(d) ) { } 

  explicit value_t( int i ) : i(i) , numeric(false) , integer(true) , missing(false) { } 

  explicit value_t( const std::string & s ) : s(s) , numeric(false) , integer(false) , missing(false) { } 
  
  double d;
  int i;
  std::string s;

  bool numeric;
  bool integer;
  bool missing;
  
  std::string str( const int dp = -1 ) const;
  
};


//
// Current stratification: factor -> level
//

struct strata_t { 

  std::map<std::string,std::string> levels;

  bool empty() const { return levels.size() == 0; } 

  void clear() { levels.clear(); }

  // F/5;SP/10
  std::string print() const;
  
};


//
// Long-format output:   ID  CMD  STRATA  VAR  VALUE
//

class writer_t 
{
  
 public:

  writer_t( std::ostream & out = std::cout ) : out( &out ) , curr_indiv( "." ) , curr_command( "." ) { } 

  // redirect output (e.g. for testing)
  void redirect( std::ostream & o ) { out = &o; }
  
  void id( const std::string & indiv_name ) { curr_indiv = indiv_name; }

  void cmd( const std::string & cmd_name ) { curr_command = cmd_name; unlevel(); } 
  
  bool level( const int level_name , const std::string & factor_name )
  {
    return level( Helper::int2str( level_name ) , factor_name );
  }

  bool level( const double level_name , const std::string & factor_name )
  {
    return level( Helper::dbl2str( level_name ) , factor_name );
  }
  
  bool level( const std::string & level_name , const std::string & factor_name )
  {
    curr_strata.levels[ factor_name ] = level_name;
    return true;
  }

  bool unlevel( const std::string & factor_name )
  {
    // drop 'factor_name' from current stratification (curr_strata)
    std::map<std::string,std::string>::iterator ff = curr_strata.levels.find( factor_name );
    if ( ff == curr_strata.levels.end() ) return false;
    curr_strata.levels.erase( ff );
    return true;
  }
  
  bool unlevel() 
  {
    // set curr_strata to 'empty' 
    curr_strata.clear();
    return true;
  }
  
  bool value( const std::string & var_name , double d )
  {    
    return to_stdout( var_name , value_t( d ) ) ;
  }

  bool value( const std::string & var_name , int i ) 
  { 
    return to_stdout( var_name , value_t( i ) ) ; 
  } 
  
  bool value( const std::string & var_name , const std::string & s )
  {
    return to_stdout( var_name , value_t( s ) ); 
  }
  
 private:

  bool to_stdout( const std::string & var_name , const value_t & x );
  
  std::ostream * out;
  
  std::string curr_indiv;

  std::string curr_command;

  strata_t curr_strata;
  
};

#endif
