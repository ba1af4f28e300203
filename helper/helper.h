
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

#ifndef __SPECDEC_HELPER_H__
#define __SPECDEC_HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm> 
#include <cctype>
#include <stdint.h>
#include <map>
#include <cmath>

namespace Helper 
{

  std::string toupper( const std::string & );  

  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase(s.begin(), std::find_if( s.begin(), s.end(),  [](int c) {return !std::isspace(c);} ));
    return s;
  }
 
  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase(std::find_if( s.rbegin(), s.rend(),  [](int c) {return !std::isspace(c);} ).base(), s.end() );
    return s;
  }
  
  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  static inline std::string unquote(const std::string &s , const char q2 = '"' ) {
    if ( s.size() == 0 ) return s;
    int a = ( s[0] == '"' || s[0] == q2 ) ? 1 : 0;
    int b = ( s[s.size()-1] == '"' || s[s.size()-1] == q2 ) ? 1 : 0 ;
    return s.substr(a,s.size()-a-b);
  }

  std::string remove_all_quotes(const std::string &s , const char q2 = '"' );

  bool yesno( const std::string & );
  
  bool fileExists(const std::string &);
  std::string expand( const std::string & f );
  
  std::istream& safe_getline(std::istream& is, std::string& t);

  // one numeric value per line ('#' and '%' comments, blank lines skipped)
  std::vector<double> read_numeric_column( std::istream & in , const std::string & label );
  std::vector<double> read_numeric_column( const std::string & filename );

  // whitespace-delimited tokens from a (parameter) file
  std::vector<std::string> file2strvector( const std::string & filename );
  
  void halt( const std::string & msg );
  bool realnum(double d);
  
  std::string int2str(int n);  
  std::string dbl2str(double n);  
  std::string dbl2str(double n, int dp);  

  bool str2dbl(const std::string & , double * ); 
  bool str2int(const std::string & , int * ); 

  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      // require the whole token to be consumed
      return !(iss >> f >> t).fail() && ( iss >> std::ws ).eof();
    }
  
  // split on any of the characters in 's'
  std::vector<std::string> parse(const std::string & item, const std::string & s = " \t\n" , bool empty = false );
  std::vector<std::string> parse(const std::string & item, const char s , bool empty = false );

  // as above, but delimiters within quotes (q or q2) are ignored
  std::vector<std::string> quoted_parse(const std::string & item , const std::string & s , const char q = '"' , const char q2 = '\'' , bool empty = false );
  
}

#endif
