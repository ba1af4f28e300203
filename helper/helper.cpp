
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

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <fstream>
#include <cstdlib>
#include <cstdio>
#include <iomanip>

extern logger_t logger;

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( s[i] );
  return j;
}

std::string Helper::remove_all_quotes( const std::string & s , const char q2 )
{
  std::string j;
  for (int i=0;i<s.size();i++)
    if ( s[i] != '"' && s[i] != q2 ) j += s[i];
  return j;
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE 
  // versus all else  (including empty, i.e. 'var'  --> 'var=T' 
  if ( s.size() == 0 ) return false; // empty == NO
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}

bool Helper::fileExists( const std::string & f )
{
  FILE *file;
  if ( ( file = fopen( f.c_str() , "r" ) ) ) 
    {
      fclose(file);
      return true;
    } 
  return false;
}

std::string Helper::expand( const std::string & f )
{
  // only expand ~ if first character for home-folder subst
  if ( f.size() == 0 ) return f;
  if ( f[0] != '~' ) return f;
  const char * home = getenv("HOME");
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}


// https://stackoverflow.com/questions/6089231/getting-std-ifstream-to-handle-lf-cr-and-crlf

std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();
  
  for ( ; ; ) 
    {
      
      int c = sb->sbumpc();
      
      switch (c) 
	{
	case '\n':
	  return is;
	  
	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

 	case EOF :
 	  // Also handle the case when the last line has no line ending
 	  if(t.empty())
 	    is.setstate(std::ios::eofbit);
 	  return is;
	  
	default:
	  t += (char)c;
	}
    }
}


std::vector<double> Helper::read_numeric_column( std::istream & in , const std::string & label )
{
  std::vector<double> d;
  int line_num = 0;

  while ( true )
    {
      std::string line;
      Helper::safe_getline( in , line );
      if ( in.eof() ) break;
      ++line_num;
      
      line = Helper::lrtrim( line );
      if ( line == "" ) continue;
      if ( line[0] == '#' || line[0] == '%' ) continue;
      
      double x = 0;
      if ( ! Helper::str2dbl( line , &x ) )
	Helper::halt( "bad numeric value on line " + Helper::int2str( line_num ) + " of " + label + ": " + line );
      
      d.push_back( x );
    }
  
  return d;
}

std::vector<double> Helper::read_numeric_column( const std::string & f )
{
  const std::string filename = Helper::expand( f );
  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not find " + filename );
  
  std::ifstream IN1( filename.c_str() , std::ios::in );
  return read_numeric_column( IN1 , filename );
}

std::vector<std::string> Helper::file2strvector( const std::string & f )
{
  std::vector<std::string> s;
  const std::string filename = Helper::expand( f );
  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not find " + filename );
  
  std::ifstream IN1( filename.c_str() , std::ios::in );
  while ( true )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() ) break;
      line = Helper::lrtrim( line );
      if ( line == "" || line[0] == '%' ) continue;
      std::vector<std::string> tok = Helper::quoted_parse( line , " \t" );
      for (int i=0; i<tok.size(); i++) s.push_back( tok[i] );
    }
  return s;
}


void Helper::halt( const std::string & msg )
{
  
  // some other code handles the exit, e.g. if embedded in another tool
  if ( globals::bail_function != NULL ) 
    globals::bail_function( msg );

  // do not kill the process? 
  if ( ! globals::bail_on_fail ) return;
  
  // switch logger off , i.e. as we don't want close-out msg
  logger.off();
  
  // generic bail function (not using logger)
  std::cerr << "error : " << msg << "\n";   

  std::exit(1);
}

bool Helper::realnum(double d)
{
  return std::isfinite( d );
}

std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}

bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

std::vector<std::string> Helper::parse(const std::string & item, const char s , bool empty )
{
  return Helper::parse( item , std::string( 1 , s ) , empty ); 
}

std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{  
  // no quoting: use a quote char that cannot appear 
  return Helper::quoted_parse( item , s , '\0' , '\0' , empty );
}  

std::vector<std::string> Helper::quoted_parse(const std::string & item , const std::string & s , const char q , const char q2, bool empty )
{

  std::vector<std::string> strs;  
  if ( item.size() == 0 ) return strs;
  
  bool in_quote = false;
  char open_quote = '\0';
  int p = 0;
  
  for (int j=0; j<item.size(); j++)
    {
      const char c = item[j];

      if ( c != '\0' && ( c == q || c == q2 ) )
	{
	  if ( ! in_quote ) { in_quote = true; open_quote = c; }
	  else if ( c == open_quote ) in_quote = false;
	  continue;
	}
      
      if ( in_quote ) continue;
      
      if ( s.find( c ) != std::string::npos ) 
	{ 	      
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back( item.substr(p,j-p) ); 
	      p=j+1; 
	    }
	}	  
    }
  
  if ( empty && p == item.size() ) 
    strs.push_back( "." );
  else if ( p < item.size() )
    strs.push_back( item.substr(p) );
  
  return strs;
}

