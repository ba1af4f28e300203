
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

#include <catch2/catch.hpp>

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <sstream>
#include <stdexcept>

extern logger_t logger;

TEST_CASE( "parse splits on any delimiter character", "[helper]" )
{
  std::vector<std::string> tok = Helper::parse( "a,b;c" , ",;" );
  REQUIRE( tok.size() == 3 );
  CHECK( tok[0] == "a" );
  CHECK( tok[2] == "c" );

  // adjacent delimiters are collapsed unless empty slots are requested
  CHECK( Helper::parse( "a,,b" , "," ).size() == 2 );
  std::vector<std::string> tok2 = Helper::parse( "a,,b" , "," , true );
  REQUIRE( tok2.size() == 3 );
  CHECK( tok2[1] == "." );
}

TEST_CASE( "quoted_parse ignores delimiters inside quotes", "[helper]" )
{
  std::vector<std::string> tok = Helper::quoted_parse( "id=\"a=b\"" , "=" );
  REQUIRE( tok.size() == 2 );
  CHECK( tok[0] == "id" );
  CHECK( Helper::unquote( tok[1] ) == "a=b" );
}

TEST_CASE( "numeric conversion requires the whole token", "[helper]" )
{
  double d = 0;
  CHECK( Helper::str2dbl( "2.5" , &d ) );
  CHECK( d == Approx( 2.5 ) );
  CHECK( Helper::str2dbl( " -1e-3 " , &d ) );
  CHECK( d == Approx( -0.001 ) );
  CHECK_FALSE( Helper::str2dbl( "2.5x" , &d ) );
  CHECK_FALSE( Helper::str2dbl( "" , &d ) );

  int i = 0;
  CHECK( Helper::str2int( "42" , &i ) );
  CHECK( i == 42 );
  CHECK_FALSE( Helper::str2int( "4.2" , &i ) );
}

TEST_CASE( "yesno and string helpers", "[helper]" )
{
  CHECK( Helper::yesno( "T" ) );
  CHECK( Helper::yesno( "yes" ) );
  CHECK_FALSE( Helper::yesno( "0" ) );
  CHECK_FALSE( Helper::yesno( "false" ) );
  CHECK_FALSE( Helper::yesno( "" ) );

  CHECK( Helper::lrtrim( "  x y \t" ) == "x y" );
  CHECK( Helper::dbl2str( 1.23456 , 2 ) == "1.23" );
  CHECK( Helper::int2str( -7 ) == "-7" );
}

TEST_CASE( "read_numeric_column skips comments and blank lines", "[helper]" )
{
  std::istringstream in( "# header\n1.5\n\n% note\n -2 \n3e1" );
  std::vector<double> x = Helper::read_numeric_column( in , "test" );
  REQUIRE( x.size() == 3 );
  CHECK( x[0] == Approx( 1.5 ) );
  CHECK( x[1] == Approx( -2 ) );
  CHECK( x[2] == Approx( 30 ) );
}

TEST_CASE( "read_numeric_column halts on a bad value", "[helper]" )
{
  std::istringstream in( "1\ntwo\n3\n" );
  CHECK_THROWS_AS( Helper::read_numeric_column( in , "test" ) , std::runtime_error );
}

TEST_CASE( "missing files halt", "[helper]" )
{
  CHECK_FALSE( Helper::fileExists( "/no/such/file.txt" ) );
  CHECK_THROWS( Helper::read_numeric_column( std::string( "/no/such/file.txt" ) ) );
}

TEST_CASE( "logger caches messages and warnings", "[helper]" )
{
  logger.print_buffer();
  globals::cache_log = true;

  logger << "filtering " << 3 << " components\n";
  logger.warning( "passband out of range" );

  globals::cache_log = false;

  const std::string buf = logger.print_buffer();
  CHECK( buf.find( "filtering 3 components" ) != std::string::npos );
  CHECK( buf.find( "** warning: passband out of range **" ) != std::string::npos );
  CHECK( logger.print_buffer() == "" );
}
