
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

#include "param.h"

#include <stdexcept>

TEST_CASE( "key=value and flag options", "[param]" )
{
  param_t param;
  param.parse( "sr=256" );
  param.parse( "comps" );
  param.parse( "ratio=F" );
  param.parse( "cwt=5,20,50" );
  
  CHECK( param.size() == 4 );
  CHECK( param.has( "sr" ) );
  CHECK_FALSE( param.has( "phases" ) );

  CHECK( param.requires_dbl( "sr" ) == Approx( 256 ) );
  CHECK( param.requires_int( "sr" ) == 256 );

  // a bare flag is 'yes', an explicit F is 'no'
  CHECK( param.empty( "comps" ) );
  CHECK( param.yesno( "comps" ) );
  CHECK_FALSE( param.yesno( "ratio" ) );
  CHECK_FALSE( param.yesno( "phases" ) );

  std::vector<double> scales = param.dblvector( "cwt" );
  REQUIRE( scales.size() == 3 );
  CHECK( scales[1] == Approx( 20 ) );
}

TEST_CASE( "values may contain further equals signs", "[param]" )
{
  param_t param;
  param.parse( "id=a=b" );
  CHECK( param.value( "id" ) == "a=b" );
}

TEST_CASE( "appending with +=", "[param]" )
{
  param_t param;
  param.add( "cwt+" , "5" );
  param.add( "cwt+" , "10" );
  CHECK( param.value( "cwt" ) == "5,10" );
}

TEST_CASE( "malformed or missing values halt", "[param]" )
{
  param_t param;
  param.parse( "sr=fast" );
  param.parse( "k=2.5" );
  
  CHECK_THROWS_AS( param.requires_dbl( "sr" ) , std::runtime_error );
  CHECK_THROWS_AS( param.requires_int( "k" ) , std::runtime_error );
  CHECK_THROWS_AS( param.requires( "dur" ) , std::runtime_error );

  // duplicated keys are an error outside API mode
  CHECK_THROWS_AS( param.parse( "sr=100" ) , std::runtime_error );
}

