
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

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "specdec.h"

#include <stdexcept>

extern globals global;

// halt() reports via an exception rather than exiting the test runner
static void bail_to_test( const std::string & msg )
{
  throw std::runtime_error( msg );
}

int main( int argc , char * argv[] )
{
  global.init_defs();
  
  globals::silent = true;
  globals::bail_function = bail_to_test;
  
  return Catch::Session().run( argc , argv );
}
