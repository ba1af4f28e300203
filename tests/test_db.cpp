
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

#include "db/db.h"
#include "defs/defs.h"

#include <sstream>
#include <cmath>
#include <limits>

TEST_CASE( "writer emits long-format rows", "[db]" )
{
  std::ostringstream ss;
  writer_t w( ss );
  
  w.id( "s1" );
  w.cmd( "PEAKS" );
  w.value( "NPEAKS" , 2 );
  w.level( 5.0 , globals::freq_strat );
  w.value( "MAG" , 0.5 );
  w.level( 10 , globals::sample_strat );
  w.value( "X" , std::string( "a" ) );
  w.unlevel( globals::sample_strat );
  w.value( "RANK" , std::numeric_limits<double>::quiet_NaN() );
  
  CHECK( ss.str() == 
	 "s1\tPEAKS\t.\tNPEAKS\t2\n"
	 "s1\tPEAKS\tF/5\tMAG\t0.5\n"
	 "s1\tPEAKS\tF/5;SP/10\tX\ta\n"
	 "s1\tPEAKS\tF/5\tRANK\tNA\n" );
}

TEST_CASE( "changing command clears strata", "[db]" )
{
  std::ostringstream ss;
  writer_t w( ss );
  w.id( "s1" );
  w.cmd( "COMP" );
  w.level( 20.0 , globals::freq_strat );
  w.cmd( "PHASE" );
  w.value( "REF" , 5.0 );
  CHECK( ss.str() == "s1\tPHASE\t.\tREF\t5\n" );
}

TEST_CASE( "non-finite numbers are written as missing", "[db]" )
{
  value_t v( std::nan( "" ) );
  CHECK( v.missing );
  CHECK( v.str() == "NA" );

  value_t v2( 1.0 / 3.0 );
  CHECK( v2.str( 3 ) == "0.333" );
}
