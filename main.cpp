
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


#include "main.h"
#include "specdec.h"

#include <Eigen/Core>
#include <fftw3.h>

#include <iostream>
#include <iomanip>
#include <cstring>
#include <cstdlib>
#include <new>
#include <set>
#include <sstream>
#include <unistd.h>

extern globals global;

extern writer_t writer;

extern logger_t logger;


int main(int argc , char ** argv )
{
   
  //
  // initiate global defintions
  //
  
  std::set_new_handler(NoMem);

  global.init_defs();


  //
  // display version info?
  //
  
  bool show_version = argc >= 2 
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );
  
  if ( show_version )  
    {
      global.api();
      std::cerr << specdec_version() ;
      std::exit( globals::retcode );
    }
  

  //
  // primary usage
  //
  
  std::string usage_msg = specdec_version() +
    "primary usage: specdec [file|-] sr=Hz [k=5] [height=0.05] [distance=0.01] [prominence=0.05]\n"
    "                       [order=5] [min-bw=0.5] [bw-frac=0.2] [min-frq=0] [ratio] [edge=0.1]\n"
    "                       [comps] [phases] [spectrum] [cwt=5,20,50] [id=ID] [silent] [log=file] [@param-file]\n"
    "                specdec --siggen sr=Hz dur=sec sine=f,a,... [ph] [noise=sd] [seed=N]\n";

  
  //
  // degenerate command line?
  //
  
  if ( argc == 1 && isatty(STDIN_FILENO) )  
    {      
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }
  

  //
  // signal generator mode
  //

  const bool siggen_mode = argc >= 2 && strcmp( argv[1] , "--siggen" ) == 0 ;
  
  
  //
  // Parse the command line
  //

  param_t param;
  
  std::string input = parse_cmdline( argc , argv , siggen_mode ? 2 : 1 , &param );

  if ( siggen_mode && input != "" ) 
    Helper::halt( "unexpected argument with --siggen: " + input );
  
  
  //
  // general options
  //

  if ( param.has( "silent" ) ) globals::silent = param.yesno( "silent" );

  if ( param.has( "verbose" ) ) globals::verbose = param.yesno( "verbose" );
  
  if ( param.has( "dp" ) ) globals::value_dp = param.requires_int( "dp" );
  
  if ( param.has( "log" ) )
    logger.write_log( Helper::expand( param.value( "log" ) ) );
  

  //
  // banner
  //
  
  logger.banner( globals::version , globals::date );

  
  //
  // make a synthetic signal? 
  //
  
  if ( siggen_mode ) 
    {

      std::vector<double> d;
      
      try 
	{
	  d = dsptools::siggen( param );
	}
      catch ( const decomp_error & e ) 
	{
	  Helper::halt( e.what() );
	}

      std::cout << std::setprecision( 12 );
      for (int i=0; i<d.size(); i++)
	std::cout << d[i] << "\n";
      
      std::exit( globals::retcode );
    }
  

  //
  // read the signal
  //

  if ( ! param.has( "sr" ) ) 
    Helper::halt( "no sample rate specified: sr=Hz" );
  
  std::vector<double> x;
  
  if ( input == "" || input == "-" )
    {
      if ( isatty(STDIN_FILENO) ) 
	Helper::halt( "no input, quitting" );
      x = Helper::read_numeric_column( std::cin , "stdin" );
      logger << " read " << x.size() << " values from stdin\n";
    }
  else
    {
      x = Helper::read_numeric_column( Helper::expand( input ) );
      logger << " read " << x.size() << " values from " << input << "\n";
    }
  
  //
  // output ID
  //

  writer.id( param.has( "id" ) ? param.value( "id" ) : globals::default_id );
  

  //
  // primary analysis
  //

  try 
    {

      dsptools::decompose( x , param );

      if ( param.has( "cwt" ) ) 
	dsptools::ricker_cwt( x , param );
      
    }
  catch ( const decomp_error & e ) 
    {
      Helper::halt( e.what() );
    }
  
  std::exit( globals::retcode );
  
}


std::string parse_cmdline( int argc , char ** argv , int start , param_t * param )
{

  std::string input = "";

  std::set<std::string> flags;
  flags.insert( "comps" );
  flags.insert( "phases" );
  flags.insert( "spectrum" );
  flags.insert( "ratio" );
  flags.insert( "ph" );
  flags.insert( "silent" );
  flags.insert( "verbose" );
  
  for (int i=start; i<argc; i++)
    {
      
      std::string arg( argv[i] );

      // @param file
      
      if ( arg[0] == '@' )
	{
	  const std::string filename = Helper::expand( arg.substr(1) );
	  if ( ! Helper::fileExists( filename ) ) 
	    Helper::halt( "could not open parameter file " + filename );
	  param->parse_file( filename );
	  continue;
	}
      
      // parse for a key=value form
      
      std::vector<std::string> tok = 
	Helper::quoted_parse( arg , "=" );
      
      if ( tok.size() >= 2 ) 
	{
	  param->parse( arg );
	  continue;
	}
      
      // flags, e.g. 'comps'
      
      if ( flags.find( arg ) != flags.end() ) 
	{
	  param->parse( arg );
	  continue;
	}

      // otherwise, the input file ('-' for stdin)

      if ( input != "" ) 
	Helper::halt( "did not recognize " + arg + " (input already set to " + input + ")" );

      input = arg;
      
    }
  
  return input;
}


std::string specdec_version()
{
  std::stringstream ss;
  ss << "specdec " << globals::version << " (" << globals::date << ")\n";
  ss << "Eigen library v"
     << EIGEN_WORLD_VERSION << "."
     << EIGEN_MAJOR_VERSION << "."
     << EIGEN_MINOR_VERSION << "\n";
  ss << fftw_version << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}
