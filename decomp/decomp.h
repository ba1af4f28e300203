
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

#ifndef __SPECDEC_DECOMP_H__
#define __SPECDEC_DECOMP_H__

#include <vector>
#include <map>
#include <string>
#include <cstddef>

struct param_t;

//
// Options for the spectral decomposition
//

struct decomp_param_t {

  decomp_param_t();

  // map command options (k, height, distance, ...) on to the fields
  void set( const param_t & param );

  // throws invalid_config_error
  void validate() const;
  
  // number of spectral peaks retained
  int max_components;

  // peak thresholds, as fractions of the spectral maximum (height,
  // prominence) or of the signal length (distance)
  double peak_height_fraction;
  double peak_distance_fraction;
  double peak_prominence_fraction;

  // Butterworth bandpass order 
  int filter_order;

  // bandwidth = max( min_bandwidth , bandwidth_fraction * f )
  double min_bandwidth;
  double bandwidth_fraction;

  // frequencies below this are not filtered (0 = no guard)
  double min_frequency;

  // n:m phase differences, i.e. phi_f - ( f / f_ref ) phi_ref
  bool phase_ratio;

  // proportion of samples dropped from each end for phase summaries
  double edge_fraction;
  
};


//
// A band-limited component of the signal
//

struct component_t {

  component_t() : frq(0) , lwr(0) , upr(0) , okay(false) { } 
  
  double frq;

  // passband (Hz)
  double lwr, upr;

  // false if the filter could not be designed; see 'error'
  bool okay;
  std::string error;

  // filtered signal (same length as the input)
  std::vector<double> x;
  
};


struct phase_summary_t {
  phase_summary_t() : mean(0) , plv(0) { } 
  // circular mean (radians, [0,2pi)) 
  double mean;
  // mean resultant length
  double plv;
};


//
// Results of analyze_signal()
//

struct decomp_results_t {

  decomp_results_t() : reference(0) , has_reference(false) { } 
  
  // by descending prominence
  std::vector<double> frequencies;
  std::vector<double> magnitudes;

  // successfully filtered components, by frequency
  std::map<double,component_t> components;

  // frequencies for which no filter could be designed
  std::vector<component_t> failures;

  // relative phase, [0,2pi), for each non-reference component
  std::map<double,std::vector<double> > phases;

  // lowest frequency component
  double reference;
  bool has_reference;

  std::map<double,phase_summary_t> summaries;
  
};


//
// Spectral peak picking, bandpass extraction and relative phase analysis
//

class decomp_t {

 public:

  explicit decomp_t( const decomp_param_t & param = decomp_param_t() );

  const decomp_param_t & config() const { return par; } 
  
  // up to max_components peak frequencies/magnitudes, by descending prominence
  void find_dominant_frequencies( const std::vector<double> & x , double sr , 
				  std::vector<double> * frq , 
				  std::vector<double> * mag ) const;

  // one tagged component per requested frequency; failures do not throw
  std::map<double,component_t> extract_components( const std::vector<double> & x , 
						   const std::vector<double> & frqs , 
						   double sr ) const;
  
  // phase of each component relative to the lowest-frequency component
  // (only components flagged 'okay' are considered) 
  std::map<double,std::vector<double> > analyze_phases( const std::map<double,component_t> & comps , 
							double * reference = NULL ) const;
  
  // find -> extract -> phases
  decomp_results_t analyze_signal( const std::vector<double> & x , double sr ) const;

  // circular mean / PLV of a phase series, ignoring edge_fraction of each end
  phase_summary_t summarize( const std::vector<double> & ph ) const;

  // passband for frequency f; throws filter_design_error 
  void passband( double f , double sr , double * lwr , double * upr ) const;
  
  // throws invalid_signal_error
  void validate_signal( const std::vector<double> & x , double sr , int min_n = 2 ) const;
  
  // 2/n |X| over the first n/2 bins, with bin frequencies k.sr/n
  static std::vector<double> spectrum( const std::vector<double> & x , double sr , 
				       std::vector<double> * frq = NULL );
  
 private:

  decomp_param_t par;
  
};


#endif
