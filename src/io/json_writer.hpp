#ifndef LITISIM_IO_JSON_WRITER_HPP
#define LITISIM_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../analysis.hpp"

namespace litisim {
namespace io {

struct JsonOutputOptions {
    bool pretty_print;
    bool include_tree;      // Add the explanatory decision tree
    bool include_trials;    // Add raw trials when the simulation retained them

    JsonOutputOptions() : pretty_print(true), include_tree(false), include_trials(false) {}
};

// Write a Recommendation as a JSON object. Output is a pure function of the
// recommendation, so equal recommendations produce identical bytes.
void write_recommendation_json(std::ostream& os, const Recommendation& recommendation,
                               bool pretty_print = true);

// Write a full Analysis: inputs, scenario ranking, best response, simulation
// summary, recommendation and optionally the tree and raw trials.
// Infinite ROI / value-per-day sentinels are written as null.
void write_analysis_json(std::ostream& os, const Analysis& analysis,
                         const JsonOutputOptions& options = JsonOutputOptions());

// Write a full Analysis to a JSON file
void write_analysis_json(const std::string& filepath, const Analysis& analysis,
                         const JsonOutputOptions& options = JsonOutputOptions());

} // namespace io
} // namespace litisim

#endif // LITISIM_IO_JSON_WRITER_HPP
