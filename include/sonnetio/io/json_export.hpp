#pragma once

#include <string>

#include "sonnetio/coupled_lines.hpp"
#include "sonnetio/io/touchstone.hpp"

namespace sonnetio {

/// Write a network parameter set to JSON.
/// Complex values are stored as [real, imag] pairs.
/// @param path Output file path
/// @param data Parsed parameter set
void write_network_json(const std::string &path,
                        const NetworkParameterSet &data);

/// Write the modal results of a coupled-line model to JSON: per frequency,
/// propagation constants, characteristic impedances, effective permittivities
/// and the characteristic impedance matrix.
void write_coupled_lines_json(const std::string &path,
                              const CoupledLineModel &model);

} // namespace sonnetio
