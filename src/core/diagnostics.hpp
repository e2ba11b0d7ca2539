#pragma once

#include "source_error.hpp"
#include "world.hpp"
#include <ostream>
#include <vector>

// Writes errors in the usual compiler layout: a header line, the location and
// the offending source line with the span underlined. Tracepoints follow as
// help notes.
void print_diagnostics(std::ostream &os, const World &world,
                       const std::vector<SourceError> &errors);
