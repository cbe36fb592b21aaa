#pragma once

// smacio: header-only C++17 readers for SMAC output files.
// Everything: JSON DOM and prefix decoder, the concatenated-JSON stream
// parser, and the state-run file readers.

#include <smacio/json.hpp>
#include <smacio/stream.hpp>
#include <smacio/readers.hpp>
