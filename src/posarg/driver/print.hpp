#pragma once

#include <string>

#include "config.hpp"
#include "posarg/common/arg_error.hpp"
#include "posarg/value/value.hpp"

namespace posarg::driver {

// Decide once whether stderr output is styled. kAuto styles only when
// stderr is a terminal.
void SetColorMode(ColorMode mode);

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

// "posarg: error: <kind>: <message>", then one "note:" line per note.
void PrintArgError(const ArgError& error);

// Decoded value on stdout, in literal notation.
void PrintValue(const Value& value);

}  // namespace posarg::driver
