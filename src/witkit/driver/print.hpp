#pragma once

#include <string>

#include "witkit/common/diagnostic.hpp"

namespace witkit::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace witkit::driver
