#pragma once

#include <functional>
#include <string>

namespace splinerig::core::log {

using Sink = std::function<void(const std::string&)>;

// Installs the process-wide sink for diagnostics. An empty sink restores stderr output.
void setSink(Sink sink);
void message(const std::string& text);

} // namespace splinerig::core::log
