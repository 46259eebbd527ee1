#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace gatewatch {

// ---------------------------------------------------------------------------
// Pull the trailing JSON object out of CLI output.
//
// `<bin> gateway health --json` may print styled doctor output before the
// JSON. Strategy:
//   1. parse from the last '{' to the end
//   2. else parse from the first '{' to the last '}'
// Throws ProbeError when neither yields a JSON value.
// ---------------------------------------------------------------------------
nlohmann::json extract_last_json_object(const std::string& text);

} // namespace gatewatch
