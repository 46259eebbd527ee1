#include "gatewatch/probe/JsonExtract.hpp"
#include "gatewatch/core/Errors.hpp"
#include <cstddef>

using namespace gatewatch;
using json = nlohmann::json;

json gatewatch::extract_last_json_object(const std::string& text) {
    const auto start = text.rfind('{');
    if (start == std::string::npos) throw ProbeError("no JSON object found in output");

    // Strict: last '{' to end. Only works for flat objects, which the health
    // summary normally is.
    json parsed = json::parse(text.begin() + static_cast<std::ptrdiff_t>(start), text.end(),
                              nullptr, false);
    if (!parsed.is_discarded()) return parsed;

    // Nested object or trailing noise: widen to first '{' .. last '}'.
    const auto s2 = text.find('{');
    const auto e2 = text.rfind('}');
    if (e2 != std::string::npos && e2 > s2) {
        parsed = json::parse(text.begin() + static_cast<std::ptrdiff_t>(s2),
                             text.begin() + static_cast<std::ptrdiff_t>(e2) + 1,
                             nullptr, false);
        if (!parsed.is_discarded()) return parsed;
    }
    throw ProbeError("failed to parse JSON output");
}
