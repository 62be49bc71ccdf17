#pragma once
#include <chrono>
#include <string>

namespace HonestMark {

// Length of one quota window for a unit name: "milliseconds", "seconds",
// "minutes", "hours" or "days" (singular forms and case are accepted).
// Throws std::invalid_argument for anything else.
std::chrono::milliseconds ParseWindowUnit(const std::string& unit);

}
