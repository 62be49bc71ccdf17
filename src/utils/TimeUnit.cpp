#include "TimeUnit.hpp"
#include <stdexcept>

namespace HonestMark {

std::chrono::milliseconds ParseWindowUnit(const std::string& unit) {
    std::string t;
    t.reserve(unit.size());
    for (unsigned char c : unit) t.push_back((c >= 'A' && c <= 'Z') ? char(c + 32) : char(c));
    if (!t.empty() && t.back() == 's') t.pop_back();

    if (t == "millisecond") return std::chrono::milliseconds(1);
    if (t == "second") return std::chrono::seconds(1);
    if (t == "minute") return std::chrono::minutes(1);
    if (t == "hour") return std::chrono::hours(1);
    if (t == "day") return std::chrono::hours(24);
    throw std::invalid_argument("Unknown window unit: " + unit);
}

}
