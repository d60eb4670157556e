#include "rollexpr/format.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

namespace rollexpr {

std::string format_number(double v, int precision) {
    precision = std::clamp(precision, 0, 17);

    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << v;
    std::string s = os.str();

    if (s.find('.') != std::string::npos) {
        while (s.back() == '0') s.pop_back();
        if (s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

static std::string format_event(const RollEvent& ev) {
    // draws are matched to their class by value, with multiplicity
    std::map<std::int64_t, int> penalties, dropped;
    for (auto v : ev.penalties) ++penalties[v];
    for (auto v : ev.dropped) ++dropped[v];

    std::ostringstream os;
    os << ev.label << " [";
    for (std::size_t i = 0; i < ev.raw.size(); ++i) {
        if (i) os << ", ";
        std::int64_t v = ev.raw[i];
        if (penalties[v] > 0) {
            --penalties[v];
            os << '!' << v;
        } else if (dropped[v] > 0) {
            --dropped[v];
            os << "~~" << v << "~~";
        } else {
            os << v;
        }
    }
    os << "] = " << ev.subtotal;
    return os.str();
}

std::string format(const EvalResult& result, int precision) {
    std::string out = format_number(result.value, precision);
    for (const auto& ev : result.events) out += "\n" + format_event(ev);
    for (const auto& w : result.warnings) out += "\nwarning: " + w;
    return out;
}

} // namespace rollexpr
