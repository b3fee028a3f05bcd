#include "academic_year.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace schoolgov {

bool is_academic_year(const std::string& label) {
    if (label.size() != 7 || label[4] != '-') {
        return false;
    }
    for (size_t i = 0; i < label.size(); ++i) {
        if (i == 4) continue;
        if (!std::isdigit(static_cast<unsigned char>(label[i]))) {
            return false;
        }
    }
    return true;
}

std::string shift_academic_year(const std::string& label, int years) {
    if (!is_academic_year(label)) {
        throw std::invalid_argument("Malformed academic year label: '" + label + "' (expected YYYY-YY)");
    }

    int start = std::stoi(label.substr(0, 4)) + years;
    int end = (std::stoi(label.substr(5, 2)) + years) % 100;
    if (end < 0) {
        end += 100;
    }

    std::ostringstream oss;
    oss << start << "-" << std::setw(2) << std::setfill('0') << end;
    return oss.str();
}

std::vector<std::string> parse_academic_year_list(const std::string& csv) {
    std::vector<std::string> years;
    std::stringstream ss(csv);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(), [](unsigned char c) {
            return std::isspace(c);
        }), item.end());
        if (item.empty()) {
            continue;
        }
        if (!is_academic_year(item)) {
            throw std::invalid_argument("Malformed academic year label: '" + item + "' (expected YYYY-YY)");
        }
        years.push_back(item);
    }

    std::sort(years.begin(), years.end());
    years.erase(std::unique(years.begin(), years.end()), years.end());
    return years;
}

} // namespace schoolgov
