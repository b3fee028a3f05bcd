#include "norms.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace schoolgov {

// ============================================================================
// CapacityNorms Implementation
// ============================================================================

//                                                          0   1   2   3   4   5   6   7   8  9  10  11
const std::array<int, CapacityNorms::NUM_CATEGORIES> CapacityNorms::classroom_table_ = {0, 30, 30, 30, 35, 35, 30, 35, 40, 0, 40, 40};
const std::array<int, CapacityNorms::NUM_CATEGORIES> CapacityNorms::teacher_table_   = {0, 30, 30, 30, 35, 30, 30, 30, 30, 0, 30, 30};

int CapacityNorms::classroom_norm(int school_category) {
    if (!is_mapped_classroom_category(school_category)) {
        return DEFAULT_NORM;
    }
    return classroom_table_[static_cast<size_t>(school_category)];
}

int CapacityNorms::pupil_teacher_norm(int school_category) {
    if (!is_mapped_teacher_category(school_category)) {
        return DEFAULT_NORM;
    }
    return teacher_table_[static_cast<size_t>(school_category)];
}

bool CapacityNorms::is_mapped_classroom_category(int school_category) {
    return school_category >= 1 && school_category <= MAX_CATEGORY &&
           classroom_table_[static_cast<size_t>(school_category)] > 0;
}

bool CapacityNorms::is_mapped_teacher_category(int school_category) {
    return school_category >= 1 && school_category <= MAX_CATEGORY &&
           teacher_table_[static_cast<size_t>(school_category)] > 0;
}

int64_t CapacityNorms::required_capacity(int64_t enrolment, int norm) {
    if (norm <= 0) {
        throw std::invalid_argument("Capacity norm must be positive, got " + std::to_string(norm));
    }
    if (enrolment <= 0) {
        return 0;
    }
    return (enrolment + norm - 1) / norm;
}

int64_t CapacityNorms::shortfall(int64_t required, int64_t current) {
    return std::max<int64_t>(required - current, 0);
}

// ============================================================================
// Risk levels
// ============================================================================

std::string to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "LOW";
        case RiskLevel::Moderate: return "MODERATE";
        case RiskLevel::High: return "HIGH";
        case RiskLevel::Critical: return "CRITICAL";
    }
    return "LOW";
}

RiskLevel parse_risk_level(const std::string& text) {
    if (text == "LOW") return RiskLevel::Low;
    if (text == "MODERATE") return RiskLevel::Moderate;
    if (text == "HIGH") return RiskLevel::High;
    if (text == "CRITICAL") return RiskLevel::Critical;
    throw std::invalid_argument("Unknown risk level: " + text);
}

RiskLevel RiskModel::classify(double risk_score) {
    if (risk_score > CRITICAL_ABOVE) return RiskLevel::Critical;
    if (risk_score > HIGH_ABOVE) return RiskLevel::High;
    if (risk_score > MODERATE_ABOVE) return RiskLevel::Moderate;
    return RiskLevel::Low;
}

// ============================================================================
// Numeric helpers
// ============================================================================

double round_to(double value, int places) {
    const double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

double capped_ratio(int64_t numerator, int64_t denominator) {
    if (denominator <= 0) {
        return 0.0;
    }
    double ratio = static_cast<double>(numerator) / static_cast<double>(denominator);
    return std::min(ratio, 1.0);
}

} // namespace schoolgov
