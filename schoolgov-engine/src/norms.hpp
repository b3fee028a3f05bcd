#ifndef SCHOOLGOV_NORMS_HPP
#define SCHOOLGOV_NORMS_HPP

#include <array>
#include <cstdint>
#include <string>

namespace schoolgov {

// Category-based capacity norms (students per classroom / per teacher).
// The two tables differ from category 5 upwards; both are kept as published.
class CapacityNorms {
public:
    static constexpr int MAX_CATEGORY = 11;
    static constexpr int NUM_CATEGORIES = MAX_CATEGORY + 1;  // slot 0 unused

    // Used for any category outside the published tables
    static constexpr int DEFAULT_NORM = 30;

    static int classroom_norm(int school_category);
    static int pupil_teacher_norm(int school_category);

    static bool is_mapped_classroom_category(int school_category);
    static bool is_mapped_teacher_category(int school_category);

    // ceil(enrolment / norm); norm must be positive
    static int64_t required_capacity(int64_t enrolment, int norm);

    // max(required - current, 0)
    static int64_t shortfall(int64_t required, int64_t current);

private:
    // 0 marks an unmapped category
    static const std::array<int, NUM_CATEGORIES> classroom_table_;
    static const std::array<int, NUM_CATEGORIES> teacher_table_;
};

enum class RiskLevel : uint8_t {
    Low = 0,
    Moderate = 1,
    High = 2,
    Critical = 3
};

std::string to_string(RiskLevel level);
RiskLevel parse_risk_level(const std::string& text);

inline bool is_high_or_critical(RiskLevel level) {
    return level == RiskLevel::High || level == RiskLevel::Critical;
}

// Composite risk weights and level thresholds
struct RiskModel {
    static constexpr double TEACHER_WEIGHT = 0.45;
    static constexpr double CLASSROOM_WEIGHT = 0.35;
    static constexpr double GROWTH_WEIGHT = 0.20;
    static constexpr double GROWTH_CAP = 0.50;

    // Lower bounds are exclusive: a score equal to a threshold takes the lower level
    static constexpr double CRITICAL_ABOVE = 0.75;
    static constexpr double HIGH_ABOVE = 0.50;
    static constexpr double MODERATE_ABOVE = 0.20;

    static RiskLevel classify(double risk_score);
};

// Round half away from zero to the given number of decimal places
double round_to(double value, int places);

// min(numerator / denominator, 1.0); 0 when the denominator is not positive
double capped_ratio(int64_t numerator, int64_t denominator);

} // namespace schoolgov

#endif // SCHOOLGOV_NORMS_HPP
