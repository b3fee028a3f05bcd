#ifndef SCHOOLGOV_PROPOSAL_VALIDATOR_HPP
#define SCHOOLGOV_PROPOSAL_VALIDATOR_HPP

#include "derived_tables.hpp"
#include "school.hpp"
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace schoolgov {

struct Proposal {
    int64_t proposal_id = 0;
    SchoolId school_id = 0;
    std::string academic_year;
    int64_t requested_classrooms = 0;
    int64_t requested_teachers = 0;
    std::string submitted_by;
};

class ProposalSet {
public:
    void add(const Proposal& proposal);
    void add(Proposal&& proposal);

    const Proposal& get(size_t index) const;
    size_t size() const { return proposals_.size(); }
    bool empty() const { return proposals_.empty(); }

    const std::vector<Proposal>& proposals() const { return proposals_; }

    // Columns: school_id, academic_year, requested_classrooms, requested_teachers,
    // optional proposal_id and submitted_by. Missing proposal ids are numbered from 1.
    static ProposalSet load_from_csv(const std::string& filepath);
    static ProposalSet load_from_csv(std::istream& is, const std::string& source_name = "proposals.csv");

private:
    std::vector<Proposal> proposals_;
};

// Decision bands on requested / actual gap
struct ProposalRules {
    static constexpr double OVER_REQUEST_ABOVE = 1.5;
    static constexpr double MODERATE_OVER_FROM = 1.2;
    static constexpr double UNDER_REQUEST_BELOW = 0.5;

    static constexpr double NO_DEFICIT_CONFIDENCE = 0.1;
    static constexpr double OVER_REQUEST_CONFIDENCE = 0.2;
    static constexpr double MODERATE_OVER_CONFIDENCE = 0.5;
    static constexpr double UNDER_REQUEST_CONFIDENCE = 0.6;
    static constexpr double NO_REQUEST_CONFIDENCE = 1.0;
};

// requested / max(gap, 1) when gap > 0; +inf when there is no gap but a request; 0 otherwise
double request_ratio(int64_t requested, int64_t actual_gap);

struct ProposalAssessment {
    ProposalDecision decision = ProposalDecision::Rejected;
    std::string reason_code;
    double confidence = 0.0;
    double classroom_ratio = 0.0;
    double teacher_ratio = 0.0;
};

// First matching rule wins; at equal severity the classroom check is applied first
ProposalAssessment evaluate_proposal(int64_t requested_classrooms,
                                     int64_t requested_teachers,
                                     int64_t classroom_gap,
                                     int64_t teacher_gap);

// Validate against each proposal's resolved gap rows. A school-year without a
// classroom gap row is REJECTED / SCHOOL_NOT_FOUND.
std::vector<ProposalValidationRow> validate_proposals(const std::vector<Proposal>& proposals,
                                                      const DerivedTables& tables);

} // namespace schoolgov

#endif // SCHOOLGOV_PROPOSAL_VALIDATOR_HPP
