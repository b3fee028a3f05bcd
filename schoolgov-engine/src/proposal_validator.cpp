#include "proposal_validator.hpp"
#include "academic_year.hpp"
#include "io/csv_reader.hpp"
#include "norms.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace schoolgov {

// ============================================================================
// ProposalSet
// ============================================================================

void ProposalSet::add(const Proposal& proposal) {
    proposals_.push_back(proposal);
}

void ProposalSet::add(Proposal&& proposal) {
    proposals_.push_back(std::move(proposal));
}

const Proposal& ProposalSet::get(size_t index) const {
    if (index >= proposals_.size()) {
        throw std::out_of_range("Proposal index out of range");
    }
    return proposals_[index];
}

ProposalSet ProposalSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file, filepath);
}

namespace {

int64_t parse_int(const std::string& value, const std::string& column,
                  const std::string& source, size_t line, bool empty_is_zero) {
    if (value.empty() && empty_is_zero) {
        return 0;
    }
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (value.empty() || consumed != value.size()) {
        throw std::invalid_argument(source + ":" + std::to_string(line) + ": invalid value '" +
                                    value + "' in column '" + column + "'");
    }
    return static_cast<int64_t>(parsed);
}

} // anonymous namespace

ProposalSet ProposalSet::load_from_csv(std::istream& is, const std::string& source_name) {
    ProposalSet ps;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return ps;
    }

    auto require = [&header, &source_name](const std::string& name) {
        int idx = CsvReader::column_index(header, name);
        if (idx < 0) {
            throw std::runtime_error(source_name + ": missing required column '" + name + "'");
        }
        return idx;
    };
    auto cell = [](const std::vector<std::string>& row, int idx) {
        return (idx >= 0 && static_cast<size_t>(idx) < row.size()) ? row[static_cast<size_t>(idx)] : std::string();
    };

    const int id_col = CsvReader::column_index(header, "proposal_id");
    const int school_col = require("school_id");
    const int year_col = require("academic_year");
    const int classrooms_col = require("requested_classrooms");
    const int teachers_col = require("requested_teachers");
    const int submitter_col = CsvReader::column_index(header, "submitted_by");

    int64_t next_id = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            continue;
        }
        const size_t line = reader.line_number();

        Proposal p;
        p.proposal_id = id_col >= 0 && !cell(row, id_col).empty()
            ? parse_int(cell(row, id_col), "proposal_id", source_name, line, false)
            : next_id;
        next_id = std::max(next_id, p.proposal_id) + 1;

        p.school_id = parse_school_id(cell(row, school_col), source_name, line);
        p.academic_year = cell(row, year_col);
        if (!is_academic_year(p.academic_year)) {
            throw std::invalid_argument(source_name + ":" + std::to_string(line) +
                                        ": invalid academic_year '" + p.academic_year + "'");
        }
        p.requested_classrooms = parse_int(cell(row, classrooms_col), "requested_classrooms", source_name, line, true);
        p.requested_teachers = parse_int(cell(row, teachers_col), "requested_teachers", source_name, line, true);
        if (p.requested_classrooms < 0 || p.requested_teachers < 0) {
            throw std::invalid_argument(source_name + ":" + std::to_string(line) +
                                        ": requested quantities must be non-negative");
        }
        p.submitted_by = cell(row, submitter_col);

        ps.add(std::move(p));
    }

    return ps;
}

// ============================================================================
// Decision rules
// ============================================================================

double request_ratio(int64_t requested, int64_t actual_gap) {
    if (actual_gap > 0) {
        return static_cast<double>(requested) / static_cast<double>(std::max<int64_t>(actual_gap, 1));
    }
    if (requested > 0) {
        return std::numeric_limits<double>::infinity();
    }
    return 0.0;
}

ProposalAssessment evaluate_proposal(int64_t requested_classrooms,
                                     int64_t requested_teachers,
                                     int64_t classroom_gap,
                                     int64_t teacher_gap) {
    ProposalAssessment a;
    a.classroom_ratio = request_ratio(requested_classrooms, classroom_gap);
    a.teacher_ratio = request_ratio(requested_teachers, teacher_gap);

    auto decide = [&a](ProposalDecision decision, const char* reason, double confidence) {
        a.decision = decision;
        a.reason_code = reason;
        a.confidence = confidence;
        return a;
    };

    const double cr = a.classroom_ratio;
    const double tr = a.teacher_ratio;

    if (classroom_gap == 0 && teacher_gap == 0 && (requested_classrooms > 0 || requested_teachers > 0)) {
        return decide(ProposalDecision::Rejected, "NO_DEFICIT", ProposalRules::NO_DEFICIT_CONFIDENCE);
    }

    if (cr > ProposalRules::OVER_REQUEST_ABOVE) {
        return decide(ProposalDecision::Rejected, "CLASSROOM_OVER_REQUEST", ProposalRules::OVER_REQUEST_CONFIDENCE);
    }
    if (tr > ProposalRules::OVER_REQUEST_ABOVE) {
        return decide(ProposalDecision::Rejected, "TEACHER_OVER_REQUEST", ProposalRules::OVER_REQUEST_CONFIDENCE);
    }

    auto moderate_over = [](double ratio) {
        return ratio >= ProposalRules::MODERATE_OVER_FROM && ratio <= ProposalRules::OVER_REQUEST_ABOVE;
    };
    if (moderate_over(cr)) {
        return decide(ProposalDecision::Flagged, "CLASSROOM_MODERATE_OVER", ProposalRules::MODERATE_OVER_CONFIDENCE);
    }
    if (moderate_over(tr)) {
        return decide(ProposalDecision::Flagged, "TEACHER_MODERATE_OVER", ProposalRules::MODERATE_OVER_CONFIDENCE);
    }

    if (classroom_gap > 0 && cr < ProposalRules::UNDER_REQUEST_BELOW) {
        return decide(ProposalDecision::Flagged, "CLASSROOM_UNDER_REQUEST", ProposalRules::UNDER_REQUEST_CONFIDENCE);
    }
    if (teacher_gap > 0 && tr < ProposalRules::UNDER_REQUEST_BELOW) {
        return decide(ProposalDecision::Flagged, "TEACHER_UNDER_REQUEST", ProposalRules::UNDER_REQUEST_CONFIDENCE);
    }

    if (requested_classrooms == 0 && requested_teachers == 0 && classroom_gap == 0 && teacher_gap == 0) {
        return decide(ProposalDecision::Accepted, "NO_REQUEST", ProposalRules::NO_REQUEST_CONFIDENCE);
    }

    const double raw = 1.0 - 0.5 * std::fabs(cr - 1.0) - 0.5 * std::fabs(tr - 1.0);
    return decide(ProposalDecision::Accepted, "WITHIN_TOLERANCE",
                  round_to(std::max(0.0, std::min(raw, 1.0)), 3));
}

std::vector<ProposalValidationRow> validate_proposals(const std::vector<Proposal>& proposals,
                                                      const DerivedTables& tables) {
    std::vector<ProposalValidationRow> rows;
    rows.reserve(proposals.size());

    for (const Proposal& p : proposals) {
        ProposalValidationRow row;
        row.proposal_id = p.proposal_id;
        row.school_id = p.school_id;
        row.academic_year = p.academic_year;
        row.requested_classrooms = p.requested_classrooms;
        row.requested_teachers = p.requested_teachers;
        row.submitted_by = p.submitted_by;

        const ClassroomGapRow* cgap = find_school_row(tables.classroom_gaps.rows(p.academic_year), p.school_id);
        if (!cgap) {
            row.decision = ProposalDecision::Rejected;
            row.reason_code = "SCHOOL_NOT_FOUND";
            row.confidence = 0.0;
            rows.push_back(std::move(row));
            continue;
        }

        const TeacherGapRow* tgap = find_school_row(tables.teacher_gaps.rows(p.academic_year), p.school_id);
        const int64_t teacher_gap = tgap ? tgap->teacher_gap : 0;

        ProposalAssessment a = evaluate_proposal(p.requested_classrooms, p.requested_teachers,
                                                 cgap->classroom_gap, teacher_gap);
        row.actual_classroom_gap = cgap->classroom_gap;
        row.actual_teacher_gap = teacher_gap;
        row.classroom_ratio = a.classroom_ratio;
        row.teacher_ratio = a.teacher_ratio;
        row.decision = a.decision;
        row.reason_code = std::move(a.reason_code);
        row.confidence = a.confidence;
        rows.push_back(std::move(row));
    }

    return rows;
}

} // namespace schoolgov
