#include "prioritisation.hpp"
#include <algorithm>
#include <map>
#include <numeric>

namespace schoolgov {

std::vector<int64_t> rank_descending(const std::vector<double>& scores) {
    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&scores](size_t a, size_t b) {
        return scores[a] > scores[b];
    });

    std::vector<int64_t> ranks(scores.size(), 0);
    for (size_t pos = 0; pos < order.size(); ++pos) {
        if (pos > 0 && scores[order[pos]] == scores[order[pos - 1]]) {
            ranks[order[pos]] = ranks[order[pos - 1]];
        } else {
            ranks[order[pos]] = static_cast<int64_t>(pos) + 1;
        }
    }
    return ranks;
}

double percent_rank(int64_t rank, size_t row_count) {
    if (row_count <= 1) {
        return 0.0;
    }
    return static_cast<double>(rank - 1) / static_cast<double>(row_count - 1);
}

PriorityBucket bucket_for_percent_rank(double pct_rank) {
    if (pct_rank <= PriorityBuckets::TOP_5) return PriorityBucket::Top5;
    if (pct_rank <= PriorityBuckets::TOP_10) return PriorityBucket::Top10;
    if (pct_rank <= PriorityBuckets::TOP_20) return PriorityBucket::Top20;
    return PriorityBucket::Standard;
}

std::vector<const RiskRow*> risk_history(const YearPartitionedTable<RiskRow>& risk,
                                         SchoolId school_id,
                                         const std::string& year) {
    std::vector<const RiskRow*> history;
    for (const auto& y : risk.years()) {
        if (y > year) {
            break;
        }
        if (const RiskRow* row = find_school_row(risk.rows(y), school_id)) {
            history.push_back(row);
        }
    }
    return history;
}

bool sustained_high_risk(const std::vector<const RiskRow*>& history) {
    if (history.size() < 3) {
        return false;
    }
    return std::all_of(history.end() - 3, history.end(), [](const RiskRow* row) {
        return is_high_or_critical(row->risk_level);
    });
}

std::vector<PriorityRow> rank_priorities(const FactTables& facts,
                                         const YearPartitionedTable<RiskRow>& risk,
                                         const std::string& year) {
    const auto& risk_rows = risk.rows(year);
    const size_t n = risk_rows.size();

    std::vector<PriorityRow> rows(n);
    std::vector<double> scores(n);
    std::map<std::string, std::vector<size_t>> by_district;

    for (size_t i = 0; i < n; ++i) {
        const RiskRow& r = risk_rows[i];
        PriorityRow& row = rows[i];
        row.school_id = r.school_id;
        row.academic_year = year;
        row.risk_score = r.risk_score;
        row.risk_level = r.risk_level;
        if (const School* school = facts.find_school(r.school_id)) {
            row.district = school->district;
        }
        scores[i] = r.risk_score;
        by_district[row.district].push_back(i);
    }

    // State-wide rank and bucket
    const auto state_ranks = rank_descending(scores);
    for (size_t i = 0; i < n; ++i) {
        rows[i].state_rank = state_ranks[i];
        rows[i].percent_rank = percent_rank(state_ranks[i], n);
        rows[i].priority_bucket = bucket_for_percent_rank(rows[i].percent_rank);
    }

    // District rank, partitioned
    for (const auto& [district, members] : by_district) {
        std::vector<double> district_scores;
        district_scores.reserve(members.size());
        for (size_t idx : members) {
            district_scores.push_back(scores[idx]);
        }
        const auto district_ranks = rank_descending(district_scores);
        for (size_t k = 0; k < members.size(); ++k) {
            rows[members[k]].district_rank = district_ranks[k];
        }
    }

    for (size_t i = 0; i < n; ++i) {
        rows[i].persistent_high_risk = sustained_high_risk(risk_history(risk, rows[i].school_id, year));
    }

    return rows;
}

} // namespace schoolgov
