#include "derived_tables.hpp"

namespace schoolgov {

std::string to_string(PriorityBucket bucket) {
    switch (bucket) {
        case PriorityBucket::Top5: return "TOP_5";
        case PriorityBucket::Top10: return "TOP_10";
        case PriorityBucket::Top20: return "TOP_20";
        case PriorityBucket::Standard: return "STANDARD";
    }
    return "STANDARD";
}

std::string to_string(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::Baseline: return "BASELINE";
        case TrendDirection::Improving: return "IMPROVING";
        case TrendDirection::Stable: return "STABLE";
        case TrendDirection::Deteriorating: return "DETERIORATING";
    }
    return "BASELINE";
}

std::string to_string(AllocationStatus status) {
    switch (status) {
        case AllocationStatus::Funded: return "FUNDED";
        case AllocationStatus::PartiallyFunded: return "PARTIALLY_FUNDED";
        case AllocationStatus::Unfunded: return "UNFUNDED";
    }
    return "UNFUNDED";
}

std::string to_string(ProposalDecision decision) {
    switch (decision) {
        case ProposalDecision::Accepted: return "ACCEPTED";
        case ProposalDecision::Flagged: return "FLAGGED";
        case ProposalDecision::Rejected: return "REJECTED";
    }
    return "REJECTED";
}

} // namespace schoolgov
