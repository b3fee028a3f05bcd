#include "stage_factory.hpp"
#include "pipeline_stages.hpp"

namespace schoolgov {

namespace {

template <typename Stage>
std::unique_ptr<IPipelineStage> make_stage() {
    return std::make_unique<Stage>();
}

} // anonymous namespace

StageFactory::StageFactory() {
    registry_[StageType::CLASSROOM_GAP] = make_stage<ClassroomGapStage>;
    registry_[StageType::TEACHER_GAP] = make_stage<TeacherGapStage>;
    registry_[StageType::RISK] = make_stage<RiskScoringStage>;
    registry_[StageType::PRIORITISATION] = make_stage<PrioritisationStage>;
    registry_[StageType::RISK_TREND] = make_stage<RiskTrendStage>;
    registry_[StageType::DISTRICT] = make_stage<DistrictAggregationStage>;
    registry_[StageType::BUDGET] = make_stage<BudgetAllocationStage>;
    registry_[StageType::FORECAST] = make_stage<ForecastStage>;
    registry_[StageType::PROPOSAL] = make_stage<ProposalValidationStage>;
}

std::unique_ptr<IPipelineStage> StageFactory::create_stage(const std::string& stage_type) const {
    auto it = registry_.find(stage_type);
    if (it == registry_.end()) {
        std::string types;
        for (const auto& pair : registry_) {
            if (!types.empty()) types += ", ";
            types += pair.first;
        }
        throw ConfigurationError("Unknown stage type: " + stage_type + ". Available types: " + types);
    }
    return it->second();
}

void StageFactory::register_stage(const std::string& stage_type, FactoryFunction factory_fn) {
    if (registry_.find(stage_type) != registry_.end()) {
        throw ConfigurationError("Stage type already registered: " + stage_type);
    }
    registry_[stage_type] = std::move(factory_fn);
}

bool StageFactory::is_registered(const std::string& stage_type) const {
    return registry_.find(stage_type) != registry_.end();
}

std::vector<std::string> StageFactory::list_stage_types() const {
    std::vector<std::string> types;
    types.reserve(registry_.size());
    for (const auto& pair : registry_) {
        types.push_back(pair.first);
    }
    return types;
}

} // namespace schoolgov
