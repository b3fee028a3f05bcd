/**
 * @file stage_factory.hpp
 * @brief Factory for creating pipeline stages by type
 *
 * Design Pattern: Factory Method with Registry
 * - Each stage type registers a factory function
 * - The orchestrator requests stages by the type named in the pipeline config
 */

#ifndef SCHOOLGOV_STAGE_FACTORY_HPP
#define SCHOOLGOV_STAGE_FACTORY_HPP

#include "stage_interface.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace schoolgov {

/**
 * @brief Factory for creating stage instances
 *
 * Usage Example:
 *   @code
 *   StageFactory factory;
 *   auto stage = factory.create_stage("risk_scorer");
 *   @endcode
 */
class StageFactory {
public:
    using FactoryFunction = std::function<std::unique_ptr<IPipelineStage>()>;

    /**
     * @brief Constructor - registers the nine built-in stage types
     */
    StageFactory();

    /**
     * @brief Create a stage instance by type
     *
     * @throws ConfigurationError If stage type is unknown
     */
    std::unique_ptr<IPipelineStage> create_stage(const std::string& stage_type) const;

    /**
     * @brief Register a custom stage type
     *
     * @throws ConfigurationError If stage_type already registered
     */
    void register_stage(const std::string& stage_type, FactoryFunction factory_fn);

    bool is_registered(const std::string& stage_type) const;

    std::vector<std::string> list_stage_types() const;

private:
    std::map<std::string, FactoryFunction> registry_;
};

} // namespace schoolgov

#endif // SCHOOLGOV_STAGE_FACTORY_HPP
