#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory>
#include <string>

namespace strategy_engine {

    // Owns a non-empty list of sub-conditions joined by one logical operator
    class CompositeCondition : public ICondition {
    public:
        ~CompositeCondition() override = default;

        std::string describe() const override;
        void collectColumns(std::set<std::string>& columns) const override;
        size_t size() const { return conditions_.size(); }

    protected:
        // Throws std::invalid_argument when the list is empty or holds a null entry
        CompositeCondition(std::vector<std::unique_ptr<ICondition>> conditions, std::string joiner);

        std::vector<std::unique_ptr<ICondition>> conditions_;

    private:
        std::string joiner_;
    };

    // True only if every sub-condition is true
    class AndCondition : public CompositeCondition {
    public:
        explicit AndCondition(std::vector<std::unique_ptr<ICondition>> conditions);
        bool evaluate(const MarketDataSnapshot& snapshot) const override;
    };

    // True if any sub-condition is true
    class OrCondition : public CompositeCondition {
    public:
        explicit OrCondition(std::vector<std::unique_ptr<ICondition>> conditions);
        bool evaluate(const MarketDataSnapshot& snapshot) const override;
    };

} // namespace strategy_engine
