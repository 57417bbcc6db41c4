#pragma once

#include "fullsync/core/config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fullsync::reconcile {

/**
 * @brief Expected-difference rule lookup
 *
 * Specificity, narrowest first:
 *   3  exact type,  exact field
 *   2  "*",         exact field
 *   1  exact type,  any field
 *   0  "*",         any field
 * Among rules of equal specificity the first declared wins.
 */
class DifferenceRules {
public:
    struct Verdict {
        bool expected = false;
        std::string reason;
        int specificity = -1;
    };

    explicit DifferenceRules(std::vector<core::ExpectedDifferenceRule> rules);

    /// Rule for a field whose values differ on a record present on both sides.
    [[nodiscard]] std::optional<Verdict> field_verdict(const std::string& entity_type, const std::string& field) const;

    /// Rule for a record present on one side only.
    [[nodiscard]] std::optional<Verdict> presence_verdict(const std::string& entity_type, core::Presence presence) const;

private:
    std::vector<core::ExpectedDifferenceRule> rules_;
};

} // namespace fullsync::reconcile
