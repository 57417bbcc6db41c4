#include "fullsync/reconcile/rules.hpp"

namespace fullsync::reconcile {
namespace {

int specificity(const core::ExpectedDifferenceRule& rule, const std::string& entity_type, const std::string& field) {
    const bool type_exact = rule.entity_type == entity_type;
    const bool type_any = rule.entity_type == "*";
    const bool field_exact = !rule.field.empty() && rule.field == field;
    const bool field_any = rule.field.empty();

    if (!(type_exact || type_any) || !(field_exact || field_any)) {
        return -1;
    }
    return (field_exact ? 2 : 0) + (type_exact ? 1 : 0);
}

} // namespace

DifferenceRules::DifferenceRules(std::vector<core::ExpectedDifferenceRule> rules) : rules_(std::move(rules)) {}

std::optional<DifferenceRules::Verdict> DifferenceRules::field_verdict(const std::string& entity_type,
                                                                       const std::string& field) const {
    std::optional<Verdict> best;
    for (const auto& rule : rules_) {
        if (rule.presence != core::Presence::Both) {
            continue;
        }
        const int score = specificity(rule, entity_type, field);
        if (score >= 0 && (!best || score > best->specificity)) {
            best = Verdict{rule.expected, rule.reason, score};
        }
    }
    return best;
}

std::optional<DifferenceRules::Verdict> DifferenceRules::presence_verdict(const std::string& entity_type,
                                                                          core::Presence presence) const {
    std::optional<Verdict> best;
    for (const auto& rule : rules_) {
        if (rule.presence != presence) {
            continue;
        }
        const int score = rule.entity_type == entity_type ? 1 : (rule.entity_type == "*" ? 0 : -1);
        if (score >= 0 && (!best || score > best->specificity)) {
            best = Verdict{rule.expected, rule.reason, score};
        }
    }
    return best;
}

} // namespace fullsync::reconcile
