#include "cgate/classification/classifier.h"

#include "cgate/classification/dependency_mapper.h"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace cgate::classification {

namespace {

std::set<std::string> tier_leaders(const std::vector<RuleOutcome>& outcomes, domain::RuleTier tier) {
  std::set<std::string> result;
  for (const auto& outcome : outcomes) {
    if (outcome.tier != tier) {
      continue;
    }
    for (auto& id : outcome.verdict.leaders()) {
      result.insert(std::move(id));
    }
  }
  return result;
}

std::string join_ids(const std::vector<std::int64_t>& ids) {
  std::string out;
  for (const auto id : ids) {
    if (!out.empty()) {
      out += ", ";
    }
    out += std::to_string(id);
  }
  return out;
}

// Ambiguity: the primary and secondary tiers each ranked a category first, and those
// categories differ. Returns the runner-up (best supported category other than the
// chosen one), or "" when the tiers agree.
std::string find_runner_up(const std::vector<RuleOutcome>& outcomes,
                           const config::CategoryCatalog& catalog, const std::string& chosen) {
  const auto primary = tier_leaders(outcomes, domain::RuleTier::kPrimary);
  const auto secondary = tier_leaders(outcomes, domain::RuleTier::kSecondary);

  bool disagree = false;
  for (const auto& a : primary) {
    for (const auto& b : secondary) {
      if (a != b) {
        disagree = true;
      }
    }
  }
  if (!disagree) {
    return "";
  }

  const auto support = aggregate_support(catalog, outcomes);
  std::string runner_up;
  double best = -1.0;
  for (const auto& category : catalog.categories) {
    const auto& id = category.category_id;
    if (id == chosen || (primary.count(id) == 0 && secondary.count(id) == 0)) {
      continue;
    }
    const double s = support.score_of(id);
    if (s > best) {
      best = s;
      runner_up = id;
    }
  }
  return runner_up;
}

std::vector<std::string> cross_references(const std::vector<RuleOutcome>& outcomes,
                                          const std::string& chosen,
                                          const config::ClassifierSettings& settings) {
  const auto primary =
      std::find_if(outcomes.begin(), outcomes.end(),
                   [](const RuleOutcome& o) { return o.tier == domain::RuleTier::kPrimary; });
  if (primary == outcomes.end() || settings.xref_limit == 0) {
    return {};
  }

  double total = 0.0;
  for (const auto& s : primary->verdict.scores) {
    total += s.score;
  }
  if (total <= 0.0) {
    return {};
  }

  std::vector<CategoryScore> shares;
  for (const auto& s : primary->verdict.scores) {
    const double share = s.score / total;
    if (s.category_id != chosen && share >= settings.xref_min_share) {
      shares.push_back(CategoryScore{s.category_id, share});
    }
  }
  // Verdict scores are in catalog order, so a stable sort keeps catalog order on ties.
  std::stable_sort(shares.begin(), shares.end(),
                   [](const CategoryScore& a, const CategoryScore& b) { return a.score > b.score; });
  if (shares.size() > settings.xref_limit) {
    shares.resize(settings.xref_limit);
  }

  std::vector<std::string> result;
  result.reserve(shares.size());
  for (auto& s : shares) {
    result.push_back(std::move(s.category_id));
  }
  return result;
}

}  // namespace

Classifier::Classifier(config::CategoryCatalog catalog, config::ClassifierSettings settings)
    : catalog_(std::move(catalog)),
      settings_(std::move(settings)),
      rules_(make_rule_set(settings_)) {}

domain::Assignment Classifier::classify(const domain::Item& item,
                                        const config::CategoryCatalog& catalog,
                                        const ClassificationContext& context) const {
  std::vector<RuleOutcome> outcomes;
  outcomes.reserve(rules_.rules.size());

  const ClassificationRule* deciding = nullptr;
  std::string chosen;
  for (const auto& rule : rules_.rules) {
    auto verdict = rule->evaluate(item, catalog, context, outcomes);
    auto winner = verdict.decisive();
    outcomes.push_back(RuleOutcome{std::string(rule->rule_id()), rule->tier(), std::move(verdict)});
    if (winner.has_value()) {
      deciding = rule.get();
      chosen = std::move(winner.value());
      break;
    }
  }

  if (deciding == nullptr) {
    throw std::logic_error("No rule decided item " + std::to_string(item.item_id));
  }
  if (!catalog.contains(chosen)) {
    throw std::runtime_error("Rule " + std::string(deciding->rule_id()) +
                             " chose unknown category '" + chosen + "' for item " +
                             std::to_string(item.item_id));
  }

  domain::Assignment assignment{};
  assignment.item_id = item.item_id;
  assignment.category_id = chosen;
  assignment.rule_id = std::string(deciding->rule_id());
  assignment.tier = deciding->tier();

  // Flag order: FRONTLOAD, AMBIGUOUS, XREF.
  if (context.dependencies.has_dependents(item.item_id)) {
    const auto term_it = context.dependencies.defined_terms.find(item.item_id);
    const std::string term =
        term_it != context.dependencies.defined_terms.end() ? term_it->second : "";
    assignment.flags.push_back(domain::Flag{
        domain::FlagKind::kFrontload,
        "defines '" + term + "' used by items " +
            join_ids(context.dependencies.dependents_of(item.item_id))});
  }

  if (deciding->tier() == domain::RuleTier::kTertiary) {
    const auto runner_up = find_runner_up(outcomes, catalog, chosen);
    if (!runner_up.empty()) {
      assignment.flags.push_back(domain::Flag{
          domain::FlagKind::kAmbiguous,
          "tiers disagreed; " + assignment.rule_id + " chose " + chosen + "; runner-up: " +
              runner_up});
    }
  }

  for (auto& xref : cross_references(outcomes, chosen, settings_)) {
    assignment.flags.push_back(domain::Flag{domain::FlagKind::kXref, std::move(xref)});
  }

  return assignment;
}

core::Result<ClassificationBatch, core::ClassificationError> Classifier::classify_batch(
    const std::vector<domain::Item>& items) const {
  using R = core::Result<ClassificationBatch, core::ClassificationError>;

  if (catalog_.categories.empty()) {
    return R::err({core::ClassificationErrorCode::kEmptyCatalog, "Category catalog is empty"});
  }

  std::set<std::int64_t> seen;
  for (const auto& item : items) {
    if (!seen.insert(item.item_id).second) {
      return R::err({core::ClassificationErrorCode::kDuplicateId,
                     "Duplicate item id: " + std::to_string(item.item_id)});
    }
  }

  ClassificationContext context{};
  context.dependencies = map_dependencies(items, settings_.definition_markers);

  // A rule fault is retried once; the second failure is reported with no partial output.
  constexpr int kMaxAttempts = 2;
  std::vector<domain::Assignment> assignments;
  std::string last_error;
  bool faulted = false;
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    assignments.clear();
    faulted = false;
    try {
      assignments.reserve(items.size());
      for (const auto& item : items) {
        assignments.push_back(classify(item, catalog_, context));
      }
      break;
    } catch (const std::exception& e) {
      faulted = true;
      last_error = e.what();
    }
  }
  if (faulted) {
    return R::err({core::ClassificationErrorCode::kRuleFault, last_error});
  }

  if (assignments.size() != items.size()) {
    return R::err({core::ClassificationErrorCode::kCoverageMismatch,
                   "Assigned " + std::to_string(assignments.size()) + " of " +
                       std::to_string(items.size()) + " items"});
  }

  ClassificationBatch batch{};
  std::map<std::string, std::size_t> counts;
  for (const auto& a : assignments) {
    ++counts[a.category_id];
  }
  for (const auto& category : catalog_.categories) {
    const std::size_t n = counts[category.category_id];
    batch.category_counts.emplace_back(category.category_id, n);
    if (n < category.min_population) {
      batch.needs_review.push_back(
          PopulationShortfall{category.category_id, n, category.min_population});
    }
  }
  batch.assignments = std::move(assignments);
  batch.suggested_order = context.dependencies.suggested_order;
  return R::ok(std::move(batch));
}

}  // namespace cgate::classification
