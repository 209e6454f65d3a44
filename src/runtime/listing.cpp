#include "runtime/listing.hpp"

#include <algorithm>
#include <cctype>

namespace srunner::runtime {
namespace {

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) ==
                  std::tolower(static_cast<unsigned char>(b));
         });
}

}  // namespace

auto parse_order(std::optional<std::string_view> order_by) -> ScriptOrder {
  if (!order_by) {
    return ScriptOrder::Unordered;
  }
  if (iequals(*order_by, "id")) {
    return ScriptOrder::IdAscending;
  }
  if (iequals(*order_by, "time")) {
    return ScriptOrder::StartTimeDescending;
  }
  return ScriptOrder::Unordered;
}

auto ListQuery::from_text(std::optional<std::string_view> status,
                          std::optional<std::string_view> order_by) -> ListQuery {
  ListQuery query;
  if (status) {
    query.status = engine::parse_status(*status);
  }
  query.order = parse_order(order_by);
  return query;
}

auto list_scripts(const engine::ScriptRegistry& registry, const ListQuery& query)
  -> std::vector<engine::ScriptSnapshot> {
  std::vector<engine::ScriptSnapshot> scripts;
  for (const auto& script : registry.snapshot_all()) {
    auto snapshot = script->snapshot();
    if (query.status && snapshot.status != *query.status) {
      continue;
    }
    scripts.push_back(std::move(snapshot));
  }

  switch (query.order) {
    case ScriptOrder::Unordered:
      break;
    case ScriptOrder::IdAscending:
      std::sort(scripts.begin(), scripts.end(),
                [](const auto& lhs, const auto& rhs) { return lhs.id < rhs.id; });
      break;
    case ScriptOrder::StartTimeDescending:
      // std::optional orders nullopt before any value.
      std::stable_sort(scripts.begin(), scripts.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.start_time > rhs.start_time;
      });
      break;
  }
  return scripts;
}

}  // namespace srunner::runtime
