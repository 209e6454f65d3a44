#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "engine/script.hpp"
#include "engine/script_registry.hpp"

namespace srunner::runtime {

enum class ScriptOrder {
  Unordered,
  IdAscending,
  StartTimeDescending,
};

/// "id" or "time" in any letter case; anything else means no ordering.
auto parse_order(std::optional<std::string_view> order_by) -> ScriptOrder;

struct ListQuery {
  std::optional<engine::ScriptStatus> status;
  ScriptOrder order = ScriptOrder::Unordered;

  /// Unrecognised status names are treated as no filter.
  static auto from_text(std::optional<std::string_view> status,
                        std::optional<std::string_view> order_by) -> ListQuery;
};

/// Snapshot the registry and apply the status filter and ordering.
/// Records without a start time sort after every started one under
/// StartTimeDescending.
auto list_scripts(const engine::ScriptRegistry& registry, const ListQuery& query)
  -> std::vector<engine::ScriptSnapshot>;

}  // namespace srunner::runtime
