#pragma once

#include <cstddef>
#include <string>
#include "engine.hpp"
#include "master_data.hpp"
#include "purchasing.hpp"

namespace forge {

struct SeedReport {
    size_t items = 0;
    size_t boms = 0;
    size_t routings = 0;
    size_t purchase_lines = 0;
};

/**
 * Load master data, opening stock and open purchase lines from a JSON
 * document:
 *
 *   {
 *     "items": [{"item_id": "PLA-BLACK", "unit": "KG", "stock_increment": "0.01",
 *                "reorder_point": "5", "standard_cost": "21.5",
 *                "lead_time_days": 10, "on_hand": "12.5"}],
 *     "boms": {"WIDGET": [{"component_id": "PLA-BLACK", "quantity_per": "0.333",
 *                          "scrap_factor": "0.05", "operation_sequence": 10}]},
 *     "routings": {"WIDGET": [{"sequence": 10, "work_center": "PRINT",
 *                              "setup_minutes": 15, "run_minutes": 120}]},
 *     "purchase_lines": [{"purchase_order_id": "PUR-1", "line_id": "1",
 *                         "item_id": "PLA-BLACK", "quantity_open": "5",
 *                         "promised_by": "2026-10-25"}]
 *   }
 *
 * Quantities are decimal strings and dates are YYYY-MM-DD. The whole
 * document is parsed before anything is applied; InvalidArgumentError
 * reports the first malformed entry.
 */
SeedReport load_seed(const std::string& json_text,
                     Engine& engine,
                     allocation::InMemoryMasterData& master_data,
                     pegging::InMemoryPurchasing& purchasing);

SeedReport load_seed_file(const std::string& path,
                          Engine& engine,
                          allocation::InMemoryMasterData& master_data,
                          pegging::InMemoryPurchasing& purchasing);

} // namespace forge
