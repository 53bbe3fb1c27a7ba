#include "seed.hpp"
#include "forge/errors.hpp"
#include "forge/helpers.hpp"
#include "forge/logging.hpp"
#include <cstdio>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <vector>

namespace forge {

namespace {

struct SeedItem {
    inventory::ItemSpec spec;
    Quantity on_hand = 0;
};

struct Seed {
    std::vector<SeedItem> items;
    std::map<std::string, std::vector<allocation::BomLine>> boms;
    std::map<std::string, std::vector<allocation::RoutingStep>> routings;
    std::vector<pegging::PurchaseLine> purchase_lines;
};

Quantity quantity_at(const nlohmann::json& entry, const char* key, Quantity fallback = 0) {
    if (!entry.contains(key)) return fallback;
    return parse_quantity(entry.at(key).get<std::string>());
}

google::protobuf::Timestamp date_at(const nlohmann::json& entry, const char* key) {
    auto text = entry.at(key).get<std::string>();
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2u-%2u%n", &year, &month, &day, &consumed) != 3 ||
        static_cast<size_t>(consumed) != text.size() || month < 1 || month > 12 || day < 1 ||
        day > 31) {
        throw InvalidArgumentError(std::string(key) + " is not a YYYY-MM-DD date: " + text);
    }
    return helpers::date_timestamp(year, month, day);
}

Seed parse_seed(const nlohmann::json& doc) {
    if (!doc.is_object()) throw InvalidArgumentError("Seed must be a JSON object");
    Seed seed;

    auto items = doc.value("items", nlohmann::json::array());
    for (const auto& entry : items) {
        SeedItem item;
        item.spec.item_id = entry.at("item_id").get<std::string>();
        item.spec.unit = entry.value("unit", item.spec.unit);
        if (entry.contains("reorder_point")) item.spec.reorder_point = quantity_at(entry, "reorder_point");
        item.spec.standard_cost = quantity_at(entry, "standard_cost");
        item.spec.stock_increment = quantity_at(entry, "stock_increment", item.spec.stock_increment);
        item.spec.lead_time_days = entry.value("lead_time_days", 0u);
        item.on_hand = quantity_at(entry, "on_hand");
        if (item.on_hand < 0) {
            throw InvalidArgumentError("Opening stock for " + item.spec.item_id + " is negative");
        }
        seed.items.push_back(std::move(item));
    }

    auto boms = doc.value("boms", nlohmann::json::object());
    for (const auto& bom : boms.items()) {
        auto& lines = seed.boms[bom.key()];
        for (const auto& entry : bom.value()) {
            allocation::BomLine line;
            line.component_id = entry.at("component_id").get<std::string>();
            line.quantity_per = quantity_at(entry, "quantity_per");
            line.scrap_factor = quantity_at(entry, "scrap_factor");
            line.operation_sequence = entry.value("operation_sequence", 0u);
            lines.push_back(std::move(line));
        }
    }

    auto routings = doc.value("routings", nlohmann::json::object());
    for (const auto& routing : routings.items()) {
        auto& steps = seed.routings[routing.key()];
        for (const auto& entry : routing.value()) {
            allocation::RoutingStep step;
            step.sequence = entry.at("sequence").get<uint32_t>();
            step.work_center = entry.at("work_center").get<std::string>();
            step.setup_minutes = entry.value("setup_minutes", int64_t{0});
            step.run_minutes = entry.value("run_minutes", int64_t{0});
            steps.push_back(std::move(step));
        }
    }

    auto purchase_lines = doc.value("purchase_lines", nlohmann::json::array());
    for (const auto& entry : purchase_lines) {
        pegging::PurchaseLine line;
        line.purchase_order_id = entry.at("purchase_order_id").get<std::string>();
        line.line_id = entry.value("line_id", std::string("1"));
        line.item_id = entry.at("item_id").get<std::string>();
        line.quantity_open = quantity_at(entry, "quantity_open");
        line.promised_by = date_at(entry, "promised_by");
        seed.purchase_lines.push_back(std::move(line));
    }
    return seed;
}

} // anonymous namespace

SeedReport load_seed(const std::string& json_text,
                     Engine& engine,
                     allocation::InMemoryMasterData& master_data,
                     pegging::InMemoryPurchasing& purchasing) {
    Seed seed;
    try {
        seed = parse_seed(nlohmann::json::parse(json_text));
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgumentError(std::string("Malformed seed: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgumentError(std::string("Seed entry is invalid: ") + e.what());
    }

    const auto& actor = engine.config().actor;
    SeedReport report;
    for (const auto& item : seed.items) {
        engine.ledger().register_item(item.spec, actor);
        if (item.on_hand > 0) {
            engine.ledger().receive(item.spec.item_id, item.on_hand, "Opening balance", actor);
        }
        ++report.items;
    }
    for (auto& bom : seed.boms) {
        master_data.set_bom(bom.first, std::move(bom.second));
        ++report.boms;
    }
    for (auto& routing : seed.routings) {
        master_data.set_routing(routing.first, std::move(routing.second));
        ++report.routings;
    }
    for (const auto& line : seed.purchase_lines) {
        purchasing.add_line(line);
        ++report.purchase_lines;
    }

    log_info("engine", "seed_loaded", {
        {"items", report.items},
        {"boms", report.boms},
        {"routings", report.routings},
        {"purchase_lines", report.purchase_lines}
    });
    return report;
}

SeedReport load_seed_file(const std::string& path,
                          Engine& engine,
                          allocation::InMemoryMasterData& master_data,
                          pegging::InMemoryPurchasing& purchasing) {
    std::ifstream file(path);
    if (!file) throw InvalidArgumentError("Cannot open seed file: " + path);
    std::stringstream contents;
    contents << file.rdbuf();
    return load_seed(contents.str(), engine, master_data, purchasing);
}

} // namespace forge
