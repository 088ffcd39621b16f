#pragma once

// genledger/pricing.hpp — Pricing Table and per-model parameter allow-lists.
//
// unit_cost() is total: it never fails. Lookup order:
//   1. exact (model, duration, size)
//   2. (model, duration, any size)
//   3. default_cost
// A gap in the table therefore charges the default instead of blocking
// admission. Whether a combination is *allowed* is a separate question,
// answered by validate().

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "genledger/types.hpp"

namespace genledger {

struct ModelSpec {
  std::set<uint32_t>    durations;      // allowed durations, seconds
  std::set<std::string> sizes;          // allowed sizes
  std::set<std::string> orientations;   // allowed orientations
  // key: "<duration>" or "<duration>/<size>"
  std::map<std::string, int64_t> prices;
};

struct PriceValidation {
  bool        ok{false};
  std::string field;     // model | duration | size | orientation
  std::string message;
};

class PriceTable {
 public:
  // Built-in table.
  PriceTable();

  int64_t unit_cost(const std::string& model, uint32_t duration_s, const std::string& size) const;
  PriceValidation validate(const GenerationParams& p) const;

  int64_t default_cost() const { return default_cost_; }
  bool has_model(const std::string& model) const { return models_.contains(model); }
  std::vector<std::string> models() const;

  void set_default_cost(int64_t cost) { default_cost_ = cost; }
  void set_model(const std::string& model, ModelSpec spec) { models_[model] = std::move(spec); }
  void clear() { models_.clear(); }

  std::string to_json() const;

 private:
  int64_t default_cost_{15};
  std::map<std::string, ModelSpec> models_;
};

struct PriceTableResult {
  bool        ok{false};
  PriceTable  table;
  std::string error_code;     // price_table_unreadable | price_table_parse_error | price_table_invalid
  std::string error_message;
};

// {"default_cost":15,"models":{"sora-2":{"durations":[5,10],"sizes":["small"],
//   "orientations":["portrait"],"prices":{"5":8,"10/large":20}}}}
PriceTableResult parse_price_table(const std::string& json);
PriceTableResult load_price_table(const std::string& path);

}  // namespace genledger
