#include "genledger/pricing.hpp"

#include "genledger/jsonlite.hpp"

#include <fstream>
#include <sstream>

namespace genledger {

namespace {

const std::set<std::string> kDefaultSizes{"small", "medium", "large"};
const std::set<std::string> kDefaultOrientations{"portrait", "landscape"};

std::string join(const std::set<std::string>& items) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += ",";
    out += s;
  }
  return out;
}

std::string join(const std::set<uint32_t>& items) {
  std::string out;
  for (auto v : items) {
    if (!out.empty()) out += ",";
    out += std::to_string(v);
  }
  return out;
}

PriceTableResult fail(const std::string& code, const std::string& message) {
  PriceTableResult r;
  r.error_code = code;
  r.error_message = message;
  return r;
}

}  // namespace

PriceTable::PriceTable() {
  ModelSpec standard;
  standard.durations = {5, 10, 15};
  standard.sizes = kDefaultSizes;
  standard.orientations = kDefaultOrientations;
  standard.prices = {{"5", 8}, {"10", 15}, {"15", 23}};
  models_["sora-2"] = standard;

  ModelSpec pro;
  pro.durations = {15, 25};
  pro.sizes = kDefaultSizes;
  pro.orientations = kDefaultOrientations;
  pro.prices = {{"15", 75}, {"25", 100}};
  models_["sora-2-pro"] = pro;
}

int64_t PriceTable::unit_cost(const std::string& model, uint32_t duration_s,
                              const std::string& size) const {
  auto it = models_.find(model);
  if (it == models_.end()) return default_cost_;
  const auto& prices = it->second.prices;
  const std::string d = std::to_string(duration_s);
  if (auto p = prices.find(d + "/" + size); p != prices.end()) return p->second;
  if (auto p = prices.find(d); p != prices.end()) return p->second;
  return default_cost_;
}

PriceValidation PriceTable::validate(const GenerationParams& p) const {
  PriceValidation v;
  auto it = models_.find(p.model);
  if (it == models_.end()) {
    v.field = "model";
    v.message = "unknown model: " + p.model;
    return v;
  }
  const ModelSpec& spec = it->second;
  if (!spec.durations.contains(p.duration_s)) {
    v.field = "duration";
    v.message = p.model + " supports durations {" + join(spec.durations) + "}, got " +
                std::to_string(p.duration_s);
    return v;
  }
  if (!spec.sizes.contains(p.size)) {
    v.field = "size";
    v.message = p.model + " supports sizes {" + join(spec.sizes) + "}, got '" + p.size + "'";
    return v;
  }
  if (!spec.orientations.contains(p.orientation)) {
    v.field = "orientation";
    v.message = p.model + " supports orientations {" + join(spec.orientations) + "}, got '" +
                p.orientation + "'";
    return v;
  }
  v.ok = true;
  return v;
}

std::vector<std::string> PriceTable::models() const {
  std::vector<std::string> out;
  for (const auto& [name, spec] : models_) out.push_back(name);
  return out;
}

std::string PriceTable::to_json() const {
  std::ostringstream o;
  o << "{\"default_cost\":" << default_cost_ << ",\"models\":{";
  bool first_model = true;
  for (const auto& [name, spec] : models_) {
    if (!first_model) o << ",";
    first_model = false;
    o << "\"" << jsonlite::escape(name) << "\":{\"durations\":[" << join(spec.durations) << "]";
    o << ",\"sizes\":[";
    bool first = true;
    for (const auto& s : spec.sizes) {
      o << (first ? "" : ",") << "\"" << jsonlite::escape(s) << "\"";
      first = false;
    }
    o << "],\"orientations\":[";
    first = true;
    for (const auto& s : spec.orientations) {
      o << (first ? "" : ",") << "\"" << jsonlite::escape(s) << "\"";
      first = false;
    }
    o << "],\"prices\":{";
    first = true;
    for (const auto& [key, cost] : spec.prices) {
      o << (first ? "" : ",") << "\"" << jsonlite::escape(key) << "\":" << cost;
      first = false;
    }
    o << "}}";
  }
  o << "}}";
  return o.str();
}

PriceTableResult parse_price_table(const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  if (err) return fail("price_table_parse_error", err->code + ": " + err->message);

  PriceTableResult r;
  r.table.clear();
  const int64_t def = jsonlite::get_i64(obj, "default_cost", 15);
  if (def <= 0) return fail("price_table_invalid", "default_cost must be positive");
  r.table.set_default_cost(def);

  const auto models = jsonlite::get_object(obj, "models");
  if (models.empty()) return fail("price_table_invalid", "models must be a non-empty object");
  for (const auto& [name, value] : models) {
    if (!std::holds_alternative<jsonlite::Object>(value.v)) {
      return fail("price_table_invalid", "model " + name + " must be an object");
    }
    const auto& m = std::get<jsonlite::Object>(value.v);
    ModelSpec spec;
    for (auto d : jsonlite::get_u64_array(m, "durations")) spec.durations.insert(static_cast<uint32_t>(d));
    for (const auto& s : jsonlite::get_string_array(m, "sizes")) spec.sizes.insert(s);
    for (const auto& s : jsonlite::get_string_array(m, "orientations")) spec.orientations.insert(s);
    if (spec.sizes.empty()) spec.sizes = kDefaultSizes;
    if (spec.orientations.empty()) spec.orientations = kDefaultOrientations;
    if (spec.durations.empty()) {
      return fail("price_table_invalid", "model " + name + " has no durations");
    }
    for (const auto& [key, cost] : jsonlite::get_object(m, "prices")) {
      if (!std::holds_alternative<std::uint64_t>(cost.v) || std::get<std::uint64_t>(cost.v) == 0) {
        return fail("price_table_invalid", "price " + name + "/" + key + " must be a positive integer");
      }
      spec.prices[key] = static_cast<int64_t>(std::get<std::uint64_t>(cost.v));
    }
    r.table.set_model(name, std::move(spec));
  }
  r.ok = true;
  return r;
}

PriceTableResult load_price_table(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return fail("price_table_unreadable", "cannot open " + path);
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return parse_price_table(ss.str());
}

}  // namespace genledger
