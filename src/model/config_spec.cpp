#include "model/config_spec.h"
#include <stdexcept>

namespace {
// Absent and null keys read as the default; a present value of the wrong
// type throws json::type_error.
template <typename T>
T field(const json &j, const char *key, const T &defaultValue) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return defaultValue;
  return it->get<T>();
}

json rawField(const json &j, const char *key) {
  auto it = j.find(key);
  return it == j.end() ? json() : *it;
}

template <typename T>
std::vector<T> arrayField(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return {};
  return it->get<std::vector<T>>();
}
} // namespace

void to_json(json &j, const ConfigCondition &c) {
  j = json{{"type", c.type},
           {"operator", c.op},
           {"field", c.field},
           {"targetValue", c.targetValue},
           {"additionalValues", c.additionalValues},
           {"idType", c.idType}};
}

void from_json(const json &j, ConfigCondition &c) {
  c.type = field<std::string>(j, "type", "");
  c.op = field<std::string>(j, "operator", "");
  c.field = field<std::string>(j, "field", "");
  c.targetValue = rawField(j, "targetValue");
  c.additionalValues = rawField(j, "additionalValues");
  if (c.additionalValues.is_null())
    c.additionalValues = json::object();
  c.idType = field<std::string>(j, "idType", "");
}

void to_json(json &j, const ConfigRule &r) {
  j = json{{"name", r.name},
           {"id", r.id},
           {"salt", r.salt},
           {"passPercentage", r.passPercentage},
           {"conditions", r.conditions},
           {"returnValue", r.returnValue},
           {"idType", r.idType},
           {"configDelegate", r.configDelegate}};
}

void from_json(const json &j, ConfigRule &r) {
  r.name = field<std::string>(j, "name", "");
  r.id = field<std::string>(j, "id", "");
  r.salt = field<std::string>(j, "salt", "");
  r.passPercentage = field<double>(j, "passPercentage", 0.0);
  r.conditions = arrayField<ConfigCondition>(j, "conditions");
  r.returnValue = rawField(j, "returnValue");
  r.idType = field<std::string>(j, "idType", "");
  r.configDelegate = field<std::string>(j, "configDelegate", "");
}

void to_json(json &j, const ConfigSpec &s) {
  j = json{{"name", s.name},
           {"type", s.type},
           {"salt", s.salt},
           {"enabled", s.enabled},
           {"rules", s.rules},
           {"defaultValue", s.defaultValue},
           {"idType", s.idType},
           {"explicitParameters", s.explicitParameters}};
}

void from_json(const json &j, ConfigSpec &s) {
  s.name = field<std::string>(j, "name", "");
  s.type = field<std::string>(j, "type", "");
  s.salt = field<std::string>(j, "salt", "");
  s.enabled = field<bool>(j, "enabled", false);
  s.rules = arrayField<ConfigRule>(j, "rules");
  s.defaultValue = rawField(j, "defaultValue");
  s.idType = field<std::string>(j, "idType", "");
  s.explicitParameters = arrayField<std::string>(j, "explicitParameters");
}

void to_json(json &j, const SyncSnapshot &s) {
  j = json{{"has_updates", s.hasUpdates},
           {"time", s.time},
           {"feature_gates", s.featureGates},
           {"dynamic_configs", s.dynamicConfigs},
           {"layer_configs", s.layerConfigs},
           {"id_lists", s.idLists}};
}

void from_json(const json &j, SyncSnapshot &s) {
  if (!j.is_object()) {
    throw std::invalid_argument("snapshot payload must be a JSON object");
  }
  s.hasUpdates = field<bool>(j, "has_updates", false);
  s.time = field<int64_t>(j, "time", 0);
  s.featureGates = arrayField<ConfigSpec>(j, "feature_gates");
  s.dynamicConfigs = arrayField<ConfigSpec>(j, "dynamic_configs");
  s.layerConfigs = arrayField<ConfigSpec>(j, "layer_configs");
  s.idLists = field<std::map<std::string, bool>>(j, "id_lists", {});
}

void to_json(json &j, const IDListMetadata &m) {
  j = json{{"name", m.name},
           {"size", m.size},
           {"creationTime", m.creationTime},
           {"url", m.url},
           {"fileID", m.fileID}};
}

void from_json(const json &j, IDListMetadata &m) {
  m.name = field<std::string>(j, "name", "");
  m.size = field<int64_t>(j, "size", 0);
  m.creationTime = field<int64_t>(j, "creationTime", 0);
  m.url = field<std::string>(j, "url", "");
  m.fileID = field<std::string>(j, "fileID", "");
}
