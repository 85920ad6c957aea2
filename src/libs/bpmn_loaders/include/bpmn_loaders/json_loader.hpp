#pragma once

#include <bpmn_model/model.hpp>
#include <nlohmann/json.hpp>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace bpmn_loaders {

// nullopt (reason logged) on malformed JSON or a missing/mistyped required field.
std::optional<bpmn_model::Model> load_model_from_json(std::istream& in);
std::optional<bpmn_model::Model> load_model_from_json_file(const std::string& path);

// Same format the loader reads; unset coordinates are left out.
nlohmann::json model_to_json(const bpmn_model::Model& model);
bool write_model_to_json(const bpmn_model::Model& model, std::ostream& out);
bool write_model_to_json_file(const bpmn_model::Model& model, const std::string& path);

} // namespace bpmn_loaders
