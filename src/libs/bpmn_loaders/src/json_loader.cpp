#include <bpmn_loaders/json_loader.hpp>
#include <bpmn_layout/logging.hpp>
#include <fstream>
#include <utility>

namespace bpmn_loaders {

namespace {

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

std::optional<double> number_or_null(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return std::nullopt;
}

std::optional<std::string> id_of(const nlohmann::json& j, const char* what) {
    if (j.is_object() && j.contains("id") && j["id"].is_string()) return j["id"].get<std::string>();
    bpmn_layout::layout_logger()->error("Model JSON: {} without a string \"id\"", what);
    return std::nullopt;
}

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& v : j[key])
        if (v.is_string()) out.push_back(v.get<std::string>());
    return out;
}

void put_optional(nlohmann::json& j, const char* key, const std::optional<double>& v) {
    if (v) j[key] = *v;
}

std::optional<bpmn_model::Shape> parse_shape(const nlohmann::json& s) {
    auto id = id_of(s, "shape");
    if (!id) return std::nullopt;
    bpmn_model::Shape shape;
    shape.id = std::move(*id);
    shape.type = string_or(s, "type", "task");
    shape.name = string_or(s, "name");
    shape.x = number_or_null(s, "x");
    shape.y = number_or_null(s, "y");
    shape.width = number_or_null(s, "width");
    shape.height = number_or_null(s, "height");
    if (s.contains("parent") && s["parent"].is_string()) shape.parent_id = s["parent"].get<std::string>();
    if (s.contains("sub_container") && s["sub_container"].is_string())
        shape.sub_container_id = s["sub_container"].get<std::string>();
    if (s.contains("properties") && s["properties"].is_object()) {
        for (const auto& [key, value] : s["properties"].items())
            shape.properties[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return shape;
}

std::optional<bpmn_model::Connector> parse_connector(const nlohmann::json& c) {
    auto id = id_of(c, "connector");
    if (!id) return std::nullopt;
    if (!c.contains("source") || !c["source"].is_string() || !c.contains("target") || !c["target"].is_string()) {
        bpmn_layout::layout_logger()->error("Model JSON: connector '{}' needs string \"source\" and \"target\"", *id);
        return std::nullopt;
    }
    bpmn_model::Connector conn;
    conn.id = std::move(*id);
    conn.kind = string_or(c, "kind", "sequenceFlow");
    conn.source_id = c["source"].get<std::string>();
    conn.target_id = c["target"].get<std::string>();
    conn.name = string_or(c, "name");
    if (c.contains("waypoints") && c["waypoints"].is_array()) {
        for (const auto& p : c["waypoints"]) {
            if (p.is_array() && p.size() == 2 && p[0].is_number() && p[1].is_number())
                conn.waypoints.emplace_back(p[0].get<double>(), p[1].get<double>());
        }
    }
    return conn;
}

std::optional<bpmn_model::Pool> parse_pool(const nlohmann::json& p) {
    auto id = id_of(p, "pool");
    if (!id) return std::nullopt;
    bpmn_model::Pool pool;
    pool.id = std::move(*id);
    pool.name = string_or(p, "name");
    pool.process_ref = string_or(p, "process_ref");
    pool.x = number_or_null(p, "x");
    pool.y = number_or_null(p, "y");
    pool.width = number_or_null(p, "width");
    pool.height = number_or_null(p, "height");
    pool.lane_ids = string_list(p, "lanes");
    pool.is_horizontal = p.contains("is_horizontal") && p["is_horizontal"].is_boolean()
        ? p["is_horizontal"].get<bool>() : true;
    return pool;
}

std::optional<bpmn_model::Lane> parse_lane(const nlohmann::json& l) {
    auto id = id_of(l, "lane");
    if (!id) return std::nullopt;
    bpmn_model::Lane lane;
    lane.id = std::move(*id);
    lane.name = string_or(l, "name");
    lane.pool_id = string_or(l, "pool");
    lane.x = number_or_null(l, "x");
    lane.y = number_or_null(l, "y");
    lane.width = number_or_null(l, "width");
    lane.height = number_or_null(l, "height");
    lane.member_ids = string_list(l, "members");
    return lane;
}

template <class T, class Parse>
bool parse_array(const nlohmann::json& j, const char* key, std::vector<T>& out, Parse parse) {
    if (!j.contains(key)) return true;
    if (!j[key].is_array()) {
        bpmn_layout::layout_logger()->error("Model JSON: \"{}\" must be an array", key);
        return false;
    }
    for (const auto& item : j[key]) {
        auto parsed = parse(item);
        if (!parsed) return false;
        out.push_back(std::move(*parsed));
    }
    return true;
}

std::optional<bpmn_model::Model> parse_model(const nlohmann::json& j) {
    if (!j.is_object()) {
        bpmn_layout::layout_logger()->error("Model JSON: top level must be an object");
        return std::nullopt;
    }
    if (!j.contains("shapes") || !j["shapes"].is_array()) {
        bpmn_layout::layout_logger()->error("Model JSON: missing \"shapes\" array");
        return std::nullopt;
    }

    bpmn_model::Model model;
    if (!parse_array(j, "shapes", model.shapes, parse_shape)) return std::nullopt;
    if (!parse_array(j, "connectors", model.connectors, parse_connector)) return std::nullopt;
    if (!parse_array(j, "pools", model.pools, parse_pool)) return std::nullopt;
    if (!parse_array(j, "lanes", model.lanes, parse_lane)) return std::nullopt;

    model.process_id = string_or(j, "process_id");
    model.process_name = string_or(j, "process_name");
    if (j.contains("has_explicit_coordinates") && j["has_explicit_coordinates"].is_boolean()) {
        model.has_explicit_coordinates = j["has_explicit_coordinates"].get<bool>();
    } else {
        for (const auto& s : model.shapes)
            model.has_explicit_coordinates = model.has_explicit_coordinates || s.has_position();
    }
    return model;
}

} // namespace

std::optional<bpmn_model::Model> load_model_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_model(j);
    } catch (const nlohmann::json::exception& e) {
        bpmn_layout::layout_logger()->error("Model JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<bpmn_model::Model> load_model_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        bpmn_layout::layout_logger()->error("Cannot open model file {}", path);
        return std::nullopt;
    }
    return load_model_from_json(f);
}

nlohmann::json model_to_json(const bpmn_model::Model& model) {
    nlohmann::json j;
    j["process_id"] = model.process_id;
    j["process_name"] = model.process_name;
    j["has_explicit_coordinates"] = model.has_explicit_coordinates;

    j["shapes"] = nlohmann::json::array();
    for (const auto& s : model.shapes) {
        nlohmann::json o{ { "id", s.id }, { "type", s.type }, { "name", s.name } };
        put_optional(o, "x", s.x);
        put_optional(o, "y", s.y);
        put_optional(o, "width", s.width);
        put_optional(o, "height", s.height);
        if (s.parent_id) o["parent"] = *s.parent_id;
        if (s.sub_container_id) o["sub_container"] = *s.sub_container_id;
        if (!s.properties.empty()) o["properties"] = s.properties;
        j["shapes"].push_back(std::move(o));
    }

    j["connectors"] = nlohmann::json::array();
    for (const auto& c : model.connectors) {
        nlohmann::json o{ { "id", c.id }, { "kind", c.kind }, { "source", c.source_id }, { "target", c.target_id } };
        if (!c.name.empty()) o["name"] = c.name;
        if (!c.waypoints.empty()) {
            o["waypoints"] = nlohmann::json::array();
            for (const auto& [x, y] : c.waypoints)
                o["waypoints"].push_back({ x, y });
        }
        j["connectors"].push_back(std::move(o));
    }

    j["pools"] = nlohmann::json::array();
    for (const auto& p : model.pools) {
        nlohmann::json o{ { "id", p.id }, { "name", p.name }, { "process_ref", p.process_ref },
            { "lanes", p.lane_ids }, { "is_horizontal", p.is_horizontal } };
        put_optional(o, "x", p.x);
        put_optional(o, "y", p.y);
        put_optional(o, "width", p.width);
        put_optional(o, "height", p.height);
        j["pools"].push_back(std::move(o));
    }

    j["lanes"] = nlohmann::json::array();
    for (const auto& l : model.lanes) {
        nlohmann::json o{ { "id", l.id }, { "name", l.name }, { "pool", l.pool_id }, { "members", l.member_ids } };
        put_optional(o, "x", l.x);
        put_optional(o, "y", l.y);
        put_optional(o, "width", l.width);
        put_optional(o, "height", l.height);
        j["lanes"].push_back(std::move(o));
    }
    return j;
}

bool write_model_to_json(const bpmn_model::Model& model, std::ostream& out) {
    out << model_to_json(model).dump(2) << '\n';
    return static_cast<bool>(out);
}

bool write_model_to_json_file(const bpmn_model::Model& model, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        bpmn_layout::layout_logger()->error("Cannot write {}", path);
        return false;
    }
    return write_model_to_json(model, f);
}

} // namespace bpmn_loaders
