#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bpmn_model {

struct Shape {
    std::string id;
    std::string type; // e.g. "userTask", "exclusiveGateway", "startEvent"
    std::string name;
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> width;
    std::optional<double> height;
    // Lane, pool or container id. After resolution: the id the coordinates are relative to.
    std::optional<std::string> parent_id;
    std::optional<std::string> sub_container_id;
    std::map<std::string, std::string> properties;

    bool has_position() const { return x.has_value() && y.has_value(); }
    bool has_size() const { return width.has_value() && height.has_value(); }
};

struct Connector {
    std::string id;
    std::string kind; // "sequenceFlow", "messageFlow", "association", ...
    std::string source_id;
    std::string target_id;
    std::string name;
    std::vector<std::pair<double, double>> waypoints;
};

struct Pool {
    std::string id;
    std::string name;
    std::string process_ref;
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> width;
    std::optional<double> height;
    std::vector<std::string> lane_ids;
    bool is_horizontal = true;

    bool has_position() const { return x.has_value() && y.has_value(); }
    bool has_size() const { return width.has_value() && height.has_value(); }
};

struct Lane {
    std::string id;
    std::string name;
    std::string pool_id;
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> width;
    std::optional<double> height;
    std::vector<std::string> member_ids;

    bool has_position() const { return x.has_value() && y.has_value(); }
    bool has_size() const { return width.has_value() && height.has_value(); }
};

struct Model {
    std::vector<Shape> shapes;
    std::vector<Connector> connectors;
    std::vector<Pool> pools;
    std::vector<Lane> lanes;
    // Set by the producer when any shape came with coordinates of its own.
    bool has_explicit_coordinates = false;
    std::string process_id;
    std::string process_name;

    const Shape* find_shape(const std::string& id) const {
        for (const auto& s : shapes)
            if (s.id == id) return &s;
        return nullptr;
    }
    Shape* find_shape(const std::string& id) {
        for (auto& s : shapes)
            if (s.id == id) return &s;
        return nullptr;
    }
    const Pool* find_pool(const std::string& id) const {
        for (const auto& p : pools)
            if (p.id == id) return &p;
        return nullptr;
    }
    const Lane* find_lane(const std::string& id) const {
        for (const auto& l : lanes)
            if (l.id == id) return &l;
        return nullptr;
    }
};

} // namespace bpmn_model
