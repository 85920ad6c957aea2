#pragma once

#include <bpmn_model/model.hpp>
#include <string>

namespace bpmn_layout::testing {

inline bpmn_model::Shape shape(const std::string& id, const std::string& type = "task") {
    bpmn_model::Shape s;
    s.id = id;
    s.type = type;
    s.name = id;
    return s;
}

inline bpmn_model::Shape positioned(const std::string& id, double x, double y, const std::string& type = "task") {
    bpmn_model::Shape s = shape(id, type);
    s.x = x;
    s.y = y;
    return s;
}

inline bpmn_model::Shape placed(const std::string& id, double x, double y, double w, double h,
    const std::string& type = "task")
{
    bpmn_model::Shape s = positioned(id, x, y, type);
    s.width = w;
    s.height = h;
    return s;
}

inline bpmn_model::Connector flow(const std::string& from, const std::string& to) {
    bpmn_model::Connector c;
    c.id = from + "_" + to;
    c.kind = "sequenceFlow";
    c.source_id = from;
    c.target_id = to;
    return c;
}

} // namespace bpmn_layout::testing
