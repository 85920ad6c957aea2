#pragma once

#include <bpmn_model/model.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bpmn_model {

inline bool is_event_type(std::string_view type) {
    return type == "startEvent" || type == "endEvent" || type == "intermediateCatchEvent"
        || type == "intermediateThrowEvent" || type == "boundaryEvent";
}

inline bool is_gateway_type(std::string_view type) {
    return type == "exclusiveGateway" || type == "parallelGateway" || type == "inclusiveGateway"
        || type == "eventBasedGateway" || type == "complexGateway";
}

inline bool is_data_type(std::string_view type) {
    return type == "dataObject" || type == "dataObjectReference"
        || type == "dataStore" || type == "dataStoreReference";
}

// Default (width, height) per element type, in pixels.
inline std::pair<double, double> default_dimensions(std::string_view type) {
    if (is_event_type(type))
        return { 36.0, 36.0 };
    if (type == "subProcess" || type == "group")
        return { 200.0, 150.0 };
    if (is_gateway_type(type))
        return { 50.0, 50.0 };
    if (type == "dataObject" || type == "dataObjectReference")
        return { 40.0, 50.0 };
    if (type == "dataStore" || type == "dataStoreReference")
        return { 50.0, 50.0 };
    if (type == "textAnnotation")
        return { 100.0, 40.0 };
    // Tasks, call activities and unknown types.
    return { 120.0, 80.0 };
}

// Shapes that sit on the border of another shape instead of inside a container.
inline bool is_attached_type(std::string_view type) {
    return type == "boundaryEvent";
}

// Types a boundary shape may be attached to when no explicit reference is given.
inline bool is_attachable_host_type(std::string_view type) {
    return type == "subProcess" || type == "task" || type == "userTask"
        || type == "serviceTask" || type == "scriptTask" || type == "callActivity";
}

// The container a shape is nested in, from the dedicated field or the legacy property.
inline std::optional<std::string> sub_container_of(const Shape& shape) {
    if (shape.sub_container_id && !shape.sub_container_id->empty())
        return shape.sub_container_id;
    if (const auto it = shape.properties.find("subprocess_id");
        it != shape.properties.end() && !it->second.empty())
        return it->second;
    return std::nullopt;
}

} // namespace bpmn_model
