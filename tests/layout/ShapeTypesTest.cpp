#include <gtest/gtest.h>
#include <bpmn_model/shape_types.hpp>

using namespace bpmn_model;

TEST(ShapeTypesTest, DefaultDimensionsFollowTypeCategory) {
    EXPECT_EQ(default_dimensions("intermediateCatchEvent"), std::make_pair(36.0, 36.0));
    EXPECT_EQ(default_dimensions("boundaryEvent"), std::make_pair(36.0, 36.0));
    EXPECT_EQ(default_dimensions("eventBasedGateway"), std::make_pair(50.0, 50.0));
    EXPECT_EQ(default_dimensions("subProcess"), std::make_pair(200.0, 150.0));
    EXPECT_EQ(default_dimensions("dataObjectReference"), std::make_pair(40.0, 50.0));
    EXPECT_EQ(default_dimensions("dataStore"), std::make_pair(50.0, 50.0));
    EXPECT_EQ(default_dimensions("textAnnotation"), std::make_pair(100.0, 40.0));
    EXPECT_EQ(default_dimensions("userTask"), std::make_pair(120.0, 80.0));
    EXPECT_EQ(default_dimensions("somethingNew"), std::make_pair(120.0, 80.0));
}

TEST(ShapeTypesTest, Categories) {
    EXPECT_TRUE(is_event_type("endEvent"));
    EXPECT_FALSE(is_event_type("exclusiveGateway"));
    EXPECT_TRUE(is_gateway_type("parallelGateway"));
    EXPECT_TRUE(is_data_type("dataStoreReference"));
    EXPECT_TRUE(is_attached_type("boundaryEvent"));
    EXPECT_TRUE(is_attachable_host_type("callActivity"));
    EXPECT_FALSE(is_attachable_host_type("startEvent"));
}

TEST(ShapeTypesTest, SubContainerFromFieldOrLegacyProperty) {
    Shape s;
    s.id = "a";
    EXPECT_FALSE(sub_container_of(s).has_value());
    s.properties["subprocess_id"] = "legacy";
    EXPECT_EQ(sub_container_of(s), std::optional<std::string>("legacy"));
    s.sub_container_id = "sub";
    EXPECT_EQ(sub_container_of(s), std::optional<std::string>("sub"));
}
