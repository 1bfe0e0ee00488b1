#include <string>
#include <vector>

#include <catx/definition_parser.hpp>

#include <gtest/gtest.h>

namespace {

std::vector<uint8_t> bytes(const std::string &text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

TEST(DefinitionParserTest, Macro) {
  std::string xml = R"(<?xml version="1.0" encoding="utf-8"?>
<macros>
  <macro name="engine_b_macro" class="engine" extends="engine_a_macro">
    <component ref="engine_b" />
    <properties>
      <identification name="{20107,1}" makerrace="argon" />
      <thrust forward="100" reverse="80.5" />
      <hull max="500" />
    </properties>
  </macro>
</macros>)";

  catx::Error error;
  auto nodes = catx::parseDefinitions(bytes(xml), "assets/engines/macros/engine_b.xml", &error);
  ASSERT_TRUE(nodes.has_value()) << error.message;
  ASSERT_EQ(nodes->size(), 1u);

  const auto &node = nodes->front();
  EXPECT_EQ(node.id, "engine_b_macro");
  EXPECT_EQ(node.kind, "engine");
  EXPECT_EQ(node.origin, catx::NodeOrigin::Macro);
  EXPECT_EQ(node.extends, "engine_a_macro");
  EXPECT_EQ(node.component, "engine_b");
  EXPECT_EQ(node.sourcePath, "assets/engines/macros/engine_b.xml");

  catx::PropertyMap expected = {
      {"identification.name", "{20107,1}"},
      {"identification.makerrace", "argon"},
      {"thrust.forward", "100"},
      {"thrust.reverse", "80.5"},
      {"hull.max", "500"},
  };
  EXPECT_EQ(node.properties, expected);
  EXPECT_TRUE(node.connections.empty());
}

TEST(DefinitionParserTest, MacroConnections) {
  std::string xml = R"(<macros>
  <macro name="ship_a_macro" class="ship_s">
    <component ref="ship_a" />
    <connections>
      <connection ref="con_storage01">
        <macro ref="storage_a_macro" connection="ShipConnection" />
      </connection>
      <connection ref="con_shipdock">
        <macro ref="dock_a_macro" connection="ShipConnection" />
      </connection>
      <connection ref="con_empty" />
    </connections>
  </macro>
</macros>)";

  auto nodes = catx::parseDefinitions(bytes(xml), "ship.xml");
  ASSERT_TRUE(nodes.has_value());
  ASSERT_EQ(nodes->size(), 1u);

  const auto &conns = nodes->front().connections;
  ASSERT_EQ(conns.size(), 2u);
  EXPECT_EQ(conns[0].role, "con_storage01");
  EXPECT_EQ(conns[0].macro, "storage_a_macro");
  EXPECT_EQ(conns[1].role, "con_shipdock");
  EXPECT_EQ(conns[1].macro, "dock_a_macro");
}

TEST(DefinitionParserTest, BulletPropertyBecomesConnection) {
  std::string xml = R"(<macros>
  <macro name="weapon_a_macro" class="weapon">
    <properties><bullet class="bullet_a_macro" /></properties>
  </macro>
</macros>)";

  auto nodes = catx::parseDefinitions(bytes(xml), "weapon.xml");
  ASSERT_TRUE(nodes.has_value());
  const auto &node = nodes->front();
  EXPECT_EQ(node.properties.at("bullet.class"), "bullet_a_macro");
  ASSERT_EQ(node.connections.size(), 1u);
  EXPECT_EQ(node.connections[0].role, "bullet");
  EXPECT_EQ(node.connections[0].macro, "bullet_a_macro");
}

TEST(DefinitionParserTest, RepeatedSiblingsAreNumbered) {
  std::string xml = R"(<macros>
  <macro name="m" class="storage">
    <properties>
      <cargo max="100" tags="container" />
      <cargo max="200" tags="solid" />
      <cargo max="300" />
      <purpose>  trade  </purpose>
    </properties>
  </macro>
</macros>)";

  auto nodes = catx::parseDefinitions(bytes(xml), "m.xml");
  ASSERT_TRUE(nodes.has_value());
  const auto &props = nodes->front().properties;
  EXPECT_EQ(props.at("cargo.max"), "100");
  EXPECT_EQ(props.at("cargo#2.max"), "200");
  EXPECT_EQ(props.at("cargo#2.tags"), "solid");
  EXPECT_EQ(props.at("cargo#3.max"), "300");
  EXPECT_EQ(props.at("purpose"), "trade");
}

TEST(DefinitionParserTest, ComponentMounts) {
  std::string xml = R"(<components>
  <component name="ship_a" class="ship_s">
    <connections>
      <connection name="con_engine01" tags="engine small platformcollision" />
      <connection name="con_engine02" tags="engine small" />
      <connection name="con_shield01" tags="shield small" />
    </connections>
  </component>
</components>)";

  auto nodes = catx::parseDefinitions(bytes(xml), "ship_a.xml");
  ASSERT_TRUE(nodes.has_value());
  ASSERT_EQ(nodes->size(), 1u);

  const auto &node = nodes->front();
  EXPECT_EQ(node.origin, catx::NodeOrigin::Component);
  EXPECT_EQ(node.id, "ship_a");
  ASSERT_EQ(node.connections.size(), 3u);
  EXPECT_EQ(node.connections[0].role, "con_engine01");
  EXPECT_EQ(node.connections[0].tags, "engine small platformcollision");
  EXPECT_TRUE(node.connections[0].macro.empty());
}

TEST(DefinitionParserTest, Wares) {
  std::string xml = R"(<wares>
  <ware id="energycells" name="{20201,701}" transport="container" volume="6"
        tags="economy stationbuilding">
    <price min="10" average="16" max="22" />
    <production time="60" amount="175" method="default" />
    <owner faction="argon" />
    <owner faction="teladi" />
  </ware>
  <ware id="ore" name="{20201,101}" transport="solid" volume="10" />
</wares>)";

  catx::Error error;
  auto nodes = catx::parseDefinitions(bytes(xml), "libraries/wares.xml", &error);
  ASSERT_TRUE(nodes.has_value()) << error.message;
  ASSERT_EQ(nodes->size(), 2u);

  const auto &ware = nodes->front();
  EXPECT_EQ(ware.id, "energycells");
  EXPECT_EQ(ware.kind, "ware");
  EXPECT_EQ(ware.origin, catx::NodeOrigin::Ware);
  EXPECT_EQ(ware.properties.at("name"), "{20201,701}");
  EXPECT_EQ(ware.properties.at("id"), "energycells");
  EXPECT_EQ(ware.properties.at("price.average"), "16");
  EXPECT_EQ(ware.properties.at("owner.faction"), "argon");
  EXPECT_EQ(ware.properties.at("owner#2.faction"), "teladi");
}

TEST(DefinitionParserTest, UnknownRootYieldsNothing) {
  auto nodes = catx::parseDefinitions(bytes("<diff><add sel=\"/x\"/></diff>"), "diff.xml");
  ASSERT_TRUE(nodes.has_value());
  EXPECT_TRUE(nodes->empty());
}

TEST(DefinitionParserTest, NotWellFormed) {
  catx::Error error;
  EXPECT_FALSE(
      catx::parseDefinitions(bytes("<macros><macro name=\"a\"></macros>"), "bad.xml", &error));
  EXPECT_EQ(error.code, catx::ErrorCode::MalformedDefinition);
  EXPECT_NE(error.message.find("bad.xml"), std::string::npos);
}

TEST(DefinitionParserTest, EmptyDocument) {
  catx::Error error;
  EXPECT_FALSE(catx::parseDefinitions(bytes(""), "empty.xml", &error));
  EXPECT_EQ(error.code, catx::ErrorCode::MalformedDefinition);
}

TEST(DefinitionParserTest, MissingClass) {
  catx::Error error;
  EXPECT_FALSE(catx::parseDefinitions(bytes("<macros><macro name=\"a\"/></macros>"), "a.xml",
                                      &error));
  EXPECT_EQ(error.code, catx::ErrorCode::MalformedDefinition);
  EXPECT_NE(error.message.find("class"), std::string::npos);
}

TEST(DefinitionParserTest, DuplicateIdentifierInDocument) {
  std::string xml = R"(<macros>
  <macro name="a" class="engine" />
  <macro name="a" class="engine" />
</macros>)";

  catx::Error error;
  EXPECT_FALSE(catx::parseDefinitions(bytes(xml), "dup.xml", &error));
  EXPECT_EQ(error.code, catx::ErrorCode::MalformedDefinition);
  EXPECT_NE(error.message.find("duplicate"), std::string::npos);
}

TEST(DefinitionParserTest, Index) {
  std::string xml = R"(<index>
  <entry name="engine_a_macro" value="assets\props\Engines\macros\engine_a_macro" />
  <entry name="broken" />
</index>)";

  auto index = catx::parseIndex(bytes(xml), "index/macros.xml");
  ASSERT_TRUE(index.has_value());
  ASSERT_EQ(index->size(), 1u);
  EXPECT_EQ(index->at("engine_a_macro"), "assets/props/Engines/macros/engine_a_macro.xml");
}
