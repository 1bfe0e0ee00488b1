#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <catx/exporter.hpp>

#include <gtest/gtest.h>
#include <json/json.h>

namespace fs = std::filesystem;

namespace {

catx::ResolvedRecord shield(const std::string &id, catx::AttributeMap attributes) {
  catx::ResolvedRecord record;
  record.id = id;
  record.kind = "shieldgenerator";
  record.attributes = std::move(attributes);
  return record;
}

// Translates {1,1} and {1,2} only
class FixedLanguage : public catx::LanguageResolver {
public:
  std::string resolve(std::string_view text, std::string_view,
                      std::vector<std::string> *) const override {
    if (text == "{1,1}") {
      return "Shield, \"Mk1\"";
    }
    if (text == "{1,2}") {
      return " Nemesis \n";
    }
    return std::string(text);
  }
};

Json::Value parseJson(const std::string &text) {
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  std::istringstream in(text);
  EXPECT_TRUE(Json::parseFromStream(builder, in, &root, &errors)) << errors;
  return root;
}

} // namespace

TEST(QuoteCsvTest, QuotesOnlyWhenNeeded) {
  EXPECT_EQ(catx::quoteCsv("plain"), "plain");
  EXPECT_EQ(catx::quoteCsv(""), "");
  EXPECT_EQ(catx::quoteCsv("a,b"), "\"a,b\"");
  EXPECT_EQ(catx::quoteCsv("say \"hi\""), "\"say \"\"hi\"\"\"");
  EXPECT_EQ(catx::quoteCsv("two\nlines"), "\"two\nlines\"");
}

TEST(CsvExporterTest, HeaderAndRows) {
  auto exporter = catx::makeExporter("csv", "shield");
  ASSERT_NE(exporter, nullptr);
  EXPECT_EQ(exporter->extension(), "csv");

  std::vector<catx::ResolvedRecord> records = {
      shield("shield_a", {{"name", std::string("A")},
                          {"size", std::string("small")},
                          {"hull", int64_t{100}},
                          {"capacity", int64_t{2000}},
                          {"recharge_rate", 12.5},
                          {"recharge_delay", 0.5},
                          {"ignored", std::string("x")}}),
      shield("shield_b", {{"name", std::string("B, large")}}),
  };

  std::ostringstream out;
  catx::Error error;
  ASSERT_TRUE(exporter->write(records, out, &error)) << error.message;

  std::string expected = "id,name,makerrace,size,hull,capacity,recharge_rate,recharge_delay\r\n"
                         "shield_a,A,,small,100,2000,12.5,0.5\r\n"
                         "shield_b,\"B, large\",,,,,,\r\n";
  EXPECT_EQ(out.str(), expected);
}

TEST(CsvExporterTest, NamesAreTranslated) {
  FixedLanguage language;
  auto exporter = catx::makeExporter("csv", "shield", &language, "en");
  ASSERT_NE(exporter, nullptr);

  std::vector<catx::ResolvedRecord> records = {shield("s", {{"name", std::string("{1,1}")}})};

  std::ostringstream out;
  ASSERT_TRUE(exporter->write(records, out));
  EXPECT_NE(out.str().find("s,\"Shield, \"\"Mk1\"\"\","), std::string::npos) << out.str();
}

TEST(CsvExporterTest, TranslatedNamesAreTrimmed) {
  FixedLanguage language;
  auto exporter = catx::makeExporter("csv", "shield", &language, "de");
  ASSERT_NE(exporter, nullptr);

  std::ostringstream out;
  ASSERT_TRUE(exporter->write({shield("s", {{"name", std::string("{1,2}")}})}, out));
  EXPECT_NE(out.str().find("\r\ns,Nemesis,"), std::string::npos) << out.str();
}

TEST(CsvExporterTest, EmptyRecordsWriteHeaderOnly) {
  auto exporter = catx::makeExporter("csv", "ware");
  ASSERT_NE(exporter, nullptr);

  std::ostringstream out;
  ASSERT_TRUE(exporter->write({}, out));
  EXPECT_EQ(out.str(),
            "id,name,factoryname,group,tags,volume,price_min,price_avg,price_max,licence,owners"
            "\r\n");
}

TEST(CsvExporterTest, WriteToFile) {
  fs::path dir = fs::temp_directory_path() / "catx_test_exporter";
  fs::create_directories(dir);
  fs::path path = dir / "shield.csv";

  auto exporter = catx::makeExporter("csv", "shield");
  ASSERT_NE(exporter, nullptr);

  catx::Error error;
  ASSERT_TRUE(exporter->write({shield("s", {})}, path, &error)) << error.message;

  std::ifstream in(path, std::ios::binary);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content.substr(0, 3), "id,");
  EXPECT_NE(content.find("\r\ns,"), std::string::npos);

  EXPECT_FALSE(exporter->write({}, dir / "missing" / "x.csv", &error));
  EXPECT_EQ(error.code, catx::ErrorCode::IoError);

  fs::remove_all(dir);
}

TEST(JsonExporterTest, RecordsWithSlotsAndDiagnostics) {
  FixedLanguage language;
  auto exporter = catx::makeExporter("json", "ship", &language, "en");
  ASSERT_NE(exporter, nullptr);
  EXPECT_EQ(exporter->extension(), "json");

  catx::ResolvedRecord ship;
  ship.id = "ship_a";
  ship.kind = "ship_s";
  ship.attributes = {{"name", std::string("{1,2}")},
                     {"hull", int64_t{4200}},
                     {"mass", 12.5},
                     {"production1_name", std::string("{1,1}")},
                     {"storage", std::string("container")}};
  ship.slots.push_back(catx::ConnectionSlot{
      "con_storage", "ship_a", "storage_a",
      catx::SlotSummary{"storage", {{"cargobay", int64_t{2500}}, {"name", std::string("{1,1}")}}}});
  ship.slots.push_back(catx::ConnectionSlot{"con_bay", "ship_a", "dockingbay_gone", std::nullopt});
  ship.diagnostics.push_back(catx::Diagnostic{catx::ErrorCode::UnresolvedReference, "ship_a",
                                              "ship_a connection con_bay references unknown macro"});

  std::ostringstream out;
  catx::Error error;
  ASSERT_TRUE(exporter->write({ship}, out, &error)) << error.message;

  Json::Value root = parseJson(out.str());
  ASSERT_TRUE(root.isMember("ship_a")) << out.str();
  const Json::Value &record = root["ship_a"];
  EXPECT_EQ(record["kind"].asString(), "ship_s");

  const Json::Value &attributes = record["attributes"];
  EXPECT_EQ(attributes["name"].asString(), "Nemesis");
  EXPECT_EQ(attributes["production1_name"].asString(), "Shield, \"Mk1\"");
  EXPECT_TRUE(attributes["hull"].isInt64());
  EXPECT_EQ(attributes["hull"].asInt64(), 4200);
  EXPECT_DOUBLE_EQ(attributes["mass"].asDouble(), 12.5);
  EXPECT_EQ(attributes["storage"].asString(), "container");

  const Json::Value &slots = record["slots"];
  ASSERT_EQ(slots.size(), 2u);
  EXPECT_EQ(slots[0]["role"].asString(), "con_storage");
  EXPECT_EQ(slots[0]["owner"].asString(), "ship_a");
  EXPECT_EQ(slots[0]["macro"].asString(), "storage_a");
  EXPECT_EQ(slots[0]["target"]["kind"].asString(), "storage");
  EXPECT_EQ(slots[0]["target"]["attributes"]["cargobay"].asInt64(), 2500);
  EXPECT_EQ(slots[0]["target"]["attributes"]["name"].asString(), "Shield, \"Mk1\"");
  EXPECT_TRUE(slots[1]["target"].isNull());

  const Json::Value &diagnostics = record["diagnostics"];
  ASSERT_EQ(diagnostics.size(), 1u);
  EXPECT_EQ(diagnostics[0]["code"].asString(),
            std::string(catx::errorCodeName(catx::ErrorCode::UnresolvedReference)));
  EXPECT_EQ(diagnostics[0]["subject"].asString(), "ship_a");
}

TEST(JsonExporterTest, EmptyRecordsWriteEmptyObject) {
  auto exporter = catx::makeExporter("json", "ware");
  ASSERT_NE(exporter, nullptr);

  std::ostringstream out;
  ASSERT_TRUE(exporter->write({}, out));
  Json::Value root = parseJson(out.str());
  EXPECT_TRUE(root.isObject());
  EXPECT_EQ(root.size(), 0u);
}

TEST(MakeExporterTest, UnsupportedFormatAndKind) {
  catx::Error error;
  EXPECT_EQ(catx::makeExporter("yaml", "shield", nullptr, {}, &error), nullptr);
  EXPECT_EQ(error.code, catx::ErrorCode::UnsupportedFormat);

  EXPECT_EQ(catx::makeExporter("csv", "starbase", nullptr, {}, &error), nullptr);
  EXPECT_EQ(error.code, catx::ErrorCode::UnknownKind);
}
