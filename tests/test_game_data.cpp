#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <catx/catx.hpp>

#include <gtest/gtest.h>

// Fallback if TEST_DATA_DIR is not defined by CMake
#ifndef TEST_DATA_DIR
#define TEST_DATA_DIR "tests/data"
#endif

namespace fs = std::filesystem;

// Checked-in two-layer installation under tests/data/game
class GameDataTest : public ::testing::Test {
protected:
  void SetUp() override {
    gameDir_ = fs::path(TEST_DATA_DIR) / "game";
    ASSERT_TRUE(fs::exists(gameDir_ / "01.cat")) << "Fixture not found: " << gameDir_;

    catx::Error error;
    overlay_ = catx::Overlay::discover(gameDir_, {}, &error);
    ASSERT_TRUE(overlay_.has_value()) << error.message;
  }

  const catx::ResolvedRecord *find(const catx::ResolveResult &result, const std::string &id) {
    for (const auto &record : result.records) {
      if (record.id == id) {
        return &record;
      }
    }
    return nullptr;
  }

  fs::path gameDir_;
  std::optional<catx::Overlay> overlay_;
};

TEST_F(GameDataTest, Layers) {
  ASSERT_EQ(overlay_->layers().size(), 2u);
  EXPECT_EQ(overlay_->fileCount(), 15u);

  auto handle = overlay_->resolve("Assets/Props/Engines/Macros/engine_arg_s_allround_01_mk1_macro.xml");
  ASSERT_TRUE(handle.has_value());
  EXPECT_EQ(overlay_->entry(*handle).rank, 2);

  // Every file verifies against its catalog checksum
  for (const auto &path : overlay_->files()) {
    catx::Error error;
    EXPECT_TRUE(overlay_->readFile(path, &error).has_value()) << path << ": " << error.message;
  }
}

TEST_F(GameDataTest, Engines) {
  catx::Session session(*overlay_);
  catx::Error error;
  ASSERT_TRUE(session.load({"engine"}, &error)) << error.message;
  EXPECT_TRUE(session.diagnostics().empty());

  auto results = session.resolve({"engine"});
  ASSERT_EQ(results.size(), 1u);
  ASSERT_EQ(results[0].records.size(), 2u);
  EXPECT_TRUE(results[0].diagnostics.empty());

  const auto *mk1 = find(results[0], "engine_arg_s_allround_01_mk1_macro");
  ASSERT_NE(mk1, nullptr);
  EXPECT_EQ(mk1->number("thrust_forward"), 1650.0);
  EXPECT_EQ(mk1->number("travel_thrust_forward"), 1650.0 * 16);
  EXPECT_NEAR(*mk1->number("boost_thrust_forward"), 9240.0, 1e-6);
  EXPECT_EQ(mk1->text("size"), "small");
  EXPECT_EQ(mk1->number("hull"), 527.0);

  // mk2 inherits the patched mk1 travel multiplier
  const auto *mk2 = find(results[0], "engine_arg_s_allround_01_mk2_macro");
  ASSERT_NE(mk2, nullptr);
  EXPECT_EQ(mk2->number("thrust_forward"), 1800.0);
  EXPECT_EQ(mk2->number("travel_thrust_forward"), 1800.0 * 16);
  EXPECT_EQ(mk2->text("size"), "small");
  EXPECT_EQ(mk2->text("name"), "{20107,1005}");
}

TEST_F(GameDataTest, Ships) {
  catx::Session session(*overlay_);
  catx::Error error;
  ASSERT_TRUE(session.load({"ship"}, &error)) << error.message;

  auto results = session.resolve({"ship"});
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].diagnostics.empty());

  const auto *ship = find(results[0], "ship_arg_s_fighter_01_a_macro");
  ASSERT_NE(ship, nullptr);
  EXPECT_EQ(ship->text("class"), "s");
  EXPECT_EQ(ship->text("type"), "fighter");
  EXPECT_EQ(ship->text("purpose"), "fight");
  EXPECT_EQ(ship->number("hull"), 3900.0);
  EXPECT_EQ(ship->number("people"), 1.0);
  EXPECT_EQ(ship->number("missile_storage"), 20.0);
  EXPECT_EQ(ship->number("mass"), 11.2);
  EXPECT_EQ(ship->number("drag_reverse"), 10.4);
  EXPECT_EQ(ship->number("inertia_roll"), 0.64);
  EXPECT_EQ(ship->number("num_engines"), 1.0);
  EXPECT_EQ(ship->number("num_shields"), 2.0);
  EXPECT_EQ(ship->number("num_weapons"), 2.0);
  EXPECT_EQ(ship->number("num_turrets"), 0.0);
  EXPECT_EQ(ship->number("num_countermeasures"), 1.0);
  EXPECT_EQ(ship->number("cargobay"), 450.0);
  EXPECT_EQ(ship->text("storage"), "container");
  EXPECT_EQ(ship->number("equipped_thrust_forward"), 1650.0);
}

TEST_F(GameDataTest, WeaponsAndBullets) {
  catx::Session session(*overlay_);
  catx::Error error;
  ASSERT_TRUE(session.load({"weapon"}, &error)) << error.message;

  auto results = session.resolve({"weapon"});
  ASSERT_EQ(results.size(), 1u);
  ASSERT_EQ(results[0].records.size(), 1u);

  const auto &weapon = results[0].records[0];
  EXPECT_EQ(weapon.id, "weapon_gen_s_laser_01_mk1_macro");
  EXPECT_EQ(weapon.text("size"), "small");
  EXPECT_EQ(weapon.text("bullet"), "bullet_gen_s_laser_01_mk1_macro");
  EXPECT_EQ(weapon.number("heat_overheat"), 10000.0);
  EXPECT_EQ(weapon.number("rotation_speed"), 180.0);
  EXPECT_EQ(weapon.number("bullet_speed"), 2500.0);
  EXPECT_EQ(weapon.number("bullet_range"), 4000.0);
  EXPECT_EQ(weapon.number("bullet_dmg_hull"), 159.0);
}

TEST_F(GameDataTest, ExportWithTranslations) {
  catx::TextDatabase text;
  catx::Error error;
  ASSERT_TRUE(text.loadLocale(*overlay_, "en", &error)) << error.message;

  catx::Session session(*overlay_);
  ASSERT_TRUE(session.load({"engine", "ship", "ware"}, &error)) << error.message;
  auto results = session.resolve({"engine", "ship", "ware"});
  ASSERT_EQ(results.size(), 3u);

  std::vector<std::string> expectedNames = {"ARG S All-round Engine Mk1",
                                            "Elite Vanguard", "Energy Cells"};
  for (size_t i = 0; i < results.size(); ++i) {
    auto exporter = catx::makeExporter("csv", results[i].kind, &text, "en", &error);
    ASSERT_NE(exporter, nullptr) << error.message;

    std::ostringstream out;
    ASSERT_TRUE(exporter->write(results[i].records, out, &error)) << error.message;
    EXPECT_NE(out.str().find(expectedNames[i]), std::string::npos) << out.str();
    EXPECT_EQ(out.str().find("{20"), std::string::npos) << out.str();
  }

  const auto &ware = results[2].records.at(0);
  EXPECT_EQ(ware.text("owners"), "argon antigone");
  EXPECT_EQ(ware.number("price_max"), 22.0);
  EXPECT_EQ(text.resolve(*ware.text("description")), "Basic energy, stored in cells");
}

TEST_F(GameDataTest, CorruptedPayloadIsDetected) {
  fs::path copyDir = fs::temp_directory_path() / "catx_test_game_copy";
  fs::remove_all(copyDir);
  fs::create_directories(copyDir);
  for (const char *name : {"01.cat", "01.dat"}) {
    fs::copy_file(gameDir_ / name, copyDir / name);
  }

  // Flip the first byte, which belongs to the first catalog entry
  {
    std::fstream data(copyDir / "01.dat", std::ios::in | std::ios::out | std::ios::binary);
    char c = 0;
    data.read(&c, 1);
    data.seekp(0);
    c = static_cast<char>(c ^ 0x20);
    data.write(&c, 1);
  }

  catx::Error error;
  auto overlay = catx::Overlay::discover(copyDir, {}, &error);
  ASSERT_TRUE(overlay.has_value()) << error.message;

  const auto &first = overlay->layers().front().catalog().entries().front();
  EXPECT_FALSE(overlay->readFile(first.path, &error).has_value());
  EXPECT_EQ(error.code, catx::ErrorCode::CorruptPayload);

  EXPECT_TRUE(overlay->readFile("libraries/wares.xml", &error).has_value()) << error.message;

  fs::remove_all(copyDir);
}
