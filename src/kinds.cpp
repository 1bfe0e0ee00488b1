#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <format>
#include <set>
#include <unordered_map>

#include <catx/kinds.hpp>

namespace catx {

namespace {

const std::vector<KindSpec> kinds = {
    {"engine",
     {"engine"},
     {"assets/props/engines/macros/engine_*.xml", "assets/props/engines/macros/thruster_*.xml"},
     {"name", "makerrace", "size", "hull", "thrust_forward", "thrust_reverse", "thrust_strafe",
      "thrust_pitch", "thrust_yaw", "thrust_roll", "boost_thrust", "boost_thrust_forward",
      "boost_duration", "travel_thrust", "travel_thrust_forward", "travel_charge",
      "travel_attack", "travel_release"}},
    {"shield",
     {"shieldgenerator"},
     {"assets/props/surfaceelements/macros/shield_*.xml"},
     {"name", "makerrace", "size", "hull", "capacity", "recharge_rate", "recharge_delay"}},
    {"ship",
     {"ship_xs", "ship_s", "ship_m", "ship_l", "ship_xl"},
     {"assets/units/size_xs/macros/ship_*.xml", "assets/units/size_s/macros/ship_*.xml",
      "assets/units/size_m/macros/ship_*.xml", "assets/units/size_l/macros/ship_*.xml",
      "assets/units/size_xl/macros/ship_*.xml"},
     {"name", "class", "type", "purpose", "hull", "people", "cargobay", "storage",
      "missile_storage", "drone_storage", "num_engines", "num_shields", "num_weapons",
      "num_turrets", "num_countermeasures", "s_docks", "m_docks", "shipstorage_s",
      "shipstorage_m", "launchtubes_s", "launchtubes_m", "mass", "equipped_thrust_forward",
      "drag_forward", "drag_reverse", "drag_horizontal", "drag_vertical", "drag_pitch",
      "drag_yaw", "drag_roll", "inertia_pitch", "inertia_yaw", "inertia_roll"}},
    {"weapon",
     {"weapon", "turret", "bomblauncher"},
     {"assets/props/weaponsystems/capital/macros/weapon_*.xml",
      "assets/props/weaponsystems/capital/macros/turret_*.xml",
      "assets/props/weaponsystems/heavy/macros/weapon_*.xml",
      "assets/props/weaponsystems/heavy/macros/turret_*.xml",
      "assets/props/weaponsystems/mining/macros/weapon_*.xml",
      "assets/props/weaponsystems/mining/macros/turret_*.xml",
      "assets/props/weaponsystems/standard/macros/weapon_*.xml",
      "assets/props/weaponsystems/standard/macros/turret_*.xml",
      "assets/props/weaponsystems/spacesuit/macros/weapon_*.xml",
      "assets/props/weaponsystems/spacesuit/macros/turret_*.xml",
      "assets/props/weaponsystems/spacesuit/macros/spacesuit_gen_laser_*.xml",
      "assets/props/weaponsystems/spacesuit/macros/spacesuit_gen_repairweapon_*.xml",
      "assets/props/weaponsystems/energy/macros/weapon_*.xml",
      "assets/props/weaponsystems/energy/macros/turret_*.xml",
      "assets/props/weaponsystems/xref_parts/macros/weapon_*.xml",
      "assets/props/weaponsystems/xref_parts/macros/turret_*.xml",
      "assets/fx/weaponfx/macros/bullet_*.xml"},
     {"name", "class", "makerrace", "size", "hull", "bullet", "rotation_speed",
      "rotation_accel", "reload_rate", "reload_time", "heat_overheat", "heat_cooldelay",
      "heat_coolrate", "heat_reenable", "bullet_speed", "bullet_range", "bullet_dmg_hull",
      "bullet_dmg_shield"}},
    {"missilelauncher",
     {"missilelauncher", "missileturret"},
     {"assets/props/weaponsystems/dumbfire/macros/weapon_*.xml",
      "assets/props/weaponsystems/dumbfire/macros/turret_*.xml",
      "assets/props/weaponsystems/guided/macros/weapon_*.xml",
      "assets/props/weaponsystems/guided/macros/turret_*.xml",
      "assets/props/weaponsystems/torpedo/macros/weapon_*.xml",
      "assets/props/weaponsystems/torpedo/macros/turret_*.xml",
      "assets/props/weaponsystems/spacesuit/macros/weapon_*.xml",
      "assets/props/weaponsystems/spacesuit/macros/turret_*.xml",
      "assets/props/weaponsystems/spacesuit/macros/spacesuit_gen_bomblauncher_*.xml",
      "assets/props/weaponsystems/missile/macros/missile_*.xml",
      "assets/fx/weaponfx/macros/bomb_*.xml"},
     {"name", "class", "makerrace", "size", "hull", "capacity", "ammunition",
      "rotation_speed"}},
    {"ware",
     {"ware"},
     {"libraries/wares.xml"},
     {"name", "factoryname", "group", "tags", "volume", "price_min", "price_avg", "price_max",
      "licence", "owners"}},
};

// 2^63, the first double past the int64_t range
constexpr double int64Limit = 9223372036854775808.0;

const char *const sizeTags[] = {"spacesuit", "extrasmall", "small",
                                "medium",    "large",      "extralarge"};

std::vector<std::string_view> splitTags(std::string_view tags) {
  std::vector<std::string_view> result;
  size_t pos = 0;
  while (pos < tags.size()) {
    auto end = tags.find_first_of(" ,\t", pos);
    if (end == std::string_view::npos) {
      end = tags.size();
    }
    if (end > pos) {
      result.push_back(tags.substr(pos, end - pos));
    }
    pos = end + 1;
  }
  return result;
}

bool hasTag(std::string_view tags, std::string_view tag) {
  auto parts = splitTags(tags);
  return std::find(parts.begin(), parts.end(), tag) != parts.end();
}

// Typed reads of raw properties with per-attribute defaults
class Deriver {
public:
  Deriver(const DerivationInput &input, AttributeMap &out, std::vector<Diagnostic> &diagnostics)
      : in_(input), out_(out), diagnostics_(diagnostics) {}

  const std::string *raw(const std::string &key) const {
    auto it = in_.raw.find(key);
    return it == in_.raw.end() ? nullptr : &it->second;
  }

  void text(const std::string &name, const std::string &key) {
    if (const auto *value = raw(key)) {
      out_[name] = *value;
    }
  }

  double real(const std::string &name, const std::string &key, double fallback) {
    double value = parseReal(key, fallback);
    out_[name] = value;
    return value;
  }

  int64_t integer(const std::string &name, const std::string &key, int64_t fallback) {
    int64_t value = parseInteger(key, fallback);
    out_[name] = value;
    return value;
  }

  // First of key or alternative that is present
  int64_t integerEither(const std::string &name, const std::string &key,
                        const std::string &alternative, int64_t fallback) {
    return integer(name, raw(key) ? key : alternative, fallback);
  }

  void set(const std::string &name, Value value) { out_[name] = std::move(value); }

  double numberOut(const std::string &name) const {
    auto it = out_.find(name);
    if (it == out_.end()) {
      return 0.0;
    }
    if (const auto *integer = std::get_if<int64_t>(&it->second)) {
      return static_cast<double>(*integer);
    }
    if (const auto *real = std::get_if<double>(&it->second)) {
      return *real;
    }
    return 0.0;
  }

  void identification() {
    text("name", "identification.name");
    text("makerrace", "identification.makerrace");
    text("description", "identification.description");
  }

  void hull(bool hittable) {
    integer("hull", "hull.max", -1);
    integer("hull_integrated", "hull.integrated", 0);
    real("hull_threshold", "hull.threshold", 0.0);
    if (hittable) {
      integer("hull_hittable", "hull.hittable", 1);
    }
  }

  void physics() {
    real("mass", "physics.mass", 0.0);
    for (const char *axis : {"pitch", "yaw", "roll"}) {
      real(std::format("inertia_{}", axis), std::format("physics.inertia.{}", axis), 0.0);
    }
    for (const char *axis : {"forward", "reverse", "horizontal", "vertical", "pitch", "yaw",
                             "roll"}) {
      real(std::format("drag_{}", axis), std::format("physics.drag.{}", axis), 0.0);
    }
  }

  // Count component mount points carrying tag
  int64_t countMounts(std::string_view tag) const {
    if (!in_.component) {
      return 0;
    }
    return std::count_if(
        in_.component->connections.begin(), in_.component->connections.end(),
        [&](const ConnectionRef &conn) { return hasTag(conn.tags, tag); });
  }

  // Size tag of the first component mount point carrying tag
  void sizeFromMounts(std::string_view tag) {
    if (!in_.component) {
      return;
    }
    for (const auto &conn : in_.component->connections) {
      if (!hasTag(conn.tags, tag)) {
        continue;
      }
      for (const char *size : sizeTags) {
        if (hasTag(conn.tags, size)) {
          out_["size"] = std::string(size);
          return;
        }
      }
    }
    diagnostics_.push_back(Diagnostic{
        ErrorCode::InvalidValue, in_.id,
        std::format("Cannot determine {} size of {}: no sized {} mount on component {}", tag,
                    in_.id, tag, in_.component->id)});
  }

  const DerivationInput &input() const { return in_; }

private:
  void invalid(const std::string &key, const std::string &value) {
    diagnostics_.push_back(Diagnostic{
        ErrorCode::InvalidValue, in_.id,
        std::format("{} of {}: '{}' is not a valid number", key, in_.id, value)});
  }

  double parseReal(const std::string &key, double fallback) {
    const auto *value = raw(key);
    if (!value || value->empty()) {
      return fallback;
    }
    double result = 0.0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
    if (ec != std::errc() || ptr != value->data() + value->size() || !std::isfinite(result)) {
      invalid(key, *value);
      return fallback;
    }
    return result;
  }

  int64_t parseInteger(const std::string &key, int64_t fallback) {
    const auto *value = raw(key);
    if (!value || value->empty()) {
      return fallback;
    }
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), result);
    if (ec == std::errc() && ptr == value->data() + value->size()) {
      return result;
    }
    // Some integer fields are written with a fractional part
    double real = 0.0;
    auto [rptr, rec] = std::from_chars(value->data(), value->data() + value->size(), real);
    if (rec == std::errc() && rptr == value->data() + value->size() && std::isfinite(real) &&
        real >= -int64Limit && real < int64Limit) {
      return static_cast<int64_t>(real);
    }
    invalid(key, *value);
    return fallback;
  }

  const DerivationInput &in_;
  AttributeMap &out_;
  std::vector<Diagnostic> &diagnostics_;
};

bool startsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

void deriveEngine(Deriver &d) {
  d.identification();
  d.hull(false);

  for (const char *axis : {"forward", "reverse", "strafe", "pitch", "yaw", "roll"}) {
    d.real(std::format("thrust_{}", axis), std::format("thrust.{}", axis), 0.0);
  }
  d.real("angular_pitch", "angular.pitch", 0.0);
  d.real("angular_roll", "angular.roll", 0.0);

  for (const char *field : {"duration", "thrust", "attack", "release"}) {
    d.real(std::format("boost_{}", field), std::format("boost.{}", field), 0.0);
  }
  for (const char *field : {"charge", "thrust", "attack", "release"}) {
    d.real(std::format("travel_{}", field), std::format("travel.{}", field), 0.0);
  }

  // Boost and travel thrust are multipliers of the forward thrust
  double forward = d.numberOut("thrust_forward");
  d.set("boost_thrust_forward", forward * d.numberOut("boost_thrust"));
  d.set("travel_thrust_forward", forward * d.numberOut("travel_thrust"));

  // Generic engine components and unknown families carry no size
  if (const auto *component = d.input().component) {
    if (startsWith(component->id, "engine_")) {
      d.sizeFromMounts("engine");
    } else if (startsWith(component->id, "thruster_")) {
      d.sizeFromMounts("thruster");
    }
  }
}

void deriveShield(Deriver &d) {
  d.identification();
  d.hull(false);
  d.integer("capacity", "recharge.max", 0);
  d.real("recharge_rate", "recharge.rate", 0.0);
  d.real("recharge_delay", "recharge.delay", 0.0);
  d.sizeFromMounts("shield");
}

// Embed the fired bullet's headline numbers into a weapon record
void bulletSummary(Deriver &d) {
  for (const auto &slot : d.input().slots) {
    if (!slot.target || slot.target->kind != "bullet") {
      continue;
    }
    for (const char *field : {"speed", "range", "dmg_hull", "dmg_shield"}) {
      auto it = slot.target->attributes.find(field);
      if (it != slot.target->attributes.end()) {
        d.set(std::format("bullet_{}", field), it->second);
      }
    }
    return;
  }
}

void deriveWeapon(Deriver &d) {
  d.identification();
  d.hull(true);
  d.set("class", d.input().macroClass);
  d.text("bullet", "bullet.class");
  d.integer("heat_overheat", "heat.overheat", 0);
  d.real("heat_cooldelay", "heat.cooldelay", 0.0);
  d.integer("heat_coolrate", "heat.coolrate", 0);
  d.integer("heat_reenable", "heat.reenable", 0);
  d.real("rotation_speed", "rotationspeed.max", 0.0);
  d.real("rotation_accel", "rotationacceleration.max", 0.0);
  d.real("reload_rate", "reload.rate", 0.0);
  d.real("reload_time", "reload.time", 0.0);
  d.real("zoom_factor", "zoom.factor", 0.0);
  d.real("zoom_time", "zoom.time", 0.0);
  d.real("zoom_delay", "zoom.delay", 0.0);
  d.sizeFromMounts(d.input().macroClass == "turret" ? "turret" : "weapon");
  bulletSummary(d);
}

void deriveBullet(Deriver &d) {
  d.integer("speed", "bullet.speed", 0);
  d.real("lifetime", "bullet.lifetime", 0.0);
  d.integer("range", "bullet.range", 0);
  d.integer("amount", "bullet.amount", 0);
  d.integer("barrelamount", "bullet.barrelamount", 0);
  d.real("timediff", "bullet.timediff", 0.0);
  d.real("angle", "bullet.angle", 0.0);
  d.integer("maxhits", "bullet.maxhits", 0);
  d.real("ricochet", "bullet.ricochet", 0.0);
  d.real("restitution", "bullet.restitution", 0.0);
  d.integer("scale", "bullet.scale", 0);
  d.integer("attach", "bullet.attach", 0);
  d.real("chargetime", "bullet.chargetime", 0.0);
  d.integer("heat", "heat.value", 0);
  d.integer("heat_initial", "heat.initial", 0);
  d.real("reload_rate", "reload.rate", 0.0);
  d.real("reload_time", "reload.time", 0.0);
  d.integerEither("dmg_hull", "damage.hull", "damage.value", 0);
  d.integerEither("dmg_shield", "damage.shield", "damage.value", 0);
  d.integer("dmg_min", "damage.min", -1);
  d.integer("dmg_max", "damage.max", -1);
  d.integer("dmg_repair", "damage.repair", 0);
  d.integer("dmg_delay", "damage.delay", 0);
  d.integer("dmg_mining_mult", "damage.multiplier.mining", 1);
}

void deriveMissileLauncher(Deriver &d) {
  d.identification();
  d.hull(true);
  d.set("class", d.input().macroClass);
  d.text("bullet", "bullet.class");
  d.real("rotation_speed", "rotationspeed.max", 0.0);
  d.integer("capacity", "storage.capacity", 0);
  d.text("ammunition", "ammunition.tags");
  d.sizeFromMounts("missile");
}

void deriveMissile(Deriver &d) {
  d.identification();
  d.integer("amount", "missile.amount", 1);
  d.integer("barrelamount", "missile.barrelamount", 1);
  d.real("lifetime", "missile.lifetime", 0.0);
  d.integer("range", "missile.range", 0);
  d.integer("retarget", "missile.retarget", 0);
  d.integer("guided", "missile.guided", 0);
  d.integer("distribute", "missile.distribute", 0);
  d.integerEither("damage_hull", "explosiondamage.hull", "explosiondamage.value", 0);
  d.integerEither("damage_shield", "explosiondamage.shield", "explosiondamage.value", 0);
  d.real("reload_time", "reload.time", 0.0);
  d.integer("hull", "hull.max", -1);
  d.real("countermeasure_resilience", "countermeasure.resilience", -1.0);
  d.integer("lock_time", "lock.time", 0);
  d.integer("lock_range", "lock.range", -1);
  d.real("lock_angle", "lock.angle", -1.0);
  d.physics();
}

void deriveStorage(Deriver &d) {
  d.integer("cargobay", "cargo.max", 0);
  d.text("storage_type", "cargo.tags");
}

void deriveDockingBay(Deriver &d) {
  d.identification();
  d.text("docksize", "docksize.tags");
  d.integer("dock_external", "dock.external", 0);
  d.integer("dock_capacity", "dock.capacity", 1);
  d.integer("dock_allow", "dock.allow", 1);
  d.integer("dock_storage", "dock.storage", 0);
}

// Totals over the storage modules, docking bays and engines connected to a ship
void shipAggregates(Deriver &d) {
  int64_t cargobay = 0;
  std::vector<std::string> storage;
  int64_t droneStorage = 0, shipStorageS = 0, shipStorageM = 0;
  int64_t sDocks = 0, mDocks = 0, launchTubesS = 0, launchTubesM = 0;
  double thrust = 0.0;

  auto intOf = [](const AttributeMap &attrs, const char *name) -> int64_t {
    auto it = attrs.find(name);
    if (it == attrs.end()) {
      return 0;
    }
    if (const auto *value = std::get_if<int64_t>(&it->second)) {
      return *value;
    }
    return 0;
  };

  for (const auto &slot : d.input().slots) {
    if (!slot.target) {
      continue;
    }
    const auto &attrs = slot.target->attributes;

    if (slot.target->kind == "storage") {
      cargobay += intOf(attrs, "cargobay");
      auto it = attrs.find("storage_type");
      if (it != attrs.end()) {
        for (auto tag : splitTags(formatValue(it->second))) {
          if (std::find(storage.begin(), storage.end(), tag) == storage.end()) {
            storage.emplace_back(tag);
          }
        }
      }
    } else if (slot.target->kind == "dockingbay") {
      auto it = attrs.find("docksize");
      std::string docksize = it == attrs.end() ? std::string() : formatValue(it->second);
      int64_t capacity = intOf(attrs, "dock_capacity");

      if (intOf(attrs, "dock_storage") != 0) {
        if (hasTag(docksize, "dock_xs")) {
          droneStorage += capacity;
        }
        if (hasTag(docksize, "dock_s")) {
          shipStorageS += capacity;
        }
        if (hasTag(docksize, "dock_m")) {
          shipStorageM += capacity;
        }
      }
      if (startsWith(slot.macro, "dockingbay")) {
        sDocks += hasTag(docksize, "dock_s") ? capacity : 0;
        mDocks += hasTag(docksize, "dock_m") ? capacity : 0;
      }
      if (startsWith(slot.macro, "launchtube")) {
        launchTubesS += hasTag(docksize, "dock_s") ? capacity : 0;
        launchTubesM += hasTag(docksize, "dock_m") ? capacity : 0;
      }
    } else if (slot.target->kind == "engine") {
      auto it = attrs.find("thrust_forward");
      if (it != attrs.end()) {
        if (const auto *value = std::get_if<double>(&it->second)) {
          thrust += *value;
        }
      }
    }
  }

  std::string storageTags;
  for (const auto &tag : storage) {
    if (!storageTags.empty()) {
      storageTags += ' ';
    }
    storageTags += tag;
  }

  d.set("cargobay", cargobay);
  d.set("storage", storageTags);
  d.set("drone_storage", droneStorage);
  d.set("shipstorage_s", shipStorageS);
  d.set("shipstorage_m", shipStorageM);
  d.set("s_docks", sDocks);
  d.set("m_docks", mDocks);
  d.set("launchtubes_s", launchTubesS);
  d.set("launchtubes_m", launchTubesM);
  d.set("equipped_thrust_forward", thrust);
}

void deriveShip(Deriver &d) {
  d.text("name", "identification.name");
  d.text("description", "identification.description");
  d.set("class", d.input().macroClass.substr(std::string_view("ship_").size()));
  d.integer("hull", "hull.max", -1);
  d.text("purpose", "purpose.primary");
  d.text("type", "ship.type");
  d.integer("people", "people.capacity", 0);
  d.integer("missile_storage", "storage.missile", 0);
  d.integer("gas_gatherrate", "gatherrate.gas", 0);
  d.physics();

  d.set("num_engines", d.countMounts("engine"));
  d.set("num_shields", d.countMounts("shield"));
  d.set("num_weapons", d.countMounts("weapon"));
  d.set("num_turrets", d.countMounts("turret"));
  d.set("num_countermeasures", d.countMounts("countermeasures"));

  shipAggregates(d);
}

void deriveWare(Deriver &d) {
  d.text("name", "name");
  d.text("description", "description");
  d.text("factoryname", "factoryname");
  d.text("group", "transport");
  d.text("tags", "tags");
  d.text("illegal", "illegal");
  d.integer("volume", "volume", 0);
  d.integer("price_min", "price.min", 0);
  d.integer("price_avg", "price.average", 0);
  d.integer("price_max", "price.max", 0);
  d.text("licence", "restriction.licence");

  // Repeated elements are flattened as owner, owner#2, owner#3, ...
  std::string owners;
  for (int i = 1;; ++i) {
    std::string key = i == 1 ? "owner.faction" : std::format("owner#{}.faction", i);
    const auto *faction = d.raw(key);
    if (!faction) {
      break;
    }
    if (!owners.empty()) {
      owners += ' ';
    }
    owners += *faction;
  }
  d.set("owners", owners);

  // Every production method with its primary inputs
  int64_t productions = 0;
  for (int i = 1;; ++i) {
    std::string prefix = i == 1 ? std::string("production") : std::format("production#{}", i);
    if (!d.raw(prefix + ".method")) {
      break;
    }
    ++productions;

    std::string name = std::format("production{}", i);
    d.real(name + "_time", prefix + ".time", 0.0);
    d.integer(name + "_amount", prefix + ".amount", 0);
    d.text(name + "_method", prefix + ".method");
    d.text(name + "_name", prefix + ".name");

    for (int j = 1;; ++j) {
      std::string input = prefix + (j == 1 ? std::string(".primary.ware")
                                           : std::format(".primary.ware#{}", j));
      const auto *ware = d.raw(input + ".ware");
      if (!ware) {
        break;
      }
      d.integer(std::format("{}_consumption.{}", name, *ware), input + ".amount", 0);
    }
  }
  d.set("production_count", productions);
}

using DerivationFn = void (*)(Deriver &);

const std::unordered_map<std::string_view, DerivationFn> derivations = {
    {"engine", deriveEngine},
    {"shieldgenerator", deriveShield},
    {"weapon", deriveWeapon},
    {"turret", deriveWeapon},
    {"bomblauncher", deriveWeapon},
    {"bullet", deriveBullet},
    {"missilelauncher", deriveMissileLauncher},
    {"missileturret", deriveMissileLauncher},
    {"missile", deriveMissile},
    {"bomb", deriveMissile},
    {"storage", deriveStorage},
    {"dockingbay", deriveDockingBay},
    {"ship_xs", deriveShip},
    {"ship_s", deriveShip},
    {"ship_m", deriveShip},
    {"ship_l", deriveShip},
    {"ship_xl", deriveShip},
    {"ware", deriveWare},
};

} // namespace

const std::vector<KindSpec> &kindCatalog() {
  return kinds;
}

const KindSpec *findKind(std::string_view name) {
  for (const auto &kind : kinds) {
    if (kind.name == name) {
      return &kind;
    }
  }
  return nullptr;
}

const KindSpec *kindForClass(std::string_view macroClass) {
  for (const auto &kind : kinds) {
    if (std::find(kind.classes.begin(), kind.classes.end(), macroClass) != kind.classes.end()) {
      return &kind;
    }
  }
  return nullptr;
}

std::vector<std::string> expandKinds(const std::vector<std::string> &requested) {
  std::vector<std::string> result;
  auto addOnce = [&](std::string_view name) {
    if (std::find(result.begin(), result.end(), name) == result.end()) {
      result.emplace_back(name);
    }
  };

  for (const auto &name : requested) {
    if (name == "all") {
      for (const auto &kind : kinds) {
        addOnce(kind.name);
      }
    } else {
      addOnce(name);
    }
  }
  return result;
}

bool deriveAttributes(const DerivationInput &input, AttributeMap &out,
                      std::vector<Diagnostic> &diagnostics) {
  auto it = derivations.find(input.macroClass);
  if (it == derivations.end()) {
    return false;
  }
  Deriver deriver(input, out, diagnostics);
  it->second(deriver);
  return true;
}

} // namespace catx
