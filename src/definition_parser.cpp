#include <cstring>
#include <format>
#include <unordered_set>

#include <tinyxml2.h>

#include <catx/definition_parser.hpp>
#include <catx/path.hpp>

namespace catx {

namespace {

std::string trim(std::string_view text) {
  const char *blanks = " \t\r\n";
  auto first = text.find_first_not_of(blanks);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(blanks);
  return std::string(text.substr(first, last - first + 1));
}

std::string attribute(const tinyxml2::XMLElement *elem, const char *name) {
  const char *value = elem->Attribute(name);
  return value ? trim(value) : std::string();
}

// Flatten the attributes, text and children of elem under prefix
void flattenElement(const tinyxml2::XMLElement *elem, const std::string &prefix,
                    PropertyMap &out) {
  for (const auto *attr = elem->FirstAttribute(); attr; attr = attr->Next()) {
    std::string key = prefix.empty() ? attr->Name() : prefix + "." + attr->Name();
    out[key] = attr->Value();
  }

  if (!prefix.empty()) {
    if (const char *text = elem->GetText()) {
      std::string trimmed = trim(text);
      if (!trimmed.empty()) {
        out[prefix] = std::move(trimmed);
      }
    }
  }

  std::unordered_map<std::string, int> seen;
  for (const auto *child = elem->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    std::string name = child->Name();
    int occurrence = ++seen[name];
    if (occurrence > 1) {
      name += std::format("#{}", occurrence);
    }
    flattenElement(child, prefix.empty() ? name : prefix + "." + name, out);
  }
}

void flattenProperties(const tinyxml2::XMLElement *owner, PropertyMap &out) {
  if (const auto *props = owner->FirstChildElement("properties")) {
    std::unordered_map<std::string, int> seen;
    for (const auto *child = props->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
      std::string name = child->Name();
      int occurrence = ++seen[name];
      if (occurrence > 1) {
        name += std::format("#{}", occurrence);
      }
      flattenElement(child, name, out);
    }
  }
}

class DocumentParser {
public:
  DocumentParser(std::string_view sourcePath, Error *outError)
      : sourcePath_(sourcePath), outError_(outError) {}

  bool parseMacro(const tinyxml2::XMLElement *elem, std::vector<DefinitionNode> &nodes) {
    DefinitionNode node;
    node.origin = NodeOrigin::Macro;
    node.id = attribute(elem, "name");
    node.kind = attribute(elem, "class");
    node.sourcePath = sourcePath_;
    if (!checkIdentity(elem, node, "name")) {
      return false;
    }

    if (std::string parent = attribute(elem, "extends"); !parent.empty()) {
      node.extends = std::move(parent);
    }
    if (const auto *comp = elem->FirstChildElement("component")) {
      if (std::string ref = attribute(comp, "ref"); !ref.empty()) {
        node.component = std::move(ref);
      }
    }
    flattenProperties(elem, node.properties);

    if (const auto *conns = elem->FirstChildElement("connections")) {
      for (const auto *conn = conns->FirstChildElement("connection"); conn;
           conn = conn->NextSiblingElement("connection")) {
        std::string role = attribute(conn, "ref");
        for (const auto *target = conn->FirstChildElement("macro"); target;
             target = target->NextSiblingElement("macro")) {
          std::string ref = attribute(target, "ref");
          if (ref.empty()) {
            continue;
          }
          node.connections.push_back(ConnectionRef{role, std::move(ref), {}});
        }
      }
    }

    // Weapons name the projectile they fire as a property
    if (auto it = node.properties.find("bullet.class");
        it != node.properties.end() && !it->second.empty()) {
      node.connections.push_back(ConnectionRef{"bullet", it->second, {}});
    }

    return add(elem, std::move(node), nodes);
  }

  bool parseComponent(const tinyxml2::XMLElement *elem, std::vector<DefinitionNode> &nodes) {
    DefinitionNode node;
    node.origin = NodeOrigin::Component;
    node.id = attribute(elem, "name");
    node.kind = attribute(elem, "class");
    node.sourcePath = sourcePath_;
    if (!checkIdentity(elem, node, "name")) {
      return false;
    }

    flattenProperties(elem, node.properties);

    if (const auto *conns = elem->FirstChildElement("connections")) {
      for (const auto *conn = conns->FirstChildElement("connection"); conn;
           conn = conn->NextSiblingElement("connection")) {
        std::string role = attribute(conn, "name");
        std::string tags = attribute(conn, "tags");
        const auto *target = conn->FirstChildElement("macro");
        if (!target) {
          node.connections.push_back(ConnectionRef{std::move(role), {}, std::move(tags)});
          continue;
        }
        for (; target; target = target->NextSiblingElement("macro")) {
          node.connections.push_back(ConnectionRef{role, attribute(target, "ref"), tags});
        }
      }
    }

    return add(elem, std::move(node), nodes);
  }

  bool parseWare(const tinyxml2::XMLElement *elem, std::vector<DefinitionNode> &nodes) {
    DefinitionNode node;
    node.origin = NodeOrigin::Ware;
    node.id = attribute(elem, "id");
    node.kind = "ware";
    node.sourcePath = sourcePath_;
    if (!checkIdentity(elem, node, "id")) {
      return false;
    }

    flattenElement(elem, "", node.properties);
    return add(elem, std::move(node), nodes);
  }

private:
  bool checkIdentity(const tinyxml2::XMLElement *elem, const DefinitionNode &node,
                     const char *idAttribute) {
    if (node.id.empty() || node.kind.empty()) {
      setError(outError_, ErrorCode::MalformedDefinition,
               std::format("Malformed definition {} (line {}): <{}> without {}", sourcePath_,
                           elem->GetLineNum(), elem->Name(),
                           node.id.empty() ? idAttribute : "class"));
      return false;
    }
    return true;
  }

  bool add(const tinyxml2::XMLElement *elem, DefinitionNode node,
           std::vector<DefinitionNode> &nodes) {
    auto &ids = node.origin == NodeOrigin::Component ? componentIds_ : macroIds_;
    if (!ids.insert(node.id).second) {
      setError(outError_, ErrorCode::MalformedDefinition,
               std::format("Malformed definition {} (line {}): duplicate identifier {}",
                           sourcePath_, elem->GetLineNum(), node.id));
      return false;
    }
    nodes.push_back(std::move(node));
    return true;
  }

  std::string sourcePath_;
  Error *outError_;
  std::unordered_set<std::string> macroIds_;
  std::unordered_set<std::string> componentIds_;
};

bool loadDocument(tinyxml2::XMLDocument &doc, std::span<const uint8_t> data,
                  std::string_view sourcePath, Error *outError) {
  doc.Parse(reinterpret_cast<const char *>(data.data()), data.size());
  if (doc.Error()) {
    setError(outError, ErrorCode::MalformedDefinition,
             std::format("Malformed definition {} (line {}): {}", sourcePath,
                         doc.ErrorLineNum(), doc.ErrorStr()));
    return false;
  }
  if (!doc.RootElement()) {
    setError(outError, ErrorCode::MalformedDefinition,
             std::format("Malformed definition {}: no root element", sourcePath));
    return false;
  }
  return true;
}

} // namespace

std::optional<std::vector<DefinitionNode>> parseDefinitions(std::span<const uint8_t> data,
                                                            std::string_view sourcePath,
                                                            Error *outError) {
  tinyxml2::XMLDocument doc;
  if (!loadDocument(doc, data, sourcePath, outError)) {
    return std::nullopt;
  }

  const auto *root = doc.RootElement();
  std::vector<DefinitionNode> nodes;
  DocumentParser parser(sourcePath, outError);

  if (std::strcmp(root->Name(), "macros") == 0) {
    for (const auto *elem = root->FirstChildElement("macro"); elem;
         elem = elem->NextSiblingElement("macro")) {
      if (!parser.parseMacro(elem, nodes)) {
        return std::nullopt;
      }
    }
  } else if (std::strcmp(root->Name(), "components") == 0) {
    for (const auto *elem = root->FirstChildElement("component"); elem;
         elem = elem->NextSiblingElement("component")) {
      if (!parser.parseComponent(elem, nodes)) {
        return std::nullopt;
      }
    }
  } else if (std::strcmp(root->Name(), "wares") == 0) {
    for (const auto *elem = root->FirstChildElement("ware"); elem;
         elem = elem->NextSiblingElement("ware")) {
      if (!parser.parseWare(elem, nodes)) {
        return std::nullopt;
      }
    }
  }

  return nodes;
}

std::optional<std::unordered_map<std::string, std::string>>
parseIndex(std::span<const uint8_t> data, std::string_view sourcePath, Error *outError) {
  tinyxml2::XMLDocument doc;
  if (!loadDocument(doc, data, sourcePath, outError)) {
    return std::nullopt;
  }

  std::unordered_map<std::string, std::string> index;
  for (const auto *entry = doc.RootElement()->FirstChildElement("entry"); entry;
       entry = entry->NextSiblingElement("entry")) {
    const char *name = entry->Attribute("name");
    const char *value = entry->Attribute("value");
    if (!name || !value) {
      continue;
    }
    index[name] = normalizeSlashes(value) + ".xml";
  }
  return index;
}

} // namespace catx
