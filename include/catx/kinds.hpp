#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "definition.hpp"
#include "record.hpp"
#include "types.hpp"

namespace catx {

// Exportable object kind: which macro classes it covers, where its documents live and
// which attributes the tabular exporters print
struct KindSpec {
  std::string_view name;
  std::vector<std::string_view> classes;
  std::vector<std::string_view> sources; // Logical path globs
  std::vector<std::string_view> columns;
};

// All supported kinds
const std::vector<KindSpec> &kindCatalog();

// Kind by name, nullptr if unsupported
const KindSpec *findKind(std::string_view name);

// Kind covering a macro class, nullptr if none
const KindSpec *kindForClass(std::string_view macroClass);

// Expand "all" into every supported kind; other names are kept as given
std::vector<std::string> expandKinds(const std::vector<std::string> &requested);

// Everything a derivation rule may look at
struct DerivationInput {
  const std::string &id;
  const std::string &macroClass;
  const PropertyMap &raw;                   // Inherited, component and own properties
  const DefinitionNode *component;          // Referenced component, nullptr if none
  const std::vector<ConnectionSlot> &slots; // Resolved connections
};

// Apply the derivation rule of input.macroClass, writing typed attributes to out
// Returns false if the class has no rule
bool deriveAttributes(const DerivationInput &input, AttributeMap &out,
                      std::vector<Diagnostic> &diagnostics);

} // namespace catx
