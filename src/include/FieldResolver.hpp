#pragma once

#include "AliasTable.hpp"
#include "XmlElement.hpp"

#include <optional>
#include <string>

namespace saft {

// Bounded breadth-first lookup of a canonical field under a captured record subtree.
//
// For each spelling of the field, in alias order, nodes are visited in breadth order
// starting with the root (depth 0) down to the depth bound. At every visited node below
// the root whose local name equals the spelling, non-empty trimmed text wins. A
// non-empty attribute named like the spelling on any visited node (the root included)
// wins next. For amount-shaped fields a matching node without text yields the text of
// its direct <Amount> child. The first hit in breadth order is returned.
class FieldResolver {
public:
	static constexpr int DEFAULT_MAX_DEPTH = 4;

	explicit FieldResolver(const AliasTable &aliases, int max_depth = DEFAULT_MAX_DEPTH);

	// nullopt when no spelling matches within the depth bound. Never throws for a
	// defined field.
	[[nodiscard]] std::optional<std::string> Resolve(const XmlElement &root, const std::string &field) const;

	[[nodiscard]] bool Has(const XmlElement &root, const std::string &field) const {
		return Resolve(root, field).has_value();
	}

	// Resolve() restricted to direct children of root, regardless of the field's bound.
	[[nodiscard]] std::optional<std::string> ResolveDirect(const XmlElement &root, const std::string &field) const;

	[[nodiscard]] const AliasTable &Aliases() const {
		return aliases_;
	}

private:
	std::optional<std::string> Search(const XmlElement &root, const AliasEntry &entry, int depth_bound) const;

	const AliasTable &aliases_;
	int max_depth_;
};

} // namespace saft
