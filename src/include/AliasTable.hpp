#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace saft {

struct AliasEntry {
	// Accepted tag/attribute spellings, in priority order.
	std::vector<std::string> spellings;
	// Search depth for this field; nullopt uses the resolver's bound.
	std::optional<int> max_depth;
	// Amount-shaped fields may carry their value in a child <Amount>.
	bool amount_shaped = false;
};

// Canonical field name -> spellings observed across producers. The default table is
// shared read-only by every run; copies can be extended for producer quirks.
class AliasTable {
public:
	AliasTable() = default;

	static const AliasTable &Default();

	void Define(const std::string &field, AliasEntry entry);
	void AddSpelling(const std::string &field, const std::string &spelling);

	// Throws std::out_of_range for a field that was never defined.
	[[nodiscard]] const AliasEntry &Lookup(const std::string &field) const;
	[[nodiscard]] bool Contains(const std::string &field) const;

	// Every spelling of every field.
	[[nodiscard]] std::unordered_set<std::string> AllSpellings() const;

private:
	std::unordered_map<std::string, AliasEntry> entries_;
};

} // namespace saft
