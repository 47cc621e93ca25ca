#include "FieldResolver.hpp"

#include <deque>
#include <utility>

namespace saft {

namespace {

std::optional<std::string> MatchNode(const XmlElement &node, int depth, const std::string &spelling,
                                     bool amount_shaped) {
	bool name_matches = depth > 0 && node.name == spelling;
	if (name_matches) {
		auto text = node.TrimmedText();
		if (!text.empty()) {
			return text;
		}
	}
	if (const auto *attr = node.Attribute(spelling)) {
		auto value = Trim(*attr);
		if (!value.empty()) {
			return value;
		}
	}
	if (name_matches && amount_shaped) {
		if (const auto *amount = node.Child("Amount")) {
			auto text = amount->TrimmedText();
			if (!text.empty()) {
				return text;
			}
		}
	}
	return std::nullopt;
}

} // namespace

FieldResolver::FieldResolver(const AliasTable &aliases, int max_depth) : aliases_(aliases), max_depth_(max_depth) {
}

std::optional<std::string> FieldResolver::Resolve(const XmlElement &root, const std::string &field) const {
	const auto &entry = aliases_.Lookup(field);
	return Search(root, entry, entry.max_depth.value_or(max_depth_));
}

std::optional<std::string> FieldResolver::ResolveDirect(const XmlElement &root, const std::string &field) const {
	return Search(root, aliases_.Lookup(field), 1);
}

std::optional<std::string> FieldResolver::Search(const XmlElement &root, const AliasEntry &entry,
                                                 int depth_bound) const {
	std::deque<std::pair<const XmlElement *, int>> queue;
	for (const auto &spelling : entry.spellings) {
		queue.clear();
		queue.emplace_back(&root, 0);
		while (!queue.empty()) {
			auto [node, depth] = queue.front();
			queue.pop_front();

			auto hit = MatchNode(*node, depth, spelling, entry.amount_shaped);
			if (hit) {
				return hit;
			}
			if (depth < depth_bound) {
				for (const auto &child : node->children) {
					queue.emplace_back(child.get(), depth + 1);
				}
			}
		}
	}
	return std::nullopt;
}

} // namespace saft
