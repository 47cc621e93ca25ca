#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace saft {

// A captured XML subtree. Element and attribute names are stored as local names
// (namespace prefix stripped). Children are owned; dropping the root releases the
// whole subtree.
struct XmlElement {
	std::string name;
	std::string text;
	std::vector<std::pair<std::string, std::string>> attributes;
	std::vector<std::unique_ptr<XmlElement>> children;

	explicit XmlElement(std::string name_p) : name(std::move(name_p)) {
	}

	XmlElement(const XmlElement &) = delete;
	XmlElement &operator=(const XmlElement &) = delete;

	XmlElement &AddChild(std::string child_name);
	void AddAttribute(std::string attr_name, std::string value);

	// nullptr when absent
	[[nodiscard]] const std::string *Attribute(const std::string &attr_name) const;
	[[nodiscard]] const XmlElement *Child(const std::string &child_name) const;

	[[nodiscard]] std::string TrimmedText() const;
	[[nodiscard]] size_t NodeCount() const;
};

// Strip a namespace qualifier: "uri|local" (expat with namespace processing) or
// "prefix:local".
const char *LocalName(const char *qualified);

std::string Trim(const std::string &s);

} // namespace saft
