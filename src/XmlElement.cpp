#include "XmlElement.hpp"

#include <cstring>

namespace saft {

XmlElement &XmlElement::AddChild(std::string child_name) {
	children.push_back(std::make_unique<XmlElement>(std::move(child_name)));
	return *children.back();
}

void XmlElement::AddAttribute(std::string attr_name, std::string value) {
	attributes.emplace_back(std::move(attr_name), std::move(value));
}

const std::string *XmlElement::Attribute(const std::string &attr_name) const {
	for (const auto &attr : attributes) {
		if (attr.first == attr_name) {
			return &attr.second;
		}
	}
	return nullptr;
}

const XmlElement *XmlElement::Child(const std::string &child_name) const {
	for (const auto &child : children) {
		if (child->name == child_name) {
			return child.get();
		}
	}
	return nullptr;
}

std::string XmlElement::TrimmedText() const {
	return Trim(text);
}

size_t XmlElement::NodeCount() const {
	size_t count = 1;
	for (const auto &child : children) {
		count += child->NodeCount();
	}
	return count;
}

const char *LocalName(const char *qualified) {
	const char *pipe = std::strrchr(qualified, '|');
	if (pipe) {
		return pipe + 1;
	}
	const char *colon = std::strrchr(qualified, ':');
	return colon ? colon + 1 : qualified;
}

std::string Trim(const std::string &s) {
	auto is_space = [](char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; };
	size_t begin = 0;
	while (begin < s.size() && is_space(s[begin])) {
		begin++;
	}
	size_t end = s.size();
	while (end > begin && is_space(s[end - 1])) {
		end--;
	}
	return s.substr(begin, end - begin);
}

} // namespace saft
