#include "IngestOptions.hpp"
#include "AliasTable.hpp"
#include "SaftLogging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace saft {

namespace {

std::string Lower(std::string value) {
	std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
	return value;
}

} // namespace

const AliasTable &IngestOptions::Aliases() const {
	return aliases ? *aliases : AliasTable::Default();
}

IngestOptions IngestOptions::FromEnvironment() {
	IngestOptions options;

	if (const char *raw = std::getenv("SAFT_WRITE_RAW")) {
		auto value = Lower(raw);
		value.erase(std::remove_if(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); }),
		            value.end());
		options.write_raw_elements = !(value == "0" || value == "false" || value == "no" || value == "off");
	}

	if (const char *events = std::getenv("SAFT_PROGRESS_EVENTS")) {
		try {
			size_t consumed = 0;
			long long parsed = std::stoll(events, &consumed);
			if (parsed <= 0 || consumed != std::string(events).size()) {
				throw std::invalid_argument(events);
			}
			options.progress_interval = static_cast<uint64_t>(parsed);
		} catch (const std::exception &) {
			Logger()->warn("Ignoring SAFT_PROGRESS_EVENTS='{}', using {}", events, options.progress_interval);
		}
	}
	return options;
}

} // namespace saft
