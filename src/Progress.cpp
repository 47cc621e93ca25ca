#include "Progress.hpp"

#include <algorithm>

namespace saft {

const char *PhaseName(Phase phase) {
	switch (phase) {
	case Phase::START_ELEMENT:
		return "start_element";
	case Phase::END_ELEMENT:
		return "end_element";
	case Phase::CENSUS:
		return "census";
	case Phase::RAW:
		return "raw";
	case Phase::HEADER:
		return "header";
	case Phase::ACCOUNT:
		return "account";
	case Phase::TAX_TABLE:
		return "tax_table";
	case Phase::PARTY:
		return "party";
	case Phase::INVOICE:
		return "invoice";
	case Phase::LINE:
		return "line";
	case Phase::VOUCHER:
		return "voucher";
	case Phase::JOURNAL:
		return "journal";
	default:
		return "unknown";
	}
}

std::vector<std::pair<std::string, double>> PhaseStats::Slowest(size_t n) const {
	std::vector<std::pair<std::string, double>> result;
	for (size_t i = 0; i < phases_.size(); i++) {
		if (phases_[i].count > 0) {
			result.emplace_back(PhaseName(static_cast<Phase>(i)), phases_[i].seconds);
		}
	}
	std::stable_sort(result.begin(), result.end(),
	                 [](const auto &a, const auto &b) { return a.second > b.second; });
	if (result.size() > n) {
		result.resize(n);
	}
	return result;
}

} // namespace saft
