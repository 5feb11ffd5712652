#include "libanoimpute/core/formula.hpp"
#include "libanoimpute/core/exceptions.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace libanoimpute {
namespace core {

namespace {

std::string Trim(const std::string &s) {
	size_t begin = 0;
	size_t end = s.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
		begin++;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
		end--;
	}
	return s.substr(begin, end - begin);
}

std::vector<std::string> SplitSide(const std::string &side, const char *side_name, const std::string &text) {
	const std::string trimmed = Trim(side);
	if (trimmed.empty()) {
		throw InvalidFormulaException(std::string(side_name) + " side is empty in '" + text + "'");
	}

	std::vector<std::string> terms;
	std::unordered_set<std::string> seen;
	size_t start = 0;
	while (true) {
		const size_t plus = trimmed.find('+', start);
		const std::string term = Trim(trimmed.substr(start, plus == std::string::npos ? std::string::npos : plus - start));
		if (term.empty()) {
			throw InvalidFormulaException("empty term on the " + std::string(side_name) + " side of '" + text + "'");
		}
		if (!seen.insert(term).second) {
			throw InvalidFormulaException("'" + term + "' is listed twice on the " + std::string(side_name) +
			                              " side of '" + text + "'");
		}
		terms.push_back(term);
		if (plus == std::string::npos) {
			break;
		}
		start = plus + 1;
	}
	return terms;
}

std::string JoinTerms(const std::vector<std::string> &terms) {
	std::string out;
	for (size_t i = 0; i < terms.size(); i++) {
		if (i > 0) {
			out += " + ";
		}
		out += terms[i];
	}
	return out;
}

} // namespace

std::string Formula::ToString() const {
	return JoinTerms(targets) + " ~ " + JoinTerms(predictors);
}

Formula Formula::ForTarget(const std::string &target) const {
	Formula single;
	single.targets.push_back(target);
	for (const auto &name : predictors) {
		if (name != target) {
			single.predictors.push_back(name);
		}
	}
	return single;
}

bool Formula::IsTarget(const std::string &name) const {
	return std::find(targets.begin(), targets.end(), name) != targets.end();
}

Formula ParseFormula(const std::string &text, const Dataset &data) {
	const size_t tilde = text.find('~');
	if (tilde == std::string::npos) {
		throw InvalidFormulaException("no '~' in '" + text + "'");
	}
	if (text.find('~', tilde + 1) != std::string::npos) {
		throw InvalidFormulaException("more than one '~' in '" + text + "'");
	}

	Formula formula;
	formula.targets = SplitSide(text.substr(0, tilde), "left-hand", text);
	formula.predictors = SplitSide(text.substr(tilde + 1), "right-hand", text);

	for (const auto *side : {&formula.targets, &formula.predictors}) {
		for (const auto &name : *side) {
			if (!data.HasColumn(name)) {
				throw InvalidFormulaException("variable '" + name + "' is not a column of the dataset");
			}
		}
	}
	return formula;
}

} // namespace core
} // namespace libanoimpute
