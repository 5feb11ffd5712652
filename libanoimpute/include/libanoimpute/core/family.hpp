#pragma once

#include "libanoimpute/core/exceptions.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <string>
#include <variant>

namespace libanoimpute {
namespace core {

enum class Distribution { GAUSSIAN, BINOMIAL, POISSON, GAMMA };

enum class Link { IDENTITY, LOG, LOGIT, PROBIT, CLOGLOG, INVERSE, SQRT };

/**
 * Error distribution and link function of a generalized linear model
 *
 * Provides the pieces IRLS needs: link, inverse link, d(mu)/d(eta),
 * variance function, unit deviance and starting values. Mirrors the
 * family objects of R's glm().
 *
 * Supported link per distribution:
 * - gaussian: identity, log, inverse
 * - binomial: logit, probit, cloglog
 * - poisson:  log, identity, sqrt
 * - Gamma:    inverse, identity, log
 */
struct FamilySpec {
	Distribution distribution = Distribution::GAUSSIAN;
	Link link = Link::IDENTITY;

	FamilySpec() = default;
	FamilySpec(Distribution distribution_, Link link_) : distribution(distribution_), link(link_) {
	}

	static FamilySpec Gaussian(Link link_ = Link::IDENTITY) {
		return FamilySpec(Distribution::GAUSSIAN, link_);
	}

	static FamilySpec Binomial(Link link_ = Link::LOGIT) {
		return FamilySpec(Distribution::BINOMIAL, link_);
	}

	static FamilySpec Poisson(Link link_ = Link::LOG) {
		return FamilySpec(Distribution::POISSON, link_);
	}

	static FamilySpec Gamma(Link link_ = Link::INVERSE) {
		return FamilySpec(Distribution::GAMMA, link_);
	}

	bool operator==(const FamilySpec &other) const {
		return distribution == other.distribution && link == other.link;
	}

	bool operator!=(const FamilySpec &other) const {
		return !(*this == other);
	}

	static std::string DistributionName(Distribution distribution_) {
		switch (distribution_) {
		case Distribution::GAUSSIAN:
			return "gaussian";
		case Distribution::BINOMIAL:
			return "binomial";
		case Distribution::POISSON:
			return "poisson";
		case Distribution::GAMMA:
			return "Gamma";
		default:
			return "unknown";
		}
	}

	static std::string LinkName(Link link_) {
		switch (link_) {
		case Link::IDENTITY:
			return "identity";
		case Link::LOG:
			return "log";
		case Link::LOGIT:
			return "logit";
		case Link::PROBIT:
			return "probit";
		case Link::CLOGLOG:
			return "cloglog";
		case Link::INVERSE:
			return "inverse";
		case Link::SQRT:
			return "sqrt";
		default:
			return "unknown";
		}
	}

	/// e.g. "binomial(logit)"
	std::string Name() const {
		return DistributionName(distribution) + "(" + LinkName(link) + ")";
	}

	bool IsValid() const {
		switch (distribution) {
		case Distribution::GAUSSIAN:
			return link == Link::IDENTITY || link == Link::LOG || link == Link::INVERSE;
		case Distribution::BINOMIAL:
			return link == Link::LOGIT || link == Link::PROBIT || link == Link::CLOGLOG;
		case Distribution::POISSON:
			return link == Link::LOG || link == Link::IDENTITY || link == Link::SQRT;
		case Distribution::GAMMA:
			return link == Link::INVERSE || link == Link::IDENTITY || link == Link::LOG;
		default:
			return false;
		}
	}

	/// @throws UnsupportedFamilyException for an unsupported distribution/link pair
	void Validate() const {
		if (!IsValid()) {
			throw UnsupportedFamilyException("link '" + LinkName(link) + "' is not available for family '" +
			                                 DistributionName(distribution) + "'");
		}
	}

	// ========================================================================
	// Link functions
	// ========================================================================

	double LinkFun(double mu) const {
		switch (link) {
		case Link::IDENTITY:
			return mu;
		case Link::LOG:
			return std::log(mu);
		case Link::LOGIT:
			return std::log(mu / (1.0 - mu));
		case Link::PROBIT:
			return NormalQuantile(mu);
		case Link::CLOGLOG:
			return std::log(-std::log(1.0 - mu));
		case Link::INVERSE:
			return 1.0 / mu;
		case Link::SQRT:
			return std::sqrt(mu);
		default:
			return std::numeric_limits<double>::quiet_NaN();
		}
	}

	double LinkInverse(double eta) const {
		switch (link) {
		case Link::IDENTITY:
			return eta;
		case Link::LOG:
			return std::max(std::exp(eta), kEpsilon);
		case Link::LOGIT: {
			// Clamp the same way R's binomial()$linkinv does
			const double e = std::exp(-std::abs(eta));
			const double p = eta >= 0 ? 1.0 / (1.0 + e) : e / (1.0 + e);
			return std::min(std::max(p, kEpsilon), 1.0 - kEpsilon);
		}
		case Link::PROBIT: {
			const double p = NormalCdf(eta);
			return std::min(std::max(p, kEpsilon), 1.0 - kEpsilon);
		}
		case Link::CLOGLOG: {
			const double p = -std::expm1(-std::exp(eta));
			return std::min(std::max(p, kEpsilon), 1.0 - kEpsilon);
		}
		case Link::INVERSE:
			return 1.0 / eta;
		case Link::SQRT:
			return eta * eta;
		default:
			return std::numeric_limits<double>::quiet_NaN();
		}
	}

	/// Derivative d(mu)/d(eta)
	double MuEta(double eta) const {
		switch (link) {
		case Link::IDENTITY:
			return 1.0;
		case Link::LOG:
			return std::max(std::exp(eta), kEpsilon);
		case Link::LOGIT: {
			const double e = std::exp(-std::abs(eta));
			return std::max(e / ((1.0 + e) * (1.0 + e)), kEpsilon);
		}
		case Link::PROBIT:
			return std::max(NormalPdf(eta), kEpsilon);
		case Link::CLOGLOG: {
			const double capped = std::min(eta, 700.0);
			return std::max(std::exp(capped) * std::exp(-std::exp(capped)), kEpsilon);
		}
		case Link::INVERSE:
			return -1.0 / (eta * eta);
		case Link::SQRT:
			return 2.0 * eta;
		default:
			return std::numeric_limits<double>::quiet_NaN();
		}
	}

	// ========================================================================
	// Distribution functions
	// ========================================================================

	double Variance(double mu) const {
		switch (distribution) {
		case Distribution::GAUSSIAN:
			return 1.0;
		case Distribution::BINOMIAL:
			return std::max(mu * (1.0 - mu), kEpsilon);
		case Distribution::POISSON:
			return std::max(mu, kEpsilon);
		case Distribution::GAMMA:
			return std::max(mu * mu, kEpsilon);
		default:
			return std::numeric_limits<double>::quiet_NaN();
		}
	}

	/// Unit deviance contribution of one observation
	double UnitDeviance(double y, double mu) const {
		switch (distribution) {
		case Distribution::GAUSSIAN:
			return (y - mu) * (y - mu);
		case Distribution::BINOMIAL:
			return 2.0 * (XLogY(y, y / mu) + XLogY(1.0 - y, (1.0 - y) / (1.0 - mu)));
		case Distribution::POISSON:
			return 2.0 * (XLogY(y, y / mu) - (y - mu));
		case Distribution::GAMMA:
			return -2.0 * (std::log(y / mu) - (y - mu) / mu);
		default:
			return std::numeric_limits<double>::quiet_NaN();
		}
	}

	double Deviance(const Eigen::VectorXd &y, const Eigen::VectorXd &mu) const {
		double dev = 0.0;
		for (Eigen::Index i = 0; i < y.size(); i++) {
			dev += UnitDeviance(y(i), mu(i));
		}
		return dev;
	}

	/// Starting value for the mean, as in the family's initialize expression
	double InitialMu(double y) const {
		switch (distribution) {
		case Distribution::BINOMIAL:
			return (y + 0.5) / 2.0;
		case Distribution::POISSON:
			return y + 0.1;
		default:
			return y;
		}
	}

	/// Whether y lies in the support of the distribution
	bool ValidResponse(double y) const {
		if (!std::isfinite(y)) {
			return false;
		}
		switch (distribution) {
		case Distribution::BINOMIAL:
			return y >= 0.0 && y <= 1.0;
		case Distribution::POISSON:
			return y >= 0.0;
		case Distribution::GAMMA:
			return y > 0.0;
		default:
			return true;
		}
	}

	/// Whether mu is an admissible mean for the distribution
	bool ValidMean(double mu) const {
		if (!std::isfinite(mu)) {
			return false;
		}
		switch (distribution) {
		case Distribution::BINOMIAL:
			return mu > 0.0 && mu < 1.0;
		case Distribution::POISSON:
		case Distribution::GAMMA:
			return mu > 0.0;
		default:
			return true;
		}
	}

	static constexpr double kEpsilon = 2.220446e-16;
	static constexpr double kPi = 3.14159265358979323846;

	static double NormalCdf(double x) {
		return 0.5 * std::erfc(-x / std::sqrt(2.0));
	}

	static double NormalPdf(double x) {
		return std::exp(-0.5 * x * x) / std::sqrt(2.0 * kPi);
	}

	/// Inverse standard normal CDF (Acklam's rational approximation, one Newton polish)
	static double NormalQuantile(double p) {
		if (p <= 0.0) return -std::numeric_limits<double>::infinity();
		if (p >= 1.0) return std::numeric_limits<double>::infinity();

		static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
		                           1.383577518672690e+02,  -3.066479806614716e+01, 2.506628277459239e+00};
		static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
		                           6.680131188771972e+01,  -1.328068155288572e+01};
		static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
		                           -2.549732539343734e+00, 4.374664141464968e+00,  2.938163982698783e+00};
		static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
		                           3.754408661907416e+00};
		const double p_low = 0.02425;

		double x;
		if (p < p_low) {
			const double q = std::sqrt(-2.0 * std::log(p));
			x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
			    ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
		} else if (p <= 1.0 - p_low) {
			const double q = p - 0.5;
			const double r = q * q;
			x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
			    (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
		} else {
			const double q = std::sqrt(-2.0 * std::log(1.0 - p));
			x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
			    ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
		}

		const double e = NormalCdf(x) - p;
		const double u = e * std::sqrt(2.0 * kPi) * std::exp(0.5 * x * x);
		return x - u / (1.0 + 0.5 * x * u);
	}

private:
	/// x * log(y) with 0 * log(0) = 0
	static double XLogY(double x, double y) {
		if (x == 0.0) return 0.0;
		return x * std::log(y);
	}
};

/// Family policy: choose the model from the target column type and level count
struct AutoFamily {
	bool operator==(const AutoFamily &) const {
		return true;
	}
};

/// Closed choice between the AUTO policy and one explicit GLM family
using FamilySelector = std::variant<AutoFamily, FamilySpec>;

inline bool IsAuto(const FamilySelector &selector) {
	return std::holds_alternative<AutoFamily>(selector);
}

inline std::string FamilySelectorName(const FamilySelector &selector) {
	if (IsAuto(selector)) {
		return "AUTO";
	}
	return std::get<FamilySpec>(selector).Name();
}

/**
 * Parse a family selector from text
 *
 * Accepts "AUTO" or a family name with an optional link in parentheses:
 * "gaussian", "binomial", "binomial(probit)", "poisson(sqrt)", "Gamma(log)".
 * Family names are matched case-insensitively; the default link is the
 * family's canonical link (Gamma defaults to inverse).
 *
 * @throws UnsupportedFamilyException if the text names no valid family
 */
inline FamilySelector ParseFamily(const std::string &text) {
	auto lower = [](std::string s) {
		s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; }), s.end());
		for (auto &c : s) {
			c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		}
		return s;
	};

	const std::string normalized = lower(text);
	if (normalized == "auto") {
		return AutoFamily {};
	}

	std::string name = normalized;
	std::string link_name;
	const auto open = normalized.find('(');
	if (open != std::string::npos) {
		if (normalized.back() != ')') {
			throw UnsupportedFamilyException("cannot parse family '" + text + "'");
		}
		name = normalized.substr(0, open);
		link_name = normalized.substr(open + 1, normalized.size() - open - 2);
		if (link_name.rfind("link=", 0) == 0) {
			link_name = link_name.substr(5);
		}
		link_name.erase(std::remove(link_name.begin(), link_name.end(), '"'), link_name.end());
		link_name.erase(std::remove(link_name.begin(), link_name.end(), '\''), link_name.end());
	}

	FamilySpec spec;
	if (name == "gaussian" || name == "normal") {
		spec = FamilySpec::Gaussian();
	} else if (name == "binomial") {
		spec = FamilySpec::Binomial();
	} else if (name == "poisson") {
		spec = FamilySpec::Poisson();
	} else if (name == "gamma") {
		spec = FamilySpec::Gamma();
	} else {
		throw UnsupportedFamilyException("family must be \"AUTO\" or a model family, got '" + text + "'");
	}

	if (!link_name.empty()) {
		if (link_name == "identity") {
			spec.link = Link::IDENTITY;
		} else if (link_name == "log") {
			spec.link = Link::LOG;
		} else if (link_name == "logit") {
			spec.link = Link::LOGIT;
		} else if (link_name == "probit") {
			spec.link = Link::PROBIT;
		} else if (link_name == "cloglog") {
			spec.link = Link::CLOGLOG;
		} else if (link_name == "inverse") {
			spec.link = Link::INVERSE;
		} else if (link_name == "sqrt") {
			spec.link = Link::SQRT;
		} else {
			throw UnsupportedFamilyException("unknown link '" + link_name + "'");
		}
	}

	spec.Validate();
	return spec;
}

} // namespace core
} // namespace libanoimpute
