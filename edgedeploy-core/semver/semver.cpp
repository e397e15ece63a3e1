// Copyright 2026 The edgedeploy Authors
//
//    Licensed under the Apache License, Version 2.0 (the "License");
//    you may not use this file except in compliance with the License.
//    You may obtain a copy of the License at
//
//        http://www.apache.org/licenses/LICENSE-2.0
//
//    Unless required by applicable law or agreed to in writing, software
//    distributed under the License is distributed on an "AS IS" BASIS,
//    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//    See the License for the specific language governing permissions and
//    limitations under the License.


#include <edgedeploy-core/semver.hpp>

#include <algorithm>
#include <cassert>
#include <cctype>

#include <common/common.hpp>
#include <common/optional.hpp>

namespace edgedeploy {
namespace core {
namespace semver {

namespace common = edgedeploy::common;
namespace optional = edgedeploy::common::optional;

const SemverErrorCategoryClass SemverErrorCategory;

const char *SemverErrorCategoryClass::name() const noexcept {
	return "SemverErrorCategory";
}

string SemverErrorCategoryClass::message(int code) const {
	switch (code) {
	case NoError:
		return "Success";
	case InvalidVersionError:
		return "Invalid version";
	case InvalidRequirementError:
		return "Invalid version requirement";
	}
	assert(false);
	return "Unknown";
}

error::Error MakeError(SemverErrorCode code, const string &msg) {
	return error::Error(error_condition(code, SemverErrorCategory), msg);
}

static bool IsNumeric(const string &str) {
	return !str.empty() && all_of(str.begin(), str.end(), [](unsigned char c) {
		return isdigit(c) != 0;
	});
}

static expected::expected<int64_t, error::Error> ParseNumber(const string &str) {
	if (!IsNumeric(str) || (str.size() > 1 && str[0] == '0')) {
		return expected::unexpected(
			MakeError(InvalidVersionError, "\"" + str + "\" is not a valid version number"));
	}
	auto num = common::StringToLongLong(str);
	if (!num) {
		return expected::unexpected(MakeError(InvalidVersionError, num.error().String()));
	}
	return num.value();
}

static expected::ExpectedStringVector ParseIdentifiers(const string &str, bool numeric_rules) {
	auto ids = common::SplitString(str, ".");
	for (const auto &id : ids) {
		if (id.empty()) {
			return expected::unexpected(
				MakeError(InvalidVersionError, "Empty identifier in \"" + str + "\""));
		}
		for (unsigned char c : id) {
			if (!isalnum(c) && c != '-') {
				return expected::unexpected(
					MakeError(InvalidVersionError, "Invalid character in \"" + str + "\""));
			}
		}
		if (numeric_rules && IsNumeric(id) && id.size() > 1 && id[0] == '0') {
			return expected::unexpected(MakeError(
				InvalidVersionError, "Numeric identifier \"" + id + "\" has a leading zero"));
		}
	}
	return ids;
}

// A version where trailing parts may be missing or wildcards, as found in requirements.
struct Partial {
	optional::optional<int64_t> major;
	optional::optional<int64_t> minor;
	optional::optional<int64_t> patch;
	vector<string> prerelease;
	string build;

	bool Complete() const {
		return bool(patch);
	}

	Version Fill() const {
		if (Complete()) {
			return Version(major.value(), minor.value(), patch.value(), prerelease);
		}
		return Version(major.value_or(0), minor.value_or(0), 0);
	}
};

using ExpectedPartial = expected::expected<Partial, error::Error>;

static ExpectedPartial ParsePartial(const string &str, bool wildcards) {
	Partial result;
	string rest = str;

	auto plus = rest.find('+');
	if (plus != string::npos) {
		result.build = rest.substr(plus + 1);
		auto build = ParseIdentifiers(result.build, false);
		if (!build) {
			return expected::unexpected(build.error());
		}
		rest = rest.substr(0, plus);
	}

	auto dash = rest.find('-');
	string prerelease;
	if (dash != string::npos) {
		prerelease = rest.substr(dash + 1);
		rest = rest.substr(0, dash);
		auto ids = ParseIdentifiers(prerelease, true);
		if (!ids) {
			return expected::unexpected(ids.error());
		}
		result.prerelease = ids.value();
	}

	auto parts = common::SplitString(rest, ".");
	if (rest.empty() || parts.size() > 3 || (!wildcards && parts.size() != 3)) {
		return expected::unexpected(
			MakeError(InvalidVersionError, "\"" + str + "\" is not a valid version"));
	}

	vector<optional::optional<int64_t>> numbers;
	bool wildcard_seen = false;
	for (const auto &part : parts) {
		if (wildcards && (part == "x" || part == "X" || part == "*")) {
			wildcard_seen = true;
		}
		if (wildcard_seen) {
			numbers.push_back(optional::nullopt);
			continue;
		}
		auto num = ParseNumber(part);
		if (!num) {
			return expected::unexpected(
				MakeError(InvalidVersionError, "\"" + str + "\" is not a valid version"));
		}
		numbers.push_back(num.value());
	}
	numbers.resize(3);
	result.major = numbers[0];
	result.minor = numbers[1];
	result.patch = numbers[2];

	if (!result.prerelease.empty() && !result.Complete()) {
		return expected::unexpected(MakeError(
			InvalidVersionError, "\"" + str + "\" has a prerelease but no patch version"));
	}
	return result;
}

Version::Version(int64_t major, int64_t minor, int64_t patch, vector<string> prerelease) :
	major_ {major},
	minor_ {minor},
	patch_ {patch},
	prerelease_ {std::move(prerelease)} {
}

ExpectedVersion Version::Parse(const string &str) {
	auto partial = ParsePartial(str, false);
	if (!partial) {
		return expected::unexpected(partial.error());
	}
	Version v = partial.value().Fill();
	v.build_ = partial.value().build;
	return v;
}

string Version::String() const {
	string ret = to_string(major_) + "." + to_string(minor_) + "." + to_string(patch_);
	if (!prerelease_.empty()) {
		ret += "-" + common::JoinStrings(prerelease_, ".");
	}
	if (!build_.empty()) {
		ret += "+" + build_;
	}
	return ret;
}

static int CompareIdentifier(const string &a, const string &b) {
	bool a_num = IsNumeric(a);
	bool b_num = IsNumeric(b);
	if (a_num && b_num) {
		// No leading zeros, so the longer one is bigger.
		if (a.size() != b.size()) {
			return a.size() < b.size() ? -1 : 1;
		}
		return a.compare(b);
	}
	if (a_num) {
		return -1;
	}
	if (b_num) {
		return 1;
	}
	return a.compare(b);
}

int Version::Compare(const Version &other) const {
	if (major_ != other.major_) {
		return major_ < other.major_ ? -1 : 1;
	}
	if (minor_ != other.minor_) {
		return minor_ < other.minor_ ? -1 : 1;
	}
	if (patch_ != other.patch_) {
		return patch_ < other.patch_ ? -1 : 1;
	}

	if (prerelease_.empty() || other.prerelease_.empty()) {
		if (prerelease_.empty() == other.prerelease_.empty()) {
			return 0;
		}
		// A release has higher precedence than any of its prereleases.
		return prerelease_.empty() ? 1 : -1;
	}

	size_t common_len = min(prerelease_.size(), other.prerelease_.size());
	for (size_t i = 0; i < common_len; i++) {
		int cmp = CompareIdentifier(prerelease_[i], other.prerelease_[i]);
		if (cmp != 0) {
			return cmp < 0 ? -1 : 1;
		}
	}
	if (prerelease_.size() == other.prerelease_.size()) {
		return 0;
	}
	return prerelease_.size() < other.prerelease_.size() ? -1 : 1;
}

bool Requirement::Comparator::Matches(const Version &v) const {
	switch (op) {
	case Op::Equal:
		return v == version;
	case Op::Greater:
		return v > version;
	case Op::GreaterEqual:
		return v >= version;
	case Op::Less:
		return v < version;
	case Op::LessEqual:
		return v <= version;
	}
	assert(false);
	return false;
}

using Op = Requirement::Op;
using Comparator = Requirement::Comparator;

// Turns one `<op><partial>` term into plain comparators.
static void Desugar(const string &op, const Partial &p, vector<Comparator> &out) {
	auto add = [&out](Op o, Version v) { out.push_back(Comparator {o, std::move(v)}); };
	// Matches nothing.
	auto none = [&add]() { add(Op::Less, Version(0, 0, 0)); };

	if (!p.major) {
		if (op == ">" || op == "<") {
			none();
		}
		// Otherwise any version.
		return;
	}
	int64_t major = p.major.value();

	if (op == "" || op == "=" || op == "==") {
		if (p.Complete()) {
			add(Op::Equal, p.Fill());
		} else if (!p.minor) {
			add(Op::GreaterEqual, Version(major, 0, 0));
			add(Op::Less, Version(major + 1, 0, 0));
		} else {
			add(Op::GreaterEqual, Version(major, p.minor.value(), 0));
			add(Op::Less, Version(major, p.minor.value() + 1, 0));
		}
	} else if (op == ">") {
		if (p.Complete()) {
			add(Op::Greater, p.Fill());
		} else if (!p.minor) {
			add(Op::GreaterEqual, Version(major + 1, 0, 0));
		} else {
			add(Op::GreaterEqual, Version(major, p.minor.value() + 1, 0));
		}
	} else if (op == ">=") {
		add(Op::GreaterEqual, p.Fill());
	} else if (op == "<") {
		add(Op::Less, p.Fill());
	} else if (op == "<=") {
		if (p.Complete()) {
			add(Op::LessEqual, p.Fill());
		} else if (!p.minor) {
			add(Op::Less, Version(major + 1, 0, 0));
		} else {
			add(Op::Less, Version(major, p.minor.value() + 1, 0));
		}
	} else if (op == "~" || op == "~>") {
		add(Op::GreaterEqual, p.Fill());
		if (!p.minor) {
			add(Op::Less, Version(major + 1, 0, 0));
		} else {
			add(Op::Less, Version(major, p.minor.value() + 1, 0));
		}
	} else if (op == "^") {
		add(Op::GreaterEqual, p.Fill());
		if (major > 0 || !p.minor) {
			add(Op::Less, Version(major + 1, 0, 0));
		} else if (p.minor.value() > 0 || !p.patch) {
			add(Op::Less, Version(0, p.minor.value() + 1, 0));
		} else {
			add(Op::Less, Version(0, 0, p.patch.value() + 1));
		}
	}
}

static const vector<string> operators = {">=", "<=", "==", "~>", ">", "<", "=", "^", "~"};

static bool IsOperatorOnly(const string &token) {
	return find(operators.begin(), operators.end(), token) != operators.end();
}

static ExpectedPartial ParseRangeVersion(const string &str) {
	string s = str;
	if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) {
		s = s.substr(1);
	}
	return ParsePartial(s, true);
}

static error::Error ParseTerm(const string &term, vector<Comparator> &out) {
	string op;
	for (const auto &candidate : operators) {
		if (common::StartsWith(term, candidate)) {
			op = candidate;
			break;
		}
	}
	auto partial = ParseRangeVersion(common::StringTrim(term.substr(op.size())));
	if (!partial) {
		return MakeError(InvalidRequirementError, partial.error().message);
	}
	Desugar(op, partial.value(), out);
	return error::NoError;
}

static vector<string> SplitWhitespace(const string &str) {
	vector<string> tokens;
	string current;
	for (unsigned char c : str) {
		if (isspace(c)) {
			if (!current.empty()) {
				tokens.push_back(current);
				current.clear();
			}
		} else {
			current += static_cast<char>(c);
		}
	}
	if (!current.empty()) {
		tokens.push_back(current);
	}
	return tokens;
}

static expected::expected<vector<Comparator>, error::Error> ParseComparatorSet(const string &str) {
	vector<Comparator> result;
	auto tokens = SplitWhitespace(str);

	// Hyphen range: `<partial> - <partial>`.
	if (tokens.size() == 3 && tokens[1] == "-") {
		auto from = ParseRangeVersion(tokens[0]);
		auto to = ParseRangeVersion(tokens[2]);
		if (!from || !to) {
			return expected::unexpected(
				MakeError(InvalidRequirementError, "Invalid hyphen range \"" + str + "\""));
		}
		if (from.value().major) {
			result.push_back(Comparator {Op::GreaterEqual, from.value().Fill()});
		}
		auto &upper = to.value();
		if (upper.Complete()) {
			result.push_back(Comparator {Op::LessEqual, upper.Fill()});
		} else if (upper.minor) {
			result.push_back(Comparator {
				Op::Less, Version(upper.major.value(), upper.minor.value() + 1, 0)});
		} else if (upper.major) {
			result.push_back(Comparator {Op::Less, Version(upper.major.value() + 1, 0, 0)});
		}
		return result;
	}

	for (size_t i = 0; i < tokens.size(); i++) {
		string term = tokens[i];
		// Allow `>= 1.2.3`.
		if (IsOperatorOnly(term)) {
			if (i + 1 >= tokens.size()) {
				return expected::unexpected(MakeError(
					InvalidRequirementError, "Operator without version in \"" + str + "\""));
			}
			term += tokens[++i];
		}
		auto err = ParseTerm(term, result);
		if (err != error::NoError) {
			return expected::unexpected(err.WithContext("\"" + str + "\""));
		}
	}
	return result;
}

ExpectedRequirement Requirement::Parse(const string &str) {
	Requirement req;
	req.sets_.clear();
	req.text_ = common::StringTrim(str);

	for (const auto &alternative : common::SplitString(req.text_, "||")) {
		auto set = ParseComparatorSet(alternative);
		if (!set) {
			return expected::unexpected(set.error());
		}
		req.sets_.push_back(set.value());
	}
	return req;
}

bool Requirement::IsSatisfiedBy(const Version &version) const {
	for (const auto &set : sets_) {
		bool all = all_of(set.begin(), set.end(), [&version](const Comparator &c) {
			return c.Matches(version);
		});
		if (!all) {
			continue;
		}
		if (!version.IsPrerelease()) {
			return true;
		}
		bool allowed = any_of(set.begin(), set.end(), [&version](const Comparator &c) {
			return c.version.IsPrerelease() && c.version.SameTuple(version);
		});
		if (allowed) {
			return true;
		}
	}
	return false;
}

} // namespace semver
} // namespace core
} // namespace edgedeploy
