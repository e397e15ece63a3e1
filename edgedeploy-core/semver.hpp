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


#ifndef EDGEDEPLOY_CORE_SEMVER_HPP
#define EDGEDEPLOY_CORE_SEMVER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <common/error.hpp>
#include <common/expected.hpp>

namespace edgedeploy {
namespace core {
namespace semver {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;

enum SemverErrorCode {
	NoError = 0,
	InvalidVersionError,
	InvalidRequirementError,
};

class SemverErrorCategoryClass : public std::error_category {
public:
	const char *name() const noexcept override;
	string message(int code) const override;
};
extern const SemverErrorCategoryClass SemverErrorCategory;

error::Error MakeError(SemverErrorCode code, const string &msg);

class Version;
using ExpectedVersion = expected::expected<Version, error::Error>;

// MAJOR.MINOR.PATCH[-prerelease][+build], ordered by semver 2.0 precedence. The build metadata
// is kept for printing but never takes part in comparisons.
class Version {
public:
	Version() = default;
	Version(int64_t major, int64_t minor, int64_t patch, vector<string> prerelease = {});

	static ExpectedVersion Parse(const string &str);

	int64_t Major() const {
		return major_;
	}
	int64_t Minor() const {
		return minor_;
	}
	int64_t Patch() const {
		return patch_;
	}
	const vector<string> &Prerelease() const {
		return prerelease_;
	}
	bool IsPrerelease() const {
		return !prerelease_.empty();
	}
	bool SameTuple(const Version &other) const {
		return major_ == other.major_ && minor_ == other.minor_ && patch_ == other.patch_;
	}

	string String() const;

	// Negative, zero or positive like `strcmp`.
	int Compare(const Version &other) const;

	bool operator==(const Version &other) const {
		return Compare(other) == 0;
	}
	bool operator!=(const Version &other) const {
		return Compare(other) != 0;
	}
	bool operator<(const Version &other) const {
		return Compare(other) < 0;
	}
	bool operator<=(const Version &other) const {
		return Compare(other) <= 0;
	}
	bool operator>(const Version &other) const {
		return Compare(other) > 0;
	}
	bool operator>=(const Version &other) const {
		return Compare(other) >= 0;
	}

private:
	int64_t major_ {0};
	int64_t minor_ {0};
	int64_t patch_ {0};
	vector<string> prerelease_;
	string build_;
};

class Requirement;
using ExpectedRequirement = expected::expected<Requirement, error::Error>;

// A version range expression such as `>=1.2.0 <2.0.0 || ^3.1`.
class Requirement {
public:
	// Matches every release version.
	Requirement() :
		sets_ {{}} {
	}

	static ExpectedRequirement Parse(const string &str);

	// Prerelease versions only match when a comparator of the same comparator set names a
	// prerelease of the same MAJOR.MINOR.PATCH.
	bool IsSatisfiedBy(const Version &version) const;

	const string &String() const {
		return text_;
	}

	enum class Op {
		Equal,
		Greater,
		GreaterEqual,
		Less,
		LessEqual,
	};

	struct Comparator {
		Op op;
		Version version;

		bool Matches(const Version &v) const;
	};

private:
	// Union of intersections.
	vector<vector<Comparator>> sets_;
	string text_;
};

} // namespace semver
} // namespace core
} // namespace edgedeploy

#endif // EDGEDEPLOY_CORE_SEMVER_HPP
