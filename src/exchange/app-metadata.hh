/*
    Token Bridge, an APNS to FCM registration token exchanger.
    Copyright (C) 2010-2025 Belledonne Communications SARL, All rights reserved.

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tokenbridge {
namespace exchange {

/**
 * Description of the application the device tokens belong to.
 * Every field is optional. Missing ones are reported with the placeholder kNotSet.
 */
class AppMetadata {
public:
	static constexpr std::string_view kNotSet{"(not set)"};

	AppMetadata() = default;
	AppMetadata(std::optional<std::string> bundleIdentifier,
	            std::optional<std::string> name = std::nullopt,
	            std::optional<std::string> version = std::nullopt,
	            std::optional<std::string> build = std::nullopt)
	    : mBundleIdentifier(std::move(bundleIdentifier)), mName(std::move(name)), mVersion(std::move(version)),
	      mBuild(std::move(build)) {
	}

	/**
	 * Identifier sent as 'application' to the exchange endpoint.
	 */
	std::string getBundleIdentifier() const {
		return mBundleIdentifier.value_or(std::string{kNotSet});
	}
	std::string getName() const {
		return mName.value_or(std::string{kNotSet});
	}
	std::string getVersion() const {
		return mVersion.value_or(std::string{kNotSet});
	}
	std::string getBuild() const {
		return mBuild.value_or(std::string{kNotSet});
	}

	/**
	 * Diagnostic user agent: "<name>/<version> (build <build>; <os> <release>)".
	 * @return nullopt when the application name is unknown.
	 */
	std::optional<std::string> getUserAgent() const;

private:
	std::optional<std::string> mBundleIdentifier{};
	std::optional<std::string> mName{};
	std::optional<std::string> mVersion{};
	std::optional<std::string> mBuild{};
};

} // namespace exchange
} // namespace tokenbridge
