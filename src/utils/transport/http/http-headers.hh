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

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nghttp2/nghttp2.h>

namespace tokenbridge {

/**
 * Ordered list of HTTP headers.
 * The list can be converted into an nghttp2 formatted header list, see HttpHeaders::makeCHeaderList
 */
class HttpHeaders {
public:
	struct Header {
		std::string name{};
		std::string value{};
		std::uint8_t flags{NGHTTP2_NV_FLAG_NONE};
	};

	using HeadersList = std::vector<Header>;
	using CHeaderList = std::vector<nghttp2_nv>;

	HttpHeaders() = default;
	HttpHeaders(std::initializer_list<std::pair<std::string, std::string>> headers) {
		for (const auto& header : headers) {
			add(header.first, header.second);
		}
	}

	const HeadersList& getHeadersList() const {
		return mHList;
	}

	/**
	 * Add a header or replace the value of the header of the same name.
	 */
	void add(const std::string& name, const std::string& value, std::uint8_t flags = NGHTTP2_NV_FLAG_NONE) noexcept;
	std::optional<std::string> get(const std::string& name) const;

	std::string toString() const noexcept;

	/**
	 * @warning the returned list points to the strings of this object and is valid as long as it is not modified.
	 */
	CHeaderList makeCHeaderList() const noexcept;

private:
	HeadersList mHList{};
};

} // namespace tokenbridge
