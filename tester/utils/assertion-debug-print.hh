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
#include <ostream>
#include <variant>

namespace tokenbridge::tester {

/**
 * Print the alternative held by a variant, so variants can be used with BC_ASSERT_CPP_EQUAL.
 */
template <typename... Alternatives>
std::ostream& operator<<(std::ostream& stream, const std::variant<Alternatives...>& variant) {
	std::visit([&stream](const auto& alternative) { stream << alternative; }, variant);
	return stream;
}

template <typename T>
std::ostream& operator<<(std::ostream& stream, const std::optional<T>& optional) {
	if (!optional) return stream << "std::nullopt";
	return stream << "std::optional{" << *optional << "}";
}

} // namespace tokenbridge::tester
