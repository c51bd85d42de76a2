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

#include <ostream>
#include <utility>
#include <variant>

namespace tokenbridge {

/**
 * Print the alternative currently held by a std::variant, provided every alternative can be written to a stream.
 *
 * Usage: SLOGD << "Outcome: " << StreamableVariant(outcome);
 */
template <typename Variant>
struct StreamableVariant {
	const Variant& variant;

	explicit StreamableVariant(const Variant& v) : variant(v) {
	}
};

template <typename Variant>
std::ostream& operator<<(std::ostream& stream, const StreamableVariant<Variant>& wrapped) {
	std::visit([&stream](const auto& alternative) { stream << alternative; }, wrapped.variant);
	return stream;
}

// Visitor built from a set of lambdas.
template <class... Ts>
struct overloaded : Ts... {
	using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/**
 * Pattern match a std::variant against a set of lambdas, one of which must accept the held alternative.
 * A generic lambda (`[](const auto&) {}`) can be used as a catch-all.
 */
template <class Variant>
class Match {
public:
	explicit Match(Variant&& v) : mVariant(std::forward<Variant>(v)) {
	}

	template <class... Patterns>
	decltype(auto) against(Patterns... patterns) && {
		return std::visit(overloaded{patterns...}, std::forward<Variant>(mVariant));
	}

private:
	Variant mVariant;
};
template <typename T>
Match(T&&) -> Match<T>;

} // namespace tokenbridge
