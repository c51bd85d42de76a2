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

#include <chrono>
#include <functional>

#include "sofia-sip/su_wait.h"

namespace sofiasip {

class SuRoot;

/**
 * @brief Wrapper for SofiaSip's timers.
 */
class Timer {
public:
	/**
	 * @brief Callback that is called when the timer expires.
	 */
	using Func = std::function<void()>;
	using NativeDuration = std::chrono::duration<su_duration_t, std::milli>;

	/**
	 * @brief Create a timer.
	 * @param[in] root SofiaSip's event loop.
	 * @param[in] interval Timer expiration interval.
	 * @throw std::logic_error if the timer couldn't been created.
	 */
	Timer(su_root_t* root, NativeDuration interval);
	Timer(const SuRoot& root, NativeDuration interval);

	/**
	 * @brief Destroying a timer cancels it, the function is never called.
	 */
	~Timer();

	// Copying or moving a timer has no sense.
	Timer(const Timer&) = delete;
	Timer(Timer&&) = delete;

	/**
	 * @brief (Re)start the timer. A timer already running is rescheduled and its previous function dropped.
	 *
	 * @param[in] func The function to call when the timer expires. The context of the function is copied and
	 * automatically destroyed on timer expiration.
	 * @throw std::logic_error if the timer could not be set.
	 */
	void set(const Func& func);

private:
	static void onExpired(su_root_magic_t* magic, su_timer_t* t, su_timer_arg_t* arg) noexcept;

	su_timer_t* mTimer{};
	Func mFunc;
};

} // namespace sofiasip
