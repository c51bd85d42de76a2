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
#include <stdexcept>

#include "sofia-sip/su_wait.h"

namespace sofiasip {

/**
 * Owner of a sofia-sip event loop (su_root_t).
 */
class SuRoot {
public:
	using NativeDuration = std::chrono::duration<su_duration_t, std::milli>;

	SuRoot() : mCPtr{su_root_create(nullptr)} {
		if (mCPtr == nullptr) {
			throw std::runtime_error{"su_root_t allocation failed"};
		}
	}
	SuRoot(const SuRoot&) = delete;
	~SuRoot() {
		su_root_destroy(mCPtr);
	}

	su_root_t* getCPtr() const noexcept {
		return mCPtr;
	}

	template <typename Duration>
	auto step(Duration timeout) {
		return static_cast<NativeDuration>(
		    su_root_step(mCPtr, std::chrono::duration_cast<NativeDuration>(timeout).count()));
	}


	/**
	 * Post a function to be executed by the thread running this loop.
	 * Functions posted from the same thread are executed in posting order.
	 * @throw std::runtime_error if the message carrying the function could not be created or sent.
	 */
	void addToMainLoop(const std::function<void()>& functionToAdd);

private:
	static void mainLoopFunctionCallback(su_root_magic_t* rm, su_msg_r msg, void* u) noexcept;
	static void mainLoopFunctionCallbackDeinitializer(su_msg_arg_t* data) noexcept;

	::su_root_t* mCPtr{nullptr};
};

} // namespace sofiasip
