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

#include <stdexcept>

#include "sofia-sip/su_wait.h"

#include "tokenbridge/logmanager.hh"
#include "tokenbridge/sofia-wrapper/su-root.hh"
#include "tokenbridge/sofia-wrapper/timer.hh"

using namespace std;

namespace sofiasip {

Timer::Timer(su_root_t* root, NativeDuration interval) {
	mTimer = su_timer_create(su_root_task(root), interval.count());
	if (mTimer == nullptr) throw logic_error("fail to instantiate the timer");
}

Timer::Timer(const SuRoot& root, NativeDuration interval) : Timer{root.getCPtr(), interval} {
}

Timer::~Timer() {
	su_timer_destroy(mTimer);
}

void Timer::set(const Func& func) {
	if (su_timer_set(mTimer, onExpired, this) != 0) throw logic_error("failed to set the timer");
	mFunc = func;
}

void Timer::onExpired([[maybe_unused]] su_root_magic_t* magic,
                      [[maybe_unused]] su_timer_t* t,
                      su_timer_arg_t* arg) noexcept {
	auto* timer = static_cast<Timer*>(arg);

	// Emptied before the call: the function may set the timer again, with another function.
	Func func;
	func.swap(timer->mFunc);
	try {
		func();
	} catch (const exception& e) {
		SLOGE << "Timer[" << timer << "] - uncaught exception in timer function: " << e.what();
	}
}

} // namespace sofiasip
