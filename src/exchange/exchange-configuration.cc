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

#include "exchange-configuration.hh"

#include "tokenbridge/logmanager.hh"

#include "exceptions/bad-configuration.hh"

using namespace std;

namespace tokenbridge {
namespace exchange {

void ExchangeConfiguration::configure(const string& apiKey, ApnsEnvironment environment) {
	if (isComplete()) {
		SLOGD << "ExchangeConfiguration[" << this << "]: overwriting previous configuration";
	}
	mApiKey = apiKey;
	mEnvironment = environment;
	SLOGD << "ExchangeConfiguration[" << this << "]: configured for APNS " << environment << " environment";
}

const string& ExchangeConfiguration::getApiKey() const {
	if (!mApiKey) throw BadConfigurationEmpty{"api key"};
	return *mApiKey;
}

ApnsEnvironment ExchangeConfiguration::getEnvironment() const {
	if (!mEnvironment) throw BadConfigurationEmpty{"environment"};
	return *mEnvironment;
}

} // namespace exchange
} // namespace tokenbridge
