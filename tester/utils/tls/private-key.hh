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

#include <filesystem>

#include <openssl/evp.h>

namespace tokenbridge::tester {

/**
 * RSA 2048 private key generated on construction.
 */
class TlsPrivateKey {
public:
	TlsPrivateKey();
	~TlsPrivateKey();

	TlsPrivateKey(const TlsPrivateKey&) = delete;
	TlsPrivateKey& operator=(const TlsPrivateKey&) = delete;

	EVP_PKEY* getKey() const {
		return mKey;
	}

	/**
	 * Write the key in PEM format, unencrypted.
	 * @throw std::runtime_error if the file could not be written.
	 */
	void writeToFile(const std::filesystem::path& keyPath) const;

private:
	EVP_PKEY* mKey = nullptr;
};

} // namespace tokenbridge::tester
