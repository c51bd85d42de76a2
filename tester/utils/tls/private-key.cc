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

#include "private-key.hh"

#include <cstdio>
#include <stdexcept>

#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "tokenbridge/logmanager.hh"

using namespace std;

namespace tokenbridge::tester {

TlsPrivateKey::TlsPrivateKey() {
#if OPENSSL_VERSION_MAJOR >= 3
	mKey = EVP_RSA_gen(2048);
#else
	mKey = EVP_PKEY_new();
	auto* rsa = RSA_new();
	auto* bne = BN_new();
	BN_set_word(bne, RSA_F4);
	RSA_generate_key_ex(rsa, 2048, bne, nullptr);
	EVP_PKEY_assign_RSA(mKey, rsa);
	BN_free(bne);
#endif
	if (mKey == nullptr) throw runtime_error{"failed to generate RSA private key"};
}

TlsPrivateKey::~TlsPrivateKey() {
	if (mKey) EVP_PKEY_free(mKey);
}

void TlsPrivateKey::writeToFile(const filesystem::path& keyPath) const {
	auto* f = fopen(keyPath.c_str(), "wb");
	if (f == nullptr) throw runtime_error{"cannot open " + keyPath.string() + " for writing"};

	const auto written = PEM_write_PrivateKey(f, mKey, nullptr, nullptr, 0, nullptr, nullptr);
	fclose(f);
	if (!written) throw runtime_error{"failed to write private key to " + keyPath.string()};
	SLOGD << "Private key written to " << keyPath;
}

} // namespace tokenbridge::tester
