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

#include "certificate.hh"

#include <cstdio>
#include <stdexcept>

#include <openssl/pem.h>

#include "tokenbridge/logmanager.hh"

using namespace std;

namespace tokenbridge::tester {

TlsCertificate::TlsCertificate(const TlsPrivateKey& pKey, const long validitySeconds) {
	auto* key = pKey.getKey();
	mX509 = X509_new();
	if (mX509 == nullptr) throw runtime_error{"X509 allocation failed"};

	ASN1_INTEGER_set(X509_get_serialNumber(mX509), 1);
	long certificateValidityStartOffset = 0;
	if (validitySeconds < 0) certificateValidityStartOffset = 2 * validitySeconds;

	X509_gmtime_adj(X509_get_notBefore(mX509), certificateValidityStartOffset);
	X509_gmtime_adj(X509_get_notAfter(mX509), validitySeconds);
	X509_set_pubkey(mX509, key);
	auto* name = X509_get_subject_name(mX509);
	X509_NAME_add_entry_by_txt(name, "C", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("FR"), -1, -1, 0);
	X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("Token Bridge"), -1, -1,
	                           0);
	X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
	X509_set_issuer_name(mX509, name);
	if (X509_sign(mX509, key, EVP_sha256()) == 0) {
		X509_free(mX509);
		throw runtime_error{"failed to sign test certificate"};
	}
}

TlsCertificate::~TlsCertificate() {
	X509_free(mX509);
}

void TlsCertificate::openAndWriteCertificate(const filesystem::path& filePath, const string& openingMode) const {
	SLOGD << "Writing certificate to " << filePath;
	auto* f = fopen(filePath.c_str(), openingMode.c_str());
	if (f == nullptr) throw runtime_error{"cannot open " + filePath.string()};
	const auto written = PEM_write_X509(f, mX509);
	fclose(f);
	if (!written) throw runtime_error{"failed to write certificate to " + filePath.string()};
}

void TlsCertificate::appendToFile(const filesystem::path& filePath) const {
	openAndWriteCertificate(filePath, "ab");
}

void TlsCertificate::writeToFile(const filesystem::path& filePath) const {
	openAndWriteCertificate(filePath, "wb");
}

} // namespace tokenbridge::tester
