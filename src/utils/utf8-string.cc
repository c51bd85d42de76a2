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

#include "utf8-string.hh"

#include <stdexcept>
#include <string>
#include <vector>

#include <iconv.h>

namespace {

// Thin wrapper around iconv* functions
class IConv {
public:
	IConv(const char* toCode, const char* fromCode) : mDescriptor(iconv_open(toCode, fromCode)) {
		if (mDescriptor == reinterpret_cast<iconv_t>(-1)) {
			throw std::runtime_error{"iconv_open() failed for UTF-8 validation"};
		}
	}
	~IConv() {
		iconv_close(mDescriptor);
	}

	IConv(const IConv&) = delete;
	IConv(IConv&&) = delete;
	IConv& operator=(const IConv&) = delete;
	IConv& operator=(IConv&&) = delete;

	size_t operator()(char** inBuf, size_t* inBytesLeft, char** outBuf, size_t* outBytesLeft) {
		return iconv(mDescriptor, inBuf, inBytesLeft, outBuf, outBytesLeft);
	}

private:
	iconv_t mDescriptor;
};

} // namespace

namespace tokenbridge {

namespace utils {

bool isValidUtf8(const std::string& source) {
	if (source.empty()) return true;

	std::string input{source};
	IConv converter("UTF-8", "UTF-8");
	size_t inBytesLeft = input.size();
	size_t outBytesLeft = inBytesLeft;
	char* pInBuf = &input.front();
	std::vector<char> outBuf(outBytesLeft);
	char* pOutBuf = outBuf.data();
	// A truncated trailing sequence makes iconv stop with EINVAL without returning an error, hence the remaining
	// bytes check.
	return converter(&pInBuf, &inBytesLeft, &pOutBuf, &outBytesLeft) != static_cast<size_t>(-1) && inBytesLeft == 0;
}

} // namespace utils

} // namespace tokenbridge
