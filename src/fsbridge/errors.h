// Copyright (c) 2026 fsbridge contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once

#include <fsbridge/protocol.capnp.h>
#include <kj/exception.h>
#include <kj/string.h>

KJ_BEGIN_HEADER

namespace fsbridge {

using protocol::ErrorCode;

kj::Exception makeError(ErrorCode code, const char* file, int line, kj::String message);
// Builds an exception carrying `code`.  The description takes the form
// "fsbridge.<codeName>: <message>" so that the code survives any layer which only passes
// kj::Exceptions along.

#define FSBRIDGE_EXCEPTION(code, ...) \
  ::fsbridge::makeError(::fsbridge::ErrorCode::code, __FILE__, __LINE__, ::kj::str(__VA_ARGS__))
// Like KJ_EXCEPTION(), but classified.  `code` is an ErrorCode enumerant, e.g. NOT_FOUND.

#define FSBRIDGE_FAIL(code, ...) \
  ::kj::throwFatalException(FSBRIDGE_EXCEPTION(code, ##__VA_ARGS__))

kj::StringPtr errorCodeName(ErrorCode code);
// Schema name of the code, e.g. "notFound".

ErrorCode getErrorCode(const kj::Exception& exception);
// Recovers the code from an exception built by makeError().  Anything else is FAILED, except
// exceptions of type DISCONNECTED, which map to DISCONNECTED.

kj::StringPtr getErrorMessage(const kj::Exception& exception);
// The description without the "fsbridge.<code>: " prefix.

}  // namespace fsbridge

KJ_END_HEADER
