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

#include "errors.h"
#include <kj/test.h>

namespace fsbridge {
namespace {

KJ_TEST("classified exceptions carry their code") {
  auto e = FSBRIDGE_EXCEPTION(NOT_FOUND, "no such file: ", "a/b");
  KJ_EXPECT(e.getType() == kj::Exception::Type::FAILED);
  KJ_EXPECT(e.getDescription() == "fsbridge.notFound: no such file: a/b");
  KJ_EXPECT(getErrorCode(e) == ErrorCode::NOT_FOUND);
  KJ_EXPECT(getErrorMessage(e) == "no such file: a/b");

  auto d = FSBRIDGE_EXCEPTION(DISCONNECTED, "gone");
  KJ_EXPECT(d.getType() == kj::Exception::Type::DISCONNECTED);
  KJ_EXPECT(getErrorCode(d) == ErrorCode::DISCONNECTED);

  KJ_EXPECT_THROW_MESSAGE("fsbridge.malformedRequest: bad",
      FSBRIDGE_FAIL(MALFORMED_REQUEST, "bad"));
}

KJ_TEST("unclassified exceptions") {
  auto plain = KJ_EXCEPTION(FAILED, "disk on fire");
  KJ_EXPECT(getErrorCode(plain) == ErrorCode::FAILED);
  KJ_EXPECT(getErrorMessage(plain) == plain.getDescription());

  auto lost = KJ_EXCEPTION(DISCONNECTED, "peer hung up");
  KJ_EXPECT(getErrorCode(lost) == ErrorCode::DISCONNECTED);

  // A prefix naming no known code is left alone.
  auto odd = KJ_EXCEPTION(FAILED, "fsbridge.bogus: x");
  KJ_EXPECT(getErrorCode(odd) == ErrorCode::FAILED);
  KJ_EXPECT(getErrorMessage(odd) == "fsbridge.bogus: x");
}

KJ_TEST("error code names match the schema") {
  KJ_EXPECT(errorCodeName(ErrorCode::NO_SESSION_ACTIVE) == "noSessionActive");
  KJ_EXPECT(errorCodeName(ErrorCode::INVALID_ARGUMENT) == "invalidArgument");
  KJ_EXPECT(errorCodeName(ErrorCode::MALFORMED_REQUEST) == "malformedRequest");
}

}  // namespace
}  // namespace fsbridge
