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

namespace fsbridge {

namespace {

constexpr ErrorCode ALL_CODES[] = {
  ErrorCode::FAILED,
  ErrorCode::NO_SESSION_ACTIVE,
  ErrorCode::INVALID_ARGUMENT,
  ErrorCode::NOT_FOUND,
  ErrorCode::MALFORMED_REQUEST,
  ErrorCode::DISCONNECTED,
};

constexpr char PREFIX[] = "fsbridge.";

kj::Maybe<size_t> prefixLength(kj::StringPtr description, ErrorCode code) {
  // If `description` starts with the prefix for `code`, returns the length of that prefix
  // including the trailing ": ".

  kj::StringPtr rest = description;
  if (!rest.startsWith(PREFIX)) return kj::none;
  rest = rest.slice(sizeof(PREFIX) - 1);

  kj::StringPtr name = errorCodeName(code);
  if (!rest.startsWith(name)) return kj::none;
  rest = rest.slice(name.size());

  if (!rest.startsWith(": ")) return kj::none;
  return description.size() - rest.size() + 2;
}

}  // namespace

kj::Exception makeError(ErrorCode code, const char* file, int line, kj::String message) {
  auto type = code == ErrorCode::DISCONNECTED
      ? kj::Exception::Type::DISCONNECTED : kj::Exception::Type::FAILED;
  return kj::Exception(type, file, line, kj::str(PREFIX, errorCodeName(code), ": ", message));
}

kj::StringPtr errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::FAILED: return "failed";
    case ErrorCode::NO_SESSION_ACTIVE: return "noSessionActive";
    case ErrorCode::INVALID_ARGUMENT: return "invalidArgument";
    case ErrorCode::NOT_FOUND: return "notFound";
    case ErrorCode::MALFORMED_REQUEST: return "malformedRequest";
    case ErrorCode::DISCONNECTED: return "disconnected";
  }
  return "unknown";
}

ErrorCode getErrorCode(const kj::Exception& exception) {
  auto description = exception.getDescription();
  for (auto code: ALL_CODES) {
    if (prefixLength(description, code) != kj::none) return code;
  }

  if (exception.getType() == kj::Exception::Type::DISCONNECTED) {
    return ErrorCode::DISCONNECTED;
  }
  return ErrorCode::FAILED;
}

kj::StringPtr getErrorMessage(const kj::Exception& exception) {
  auto description = exception.getDescription();
  for (auto code: ALL_CODES) {
    KJ_IF_SOME(length, prefixLength(description, code)) {
      return description.slice(length);
    }
  }
  return description;
}

}  // namespace fsbridge
