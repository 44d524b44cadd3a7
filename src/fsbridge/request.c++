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

#include "request.h"
#include "errors.h"
#include <kj/debug.h>

namespace fsbridge {

namespace {

VirtualPath requirePath(bool present, capnp::Text::Reader text, protocol::Request::Which which) {
  if (!present) {
    FSBRIDGE_FAIL(MALFORMED_REQUEST, operationName(which), " request has no path");
  }
  return VirtualPath::parse(text);
}

struct PendingGrant {
  uint index;
};
// A set-directory request whose descriptor has not been classified yet.

typedef kj::OneOf<Operation, PendingGrant> Decoded;

Decoded decodeImpl(protocol::Request::Reader request, kj::ArrayPtr<kj::AutoCloseFd> fds) {
  auto which = request.which();
  switch (which) {
    case protocol::Request::UNSET:
      FSBRIDGE_FAIL(MALFORMED_REQUEST, "request does not name an operation");

    case protocol::Request::CLEANUP:
      return Operation(Cleanup());

    case protocol::Request::SET_DIRECTORY: {
      if (!request.hasSetDirectory()) {
        FSBRIDGE_FAIL(MALFORMED_REQUEST, "set-directory request has no grant");
      }
      uint index = request.getSetDirectory().getFdIndex();
      if (index >= fds.size() || fds[index].get() < 0) {
        FSBRIDGE_FAIL(INVALID_ARGUMENT,
            "set-directory request carries no capability at index ", index,
            "; ", fds.size(), " attached");
      }
      return PendingGrant { index };
    }

    case protocol::Request::ENTRY_EXISTS:
      return Operation(EntryExists {
        requirePath(request.hasEntryExists(), request.getEntryExists(), which) });

    case protocol::Request::GET_FILE_SIZE:
      return Operation(GetFileSize {
        requirePath(request.hasGetFileSize(), request.getGetFileSize(), which) });

    case protocol::Request::READ_FILE_ALL:
      return Operation(ReadFileAll {
        requirePath(request.hasReadFileAll(), request.getReadFileAll(), which) });

    case protocol::Request::READ_FILE_AT: {
      auto args = request.getReadFileAt();
      return Operation(ReadFileAt {
        requirePath(args.hasPath(), args.getPath(), which), args.getOffset(), args.getLength() });
    }
  }

  FSBRIDGE_FAIL(MALFORMED_REQUEST, "unknown operation ", static_cast<uint>(which));
}

}  // namespace

Operation decodeRequest(protocol::Request::Reader request, kj::ArrayPtr<kj::AutoCloseFd> fds) {
  kj::Maybe<Decoded> result;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
    result = decodeImpl(request, fds);
  })) {
    if (getErrorCode(exception) == ErrorCode::FAILED) {
      // Typically a pointer that fails validation inside the message.
      FSBRIDGE_FAIL(MALFORMED_REQUEST, "request could not be decoded: ",
                    exception.getDescription());
    }
    kj::throwFatalException(kj::mv(exception));
  }

  auto& decoded = KJ_ASSERT_NONNULL(result);
  KJ_SWITCH_ONEOF(decoded) {
    KJ_CASE_ONEOF(operation, Operation) {
      return kj::mv(operation);
    }
    KJ_CASE_ONEOF(grant, PendingGrant) {
      // Failures here come from the host, not from the message.
      return SetDirectory { adoptHostHandle(kj::mv(fds[grant.index])) };
    }
  }
  KJ_UNREACHABLE;
}

kj::StringPtr operationName(protocol::Request::Which which) {
  switch (which) {
    case protocol::Request::UNSET: return "unset";
    case protocol::Request::CLEANUP: return "cleanup";
    case protocol::Request::SET_DIRECTORY: return "set-directory";
    case protocol::Request::ENTRY_EXISTS: return "entry-exists";
    case protocol::Request::GET_FILE_SIZE: return "get-file-size";
    case protocol::Request::READ_FILE_ALL: return "read-file-all";
    case protocol::Request::READ_FILE_AT: return "read-file-at";
  }
  return "unknown";
}

void encodeOutcome(Outcome&& outcome, protocol::Response::Builder response) {
  KJ_SWITCH_ONEOF(outcome) {
    KJ_CASE_ONEOF(ack, Ack) {
      response.setAck();
    }
    KJ_CASE_ONEOF(exists, Exists) {
      response.setExists(exists.value);
    }
    KJ_CASE_ONEOF(size, FileSize) {
      response.setSize(size.bytes);
    }
    KJ_CASE_ONEOF(contents, FileContents) {
      response.setContents(capnp::Data::Reader(contents.bytes.begin(), contents.bytes.size()));
    }
    KJ_CASE_ONEOF(read, BytesRead) {
      auto results = response.initRead();
      results.setBytesRead(read.count);
      results.setData(capnp::Data::Reader(read.buffer.begin(), read.count));
    }
  }
}

void encodeError(const kj::Exception& exception, protocol::Response::Builder response) {
  auto error = response.initError();
  error.setCode(getErrorCode(exception));
  error.setMessage(getErrorMessage(exception));
}

}  // namespace fsbridge
