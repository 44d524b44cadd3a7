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

#include "router.h"
#include "errors.h"
#include <kj/debug.h>
#include <kj/time.h>

namespace fsbridge {

Router::Router(WorkerOptions options): options(kj::mv(options)) {}

kj::Promise<Outcome> Router::dispatch(Operation&& operation) {
  KJ_SWITCH_ONEOF(operation) {
    KJ_CASE_ONEOF(op, Cleanup) {
      sessions.clear();
      return Outcome(Ack());
    }

    KJ_CASE_ONEOF(op, SetDirectory) {
      KJ_IF_SOME(dir, op.handle.tryGet<HostDirectory>()) {
        sessions.install(kj::mv(dir));
        return Outcome(Ack());
      }
      FSBRIDGE_FAIL(INVALID_ARGUMENT,
          "set-directory requires a directory capability; received a ", describeHandle(op.handle));
    }

    KJ_CASE_ONEOF(op, EntryExists) {
      auto& session = sessions.require();
      return session.wrap(session.exists(op.path))
          .then([](bool exists) -> Outcome { return Exists { exists }; });
    }

    KJ_CASE_ONEOF(op, GetFileSize) {
      auto& session = sessions.require();
      return session.wrap(session.openFile(op.path))
          .then([](kj::Own<OpenFileHandle>&& handle) -> Outcome {
        return FileSize { handle->getSize() };
      });
    }

    KJ_CASE_ONEOF(op, ReadFileAll) {
      auto& session = sessions.require();
      return session.wrap(session.openFile(op.path))
          .then([limit = options.maxReadAllSize](kj::Own<OpenFileHandle>&& handle) -> Outcome {
        auto size = handle->getSize();
        if (size > limit) {
          FSBRIDGE_FAIL(INVALID_ARGUMENT, "file too large to read whole; ", handle->getPath(),
                        " is ", size, " bytes, limit is ", limit, "; use read-file-at");
        }
        return FileContents { handle->readAll() };
      });
    }

    KJ_CASE_ONEOF(op, ReadFileAt) {
      auto& session = sessions.require();
      if (op.length > options.maxReadLength) {
        FSBRIDGE_FAIL(INVALID_ARGUMENT, "read length ", op.length, " exceeds limit of ",
                      options.maxReadLength, " bytes");
      }
      return session.wrap(session.openFile(op.path))
          .then([offset = op.offset, length = op.length](kj::Own<OpenFileHandle>&& handle)
              -> Outcome {
        auto buffer = kj::heapArray<kj::byte>(length);
        size_t n = handle->read(offset, buffer);
        return BytesRead { kj::mv(buffer), n };
      });
    }
  }
  KJ_UNREACHABLE;
}

kj::Promise<void> Router::handle(protocol::Request::Reader request,
                                 kj::ArrayPtr<kj::AutoCloseFd> fds,
                                 protocol::Response::Builder response) {
  auto& clock = kj::systemPreciseMonotonicClock();
  auto startTime = clock.now();
  auto id = request.getId();
  auto name = operationName(request.which());
  response.setId(id);

  return kj::evalNow([&]() {
    return dispatch(decodeRequest(request, fds));
  }).then([response](Outcome&& outcome) mutable {
    encodeOutcome(kj::mv(outcome), response);
  }, [response, id, name](kj::Exception&& exception) mutable {
    auto code = getErrorCode(exception);
    if (code == ErrorCode::FAILED) {
      KJ_LOG(ERROR, "request failed", id, name, exception);
    } else {
      KJ_LOG(INFO, "request rejected", id, name, errorCodeName(code), getErrorMessage(exception));
    }
    encodeError(exception, response);
  }).then([&clock, startTime, id, name]() {
    KJ_LOG(INFO, "request complete", id, name,
           (clock.now() - startTime) / kj::MICROSECONDS, "us");
  });
}

}  // namespace fsbridge
