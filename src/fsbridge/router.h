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

#include "request.h"
#include "session.h"
#include <capnp/message.h>

KJ_BEGIN_HEADER

namespace fsbridge {

struct WorkerOptions {
  uint64_t maxReadLength = 16u << 20;
  // read-file-at requests asking for more than this many bytes fail with INVALID_ARGUMENT.

  uint64_t maxReadAllSize = 48u << 20;
  // read-file-all of a file larger than this fails with INVALID_ARGUMENT.  Must leave room under
  // readerOptions.traversalLimitInWords on the receiving side.

  uint maxFdsPerMessage = 1;
  // Descriptors accepted alongside one request.  Extras are closed on arrival.

  capnp::ReaderOptions readerOptions;
};

class Router {
  // Owns the directory session and carries out decoded requests against it.  Lives on the worker
  // thread; every method must be called from there.
  //
  // cleanup and set-directory complete synchronously, so requests that arrive after them always
  // observe their effect.  File operations may interleave freely with each other.

public:
  explicit Router(WorkerOptions options = WorkerOptions());
  KJ_DISALLOW_COPY_AND_MOVE(Router);

  kj::Promise<Outcome> dispatch(Operation&& operation);
  // May throw synchronously, e.g. NO_SESSION_ACTIVE when there is no session.

  kj::Promise<void> handle(protocol::Request::Reader request,
                           kj::ArrayPtr<kj::AutoCloseFd> fds,
                           protocol::Response::Builder response);
  // Decodes, dispatches, and fills in `response`, which always ends up holding either a result
  // or an error; the returned promise never rejects.  `request` is only used synchronously, but
  // `response` must remain valid until the promise resolves.

  bool hasSession() { return sessions.get() != kj::none; }

private:
  WorkerOptions options;
  SessionSlot sessions;
};

}  // namespace fsbridge

KJ_END_HEADER
