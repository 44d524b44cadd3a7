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

#include "router.h"
#include <capnp/serialize-async.h>
#include <kj/async-io.h>
#include <kj/thread.h>

KJ_BEGIN_HEADER

namespace fsbridge {

class BridgeWorker final: private kj::TaskSet::ErrorHandler {
  // Serves the bridge protocol over one channel.  Each request is handed to the Router as soon as
  // it arrives; responses are written in completion order, which need not match request order.

public:
  BridgeWorker(kj::AsyncCapabilityStream& stream, WorkerOptions options = WorkerOptions());
  KJ_DISALLOW_COPY_AND_MOVE(BridgeWorker);

  kj::Promise<void> run();
  // Serves until the application closes its end of the channel, then waits for outstanding
  // requests, flushes their responses, and ends the stream.  The directory session, if any, is
  // torn down when the worker is destroyed.

private:
  kj::Own<capnp::MessageStream> stream;
  capnp::ReaderOptions readerOptions;
  Router router;
  kj::Array<kj::AutoCloseFd> fdSpace;
  kj::Promise<void> previousWrite = kj::READY_NOW;
  kj::TaskSet tasks;

  kj::Promise<void> receiveLoop();
  void serve(capnp::MessageReaderAndFds message);
  void send(kj::Own<capnp::MallocMessageBuilder> message);

  void taskFailed(kj::Exception&& exception) override;
};

struct WorkerThread {
  kj::Own<kj::Thread> thread;
  kj::Own<kj::AsyncCapabilityStream> channel;
  // The application's end of the channel.  Dropping it makes the worker shut down, after which
  // destroying `thread` joins it.
};

WorkerThread startWorkerThread(kj::LowLevelAsyncIoProvider& lowLevel,
                               WorkerOptions options = WorkerOptions());
// Creates a socket pair and starts a thread, with its own event loop, running a BridgeWorker on
// one end.  The other end is wrapped using `lowLevel`, which must belong to the calling thread.

}  // namespace fsbridge

KJ_END_HEADER
