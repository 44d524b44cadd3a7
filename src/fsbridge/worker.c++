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

#include "worker.h"
#include "errors.h"
#include <kj/debug.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fsbridge {

BridgeWorker::BridgeWorker(kj::AsyncCapabilityStream& stream, WorkerOptions options)
    : stream(kj::heap<capnp::AsyncCapabilityMessageStream>(stream)),
      readerOptions(options.readerOptions),
      router(options),
      fdSpace(kj::heapArray<kj::AutoCloseFd>(options.maxFdsPerMessage)),
      tasks(*this) {}

kj::Promise<void> BridgeWorker::run() {
  return receiveLoop().catch_([](kj::Exception&& exception) {
    // A frame we can't parse leaves us with no way to find the next one.
    KJ_LOG(WARNING, "channel failed; no further requests will be read", exception);
  }).then([this]() {
    return tasks.onEmpty();
  }).then([this]() {
    return kj::mv(previousWrite);
  }).then([this]() {
    return stream->end();
  });
}

kj::Promise<void> BridgeWorker::receiveLoop() {
  return stream->tryReadMessage(fdSpace, readerOptions)
      .then([this](kj::Maybe<capnp::MessageReaderAndFds>&& maybeMessage) -> kj::Promise<void> {
    KJ_IF_SOME(message, maybeMessage) {
      serve(kj::mv(message));
      return receiveLoop();
    } else {
      KJ_LOG(INFO, "application closed the channel");
      return kj::READY_NOW;
    }
  });
}

void BridgeWorker::serve(capnp::MessageReaderAndFds message) {
  auto response = kj::heap<capnp::MallocMessageBuilder>();
  auto root = response->initRoot<protocol::Response>();

  kj::Promise<void> promise = nullptr;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
    promise = router.handle(message.reader->getRoot<protocol::Request>(), message.fds, root);
  })) {
    // Router::handle() reports everything that goes wrong with the request itself; only a frame
    // without a valid root struct gets here.  There is no id to echo.
    KJ_LOG(WARNING, "received a frame that is not a request", exception);
    encodeError(FSBRIDGE_EXCEPTION(MALFORMED_REQUEST,
        "frame does not contain a request: ", exception.getDescription()), root);
    promise = kj::READY_NOW;
  }

  // Anything attached but not claimed by the request is closed now, before the next read reuses
  // the space.
  for (auto& fd: message.fds) {
    fd = kj::AutoCloseFd();
  }

  tasks.add(promise.then([this, response = kj::mv(response)]() mutable {
    send(kj::mv(response));
  }));
}

void BridgeWorker::send(kj::Own<capnp::MallocMessageBuilder> message) {
  previousWrite = previousWrite.then([this, message = kj::mv(message)]() mutable {
    return stream->writeMessage(*message).attach(kj::mv(message));
  }).eagerlyEvaluate([](kj::Exception&& exception) {
    KJ_LOG(WARNING, "failed to write response", exception);
  });
}

void BridgeWorker::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, exception);
}

// =======================================================================================

namespace {

#if __linux__
static constexpr uint WORKER_FD_FLAGS =
    kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
    kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC |
    kj::LowLevelAsyncIoProvider::ALREADY_NONBLOCK;
#else
static constexpr uint WORKER_FD_FLAGS = kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP;
#endif

}  // namespace

WorkerThread startWorkerThread(kj::LowLevelAsyncIoProvider& lowLevel, WorkerOptions options) {
  int fds[2];
  int type = SOCK_STREAM;
#if __linux__
  type |= SOCK_NONBLOCK | SOCK_CLOEXEC;
#endif
  KJ_SYSCALL(socketpair(AF_UNIX, type, 0, fds));

  int workerFd = fds[1];
  KJ_ON_SCOPE_FAILURE(close(workerFd));

  auto channel = lowLevel.wrapUnixSocketFd(fds[0], WORKER_FD_FLAGS);

  auto thread = kj::heap<kj::Thread>([workerFd, options = kj::mv(options)]() mutable {
    auto io = kj::setupAsyncIo();
    auto stream = io.lowLevelProvider->wrapUnixSocketFd(workerFd, WORKER_FD_FLAGS);
    BridgeWorker worker(*stream, kj::mv(options));
    worker.run().wait(io.waitScope);
  });

  return { kj::mv(thread), kj::mv(channel) };
}

}  // namespace fsbridge
