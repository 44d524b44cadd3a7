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

#include "client.h"
#include "errors.h"
#include <kj/debug.h>
#include <string.h>

namespace fsbridge {

namespace {

protocol::Response::Reader expectResponse(capnp::MessageReader& reader,
                                          protocol::Response::Which which,
                                          kj::StringPtr operation) {
  auto response = reader.getRoot<protocol::Response>();
  if (response.which() != which) {
    FSBRIDGE_FAIL(FAILED, "worker answered ", operation, " with the wrong kind of response");
  }
  return response;
}

}  // namespace

BridgeClient::BridgeClient(kj::AsyncCapabilityStream& stream, ClientOptions options)
    : stream(kj::heap<capnp::AsyncCapabilityMessageStream>(stream)),
      options(kj::mv(options)),
      receiveTask(receiveLoop().eagerlyEvaluate(nullptr)) {
  KJ_REQUIRE(this->options.chunkSize > 0, "chunk size must be positive");
}

BridgeClient::~BridgeClient() noexcept(false) {
  for (auto& entry: pending) {
    entry.value->reject(FSBRIDGE_EXCEPTION(DISCONNECTED, "bridge client was destroyed"));
  }
}

kj::Promise<void> BridgeClient::receiveLoop() {
  return stream->tryReadMessage(options.readerOptions)
      .then([this](kj::Maybe<kj::Own<capnp::MessageReader>>&& maybeMessage) -> kj::Promise<void> {
    KJ_IF_SOME(message, maybeMessage) {
      auto id = message->getRoot<protocol::Response>().getId();
      KJ_IF_SOME(fulfiller, pending.find(id)) {
        // The caller may have stopped waiting; fulfilling is harmless either way.
        fulfiller->fulfill(kj::mv(message));
        pending.erase(id);
      } else {
        KJ_LOG(WARNING, "response does not match any outstanding request", id);
      }
      return receiveLoop();
    } else {
      disconnect(FSBRIDGE_EXCEPTION(DISCONNECTED, "worker closed the channel"));
      return kj::READY_NOW;
    }
  }, [this](kj::Exception&& exception) -> kj::Promise<void> {
    disconnect(FSBRIDGE_EXCEPTION(DISCONNECTED, "channel to worker failed: ",
                                  exception.getDescription()));
    return kj::READY_NOW;
  });
}

void BridgeClient::disconnect(kj::Exception&& reason) {
  for (auto& entry: pending) {
    entry.value->reject(kj::cp(reason));
  }
  pending.clear();
  disconnectReason = kj::mv(reason);
}

kj::Promise<kj::Own<capnp::MessageReader>> BridgeClient::call(
    kj::Own<capnp::MallocMessageBuilder> message, kj::Maybe<kj::AutoCloseFd> fd) {
  KJ_IF_SOME(reason, disconnectReason) {
    return kj::cp(reason);
  }

  auto id = nextId++;
  message->getRoot<protocol::Request>().setId(id);

  auto paf = kj::newPromiseAndFulfiller<kj::Own<capnp::MessageReader>>();
  pending.insert(id, kj::mv(paf.fulfiller));

  previousWrite = previousWrite.then(
      [this, message = kj::mv(message), fd = kj::mv(fd)]() mutable -> kj::Promise<void> {
    KJ_IF_SOME(f, fd) {
      auto fds = kj::heapArray<int>({ f.get() });
      auto promise = stream->writeMessage(fds, *message);
      return promise.attach(kj::mv(fds), kj::mv(message), kj::mv(fd));
    }
    return stream->writeMessage(*message).attach(kj::mv(message));
  }).eagerlyEvaluate([this, id](kj::Exception&& exception) {
    KJ_IF_SOME(fulfiller, pending.find(id)) {
      fulfiller->reject(FSBRIDGE_EXCEPTION(DISCONNECTED, "failed to send request: ",
                                           exception.getDescription()));
      pending.erase(id);
    }
  });

  return paf.promise.then([](kj::Own<capnp::MessageReader>&& reader) {
    auto response = reader->getRoot<protocol::Response>();
    if (response.isError()) {
      auto error = response.getError();
      kj::throwFatalException(makeError(error.getCode(), __FILE__, __LINE__,
                                        kj::heapString(error.getMessage())));
    }
    return kj::mv(reader);
  });
}

kj::Promise<void> BridgeClient::setDirectory(kj::AutoCloseFd directory) {
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  message->initRoot<protocol::Request>().initSetDirectory().setFdIndex(0);
  return call(kj::mv(message), kj::mv(directory))
      .then([](kj::Own<capnp::MessageReader>&& reader) {
    expectResponse(*reader, protocol::Response::ACK, "set-directory");
  });
}

kj::Promise<void> BridgeClient::cleanup() {
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  message->initRoot<protocol::Request>().setCleanup();
  return call(kj::mv(message)).then([](kj::Own<capnp::MessageReader>&& reader) {
    expectResponse(*reader, protocol::Response::ACK, "cleanup");
  });
}

kj::Promise<bool> BridgeClient::entryExists(kj::StringPtr path) {
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  message->initRoot<protocol::Request>().setEntryExists(path);
  return call(kj::mv(message)).then([](kj::Own<capnp::MessageReader>&& reader) {
    return expectResponse(*reader, protocol::Response::EXISTS, "entry-exists").getExists();
  });
}

kj::Promise<bool> BridgeClient::probe(kj::StringPtr path) {
  return entryExists(path).catch_([path = kj::heapString(path)](kj::Exception&& exception) {
    KJ_LOG(ERROR, "existence check failed", path, exception);
    return false;
  });
}

kj::Promise<uint64_t> BridgeClient::getFileSize(kj::StringPtr path) {
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  message->initRoot<protocol::Request>().setGetFileSize(path);
  return call(kj::mv(message)).then([](kj::Own<capnp::MessageReader>&& reader) {
    return expectResponse(*reader, protocol::Response::SIZE, "get-file-size").getSize();
  });
}

kj::Promise<kj::Array<kj::byte>> BridgeClient::readFileAll(kj::StringPtr path) {
  auto message = kj::heap<capnp::MallocMessageBuilder>();
  message->initRoot<protocol::Request>().setReadFileAll(path);
  return call(kj::mv(message)).then([](kj::Own<capnp::MessageReader>&& reader) {
    auto contents =
        expectResponse(*reader, protocol::Response::CONTENTS, "read-file-all").getContents();
    return kj::heapArray<kj::byte>(contents);
  });
}

kj::Promise<size_t> BridgeClient::readFileAt(kj::StringPtr path, kj::ArrayPtr<kj::byte> buffer,
                                             uint64_t offset) {
  uint32_t limit = kj::maxValue;
  if (buffer.size() > limit) {
    return FSBRIDGE_EXCEPTION(INVALID_ARGUMENT,
        "read of ", buffer.size(), " bytes is too large for one request");
  }

  auto message = kj::heap<capnp::MallocMessageBuilder>();
  auto args = message->initRoot<protocol::Request>().initReadFileAt();
  args.setPath(path);
  args.setOffset(offset);
  args.setLength(buffer.size());

  return call(kj::mv(message)).then([buffer](kj::Own<capnp::MessageReader>&& reader) {
    auto read = expectResponse(*reader, protocol::Response::READ, "read-file-at").getRead();
    auto data = read.getData();
    if (data.size() > buffer.size() || data.size() != read.getBytesRead()) {
      FSBRIDGE_FAIL(FAILED, "worker returned ", data.size(), " bytes for a read of ",
                    buffer.size());
    }
    memcpy(buffer.begin(), data.begin(), data.size());
    return data.size();
  });
}

kj::Promise<kj::Own<RemoteFile>> BridgeClient::openFile(kj::StringPtr path) {
  return getFileSize(path).then([this, path = kj::heapString(path)](uint64_t size) mutable {
    return kj::heap<RemoteFile>(*this, kj::mv(path), size);
  });
}

// =======================================================================================

RemoteFile::RemoteFile(BridgeClient& client, kj::String path, uint64_t size)
    : client(client), path(kj::mv(path)), size(size) {}

uint64_t RemoteFile::seek(int64_t offset, Whence whence) {
  uint64_t base = 0;
  switch (whence) {
    case Whence::SET: base = 0; break;
    case Whence::CURRENT: base = position; break;
    case Whence::END: base = size; break;
  }

  if (offset < 0) {
    // Negate without overflowing on INT64_MIN.
    uint64_t back = static_cast<uint64_t>(-(offset + 1)) + 1;
    if (back > base) {
      FSBRIDGE_FAIL(INVALID_ARGUMENT, "seek to before the start of ", path);
    }
    position = base - back;
  } else {
    uint64_t forward = offset;
    uint64_t limit = kj::maxValue;
    if (forward > limit - base) {
      FSBRIDGE_FAIL(INVALID_ARGUMENT, "seek offset overflows in ", path);
    }
    position = base + forward;
  }
  return position;
}

kj::Promise<void> RemoteFile::readExactly(kj::ArrayPtr<kj::byte> buffer, uint64_t offset) {
  position = offset;
  return tryRead(buffer.begin(), buffer.size(), buffer.size())
      .then([this, expected = buffer.size()](size_t n) {
    if (n < expected) {
      FSBRIDGE_FAIL(NOT_FOUND, "premature EOF in ", path, "; wanted ", expected,
                    " bytes, got ", n);
    }
  });
}

kj::Promise<size_t> RemoteFile::tryRead(void* buffer, size_t minBytes, size_t maxBytes) {
  if (maxBytes == 0) return size_t(0);
  return readLoop(reinterpret_cast<kj::byte*>(buffer), kj::max(minBytes, size_t(1)), maxBytes, 0);
}

kj::Promise<size_t> RemoteFile::readLoop(kj::byte* buffer, size_t minBytes, size_t maxBytes,
                                         size_t alreadyRead) {
  size_t amount = kj::min(maxBytes - alreadyRead, client.getOptions().chunkSize);
  return client.readFileAt(path, kj::arrayPtr(buffer + alreadyRead, amount), position)
      .then([this, buffer, minBytes, maxBytes, alreadyRead](size_t n) -> kj::Promise<size_t> {
    position += n;
    size_t total = alreadyRead + n;
    if (n == 0 || total >= minBytes) {
      return total;
    }
    return readLoop(buffer, minBytes, maxBytes, total);
  });
}

kj::Maybe<uint64_t> RemoteFile::tryGetLength() {
  return position >= size ? 0 : size - position;
}

}  // namespace fsbridge
