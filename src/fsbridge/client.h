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
#include <capnp/message.h>
#include <capnp/serialize-async.h>
#include <kj/async-io.h>
#include <kj/map.h>

KJ_BEGIN_HEADER

namespace fsbridge {

class RemoteFile;

struct ClientOptions {
  capnp::ReaderOptions readerOptions;
  // The traversal limit must admit the largest response expected, i.e. a read-file-all of the
  // largest file the worker will return whole.

  size_t chunkSize = 1u << 20;
  // Largest single read-file-at issued by RemoteFile.
};

class BridgeClient {
  // The application's side of the bridge.  Each method sends one request and resolves when the
  // matching response arrives; any number of calls may be outstanding at once.
  //
  // Errors reported by the worker are rethrown as exceptions classified with the same
  // ErrorCode (see getErrorCode()).  If the channel fails or the worker closes it, every
  // outstanding and future call fails with DISCONNECTED.

public:
  explicit BridgeClient(kj::AsyncCapabilityStream& stream, ClientOptions options = ClientOptions());
  ~BridgeClient() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(BridgeClient);

  const ClientOptions& getOptions() const { return options; }

  kj::Promise<void> setDirectory(kj::AutoCloseFd directory);
  // Grants `directory` to the worker as the new root, ending any previous session.  The
  // descriptor is closed locally once sent.

  kj::Promise<void> cleanup();

  kj::Promise<bool> entryExists(kj::StringPtr path);

  kj::Promise<bool> probe(kj::StringPtr path);
  // Like entryExists(), but never fails: an error is logged and reported as false.

  kj::Promise<uint64_t> getFileSize(kj::StringPtr path);

  kj::Promise<kj::Array<kj::byte>> readFileAll(kj::StringPtr path);

  kj::Promise<size_t> readFileAt(kj::StringPtr path, kj::ArrayPtr<kj::byte> buffer,
                                 uint64_t offset);
  // Fills `buffer` from `offset` and returns the number of bytes read, which is less than
  // buffer.size() only at end-of-file.  `buffer` must remain valid until the promise resolves.

  kj::Promise<kj::Own<RemoteFile>> openFile(kj::StringPtr path);
  // Looks up the file's size and returns a stream positioned at its start.  The stream must not
  // outlive the client.

private:
  typedef kj::PromiseFulfiller<kj::Own<capnp::MessageReader>> ResponseFulfiller;

  kj::Own<capnp::MessageStream> stream;
  ClientOptions options;
  uint64_t nextId = 1;
  kj::HashMap<uint64_t, kj::Own<ResponseFulfiller>> pending;
  kj::Maybe<kj::Exception> disconnectReason;
  kj::Promise<void> previousWrite = kj::READY_NOW;
  kj::Promise<void> receiveTask;

  kj::Promise<kj::Own<capnp::MessageReader>> call(
      kj::Own<capnp::MallocMessageBuilder> message,
      kj::Maybe<kj::AutoCloseFd> fd = kj::none);
  // Sends the request in `message`, assigning its id, and waits for the response.  Resolves only
  // to successful responses; error responses are thrown.

  kj::Promise<void> receiveLoop();
  void disconnect(kj::Exception&& reason);
};

class RemoteFile final: public kj::AsyncInputStream {
  // A file in the granted directory, read through the bridge.  Keeps its own position; reads
  // are issued as read-file-at requests of at most ClientOptions::chunkSize bytes.

public:
  enum class Whence { SET, CURRENT, END };

  RemoteFile(BridgeClient& client, kj::String path, uint64_t size);

  kj::StringPtr getPath() const { return path; }
  uint64_t getSize() const { return size; }
  // As of when the file was opened.

  uint64_t tell() const { return position; }

  uint64_t seek(int64_t offset, Whence whence);
  // Moves the position and returns it.  Throws INVALID_ARGUMENT if the result would be negative
  // or overflow.  Seeking past the end is allowed; reads there return nothing.

  kj::Promise<void> readExactly(kj::ArrayPtr<kj::byte> buffer, uint64_t offset);
  // Fills all of `buffer` starting at `offset`, leaving the position just past it.  Fails with
  // NOT_FOUND if the file ends first.

  // implements AsyncInputStream -------------------------------------
  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override;
  kj::Maybe<uint64_t> tryGetLength() override;

private:
  BridgeClient& client;
  kj::String path;
  uint64_t size;
  uint64_t position = 0;

  kj::Promise<size_t> readLoop(kj::byte* buffer, size_t minBytes, size_t maxBytes,
                               size_t alreadyRead);
};

}  // namespace fsbridge

KJ_END_HEADER
