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
#include "test-util.h"
#include "worker.h"
#include <kj/debug.h>
#include <kj/test.h>

namespace fsbridge {
namespace {

kj::Array<kj::byte> pattern(size_t size) {
  auto result = kj::heapArray<kj::byte>(size);
  for (size_t i = 0; i < size; i++) {
    result[i] = i % 251;
  }
  return result;
}

class BridgeTest {
  // A worker thread serving a client on this thread, plus two populated directories to grant.

public:
  explicit BridgeTest(ClientOptions options = ClientOptions())
      : io(kj::setupAsyncIo()),
        worker(startWorkerThread(*io.lowLevelProvider)),
        client(*worker.channel, kj::mv(options)) {
    auto create = kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT;
    auto dirA = a.get();
    dirA->openFile(kj::Path({"data.bin"}), create)->writeAll(pattern(1048576));
    dirA->openFile(kj::Path({"a", "b", "c"}), create)->writeAll("hello");
    auto dirB = b.get();
    dirB->openFile(kj::Path({"only-in-b.txt"}), create)->writeAll("bb");
  }

  TempDir a;
  TempDir b;
  kj::AsyncIoContext io;
  WorkerThread worker;
  BridgeClient client;

  template <typename T>
  T wait(kj::Promise<T>&& promise) { return promise.wait(io.waitScope); }
};

KJ_TEST("bridge serves a granted directory") {
  BridgeTest test;
  test.wait(test.client.setDirectory(test.a.open()));

  KJ_EXPECT(test.wait(test.client.getFileSize("data.bin")) == 1048576);
  KJ_EXPECT(test.wait(test.client.entryExists("a/b/c")));
  KJ_EXPECT(!test.wait(test.client.entryExists("a/b/missing")));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound",
      test.wait(test.client.entryExists("missing/file")));

  auto all = test.wait(test.client.readFileAll("data.bin"));
  KJ_EXPECT(all.size() == 1048576);
  KJ_EXPECT(all.asPtr() == pattern(1048576).asPtr());

  kj::byte buffer[16];
  KJ_EXPECT(test.wait(test.client.readFileAt("data.bin", buffer, 1048570)) == 6);
  KJ_EXPECT(kj::arrayPtr(buffer, 6) == all.slice(1048570, 1048576));
}

KJ_TEST("bridge read-file-at past the end of a disk file reads nothing") {
  BridgeTest test;
  test.wait(test.client.setDirectory(test.a.open()));

  kj::byte buffer[16];
  KJ_EXPECT(test.wait(test.client.readFileAt("data.bin", buffer, 1048576)) == 0);
  KJ_EXPECT(test.wait(test.client.readFileAt("data.bin", buffer, 5000000)) == 0);
  KJ_EXPECT(test.wait(test.client.readFileAt("data.bin", buffer, 1ull << 63)) == 0);
  KJ_EXPECT(test.wait(test.client.readFileAt("data.bin", buffer, kj::maxValue)) == 0);
  KJ_EXPECT(test.wait(test.client.readFileAt("a/b/c", buffer, 1ull << 63)) == 0);
}

KJ_TEST("bridge rejects a file as the directory") {
  BridgeTest test;
  test.wait(test.client.setDirectory(test.a.open()));

  KJ_EXPECT_THROW_MESSAGE("fsbridge.invalidArgument",
      test.wait(test.client.setDirectory(test.a.open("data.bin"))));

  KJ_EXPECT(test.wait(test.client.getFileSize("a/b/c")) == 5);
}

KJ_TEST("bridge replaces and cleans up sessions") {
  BridgeTest test;
  test.wait(test.client.setDirectory(test.a.open()));
  KJ_EXPECT(test.wait(test.client.getFileSize("data.bin")) == 1048576);

  test.wait(test.client.setDirectory(test.b.open()));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.wait(test.client.getFileSize("data.bin")));
  KJ_EXPECT(test.wait(test.client.getFileSize("only-in-b.txt")) == 2);

  test.wait(test.client.cleanup());
  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive",
      test.wait(test.client.getFileSize("only-in-b.txt")));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive",
      test.wait(test.client.entryExists("only-in-b.txt")));

  // Cleaning up twice is harmless.
  test.wait(test.client.cleanup());
}

KJ_TEST("bridge correlates concurrent requests") {
  BridgeTest test;
  test.wait(test.client.setDirectory(test.a.open()));
  auto expected = pattern(1048576);

  constexpr size_t COUNT = 16;
  constexpr size_t LENGTH = 4096;
  auto buffers = kj::heapArray<kj::Array<kj::byte>>(COUNT);
  auto promises = kj::heapArrayBuilder<kj::Promise<void>>(COUNT);
  for (size_t i = 0; i < COUNT; i++) {
    buffers[i] = kj::heapArray<kj::byte>(LENGTH);
    uint64_t offset = (COUNT - i) * 60000;
    promises.add(test.client.readFileAt("data.bin", buffers[i], offset)
        .then([&expected, &buffers, i, offset](size_t n) {
      KJ_EXPECT(n == LENGTH);
      KJ_EXPECT(buffers[i].asPtr() == expected.slice(offset, offset + LENGTH), i);
    }));
  }
  test.wait(kj::joinPromises(promises.finish()));
}

KJ_TEST("bridge probe reports errors as absence") {
  BridgeTest test;

  {
    KJ_EXPECT_LOG(ERROR, "existence check failed");
    KJ_EXPECT(!test.wait(test.client.probe("data.bin")));
  }

  test.wait(test.client.setDirectory(test.a.open()));
  KJ_EXPECT(test.wait(test.client.probe("data.bin")));
}

KJ_TEST("RemoteFile streams in chunks") {
  ClientOptions options;
  options.chunkSize = 1000;
  BridgeTest test(kj::mv(options));
  test.wait(test.client.setDirectory(test.a.open()));
  auto expected = pattern(1048576);

  auto file = test.wait(test.client.openFile("data.bin"));
  KJ_EXPECT(file->getSize() == 1048576);
  KJ_EXPECT(KJ_ASSERT_NONNULL(file->tryGetLength()) == 1048576);

  // One call spans several chunk-sized requests.
  auto buffer = kj::heapArray<kj::byte>(2500);
  KJ_EXPECT(test.wait(file->tryRead(buffer.begin(), buffer.size(), buffer.size())) == 2500);
  KJ_EXPECT(buffer.asPtr() == expected.slice(0, 2500));
  KJ_EXPECT(file->tell() == 2500);
  KJ_EXPECT(KJ_ASSERT_NONNULL(file->tryGetLength()) == 1048576 - 2500);

  // The whole remainder, via the generic stream interface.
  auto rest = test.wait(file->readAllBytes());
  KJ_EXPECT(rest.size() == 1048576 - 2500);
  KJ_EXPECT(rest.asPtr() == expected.slice(2500, 1048576));
  KJ_EXPECT(test.wait(file->tryRead(buffer.begin(), 1, buffer.size())) == 0);
}

KJ_TEST("RemoteFile seeks") {
  BridgeTest test;
  test.wait(test.client.setDirectory(test.a.open()));
  auto expected = pattern(1048576);

  auto file = test.wait(test.client.openFile("data.bin"));
  kj::byte buffer[16];

  KJ_EXPECT(file->seek(-6, RemoteFile::Whence::END) == 1048570);
  KJ_EXPECT(test.wait(file->tryRead(buffer, 1, sizeof(buffer))) == 6);
  KJ_EXPECT(kj::arrayPtr(buffer, 6) == expected.slice(1048570, 1048576));

  KJ_EXPECT(file->seek(100, RemoteFile::Whence::SET) == 100);
  KJ_EXPECT(file->seek(-50, RemoteFile::Whence::CURRENT) == 50);
  KJ_EXPECT(test.wait(file->tryRead(buffer, sizeof(buffer), sizeof(buffer))) == 16);
  KJ_EXPECT(kj::arrayPtr(buffer, 16) == expected.slice(50, 66));

  KJ_EXPECT_THROW_MESSAGE("fsbridge.invalidArgument", file->seek(-1, RemoteFile::Whence::SET));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.invalidArgument",
      file->seek(-1048577, RemoteFile::Whence::END));
  KJ_EXPECT(file->tell() == 66);

  // Past the end is allowed but reads nothing.
  KJ_EXPECT(file->seek(10, RemoteFile::Whence::END) == 1048586);
  KJ_EXPECT(test.wait(file->tryRead(buffer, 1, sizeof(buffer))) == 0);
  KJ_EXPECT(KJ_ASSERT_NONNULL(file->tryGetLength()) == 0);

  int64_t huge = kj::maxValue;
  file->seek(huge, RemoteFile::Whence::SET);
  file->seek(huge, RemoteFile::Whence::CURRENT);
  KJ_EXPECT_THROW_MESSAGE("fsbridge.invalidArgument",
      file->seek(huge, RemoteFile::Whence::CURRENT));
}

KJ_TEST("RemoteFile readExactly fails at premature end-of-file") {
  BridgeTest test;
  test.wait(test.client.setDirectory(test.a.open()));

  auto file = test.wait(test.client.openFile("a/b/c"));
  kj::byte buffer[5];
  test.wait(file->readExactly(buffer, 0));
  KJ_EXPECT(kj::heapString(reinterpret_cast<char*>(buffer), 5) == "hello");

  KJ_EXPECT_THROW_MESSAGE("premature EOF", test.wait(file->readExactly(buffer, 2)));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.wait(file->readExactly(buffer, 3)));
}

KJ_TEST("BridgeClient fails outstanding calls on disconnect") {
  auto io = kj::setupAsyncIo();
  auto pipe = io.provider->newCapabilityPipe();
  BridgeClient client(*pipe.ends[0]);

  auto promise = client.getFileSize("data.bin");
  KJ_EXPECT(!promise.poll(io.waitScope));

  pipe.ends[1] = nullptr;
  KJ_EXPECT_THROW_MESSAGE("fsbridge.disconnected", promise.wait(io.waitScope));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.disconnected", client.cleanup().wait(io.waitScope));
}

KJ_TEST("worker stops reading after a corrupt frame") {
  auto io = kj::setupAsyncIo();
  auto worker = startWorkerThread(*io.lowLevelProvider);

  // A segment table claiming 4096 segments.
  kj::byte garbage[8] = { 0xff, 0x0f, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00 };
  worker.channel->write(garbage, sizeof(garbage)).wait(io.waitScope);

  kj::byte buffer[16];
  KJ_EXPECT(worker.channel->tryRead(buffer, 1, sizeof(buffer)).wait(io.waitScope) == 0);
}

}  // namespace
}  // namespace fsbridge
