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

class TestRouter {
public:
  explicit TestRouter(WorkerOptions options = WorkerOptions())
      : waitScope(loop),
        dirA(kj::newInMemoryDirectory(kj::nullClock())),
        dirB(kj::newInMemoryDirectory(kj::nullClock())),
        router(kj::mv(options)) {
    auto create = kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT;
    dirA->openFile(kj::Path({"data.bin"}), create)->writeAll(pattern(1048576));
    dirA->openFile(kj::Path({"a", "b", "c"}), create)->writeAll("hello");
    dirA->openFile(kj::Path({"only-in-a.txt"}), create)->writeAll("a");
    dirB->openFile(kj::Path({"only-in-b.txt"}), create)->writeAll("bb");
  }

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  kj::Own<kj::Directory> dirA;
  kj::Own<kj::Directory> dirB;
  Router router;

  Outcome run(Operation&& operation) {
    return router.dispatch(kj::mv(operation)).wait(waitScope);
  }

  void grant(const kj::Directory& dir) {
    run(SetDirectory { HostDirectory(dir.clone()) });
  }

  bool exists(kj::StringPtr path) {
    return run(EntryExists { VirtualPath::parse(path) }).get<Exists>().value;
  }

  uint64_t size(kj::StringPtr path) {
    return run(GetFileSize { VirtualPath::parse(path) }).get<FileSize>().bytes;
  }

  kj::Array<kj::byte> readAll(kj::StringPtr path) {
    return kj::mv(run(ReadFileAll { VirtualPath::parse(path) }).get<FileContents>().bytes);
  }

  kj::Array<kj::byte> readAt(kj::StringPtr path, uint64_t offset, uint32_t length) {
    auto result = run(ReadFileAt { VirtualPath::parse(path), offset, length });
    auto& read = result.get<BytesRead>();
    return kj::heapArray<kj::byte>(read.buffer.first(read.count));
  }
};

KJ_TEST("Router without a session") {
  TestRouter test;
  KJ_EXPECT(!test.router.hasSession());

  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", test.exists("data.bin"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", test.size("data.bin"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", test.readAll("data.bin"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", test.readAt("data.bin", 0, 16));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", test.readAt("data.bin", 0, 20u << 20));

  // cleanup is fine with nothing to clean up.
  KJ_EXPECT(test.run(Cleanup()).is<Ack>());
}

KJ_TEST("Router reports size and contents of a granted file") {
  TestRouter test;
  test.grant(*test.dirA);
  KJ_EXPECT(test.router.hasSession());

  auto size = test.size("data.bin");
  KJ_EXPECT(size == 1048576);

  auto contents = test.readAll("data.bin");
  KJ_EXPECT(contents.size() == size);
  KJ_EXPECT(contents.asPtr() == pattern(1048576).asPtr());

  KJ_EXPECT(test.size("a/b/c") == 5);
  KJ_EXPECT(kj::heapString(test.readAll("a/b/c").asChars()) == "hello");
}

KJ_TEST("Router read-file-at stops at end-of-file") {
  TestRouter test;
  test.grant(*test.dirA);

  auto tail = test.readAt("data.bin", 1048570, 16);
  KJ_EXPECT(tail.size() == 6);
  auto expected = pattern(1048576);
  KJ_EXPECT(tail.asPtr() == expected.slice(1048570, 1048576));

  KJ_EXPECT(test.readAt("data.bin", 1048576, 16).size() == 0);
  KJ_EXPECT(test.readAt("data.bin", 5000000, 16).size() == 0);
  KJ_EXPECT(test.readAt("data.bin", 0, 0).size() == 0);
  KJ_EXPECT(test.readAt("data.bin", 100, 16).asPtr() == expected.slice(100, 116));
}

KJ_TEST("Router entry-exists") {
  TestRouter test;
  test.grant(*test.dirA);

  KJ_EXPECT(test.exists("a/b/c"));
  KJ_EXPECT(test.exists("a/b"));
  KJ_EXPECT(test.exists("data.bin"));
  KJ_EXPECT(!test.exists("a/b/missing"));
  KJ_EXPECT(!test.exists("missing"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.exists("missing/file"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.exists("data.bin/x"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.invalidArgument", test.exists("a/../data.bin"));
}

KJ_TEST("Router file operations on missing files and directories") {
  TestRouter test;
  test.grant(*test.dirA);

  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.size("nope.bin"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.size("a/b"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.readAll("a/nope/c"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.readAt("nope.bin", 0, 1));
}

KJ_TEST("Router cleanup ends the session") {
  TestRouter test;
  test.grant(*test.dirA);
  KJ_EXPECT(test.size("data.bin") == 1048576);

  KJ_EXPECT(test.run(Cleanup()).is<Ack>());
  KJ_EXPECT(!test.router.hasSession());

  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", test.exists("data.bin"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", test.size("data.bin"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", test.readAll("data.bin"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", test.readAt("data.bin", 0, 16));
}

KJ_TEST("Router replacing the directory hides the old one") {
  TestRouter test;
  test.grant(*test.dirA);
  KJ_EXPECT(test.exists("only-in-a.txt"));
  KJ_EXPECT(test.size("only-in-a.txt") == 1);

  test.grant(*test.dirB);
  KJ_EXPECT(!test.exists("only-in-a.txt"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.size("only-in-a.txt"));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", test.readAt("data.bin", 0, 16));
  KJ_EXPECT(test.size("only-in-b.txt") == 2);
}

KJ_TEST("Router rejects set-directory with a file") {
  TestRouter test;
  test.grant(*test.dirA);

  HostFile file = test.dirA->openFile(kj::Path({"data.bin"}));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.invalidArgument", test.run(SetDirectory { kj::mv(file) }));

  // The existing session is untouched.
  KJ_EXPECT(test.router.hasSession());
  KJ_EXPECT(test.size("data.bin") == 1048576);
}

KJ_TEST("Router serves concurrent reads of disjoint ranges") {
  TestRouter test;
  test.grant(*test.dirA);
  auto expected = pattern(1048576);

  auto first = test.router.dispatch(ReadFileAt { VirtualPath::parse("data.bin"), 0, 4096 });
  auto second = test.router.dispatch(ReadFileAt { VirtualPath::parse("data.bin"), 524288, 4096 });
  auto third = test.router.dispatch(ReadFileAt { VirtualPath::parse("data.bin"), 1048000, 4096 });

  auto check = [&](kj::Promise<Outcome>& promise, size_t offset, size_t count) {
    auto outcome = promise.wait(test.waitScope);
    auto& read = outcome.get<BytesRead>();
    KJ_EXPECT(read.count == count);
    KJ_EXPECT(read.buffer.first(read.count) == expected.slice(offset, offset + count));
  };
  check(third, 1048000, 576);
  check(first, 0, 4096);
  check(second, 524288, 4096);
}

KJ_TEST("Router cancels in-flight requests when the session is replaced") {
  TestRouter test;
  test.grant(*test.dirA);

  // Resolving a nested path takes several turns of the event loop, so this is still pending
  // when the next request is dispatched.
  auto inFlight = test.router.dispatch(ReadFileAt { VirtualPath::parse("a/b/c"), 0, 5 });
  test.grant(*test.dirB);

  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", inFlight.wait(test.waitScope));
  KJ_EXPECT(test.size("only-in-b.txt") == 2);
}

KJ_TEST("Router enforces read limits") {
  WorkerOptions options;
  options.maxReadLength = 1024;
  options.maxReadAllSize = 4096;
  TestRouter test(kj::mv(options));
  test.grant(*test.dirA);

  KJ_EXPECT(test.readAt("data.bin", 0, 1024).size() == 1024);
  KJ_EXPECT_THROW_MESSAGE("fsbridge.invalidArgument", test.readAt("data.bin", 0, 1025));

  KJ_EXPECT(test.readAll("a/b/c").size() == 5);
  KJ_EXPECT_THROW_MESSAGE("fsbridge.invalidArgument", test.readAll("data.bin"));
}

// =======================================================================================
// Wire handling

class WireCall {
public:
  WireCall() { request = requestMessage.initRoot<protocol::Request>(); }

  capnp::MallocMessageBuilder requestMessage;
  protocol::Request::Builder request = nullptr;

  protocol::Response::Reader send(TestRouter& test, kj::ArrayPtr<kj::AutoCloseFd> fds = nullptr) {
    auto response = responseMessage.initRoot<protocol::Response>();
    test.router.handle(request.asReader(), fds, response).wait(test.waitScope);
    return response.asReader();
  }

private:
  capnp::MallocMessageBuilder responseMessage;
};

void expectError(protocol::Response::Reader response, ErrorCode code) {
  KJ_ASSERT(response.isError(), response);
  KJ_EXPECT(response.getError().getCode() == code, response);
}

KJ_TEST("Router handle echoes the request id") {
  TestRouter test;

  WireCall call;
  call.request.setId(12345);
  call.request.setCleanup();
  auto response = call.send(test);
  KJ_EXPECT(response.getId() == 12345);
  KJ_EXPECT(response.isAck());
}

KJ_TEST("Router handle rejects malformed requests") {
  TestRouter test;
  test.grant(*test.dirA);

  {
    WireCall call;
    call.request.setId(1);
    auto response = call.send(test);
    KJ_EXPECT(response.getId() == 1);
    expectError(response, ErrorCode::MALFORMED_REQUEST);
  }

  {
    WireCall call;
    call.request.setId(2);
    call.request.initReadFileAt().setLength(16);
    expectError(call.send(test), ErrorCode::MALFORMED_REQUEST);
  }

  {
    WireCall call;
    call.request.setId(3);
    call.request.initSetDirectory();
    expectError(call.send(test), ErrorCode::INVALID_ARGUMENT);
    KJ_EXPECT(test.router.hasSession());
  }

  {
    WireCall call;
    call.request.setId(4);
    call.request.setGetFileSize("../etc/passwd");
    auto response = call.send(test);
    expectError(response, ErrorCode::INVALID_ARGUMENT);
    KJ_EXPECT(response.getError().getMessage().size() > 0);
  }
}

KJ_TEST("Router handle reports a grant the host can't inspect as a failure") {
  TestRouter test;
  test.grant(*test.dirA);

  // No descriptor can have this number, so fstat() fails.  Closing it fails too, and is logged.
  int badFd = kj::maxValue;
  auto fds = kj::heapArrayBuilder<kj::AutoCloseFd>(1);
  fds.add(badFd);
  auto fdArray = fds.finish();

  KJ_EXPECT_LOG(ERROR, "close");
  KJ_EXPECT_LOG(ERROR, "request failed");

  WireCall call;
  call.request.setId(7);
  call.request.initSetDirectory().setFdIndex(0);
  auto response = call.send(test, fdArray);
  KJ_EXPECT(response.getId() == 7);
  expectError(response, ErrorCode::FAILED);
  KJ_EXPECT(test.router.hasSession());
  KJ_EXPECT(test.size("data.bin") == 1048576);
}

KJ_TEST("Router handle encodes results") {
  TestRouter test;
  test.grant(*test.dirA);

  {
    WireCall call;
    call.request.setEntryExists("a/b/c");
    auto response = call.send(test);
    KJ_ASSERT(response.isExists(), response);
    KJ_EXPECT(response.getExists());
  }

  {
    WireCall call;
    call.request.setGetFileSize("data.bin");
    auto response = call.send(test);
    KJ_ASSERT(response.isSize(), response);
    KJ_EXPECT(response.getSize() == 1048576);
  }

  {
    WireCall call;
    call.request.setReadFileAll("a/b/c");
    auto response = call.send(test);
    KJ_ASSERT(response.isContents(), response);
    KJ_EXPECT(kj::heapString(response.getContents().asChars()) == "hello");
  }

  {
    WireCall call;
    auto args = call.request.initReadFileAt();
    args.setPath("data.bin");
    args.setOffset(1048570);
    args.setLength(16);
    auto response = call.send(test);
    KJ_ASSERT(response.isRead(), response);
    KJ_EXPECT(response.getRead().getBytesRead() == 6);
    KJ_EXPECT(response.getRead().getData().size() == 6);
  }

  {
    WireCall call;
    call.request.setGetFileSize("missing.bin");
    auto response = call.send(test);
    expectError(response, ErrorCode::NOT_FOUND);
    KJ_EXPECT(response.getError().getMessage().startsWith("no such file"));
  }
}

}  // namespace
}  // namespace fsbridge
