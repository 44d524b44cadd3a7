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

#include "handle-cache.h"
#include "errors.h"
#include <kj/test.h>
#include <kj/vector.h>

namespace fsbridge {
namespace {

class TestFiles {
  // An in-memory directory plus an opener that counts how often it is called and can hold opens
  // until released.

public:
  TestFiles(): dir(kj::newInMemoryDirectory(kj::nullClock())) {
    auto create = kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT;
    dir->openFile(kj::Path({"ten.bin"}), create)->writeAll("0123456789");
    dir->openFile(kj::Path({"sub", "x.txt"}), create)->writeAll("x");
  }

  HandleCache::Opener opener() {
    return [this](const VirtualPath& path) -> kj::Promise<HostFile> {
      ++opens;
      if (failNext) {
        failNext = false;
        return FSBRIDGE_EXCEPTION(NOT_FOUND, "injected failure: ", path);
      }
      HostFile file = dir->openFile(path.asPath());
      if (hold) {
        auto paf = kj::newPromiseAndFulfiller<void>();
        held.add(kj::mv(paf.fulfiller));
        return paf.promise.then([file = kj::mv(file)]() mutable { return kj::mv(file); });
      }
      return kj::mv(file);
    };
  }

  void release() {
    for (auto& fulfiller: held) fulfiller->fulfill();
    held.clear();
  }

  kj::Own<kj::Directory> dir;
  uint opens = 0;
  bool hold = false;
  bool failNext = false;
  kj::Vector<kj::Own<kj::PromiseFulfiller<void>>> held;
};

KJ_TEST("HandleCache reuses an open handle") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestFiles files;
  HandleCache cache(files.opener());

  auto path = VirtualPath::parse("ten.bin");
  KJ_EXPECT(cache.find(path) == kj::none);

  auto first = cache.open(path).wait(waitScope);
  auto second = cache.open(path).wait(waitScope);
  KJ_EXPECT(first.get() == second.get());
  KJ_EXPECT(files.opens == 1);
  KJ_EXPECT(cache.size() == 1);
  KJ_EXPECT(&KJ_ASSERT_NONNULL(cache.find(path)) == first.get());

  KJ_EXPECT(first->getSize() == 10);
  KJ_EXPECT(first->getPath().toString() == "ten.bin");

  cache.open(VirtualPath::parse("sub/x.txt")).wait(waitScope);
  KJ_EXPECT(files.opens == 2);
  KJ_EXPECT(cache.size() == 2);
}

KJ_TEST("HandleCache collapses concurrent opens of one path") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestFiles files;
  files.hold = true;
  HandleCache cache(files.opener());

  auto path = VirtualPath::parse("ten.bin");
  auto promise1 = cache.open(path);
  auto promise2 = cache.open(path);
  KJ_EXPECT(files.opens == 1);
  KJ_EXPECT(cache.find(path) == kj::none);

  files.release();
  auto handle1 = promise1.wait(waitScope);
  auto handle2 = promise2.wait(waitScope);
  KJ_EXPECT(handle1.get() == handle2.get());
  KJ_EXPECT(cache.find(path) != kj::none);

  cache.open(path).wait(waitScope);
  KJ_EXPECT(files.opens == 1);
}

KJ_TEST("HandleCache forgets a failed open") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestFiles files;
  files.failNext = true;
  HandleCache cache(files.opener());

  auto path = VirtualPath::parse("ten.bin");
  KJ_EXPECT_THROW_MESSAGE("injected failure", cache.open(path).wait(waitScope));
  KJ_EXPECT(cache.size() == 0);

  auto handle = cache.open(path).wait(waitScope);
  KJ_EXPECT(files.opens == 2);
  KJ_EXPECT(handle->getSize() == 10);
}

KJ_TEST("HandleCache purge closes handles and cancels pending opens") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestFiles files;
  HandleCache cache(files.opener());

  auto handle = cache.open(VirtualPath::parse("ten.bin")).wait(waitScope);

  files.hold = true;
  auto pending = cache.open(VirtualPath::parse("sub/x.txt"));
  KJ_EXPECT(cache.size() == 2);

  cache.purge();
  KJ_EXPECT(cache.size() == 0);
  KJ_EXPECT(handle->isClosed());
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", handle->getSize());
  kj::byte buffer[4];
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound", handle->read(0, buffer));

  KJ_EXPECT_THROW_MESSAGE("fsbridge.noSessionActive", pending.wait(waitScope));

  // Completing the abandoned open must not resurrect the entry.
  files.release();
  waitScope.poll();
  KJ_EXPECT(cache.size() == 0);
}

KJ_TEST("OpenFileHandle reads stop at end-of-file") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TestFiles files;
  HandleCache cache(files.opener());

  auto handle = cache.open(VirtualPath::parse("ten.bin")).wait(waitScope);

  kj::byte buffer[16];
  KJ_EXPECT(handle->read(4, buffer) == 6);
  KJ_EXPECT(kj::heapString(reinterpret_cast<char*>(buffer), 6) == "456789");
  KJ_EXPECT(handle->read(10, buffer) == 0);
  KJ_EXPECT(handle->read(1000, buffer) == 0);
  KJ_EXPECT(handle->read(0, kj::arrayPtr(buffer, 3)) == 3);

  auto all = handle->readAll();
  KJ_EXPECT(all.size() == 10);
  KJ_EXPECT(kj::heapString(all.asChars()) == "0123456789");
}

}  // namespace
}  // namespace fsbridge
