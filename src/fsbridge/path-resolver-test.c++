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

#include "path-resolver.h"
#include "errors.h"
#include <kj/test.h>

namespace fsbridge {
namespace {

kj::Own<kj::Directory> makeTree() {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  auto create = kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT;
  dir->openFile(kj::Path({"top.txt"}), create)->writeAll("top");
  dir->openFile(kj::Path({"a", "b", "c"}), create)->writeAll("deep");
  dir->openFile(kj::Path({"a", "b", "d"}), create)->writeAll("");
  dir->openSubdir(kj::Path({"a", "empty"}), create);
  return dir;
}

KJ_TEST("PathResolver exists checks the listed children of the parent") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  auto dir = makeTree();
  PathResolver resolver(*dir);

  KJ_EXPECT(resolver.exists(VirtualPath::parse("top.txt")).wait(waitScope));
  KJ_EXPECT(resolver.exists(VirtualPath::parse("a")).wait(waitScope));
  KJ_EXPECT(resolver.exists(VirtualPath::parse("a/b/c")).wait(waitScope));
  KJ_EXPECT(resolver.exists(VirtualPath::parse("a/empty")).wait(waitScope));
  KJ_EXPECT(!resolver.exists(VirtualPath::parse("a/b/missing")).wait(waitScope));
  KJ_EXPECT(!resolver.exists(VirtualPath::parse("missing")).wait(waitScope));
}

KJ_TEST("PathResolver fails on a missing intermediate directory") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  auto dir = makeTree();
  PathResolver resolver(*dir);

  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound",
      resolver.exists(VirtualPath::parse("missing/file")).wait(waitScope));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound",
      resolver.exists(VirtualPath::parse("a/x/c")).wait(waitScope));

  // A file in the middle of a path is not a directory.
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound",
      resolver.exists(VirtualPath::parse("top.txt/x")).wait(waitScope));
}

KJ_TEST("PathResolver opens files") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  auto dir = makeTree();
  PathResolver resolver(*dir);

  auto file = resolver.openFile(VirtualPath::parse("a/b/c")).wait(waitScope);
  KJ_EXPECT(file->readAllText() == "deep");

  KJ_EXPECT(resolver.openFile(VirtualPath::parse("a/b/d")).wait(waitScope)->stat().size == 0);

  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound",
      resolver.openFile(VirtualPath::parse("a/b/missing")).wait(waitScope));
  KJ_EXPECT_THROW_MESSAGE("fsbridge.notFound",
      resolver.openFile(VirtualPath::parse("a/b")).wait(waitScope));
}

KJ_TEST("PathResolver resolves the containing directory") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  auto dir = makeTree();
  PathResolver resolver(*dir);

  auto parent = resolver.resolveParent(VirtualPath::parse("a/b/c")).wait(waitScope);
  KJ_EXPECT(parent->listNames().size() == 2);
  KJ_EXPECT(parent->exists(kj::Path({"c"})));

  auto root = resolver.resolveParent(VirtualPath::parse("top.txt")).wait(waitScope);
  KJ_EXPECT(root->exists(kj::Path({"a"})));
}

}  // namespace
}  // namespace fsbridge
