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

#include "virtual-path.h"
#include "errors.h"
#include <kj/test.h>

namespace fsbridge {
namespace {

void expectInvalid(kj::StringPtr text) {
  KJ_IF_SOME(e, kj::runCatchingExceptions([&]() { VirtualPath::parse(text); })) {
    KJ_EXPECT(getErrorCode(e) == ErrorCode::INVALID_ARGUMENT, text, e);
  } else {
    KJ_FAIL_EXPECT("path should have been rejected", text);
  }
}

KJ_TEST("VirtualPath parses segments") {
  auto path = VirtualPath::parse("sqpack/ffxiv/0a0000.win32.index");
  KJ_EXPECT(path.size() == 3);
  KJ_EXPECT(path.basename() == "0a0000.win32.index");
  KJ_EXPECT(path.parent() == kj::Path({"sqpack", "ffxiv"}));
  KJ_EXPECT(path.toString() == "sqpack/ffxiv/0a0000.win32.index");
  KJ_EXPECT(kj::str(path) == "sqpack/ffxiv/0a0000.win32.index");

  auto top = VirtualPath::parse("data.bin");
  KJ_EXPECT(top.size() == 1);
  KJ_EXPECT(top.parent().size() == 0);
  KJ_EXPECT(top.basename() == "data.bin");
}

KJ_TEST("VirtualPath preserves case and odd characters") {
  KJ_EXPECT(VirtualPath::parse("Data.BIN").basename() == "Data.BIN");
  KJ_EXPECT(VirtualPath::parse("a b/...c").basename() == "...c");
  KJ_EXPECT(!(VirtualPath::parse("Data.bin") == VirtualPath::parse("data.bin")));
}

KJ_TEST("VirtualPath rejects traversal and empty segments") {
  expectInvalid("");
  expectInvalid("/");
  expectInvalid("/etc/passwd");
  expectInvalid("a//b");
  expectInvalid("a/b/");
  expectInvalid("..");
  expectInvalid("a/../b");
  expectInvalid("./a");
  expectInvalid(kj::StringPtr("a\0b", 3));
}

KJ_TEST("VirtualPath clone is equal and independent") {
  auto path = VirtualPath::parse("a/b");
  auto copy = path.clone();
  KJ_EXPECT(copy == path);
  path = VirtualPath::parse("c");
  KJ_EXPECT(copy.toString() == "a/b");
}

}  // namespace
}  // namespace fsbridge
