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

#include "host.h"
#include "virtual-path.h"
#include <kj/async.h>

KJ_BEGIN_HEADER

namespace fsbridge {

class PathResolver {
  // Resolves virtual paths against a root directory.
  //
  // All segments but the last are looked up as nested directories; a segment which does not
  // exist, or exists but is not a directory, fails with NOT_FOUND.  Each lookup runs in its own
  // turn of the event loop, so resolving a deep path never holds up other work.
  //
  // The resolver has no state of its own and never touches the handle cache; callers layer
  // caching on top.

public:
  explicit PathResolver(const kj::ReadableDirectory& root): root(root) {}

  kj::Promise<HostDirectory> resolveParent(const VirtualPath& path);
  // The directory that contains the leaf of `path`.

  kj::Promise<bool> exists(const VirtualPath& path);
  // True iff the leaf is among the children listed for its parent directory.  A missing
  // intermediate directory is still an error.

  kj::Promise<HostFile> openFile(const VirtualPath& path);
  // Opens the leaf for reading.  Fails with NOT_FOUND if it does not exist or is a directory.

private:
  const kj::ReadableDirectory& root;
};

}  // namespace fsbridge

KJ_END_HEADER
