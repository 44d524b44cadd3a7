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
#include <kj/vector.h>

namespace fsbridge {

VirtualPath VirtualPath::parse(kj::StringPtr text) {
  if (text.size() == 0) {
    FSBRIDGE_FAIL(INVALID_ARGUMENT, "empty path");
  }
  if (text.findFirst('\0') != kj::none) {
    FSBRIDGE_FAIL(INVALID_ARGUMENT, "path contains NUL byte");
  }

  kj::Vector<kj::String> parts;
  size_t start = 0;
  for (;;) {
    kj::String part;
    bool last = false;
    KJ_IF_SOME(slash, text.slice(start).findFirst('/')) {
      part = kj::heapString(text.slice(start, start + slash));
      start += slash + 1;
    } else {
      part = kj::heapString(text.slice(start));
      last = true;
    }

    if (part.size() == 0) {
      FSBRIDGE_FAIL(INVALID_ARGUMENT, "path has an empty segment: ", text);
    }
    if (part == "." || part == "..") {
      FSBRIDGE_FAIL(INVALID_ARGUMENT, "path segment may not be '", part, "': ", text);
    }
    parts.add(kj::mv(part));

    if (last) break;
  }

  return VirtualPath(kj::Path(parts.releaseAsArray()), kj::heapString(text));
}

VirtualPath VirtualPath::clone() const {
  return VirtualPath(path.clone(), kj::heapString(text));
}

}  // namespace fsbridge
