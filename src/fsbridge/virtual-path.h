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

#include <kj/filesystem.h>
#include <kj/string.h>

KJ_BEGIN_HEADER

namespace fsbridge {

class VirtualPath {
  // A slash-delimited path relative to the root of the active directory session, e.g.
  // "sqpack/ffxiv/0a0000.win32.index".  Always has at least one segment.  There is no notion of
  // an absolute path or of a parent directory: ".", ".." and empty segments are rejected rather
  // than evaluated, so a VirtualPath can never escape the root it is resolved against.
  //
  // Case is passed through untouched; whether "Data.bin" and "data.bin" name the same file is up
  // to the host filesystem.

public:
  static VirtualPath parse(kj::StringPtr text);
  // Throws INVALID_ARGUMENT if `text` is not an acceptable virtual path.

  VirtualPath(VirtualPath&&) = default;
  VirtualPath& operator=(VirtualPath&&) = default;
  KJ_DISALLOW_COPY(VirtualPath);

  VirtualPath clone() const;

  kj::PathPtr asPath() const { return path; }
  kj::PathPtr parent() const { return path.slice(0, path.size() - 1); }
  // The directory containing the leaf; empty for a top-level entry.

  kj::StringPtr basename() const { return path[path.size() - 1]; }
  // The last segment.

  size_t size() const { return path.size(); }

  kj::StringPtr toString() const { return text; }
  // Canonical form, used as the handle cache key.

  bool operator==(const VirtualPath& other) const { return text == other.text; }

private:
  kj::Path path;
  kj::String text;

  VirtualPath(kj::Path path, kj::String text): path(kj::mv(path)), text(kj::mv(text)) {}
};

inline kj::StringPtr KJ_STRINGIFY(const VirtualPath& path) { return path.toString(); }

}  // namespace fsbridge

KJ_END_HEADER
