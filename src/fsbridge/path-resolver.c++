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

namespace fsbridge {

namespace {

HostDirectory openSubdir(const kj::ReadableDirectory& dir, kj::StringPtr name,
                         kj::StringPtr fullPath) {
  kj::Path child(name);

  KJ_IF_SOME(metadata, dir.tryLstat(child)) {
    if (metadata.type == kj::FsNode::Type::DIRECTORY ||
        metadata.type == kj::FsNode::Type::SYMLINK) {
      KJ_IF_SOME(subdir, dir.tryOpenSubdir(child)) {
        return kj::mv(subdir);
      }
    }
    FSBRIDGE_FAIL(NOT_FOUND, "not a directory: '", name, "' in ", fullPath);
  }

  FSBRIDGE_FAIL(NOT_FOUND, "no such directory: '", name, "' in ", fullPath);
}

kj::Promise<HostDirectory> walk(HostDirectory dir, kj::Path remaining, kj::String fullPath) {
  if (remaining.size() == 0) {
    return kj::mv(dir);
  }

  return kj::evalLater([dir = kj::mv(dir), remaining = kj::mv(remaining),
                        fullPath = kj::mv(fullPath)]() mutable {
    auto next = openSubdir(*dir, remaining[0], fullPath);
    auto rest = remaining.slice(1, remaining.size()).clone();
    return walk(kj::mv(next), kj::mv(rest), kj::mv(fullPath));
  });
}

}  // namespace

kj::Promise<HostDirectory> PathResolver::resolveParent(const VirtualPath& path) {
  return walk(root.clone(), path.parent().clone(), kj::heapString(path.toString()));
}

kj::Promise<bool> PathResolver::exists(const VirtualPath& path) {
  return resolveParent(path)
      .then([name = kj::heapString(path.basename())](HostDirectory&& dir) {
    for (auto& child: dir->listNames()) {
      if (child == name) return true;
    }
    return false;
  });
}

kj::Promise<HostFile> PathResolver::openFile(const VirtualPath& path) {
  return resolveParent(path)
      .then([name = kj::heapString(path.basename()), fullPath = kj::heapString(path.toString())]
            (HostDirectory&& dir) -> HostFile {
    kj::Path leaf(name);

    KJ_IF_SOME(metadata, dir->tryLstat(leaf)) {
      if (metadata.type == kj::FsNode::Type::DIRECTORY) {
        FSBRIDGE_FAIL(NOT_FOUND, "is a directory: ", fullPath);
      }
    }

    KJ_IF_SOME(file, dir->tryOpenFile(leaf)) {
      return kj::mv(file);
    }
    FSBRIDGE_FAIL(NOT_FOUND, "no such file: ", fullPath);
  });
}

}  // namespace fsbridge
