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

#include <kj/debug.h>
#include <kj/filesystem.h>
#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>

KJ_BEGIN_HEADER

namespace fsbridge {

class TempDir {
  // A scratch directory on disk, removed with its contents on destruction.

public:
  TempDir(): filename(kj::heapString("/tmp/fsbridge-test.XXXXXX")) {
    if (mkdtemp(filename.begin()) == nullptr) {
      KJ_FAIL_SYSCALL("mkdtemp", errno, filename);
    }
  }

  ~TempDir() noexcept(false) {
    auto fs = kj::newDiskFilesystem();
    fs->getRoot().remove(fs->getCurrentPath().eval(filename));
  }

  kj::StringPtr getPath() const { return filename; }

  kj::Own<const kj::Directory> get() {
    return kj::newDiskDirectory(open());
  }

  kj::AutoCloseFd open() {
    return openPath(filename);
  }

  kj::AutoCloseFd open(kj::StringPtr child) {
    return openPath(kj::str(filename, '/', child));
  }

private:
  kj::String filename;

  static kj::AutoCloseFd openPath(kj::StringPtr path) {
    int fd;
    KJ_SYSCALL(fd = ::open(path.cStr(), O_RDONLY | O_CLOEXEC), path);
    return kj::AutoCloseFd(fd);
  }
};

}  // namespace fsbridge

KJ_END_HEADER
