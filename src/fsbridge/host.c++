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

#include "host.h"
#include "errors.h"
#include <kj/debug.h>
#include <sys/stat.h>

namespace fsbridge {

HostHandle adoptHostHandle(kj::AutoCloseFd fd) {
  struct stat stats;
  KJ_SYSCALL(fstat(fd.get(), &stats));

  if (S_ISDIR(stats.st_mode)) {
    return HostDirectory(kj::newDiskReadableDirectory(kj::mv(fd)));
  } else if (S_ISREG(stats.st_mode)) {
    return HostFile(kj::newDiskReadableFile(kj::mv(fd)));
  } else {
    FSBRIDGE_FAIL(INVALID_ARGUMENT,
        "capability is neither a directory nor a regular file; mode = ", stats.st_mode);
  }
}

kj::StringPtr describeHandle(const HostHandle& handle) {
  return handle.is<HostDirectory>() ? "directory" : "file";
}

}  // namespace fsbridge
