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
#include <kj/one-of.h>
#include <kj/io.h>

KJ_BEGIN_HEADER

namespace fsbridge {

// =======================================================================================
// Host capabilities
//
// The bridge never opens anything by name on its own: everything it can reach hangs off a
// capability handed to it by the application.  On the wire a capability is a file descriptor;
// once received it is classified exactly once into one of the closed set of kinds below, and the
// rest of the bridge deals only in these types.

typedef kj::Own<const kj::ReadableDirectory> HostDirectory;
typedef kj::Own<const kj::ReadableFile> HostFile;

typedef kj::OneOf<HostDirectory, HostFile> HostHandle;

HostHandle adoptHostHandle(kj::AutoCloseFd fd);
// Takes ownership of a received descriptor and wraps it according to what it refers to.  Throws
// INVALID_ARGUMENT for anything other than a directory or a regular file.

kj::StringPtr describeHandle(const HostHandle& handle);
// "directory" or "file", for log and error messages.

}  // namespace fsbridge

KJ_END_HEADER
