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
#include <fsbridge/protocol.capnp.h>
#include <kj/one-of.h>

KJ_BEGIN_HEADER

namespace fsbridge {

// =======================================================================================
// Decoded requests
//
// A protocol::Request is decoded into one of these exactly once, at the channel boundary.  Past
// that point nothing looks at the wire form again: paths are validated, and any attached
// capability has been classified.

struct Cleanup {};

struct SetDirectory {
  HostHandle handle;
  // Whatever was attached.  Only a directory is acceptable; that is checked on dispatch so the
  // error names what was actually received.
};

struct EntryExists {
  VirtualPath path;
};

struct GetFileSize {
  VirtualPath path;
};

struct ReadFileAll {
  VirtualPath path;
};

struct ReadFileAt {
  VirtualPath path;
  uint64_t offset;
  uint32_t length;
};

typedef kj::OneOf<Cleanup, SetDirectory, EntryExists, GetFileSize, ReadFileAll, ReadFileAt>
    Operation;

Operation decodeRequest(protocol::Request::Reader request, kj::ArrayPtr<kj::AutoCloseFd> fds);
// Throws MALFORMED_REQUEST if the request names no operation, an unknown one, or omits its
// payload, and INVALID_ARGUMENT if a path is unacceptable or set-directory refers to a
// descriptor that was not attached.  The descriptor consumed by set-directory is moved out of
// `fds`.

kj::StringPtr operationName(protocol::Request::Which which);
// "set-directory", "read-file-at", etc.

// =======================================================================================
// Results

struct Ack {};

struct Exists {
  bool value;
};

struct FileSize {
  uint64_t bytes;
};

struct FileContents {
  kj::Array<kj::byte> bytes;
};

struct BytesRead {
  kj::Array<kj::byte> buffer;
  size_t count;
  // Only the first `count` bytes of `buffer` are meaningful.
};

typedef kj::OneOf<Ack, Exists, FileSize, FileContents, BytesRead> Outcome;

void encodeOutcome(Outcome&& outcome, protocol::Response::Builder response);
void encodeError(const kj::Exception& exception, protocol::Response::Builder response);

}  // namespace fsbridge

KJ_END_HEADER
