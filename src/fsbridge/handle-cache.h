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
#include <kj/function.h>
#include <kj/map.h>
#include <kj/refcount.h>

KJ_BEGIN_HEADER

namespace fsbridge {

class OpenFileHandle final: public kj::Refcounted {
  // A file opened for random-access reads, shared by every request that reads the same path
  // during one directory session.  close() releases the underlying host file immediately, even
  // if other references to the handle remain; after that, every operation fails with NOT_FOUND.

public:
  OpenFileHandle(VirtualPath path, HostFile file);
  ~OpenFileHandle() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(OpenFileHandle);

  kj::Own<OpenFileHandle> addRef() { return kj::addRef(*this); }
  // Needed so that kj::ForkedPromise can hand the same handle to every branch.

  const VirtualPath& getPath() const { return path; }

  uint64_t getSize() const;

  size_t read(uint64_t offset, kj::ArrayPtr<kj::byte> buffer) const;
  // Reads up to buffer.size() bytes starting at `offset`.  Returns fewer only if end-of-file was
  // reached; an offset at or beyond end-of-file reads nothing.

  kj::Array<kj::byte> readAll() const;
  // Allocates a buffer the size of the file and fills it with one read.

  void close();
  bool isClosed() const { return file == kj::none; }

private:
  VirtualPath path;
  kj::Maybe<HostFile> file;

  const kj::ReadableFile& requireOpen() const;
};

class HandleCache {
  // Memoizes opened files by virtual path for the lifetime of one directory session.
  //
  // The cache is unbounded; the expected working set (a game install's index and data files) is
  // small.  Entries leave the cache only through purge(), which closes every open handle.
  //
  // Concurrent opens of a path that is not yet cached share one underlying open: the first
  // request starts it and parks the forked promise in the cache slot, and any request arriving
  // before it completes takes a branch.  If the open fails the slot is erased, so the next
  // request tries again.

public:
  typedef kj::Function<kj::Promise<HostFile>(const VirtualPath&)> Opener;

  explicit HandleCache(Opener opener);
  ~HandleCache() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(HandleCache);

  kj::Promise<kj::Own<OpenFileHandle>> open(const VirtualPath& path);
  // Returns the cached handle for `path`, or opens one using the opener.

  kj::Maybe<OpenFileHandle&> find(const VirtualPath& path);
  // Returns the handle for `path` if one is fully open; never starts an open.

  void purge();
  // Closes every cached handle and forgets every entry, including opens still in flight.

  size_t size() const { return entries.size(); }
  // Number of slots, pending or open.

private:
  typedef kj::ForkedPromise<kj::Own<OpenFileHandle>> PendingOpen;

  struct Slot {
    uint64_t serial;
    // Distinguishes this slot from an earlier or later one for the same path.

    kj::OneOf<PendingOpen, kj::Own<OpenFileHandle>> state;
  };

  Opener opener;
  kj::HashMap<kj::String, Slot> entries;
  uint64_t nextSerial = 0;

  kj::Canceler canceler;
  // Wraps every promise returned by open() while an open is in flight, so that purge() can cut
  // them off before the entries they refer to disappear.

  kj::Promise<kj::Own<OpenFileHandle>> settle(
      kj::String key, uint64_t serial, kj::Promise<kj::Own<OpenFileHandle>> branch);
  // Waits for one branch of a pending open; the first branch to see it succeed promotes the
  // slot to an open handle, and any branch seeing it fail erases the slot.
};

}  // namespace fsbridge

KJ_END_HEADER
