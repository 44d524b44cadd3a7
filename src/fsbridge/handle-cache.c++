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

#include "handle-cache.h"
#include "errors.h"
#include <kj/debug.h>

namespace fsbridge {

OpenFileHandle::OpenFileHandle(VirtualPath path, HostFile file)
    : path(kj::mv(path)), file(kj::mv(file)) {}

OpenFileHandle::~OpenFileHandle() noexcept(false) {}

const kj::ReadableFile& OpenFileHandle::requireOpen() const {
  KJ_IF_SOME(f, file) {
    return *f;
  }
  FSBRIDGE_FAIL(NOT_FOUND, "file handle was closed: ", path);
}

uint64_t OpenFileHandle::getSize() const {
  return requireOpen().stat().size;
}

size_t OpenFileHandle::read(uint64_t offset, kj::ArrayPtr<kj::byte> buffer) const {
  auto& f = requireOpen();
  // The host rejects offsets that don't fit in off_t, so anything at or past the end is answered
  // here.
  if (offset >= f.stat().size) return 0;
  return f.read(offset, buffer);
}

kj::Array<kj::byte> OpenFileHandle::readAll() const {
  auto& f = requireOpen();
  uint64_t size = f.stat().size;
  KJ_REQUIRE(size == static_cast<size_t>(size), "file too large to hold in memory", path);

  auto buffer = kj::heapArray<kj::byte>(size);
  size_t n = f.read(0, buffer);
  if (n < buffer.size()) {
    // Truncated since stat().
    return kj::heapArray<kj::byte>(buffer.first(n));
  }
  return buffer;
}

void OpenFileHandle::close() {
  file = kj::none;
}

// =======================================================================================

HandleCache::HandleCache(Opener opener): opener(kj::mv(opener)) {}

HandleCache::~HandleCache() noexcept(false) {
  purge();
}

kj::Promise<kj::Own<OpenFileHandle>> HandleCache::open(const VirtualPath& path) {
  KJ_IF_SOME(slot, entries.find(path.toString())) {
    KJ_IF_SOME(handle, slot.state.tryGet<kj::Own<OpenFileHandle>>()) {
      return handle->addRef();
    }

    auto& pending = slot.state.get<PendingOpen>();
    return canceler.wrap(settle(kj::heapString(path.toString()), slot.serial,
                                pending.addBranch()));
  }

  uint64_t serial = nextSerial++;
  auto forked = opener(path)
      .then([path = path.clone()](HostFile file) mutable {
    return kj::refcounted<OpenFileHandle>(kj::mv(path), kj::mv(file));
  }).fork();
  auto branch = forked.addBranch();
  entries.insert(kj::heapString(path.toString()), Slot { serial, kj::mv(forked) });

  return canceler.wrap(settle(kj::heapString(path.toString()), serial, kj::mv(branch)));
}

kj::Promise<kj::Own<OpenFileHandle>> HandleCache::settle(
    kj::String key, uint64_t serial, kj::Promise<kj::Own<OpenFileHandle>> branch) {
  auto errorKey = kj::heapString(key);
  return branch.then([this,key=kj::mv(key),serial](kj::Own<OpenFileHandle>&& handle) {
    KJ_IF_SOME(slot, entries.find(key)) {
      if (slot.serial == serial && slot.state.is<PendingOpen>()) {
        slot.state.init<kj::Own<OpenFileHandle>>(handle->addRef());
      }
    }
    return kj::mv(handle);
  }, [this,key=kj::mv(errorKey),serial](kj::Exception&& e) -> kj::Own<OpenFileHandle> {
    KJ_IF_SOME(slot, entries.find(key)) {
      if (slot.serial == serial) {
        entries.erase(key);
      }
    }
    kj::throwFatalException(kj::mv(e));
  });
}

kj::Maybe<OpenFileHandle&> HandleCache::find(const VirtualPath& path) {
  KJ_IF_SOME(slot, entries.find(path.toString())) {
    KJ_IF_SOME(handle, slot.state.tryGet<kj::Own<OpenFileHandle>>()) {
      return *handle;
    }
  }
  return kj::none;
}

void HandleCache::purge() {
  if (!canceler.isEmpty()) {
    canceler.cancel(FSBRIDGE_EXCEPTION(NO_SESSION_ACTIVE,
        "directory session ended while the file was being opened"));
  }

  if (entries.size() == 0) return;

  uint closed = 0;
  for (auto& entry: entries) {
    KJ_IF_SOME(handle, entry.value.state.tryGet<kj::Own<OpenFileHandle>>()) {
      handle->close();
      ++closed;
    }
  }
  KJ_LOG(INFO, "purged file handle cache", entries.size(), closed);
  entries.clear();
}

}  // namespace fsbridge
