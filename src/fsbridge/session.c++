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

#include "session.h"
#include "errors.h"
#include <kj/debug.h>

namespace fsbridge {

DirectorySession::DirectorySession(uint64_t id, HostDirectory rootParam)
    : id(id), root(kj::mv(rootParam)),
      resolver(*KJ_ASSERT_NONNULL(root)),
      cache([this](const VirtualPath& path) { return resolver.openFile(path); }) {}

DirectorySession::~DirectorySession() noexcept(false) {
  retire();
}

kj::Promise<bool> DirectorySession::exists(const VirtualPath& path) {
  requireActive();
  if (cache.find(path) != kj::none) {
    return true;
  }
  return resolver.exists(path);
}

kj::Promise<kj::Own<OpenFileHandle>> DirectorySession::openFile(const VirtualPath& path) {
  requireActive();
  return cache.open(path);
}

void DirectorySession::requireActive() const {
  if (!active) {
    FSBRIDGE_FAIL(NO_SESSION_ACTIVE, "directory session ", id, " has ended");
  }
}

void DirectorySession::retire() {
  if (!active) return;
  active = false;

  if (!canceler.isEmpty()) {
    canceler.cancel(FSBRIDGE_EXCEPTION(NO_SESSION_ACTIVE,
        "directory session ended while the request was in flight"));
  }
  cache.purge();
  root = kj::none;

  KJ_LOG(INFO, "directory session retired", id);
}

// =======================================================================================

SessionSlot::~SessionSlot() noexcept(false) {
  clear();
}

void SessionSlot::install(kj::Maybe<HostDirectory> root) {
  KJ_IF_SOME(old, session) {
    old->retire();
  }
  session = kj::none;

  KJ_IF_SOME(r, root) {
    auto id = nextId++;
    session = kj::heap<DirectorySession>(id, kj::mv(r));
    KJ_LOG(INFO, "directory session installed", id);
  }
}

kj::Maybe<DirectorySession&> SessionSlot::get() {
  KJ_IF_SOME(s, session) {
    return *s;
  }
  return kj::none;
}

DirectorySession& SessionSlot::require() {
  KJ_IF_SOME(s, session) {
    return *s;
  }
  FSBRIDGE_FAIL(NO_SESSION_ACTIVE, "no directory has been granted");
}

}  // namespace fsbridge
