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

#include "handle-cache.h"
#include "path-resolver.h"
#include <kj/async.h>

KJ_BEGIN_HEADER

namespace fsbridge {

class DirectorySession {
  // Everything derived from one granted root directory: the root capability itself, the resolver
  // walking it, and the cache of files opened beneath it.
  //
  // A session is torn down as a unit by retire(): in-flight operations are cancelled first, then
  // every cached file is closed, then the root is released.  Nothing derived from a retired
  // session can be reached again.

public:
  DirectorySession(uint64_t id, HostDirectory root);
  ~DirectorySession() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(DirectorySession);

  uint64_t getId() const { return id; }
  bool isActive() const { return active; }

  template <typename T>
  kj::Promise<T> wrap(kj::Promise<T> promise) { return canceler.wrap(kj::mv(promise)); }
  // Ties an operation to this session, so that retiring the session cancels it with
  // NO_SESSION_ACTIVE.

  kj::Promise<bool> exists(const VirtualPath& path);
  // An open file in the cache counts as existing without consulting the host.

  kj::Promise<kj::Own<OpenFileHandle>> openFile(const VirtualPath& path);

  void retire();

private:
  uint64_t id;
  bool active = true;
  kj::Maybe<HostDirectory> root;
  PathResolver resolver;
  HandleCache cache;
  kj::Canceler canceler;

  void requireActive() const;
};

class SessionSlot {
  // Holds at most one active DirectorySession.  Installing a session retires the previous one
  // before the new one becomes visible.

public:
  SessionSlot() = default;
  ~SessionSlot() noexcept(false);
  KJ_DISALLOW_COPY_AND_MOVE(SessionSlot);

  void install(kj::Maybe<HostDirectory> root);
  // Retires the active session, if any, then installs a new session for `root` unless it is
  // none.

  void clear() { install(kj::none); }

  kj::Maybe<DirectorySession&> get();

  DirectorySession& require();
  // Throws NO_SESSION_ACTIVE if there is no active session.

private:
  kj::Maybe<kj::Own<DirectorySession>> session;
  uint64_t nextId = 1;
};

}  // namespace fsbridge

KJ_END_HEADER
