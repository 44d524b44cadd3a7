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

#include <kj/io.h>
#include <kj/main.h>

KJ_BEGIN_HEADER

namespace fsbridge {

class BridgeClient;

class ToolMain {
  // The `fsbridge` command-line tool.  Each invocation grants one directory to a fresh worker
  // thread, performs one operation through a BridgeClient exactly as an application would, and
  // then ends the session.
  //
  // Failures are reported through the ProcessContext as "<code>: <message>" with a failing exit
  // status.

public:
  explicit ToolMain(kj::ProcessContext& context);
  ToolMain(kj::ProcessContext& context, kj::OutputStream& output);
  // File contents are written to `output`, or to stdout by default.

  kj::MainFunc getMain();

private:
  kj::ProcessContext& context;
  kj::FdOutputStream standardOutput;
  kj::OutputStream& output;
  kj::String directory;
  kj::String path;
  uint64_t offset = 0;
  uint64_t length = 1u << 20;
  uint64_t chunkSize = 1u << 20;

  kj::MainFunc getSizeMain();
  kj::MainFunc getExistsMain();
  kj::MainFunc getCatMain();
  kj::MainFunc getReadMain();

  void addTargetArgs(kj::MainBuilder& builder);
  kj::MainBuilder::Validity setDirectory(kj::StringPtr arg);
  kj::MainBuilder::Validity setPath(kj::StringPtr arg);
  kj::MainBuilder::Validity setOffset(kj::StringPtr arg);
  kj::MainBuilder::Validity setLength(kj::StringPtr arg);
  kj::MainBuilder::Validity setChunkSize(kj::StringPtr arg);

  kj::AutoCloseFd openDirectory();

  template <typename Func>
  kj::MainBuilder::Validity withBridge(Func&& func);

  kj::MainBuilder::Validity size();
  kj::MainBuilder::Validity exists();
  kj::MainBuilder::Validity cat();
  kj::MainBuilder::Validity read();
};

}  // namespace fsbridge

KJ_END_HEADER
