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


#include "tool.h"
#include "client.h"
#include "errors.h"
#include "worker.h"
#include <kj/debug.h>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

namespace fsbridge {

namespace {

const char VERSION_STRING[] = "fsbridge version 0.1";

kj::Maybe<uint64_t> parseCount(kj::StringPtr arg) {
  if (arg.size() == 0 || arg[0] == '-') return kj::none;
  char* end;
  uint64_t value = strtoull(arg.cStr(), &end, 0);
  if (*end != '\0') return kj::none;
  return value;
}

}  // namespace

ToolMain::ToolMain(kj::ProcessContext& context)
    : context(context), standardOutput(STDOUT_FILENO), output(standardOutput) {}

ToolMain::ToolMain(kj::ProcessContext& context, kj::OutputStream& output)
    : context(context), standardOutput(STDOUT_FILENO), output(output) {}

kj::MainFunc ToolMain::getMain() {
  return kj::MainBuilder(context, VERSION_STRING,
        "Reads files beneath a granted directory through the file bridge.  The directory is "
        "opened once and handed to a worker thread as a capability; all paths are resolved "
        "by the worker relative to it.")
      .addSubCommand("size", KJ_BIND_METHOD(*this, getSizeMain),
                     "Print the size of a file in bytes.")
      .addSubCommand("exists", KJ_BIND_METHOD(*this, getExistsMain),
                     "Report whether a path names a file or directory.")
      .addSubCommand("cat", KJ_BIND_METHOD(*this, getCatMain),
                     "Stream a file to stdout.")
      .addSubCommand("read", KJ_BIND_METHOD(*this, getReadMain),
                     "Read a byte range of a file to stdout.")
      .build();
}

kj::MainFunc ToolMain::getSizeMain() {
  kj::MainBuilder builder(context, VERSION_STRING, "Prints the size of <path> in bytes.");
  addTargetArgs(builder);
  return builder.callAfterParsing(KJ_BIND_METHOD(*this, size)).build();
}

kj::MainFunc ToolMain::getExistsMain() {
  kj::MainBuilder builder(context, VERSION_STRING,
        "Prints \"true\" if <path> names a file or directory.  Otherwise prints \"false\" to "
        "stderr and exits with status 1.");
  addTargetArgs(builder);
  return builder.callAfterParsing(KJ_BIND_METHOD(*this, exists)).build();
}

kj::MainFunc ToolMain::getCatMain() {
  kj::MainBuilder builder(context, VERSION_STRING,
        "Writes the contents of <path> to stdout, fetching it in chunks.");
  builder.addOptionWithArg({"chunk-size"}, KJ_BIND_METHOD(*this, setChunkSize), "<bytes>",
                           "Fetch at most <bytes> per request.  Default: 1048576.");
  addTargetArgs(builder);
  return builder.callAfterParsing(KJ_BIND_METHOD(*this, cat)).build();
}

kj::MainFunc ToolMain::getReadMain() {
  kj::MainBuilder builder(context, VERSION_STRING,
        "Writes up to <length> bytes of <path>, starting at <offset>, to stdout.  Fewer "
        "bytes are written only at end-of-file.");
  builder.addOptionWithArg({"offset"}, KJ_BIND_METHOD(*this, setOffset), "<bytes>",
                           "Start reading at byte <bytes>.  Default: 0.")
         .addOptionWithArg({"length"}, KJ_BIND_METHOD(*this, setLength), "<bytes>",
                           "Read at most <bytes>.  Default: 1048576.");
  addTargetArgs(builder);
  return builder.callAfterParsing(KJ_BIND_METHOD(*this, read)).build();
}

void ToolMain::addTargetArgs(kj::MainBuilder& builder) {
  builder.expectArg("<dir>", KJ_BIND_METHOD(*this, setDirectory))
         .expectArg("<path>", KJ_BIND_METHOD(*this, setPath));
}

kj::MainBuilder::Validity ToolMain::setDirectory(kj::StringPtr arg) {
  directory = kj::heapString(arg);
  return true;
}

kj::MainBuilder::Validity ToolMain::setPath(kj::StringPtr arg) {
  path = kj::heapString(arg);
  return true;
}

kj::MainBuilder::Validity ToolMain::setOffset(kj::StringPtr arg) {
  KJ_IF_SOME(value, parseCount(arg)) {
    offset = value;
    return true;
  }
  return "not a non-negative integer";
}

kj::MainBuilder::Validity ToolMain::setLength(kj::StringPtr arg) {
  KJ_IF_SOME(value, parseCount(arg)) {
    if (value > 0xffffffffu) return "must fit in 32 bits";
    length = value;
    return true;
  }
  return "not a non-negative integer";
}

kj::MainBuilder::Validity ToolMain::setChunkSize(kj::StringPtr arg) {
  KJ_IF_SOME(value, parseCount(arg)) {
    if (value == 0) return "must be positive";
    if (value > 0xffffffffu) return "must fit in 32 bits";
    chunkSize = value;
    return true;
  }
  return "not a positive integer";
}

kj::AutoCloseFd ToolMain::openDirectory() {
  int fd;
  KJ_SYSCALL(fd = open(directory.cStr(), O_RDONLY | O_DIRECTORY | O_CLOEXEC), directory);
  return kj::AutoCloseFd(fd);
}

template <typename Func>
kj::MainBuilder::Validity ToolMain::withBridge(Func&& func) {
  // Runs `func(client, waitScope)` against a session rooted at `directory`.

  kj::MainBuilder::Validity result = true;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
    auto root = openDirectory();

    auto io = kj::setupAsyncIo();
    auto worker = startWorkerThread(*io.lowLevelProvider);

    ClientOptions options;
    options.chunkSize = chunkSize;
    BridgeClient client(*worker.channel, options);

    client.setDirectory(kj::mv(root)).wait(io.waitScope);
    result = func(client, io.waitScope);
    client.cleanup().wait(io.waitScope);
  })) {
    context.exitError(kj::str(errorCodeName(getErrorCode(exception)), ": ",
                              getErrorMessage(exception)));
  }
  return result;
}

kj::MainBuilder::Validity ToolMain::size() {
  uint64_t bytes = 0;
  auto result = withBridge(
      [&](BridgeClient& client, kj::WaitScope& waitScope) -> kj::MainBuilder::Validity {
    bytes = client.getFileSize(path).wait(waitScope);
    return true;
  });
  KJ_IF_SOME(error, result.releaseError()) {
    return kj::mv(error);
  }
  context.exitInfo(kj::str(bytes));
}

kj::MainBuilder::Validity ToolMain::exists() {
  bool found = false;
  auto result = withBridge(
      [&](BridgeClient& client, kj::WaitScope& waitScope) -> kj::MainBuilder::Validity {
    found = client.entryExists(path).wait(waitScope);
    return true;
  });
  KJ_IF_SOME(error, result.releaseError()) {
    return kj::mv(error);
  }
  if (found) {
    context.exitInfo("true");
  } else {
    context.exitError("false");
  }
}

kj::MainBuilder::Validity ToolMain::cat() {
  return withBridge([this](BridgeClient& client, kj::WaitScope& waitScope)
      -> kj::MainBuilder::Validity {
    auto file = client.openFile(path).wait(waitScope);
    auto buffer = kj::heapArray<kj::byte>(chunkSize);
    for (;;) {
      size_t n = file->tryRead(buffer.begin(), 1, buffer.size()).wait(waitScope);
      if (n == 0) break;
      output.write(buffer.begin(), n);
    }
    KJ_LOG(INFO, "streamed file", path, file->tell());
    return true;
  });
}

kj::MainBuilder::Validity ToolMain::read() {
  return withBridge([this](BridgeClient& client, kj::WaitScope& waitScope)
      -> kj::MainBuilder::Validity {
    auto buffer = kj::heapArray<kj::byte>(length);
    size_t n = client.readFileAt(path, buffer, offset).wait(waitScope);
    output.write(buffer.begin(), n);
    KJ_LOG(INFO, "bytes read", path, offset, n);
    return true;
  });
}

}  // namespace fsbridge
