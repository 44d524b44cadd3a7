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
#include "test-util.h"
#include <kj/test.h>
#include <kj/vector.h>
#include <string.h>

namespace fsbridge {
namespace {

class TestContext final: public kj::ProcessContext {
  // Records what the tool reports instead of writing it to the terminal.  Exiting throws the
  // same exception a clean shutdown of the real process context would.

public:
  kj::String info;

  kj::StringPtr getProgramName() override { return "fsbridge"; }

  [[noreturn]] void exit() override {
    throw kj::TopLevelProcessContext::CleanShutdownException { hadErrors ? 1 : 0 };
  }

  void warning(kj::StringPtr message) const override {
    warnings = kj::str(warnings, message, '\n');
  }

  void error(kj::StringPtr message) const override {
    hadErrors = true;
    errors = kj::str(errors, message);
  }

  [[noreturn]] void exitError(kj::StringPtr message) override {
    error(message);
    exit();
  }

  [[noreturn]] void exitInfo(kj::StringPtr message) override {
    info = kj::str(message);
    exit();
  }

  void increaseLoggingVerbosity() override {}

  kj::StringPtr getErrors() const { return errors; }

private:
  mutable bool hadErrors = false;
  mutable kj::String warnings;
  mutable kj::String errors;
};

class CapturedOutput final: public kj::OutputStream {
public:
  kj::Vector<char> bytes;

  void write(const void* buffer, size_t size) override {
    bytes.addAll(reinterpret_cast<const char*>(buffer),
                 reinterpret_cast<const char*>(buffer) + size);
  }

  kj::String text() const { return kj::heapString(bytes.begin(), bytes.size()); }
};

bool mentions(kj::StringPtr text, kj::StringPtr part) {
  return strstr(text.cStr(), part.cStr()) != nullptr;
}

struct ToolRun {
  int status;
  kj::String info;
  kj::String error;
  kj::String output;
};

ToolRun runTool(kj::ArrayPtr<const kj::StringPtr> args) {
  TestContext context;
  CapturedOutput output;
  ToolMain tool(context, output);

  int status = 0;
  try {
    tool.getMain()("fsbridge", args);
  } catch (const kj::TopLevelProcessContext::CleanShutdownException& e) {
    status = e.exitCode;
  }

  return { status, kj::mv(context.info), kj::heapString(context.getErrors()), output.text() };
}

class ToolTest {
public:
  ToolTest() {
    auto create = kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT;
    auto root = dir.get();
    root->openFile(kj::Path({"hello.txt"}), create)->writeAll("hello world");
    root->openFile(kj::Path({"sub", "empty.txt"}), create)->writeAll("");
  }

  TempDir dir;
};

KJ_TEST("fsbridge size prints the file size") {
  ToolTest test;
  auto run = runTool({"size", test.dir.getPath(), "hello.txt"});
  KJ_EXPECT(run.status == 0, run.error);
  KJ_EXPECT(run.info == "11", run.info);

  run = runTool({"size", test.dir.getPath(), "sub/empty.txt"});
  KJ_EXPECT(run.status == 0, run.error);
  KJ_EXPECT(run.info == "0", run.info);
}

KJ_TEST("fsbridge size reports errors by code") {
  ToolTest test;

  auto run = runTool({"size", test.dir.getPath(), "missing.txt"});
  KJ_EXPECT(run.status == 1);
  KJ_EXPECT(run.error.startsWith("notFound: "), run.error);

  run = runTool({"size", test.dir.getPath(), "../hello.txt"});
  KJ_EXPECT(run.status == 1);
  KJ_EXPECT(run.error.startsWith("invalidArgument: "), run.error);

  run = runTool({"size", kj::str(test.dir.getPath(), "/no-such-dir"), "hello.txt"});
  KJ_EXPECT(run.status == 1);
  KJ_EXPECT(run.error.startsWith("failed: "), run.error);
}

KJ_TEST("fsbridge exists uses the exit status") {
  ToolTest test;

  auto run = runTool({"exists", test.dir.getPath(), "hello.txt"});
  KJ_EXPECT(run.status == 0, run.error);
  KJ_EXPECT(run.info == "true");

  run = runTool({"exists", test.dir.getPath(), "sub"});
  KJ_EXPECT(run.status == 0, run.error);
  KJ_EXPECT(run.info == "true");

  run = runTool({"exists", test.dir.getPath(), "nope.txt"});
  KJ_EXPECT(run.status == 1);
  KJ_EXPECT(run.error == "false", run.error);
  KJ_EXPECT(run.info.size() == 0);
}

KJ_TEST("fsbridge cat writes the whole file") {
  ToolTest test;

  auto run = runTool({"cat", "--chunk-size", "3", test.dir.getPath(), "hello.txt"});
  KJ_EXPECT(run.status == 0, run.error);
  KJ_EXPECT(run.output == "hello world", run.output);

  run = runTool({"cat", test.dir.getPath(), "sub/empty.txt"});
  KJ_EXPECT(run.status == 0, run.error);
  KJ_EXPECT(run.output == "");
}

KJ_TEST("fsbridge read writes a byte range") {
  ToolTest test;

  auto run = runTool({"read", "--offset", "6", "--length", "100", test.dir.getPath(),
                      "hello.txt"});
  KJ_EXPECT(run.status == 0, run.error);
  KJ_EXPECT(run.output == "world", run.output);

  run = runTool({"read", "--offset=0", "--length=5", test.dir.getPath(), "hello.txt"});
  KJ_EXPECT(run.status == 0, run.error);
  KJ_EXPECT(run.output == "hello", run.output);

  run = runTool({"read", "--offset", "1000", test.dir.getPath(), "hello.txt"});
  KJ_EXPECT(run.status == 0, run.error);
  KJ_EXPECT(run.output == "");
}

KJ_TEST("fsbridge validates numeric options") {
  ToolTest test;

  auto run = runTool({"cat", "--chunk-size=0", test.dir.getPath(), "hello.txt"});
  KJ_EXPECT(run.status == 1);
  KJ_EXPECT(mentions(run.error, "must be positive"), run.error);

  run = runTool({"read", "--offset=-1", test.dir.getPath(), "hello.txt"});
  KJ_EXPECT(run.status == 1);
  KJ_EXPECT(mentions(run.error, "not a non-negative integer"), run.error);

  run = runTool({"read", "--length=4294967296", test.dir.getPath(), "hello.txt"});
  KJ_EXPECT(run.status == 1);
  KJ_EXPECT(mentions(run.error, "must fit in 32 bits"), run.error);

  run = runTool({"read", "--length=12abc", test.dir.getPath(), "hello.txt"});
  KJ_EXPECT(run.status == 1);
  KJ_EXPECT(mentions(run.error, "not a non-negative integer"), run.error);
  KJ_EXPECT(run.output == "");
}

}  // namespace
}  // namespace fsbridge
