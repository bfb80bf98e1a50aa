// vi:noai:sw=4
// Copyright © 2015 David Bryant

#include "termed/common/buffer.hxx"
#include "termed/support/exception.hxx"
#include "termed/support/test.hxx"

#include <cstdio>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace {

using Lines = std::vector<std::string>;

std::string tempPath(const std::string & name) {
    return "/tmp/termed-test-" + name + "-" + std::to_string(::getpid());
}

void testLoad(Test & test) {
    std::istringstream ist("one\r\ntwo\n\nthree");
    Buffer buffer;
    buffer.load(ist);

    test.enforceEqual(buffer.height(), 4u, "Four lines");
    test.enforceEqual(buffer.line(0).text(), std::string("one"), "Carriage return stripped");
    test.enforce(buffer.line(2).isEmpty(), "Blank line kept");
    test.enforceEqual(buffer.line(3).text(), std::string("three"), "Unterminated last line");
    test.enforce(!buffer.isDirty(), "Clean after load");

    std::ostringstream ost;
    buffer.save(ost);
    test.enforceEqual(ost.str(), std::string("one\ntwo\n\nthree\n"), "Every line terminated");

    std::istringstream empty("");
    buffer.load(empty);
    test.enforce(buffer.isEmpty(), "Empty input gives no lines");
    test.enforce(buffer.line(5).isEmpty(), "Out of range line");
}

void testFiles(Test & test) {
    auto path = tempPath("buffer");

    {
        std::ofstream ofs(path);
        ofs << "hello\nworld\n";
    }

    Buffer buffer;
    test.enforceEqual(buffer.fileName(), std::string("[No Name]"), "No name");

    buffer.loadFile(path);
    test.enforceEqual(buffer.height(), 2u, "Loaded");
    test.enforceEqual(buffer.fileName(), path.substr(5), "Base name");

    buffer.insert(Location(0, 5), "!");
    test.enforce(buffer.isDirty(), "Dirty after edit");

    buffer.saveFile();
    test.enforce(!buffer.isDirty(), "Clean after save");

    Buffer reloaded;
    reloaded.loadFile(path);
    test.enforce(reloaded.lines() == Lines{"hello!", "world"}, "Round trip");

    std::remove(path.c_str());

    test.enforceThrows<SystemError>([&]() { reloaded.loadFile(path); }, "Missing file throws");
    test.enforceEqual(reloaded.height(), 2u, "Buffer untouched on failure");

    Buffer unnamed;
    test.enforceThrows<UserError>([&]() { unnamed.saveFile(); }, "Save without a name throws");

    unnamed.insert(Location(), "x");
    unnamed.saveFileAs(path);
    test.enforce(unnamed.hasPath(), "Path adopted");
    test.enforce(!unnamed.isDirty(), "Clean after save as");

    std::remove(path.c_str());
}

void testEdits(Test & test) {
    auto buffer = Buffer::fromLines({"abc", "def"});

    buffer.insertNewline(Location(0, 1));
    test.enforce(buffer.lines() == Lines{"a", "bc", "def"}, "Split");

    buffer.erase(Location(0, 1));
    test.enforce(buffer.lines() == Lines{"abc", "def"}, "Join");

    buffer.erase(Location(1, 3));
    test.enforce(buffer.lines() == Lines{"abc", "def"}, "Nothing to join on the last line");

    buffer.erase(Location(1, 0));
    test.enforce(buffer.lines() == Lines{"abc", "ef"}, "Erase a grapheme");

    buffer.insert(Location(2, 0), "new");
    test.enforce(buffer.lines() == Lines{"abc", "ef", "new"}, "Insert on the virtual line");

    buffer.insertNewline(Location(3, 0));
    test.enforceEqual(buffer.height(), 4u, "Newline on the virtual line");

    Buffer empty;
    empty.erase(Location());
    test.enforce(empty.isEmpty(), "Erase on an empty document");
    test.enforce(!empty.isDirty(), "Not dirty");
}

} // namespace {anonymous}

int main() {
    Test test("common/buffer");
    test.run("load", testLoad);
    test.run("files", testFiles);
    test.run("edits", testEdits);
    return 0;
}
