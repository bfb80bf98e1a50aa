// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/support/selector.hxx"
#include "termed/support/pipe.hxx"
#include "termed/support/test.hxx"

#include <vector>

namespace {

class Recorder final : public I_Selector::I_ReadHandler {
public:
    std::vector<int> reads;

    void handleRead(int fd) override { reads.push_back(fd); }
};

void testNotify(Test & test) {
    Selector   selector;
    SignalPipe pipe;
    Recorder   recorder;

    selector.addReadable(pipe.readFd(), &recorder);

    test.enforce(!pipe.drain(), "Nothing pending");
    test.enforce(!selector.animate(0), "Nothing readable");
    test.enforce(recorder.reads.empty(), "No dispatch");

    pipe.notify();
    pipe.notify();

    test.enforce(selector.animate(1000), "Readable after notify");
    test.enforce(recorder.reads == std::vector<int>{pipe.readFd()}, "Dispatched once");
    test.enforce(pipe.drain(), "Notifications coalesce");
    test.enforce(!pipe.drain(), "Drained");

    selector.removeReadable(pipe.readFd());
}

void testTimeout(Test & test) {
    Selector   selector;
    SignalPipe pipe;
    Recorder   recorder;

    selector.addReadable(pipe.readFd(), &recorder);
    test.enforce(!selector.animate(20), "Times out");
    selector.removeReadable(pipe.readFd());

    test.enforce(recorder.reads.empty(), "No dispatch");
}

} // namespace {anonymous}

int main() {
    Test test("support/selector");
    test.run("notify", testNotify);
    test.run("timeout", testTimeout);
    return 0;
}
