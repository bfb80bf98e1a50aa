// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef TTY__TERMINAL__HXX
#define TTY__TERMINAL__HXX

#include "termed/common/config.hxx"
#include "termed/common/data_types.hxx"
#include "termed/common/ui_component.hxx"
#include "termed/support/pattern.hxx"

#include <sstream>
#include <string>

#include <termios.h>

//
// The controlling terminal while the editor runs. Construction switches
// to raw mode and the alternate screen; destruction switches back, on
// every exit path.
//
// Painting is buffered: a frame is written out in one go by endFrame().
//
class Terminal final : public I_Painter, private Uncopyable {
    const Config       & _config;
    int                  _inFd;
    int                  _outFd;
    struct termios       _savedTermios;
    std::ostringstream   _frame;
    std::string          _title;

public:
    explicit Terminal(const Config & config);
    ~Terminal();

    int inFd() const { return _inFd; }

    Size size() const;

    // Hide the caret while the frame is drawn.
    void beginFrame();

    // Place and show the caret, then flush.
    void endFrame(Position caret);

    void setTitle(const std::string & title);

    // I_Painter implementation:

    void paintSpans(uint16_t row, AnnotatedStringIterator & spans) override;
    void paintText(uint16_t row, const std::string & text) override;
    void paintInverse(uint16_t row, const std::string & text) override;

private:
    void style(AnnotationType type);
    void flush();
};

#endif // TTY__TERMINAL__HXX
