// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef TTY__EDITOR__HXX
#define TTY__EDITOR__HXX

#include "termed/tty/key.hxx"
#include "termed/common/command.hxx"
#include "termed/common/command_bar.hxx"
#include "termed/common/config.hxx"
#include "termed/common/message_bar.hxx"
#include "termed/common/status_bar.hxx"
#include "termed/common/view.hxx"
#include "termed/support/pattern.hxx"

#include <iosfwd>
#include <string>

//
// Routes commands to the view or to the active prompt and lays out the
// screen: the view on top, then the status bar, then the message bar
// (or the command bar while prompting) on the last row.
//
class Editor final : private Uncopyable {
public:
    enum class Prompt {
        NONE,
        SEARCH,
        SAVE
    };

private:
    const Config & _config;
    View           _view;
    StatusBar      _statusBar;
    MessageBar     _messageBar;
    CommandBar     _commandBar;
    Prompt         _prompt      = Prompt::NONE;
    Size           _size;
    int            _quitPresses = 0;
    bool           _shouldQuit  = false;

public:
    explicit Editor(const Config & config);

    // On failure the error goes to the message bar.
    void open(const std::string & path);

    void resize(Size size);

    void handleKey(const KeyEvent & event);
    void process(const Command & command);

    // Draw whatever changed since the last call.
    void render(I_Painter & painter);
    void setNeedsRedraw();

    Position    caretPosition() const;
    std::string title() const;
    bool        shouldQuit() const { return _shouldQuit; }
    Prompt      prompt() const { return _prompt; }

    // Milliseconds until the message bar must be redrawn, zero if never.
    uint32_t messageExpiresIn() const { return _messageBar.expiresIn(); }

    const View       & view()       const { return _view; }
    const MessageBar & messageBar() const { return _messageBar; }
    const CommandBar & commandBar() const { return _commandBar; }

private:
    void processNoPrompt(const Command & command);
    void processDuringSave(const Command & command);
    void processDuringSearch(const Command & command);

    void editView(const Command & command);
    void editCommandBar(const Command & command);

    void handleQuit();
    void resetQuitPresses();
    void handleSave();
    void save(const std::string * path);

    void setPrompt(Prompt prompt);
    void refreshStatus();
};

std::ostream & operator << (std::ostream & ost, Editor::Prompt prompt);

#endif // TTY__EDITOR__HXX
