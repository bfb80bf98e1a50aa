// vi:noai:sw=4
// Copyright © 2013 David Bryant

#include "termed/tty/editor.hxx"
#include "termed/tty/key_map.hxx"
#include "termed/support/debug.hxx"
#include "termed/support/exception.hxx"

#include <iostream>

namespace {

const std::string HELP          = "HELP: Ctrl-F = find | Ctrl-S = save | Ctrl-Q = quit";
const std::string SEARCH_PROMPT = "Search (Esc to cancel, Arrows to navigate): ";
const std::string SAVE_PROMPT   = "Save as: ";

} // namespace {anonymous}

Editor::Editor(const Config & config) :
    _config(config),
    _view(config.showWelcome),
    _messageBar(config.messageTimeout)
{
    _messageBar.update(HELP);
    refreshStatus();
}

void Editor::open(const std::string & path) {
    try {
        _view.load(path);
    }
    catch (const Exception & ex) {
        ERROR(<< ex.what());
        _messageBar.update("ERR: Could not open file: " + path);
    }

    refreshStatus();
}

void Editor::resize(Size size) {
    _size = size;

    auto viewRows = static_cast<uint16_t>(size.rows > 2 ? size.rows - 2 : 0);
    Size barSize(1, size.cols);

    _view.resize(Size(viewRows, size.cols));
    _statusBar.resize(barSize);
    _messageBar.resize(barSize);
    _commandBar.resize(barSize);
}

void Editor::handleKey(const KeyEvent & event) {
    auto command = keyToCommand(event);

    if (command.type == Command::Type::NONE) {
        PRINT(<< "Unbound key: " << event);
        return;
    }

    process(command);
}

void Editor::process(const Command & command) {
    switch (_prompt) {
        case Prompt::NONE:
            processNoPrompt(command);
            break;
        case Prompt::SAVE:
            processDuringSave(command);
            break;
        case Prompt::SEARCH:
            processDuringSearch(command);
            break;
    }

    refreshStatus();
}

void Editor::render(I_Painter & painter) {
    if (_size.rows == 0 || _size.cols == 0) {
        return;
    }

    auto bottomRow = static_cast<uint16_t>(_size.rows - 1);

    if (_prompt != Prompt::NONE) {
        if (_commandBar.needsRedraw()) { _commandBar.render(painter, bottomRow); }
    }
    else {
        if (_messageBar.needsRedraw()) { _messageBar.render(painter, bottomRow); }
    }

    if (_size.rows > 1 && _statusBar.needsRedraw()) {
        _statusBar.render(painter, static_cast<uint16_t>(_size.rows - 2));
    }

    if (_size.rows > 2 && _view.needsRedraw()) {
        _view.render(painter, 0);
    }
}

void Editor::setNeedsRedraw() {
    _view.setNeedsRedraw();
    _statusBar.setNeedsRedraw();
    _messageBar.setNeedsRedraw();
    _commandBar.setNeedsRedraw();
}

Position Editor::caretPosition() const {
    if (_prompt != Prompt::NONE) {
        return Position(_size.rows > 0 ? _size.rows - 1 : 0, _commandBar.caretColumn());
    }
    else {
        return _view.caretPosition();
    }
}

std::string Editor::title() const {
    return _view.buffer().fileName() + " - termed";
}

void Editor::processNoPrompt(const Command & command) {
    if (command.type == Command::Type::SYSTEM && command.system == System::QUIT) {
        handleQuit();
        return;
    }

    resetQuitPresses();

    switch (command.type) {
        case Command::Type::NONE:
            break;
        case Command::Type::MOVE:
            _view.move(command.move, command.extend);
            break;
        case Command::Type::EDIT:
            editView(command);
            break;
        case Command::Type::SYSTEM:
            switch (command.system) {
                case System::SEARCH:
                    setPrompt(Prompt::SEARCH);
                    break;
                case System::SAVE:
                    handleSave();
                    break;
                case System::QUIT:
                case System::DISMISS:
                    break;
            }
            break;
    }
}

void Editor::processDuringSave(const Command & command) {
    if (command.type == Command::Type::SYSTEM && command.system == System::DISMISS) {
        setPrompt(Prompt::NONE);
        _messageBar.update("Save aborted.");
    }
    else if (command.type == Command::Type::EDIT && command.edit == Edit::INSERT_NEWLINE) {
        auto path = _commandBar.value();
        setPrompt(Prompt::NONE);
        save(&path);
    }
    else if (command.type == Command::Type::EDIT) {
        editCommandBar(command);
    }
}

void Editor::processDuringSearch(const Command & command) {
    switch (command.type) {
        case Command::Type::NONE:
            break;
        case Command::Type::SYSTEM:
            if (command.system == System::DISMISS) {
                setPrompt(Prompt::NONE);
                _view.cancelSearch();
            }
            break;
        case Command::Type::EDIT:
            if (command.edit == Edit::INSERT_NEWLINE) {
                setPrompt(Prompt::NONE);
                _view.commitSearch();
            }
            else {
                editCommandBar(command);
                _view.search(_commandBar.value());
            }
            break;
        case Command::Type::MOVE:
            switch (command.move) {
                case Move::RIGHT:
                case Move::DOWN:
                    _view.searchNext();
                    break;
                case Move::LEFT:
                case Move::UP:
                    _view.searchPrevious();
                    break;
                default:
                    break;
            }
            break;
    }
}

void Editor::editView(const Command & command) {
    switch (command.edit) {
        case Edit::INSERT:
            _view.insert(command.text);
            break;
        case Edit::INSERT_NEWLINE:
            _view.insertNewline();
            break;
        case Edit::DELETE:
            _view.erase();
            break;
        case Edit::DELETE_BACKWARD:
            _view.eraseBackward();
            break;
    }
}

void Editor::editCommandBar(const Command & command) {
    switch (command.edit) {
        case Edit::INSERT:
            _commandBar.append(command.text);
            break;
        case Edit::DELETE_BACKWARD:
            _commandBar.eraseLast();
            break;
        case Edit::INSERT_NEWLINE:
        case Edit::DELETE:
            break;
    }
}

void Editor::handleQuit() {
    if (!_view.buffer().isDirty() || _quitPresses + 1 >= _config.quitTimes) {
        _shouldQuit = true;
    }
    else {
        ++_quitPresses;
        _messageBar.update("WARNING! File has unsaved changes. Press Ctrl-Q " +
                           std::to_string(_config.quitTimes - _quitPresses) +
                           " more times to quit.");
    }
}

void Editor::resetQuitPresses() {
    if (_quitPresses > 0) {
        _quitPresses = 0;
        _messageBar.update(std::string());
    }
}

void Editor::handleSave() {
    if (_view.buffer().hasPath()) {
        save(nullptr);
    }
    else {
        setPrompt(Prompt::SAVE);
    }
}

void Editor::save(const std::string * path) {
    try {
        if (path) { _view.saveAs(*path); }
        else      { _view.save();        }

        _messageBar.update("File saved successfully.");
    }
    catch (const Exception & ex) {
        ERROR(<< ex.what());
        _messageBar.update("Error writing file!");
    }
}

void Editor::setPrompt(Prompt prompt) {
    switch (prompt) {
        case Prompt::SAVE:
            _commandBar.setPrompt(SAVE_PROMPT);
            break;
        case Prompt::SEARCH:
            _view.enterSearch();
            _commandBar.setPrompt(SEARCH_PROMPT);
            break;
        case Prompt::NONE:
            _messageBar.setNeedsRedraw();
            break;
    }

    _commandBar.clearValue();
    _prompt = prompt;
}

void Editor::refreshStatus() {
    _statusBar.update(_view.status());
}

//
//
//

std::ostream & operator << (std::ostream & ost, Editor::Prompt prompt) {
    switch (prompt) {
        case Editor::Prompt::NONE:
            return ost << "NONE";
        case Editor::Prompt::SEARCH:
            return ost << "SEARCH";
        case Editor::Prompt::SAVE:
            return ost << "SAVE";
    }

    FATAL(<< "Invalid prompt: " << static_cast<int>(prompt));
}
