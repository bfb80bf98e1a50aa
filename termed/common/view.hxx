// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__VIEW__HXX
#define COMMON__VIEW__HXX

#include "termed/common/buffer.hxx"
#include "termed/common/command.hxx"
#include "termed/common/document_status.hxx"
#include "termed/common/search.hxx"
#include "termed/common/selection.hxx"
#include "termed/common/ui_component.hxx"
#include "termed/support/pattern.hxx"

#include <string>

//
// The text area: owns the document, the cursor, the scroll offset, the
// search and the selection, and projects the visible part of the document
// onto the screen.
//
// The cursor's line may be the virtual line past the end of the document.
// The scroll offset is in display units: rows and columns.
//

class View final : public I_UiComponent, private Uncopyable {
    Buffer    _buffer;
    Location  _cursor;
    Position  _scroll;
    Size      _size;
    Search    _search;
    Selection _selection;
    bool      _showWelcome;
    bool      _needsRedraw = true;

public:
    explicit View(bool showWelcome = true) : _showWelcome(showWelcome) {}

    // Replace the document, resetting the cursor and scroll offset.
    void setBuffer(Buffer buffer);

    // Throws on failure; the current document is kept.
    void load(const std::string & path);
    void save();
    void saveAs(const std::string & path);

    const Buffer    & buffer()      const { return _buffer; }
    const Search    & searchState() const { return _search; }
    const Selection & selection()   const { return _selection; }
    Location          cursor()      const { return _cursor; }
    Position          scroll()      const { return _scroll; }
    Size              size()        const { return _size; }

    DocumentStatus status() const;

    // Screen position of the cursor relative to the view's origin.
    Position caretPosition() const;

    // Edits. Text may contain newlines.
    void insert(const std::string & text);
    void insertNewline();
    void erase();
    void eraseBackward();

    // Movement. Extending moves grow the selection, others drop it.
    void move(Move move, bool extend = false);

    // Search glue.
    bool isSearching() const { return _search.isActive(); }
    void enterSearch();
    void search(const std::string & query);
    void searchNext();
    void searchPrevious();
    void commitSearch();
    void cancelSearch();

    // The banner drawn on an empty document.
    static std::string welcomeMessage(size_t width);

    // I_UiComponent implementation:

    void resize(Size size) override;
    void render(I_Painter & painter, uint16_t originRow) override;
    bool needsRedraw() const override { return _needsRedraw; }
    void setNeedsRedraw() override { _needsRedraw = true; }

private:
    void insertText(const std::string & text);

    void moveUp(size_t step);
    void moveDown(size_t step);
    void moveLeft();
    void moveRight();

    size_t cursorColumn() const;
    void   snapToValidLine();
    void   snapToValidGrapheme();

    void scrollIntoView();
    void centerCursor();
    void jumpTo(Location location);
};

#endif // COMMON__VIEW__HXX
