// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__BUFFER__HXX
#define COMMON__BUFFER__HXX

#include "termed/common/line.hxx"
#include "termed/common/data_types.hxx"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

//
// The document: an ordered sequence of lines plus the file it came from.
//
// A location's line may equal height(), the virtual line past the end.
// Editing there appends a line. Other out of range locations clamp.
//

class Buffer {
    std::vector<Line>          _lines;
    std::optional<std::string> _path;
    bool                       _dirty = false;

public:
    Buffer() = default;

    static Buffer fromLines(const std::vector<std::string> & lines);

    // Replace the contents with lines read from the stream. A trailing
    // '\r' is stripped from each line.
    void load(std::istream & ist);

    // Throws SystemError if the file can't be read; the buffer is untouched.
    void loadFile(const std::string & path);

    // Each line followed by '\n'.
    void save(std::ostream & ost) const;

    // Write to the current path. Throws UserError if there is none and
    // SystemError if writing fails; on failure the buffer stays dirty.
    void saveFile();

    // Write to path and adopt it on success.
    void saveFileAs(const std::string & path);

    std::vector<std::string> lines() const;

    size_t height()  const { return _lines.size(); }
    bool   isEmpty() const { return _lines.empty(); }
    bool   isDirty() const { return _dirty; }

    bool                                hasPath() const { return static_cast<bool>(_path); }
    const std::optional<std::string> &  path()    const { return _path; }

    // Base name of the path, or "[No Name]".
    std::string fileName() const;

    // An empty line if index is out of range.
    const Line & line(size_t index) const;

    size_t graphemeCount(size_t lineIndex) const { return line(lineIndex).graphemeCount(); }

    size_t widthUpTo(size_t lineIndex, size_t graphemeIndex) const {
        return line(lineIndex).widthUpTo(graphemeIndex);
    }

    // Insert text (no newlines) at the location.
    void insert(Location at, const std::string & text);

    // Remove the grapheme at the location; at the end of a line join the
    // next line onto it.
    void erase(Location at);

    // Split the line at the location.
    void insertNewline(Location at);

private:
    void write(const std::string & path) const;
};

#endif // COMMON__BUFFER__HXX
