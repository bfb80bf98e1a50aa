// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef COMMON__DOCUMENT_STATUS__HXX
#define COMMON__DOCUMENT_STATUS__HXX

#include <string>
#include <cstddef>

struct DocumentStatus {
    size_t      totalLines  = 0;
    size_t      currentLine = 0;    // Zero based.
    bool        modified    = false;
    std::string fileName;

    std::string modifiedIndicator() const {
        return modified ? "(modified)" : "";
    }

    std::string lineCount() const {
        return std::to_string(totalLines) + " lines";
    }

    std::string positionIndicator() const {
        return std::to_string(currentLine + 1) + "/" + std::to_string(totalLines);
    }
};

inline bool operator == (const DocumentStatus & lhs, const DocumentStatus & rhs) {
    return
        lhs.totalLines  == rhs.totalLines  &&
        lhs.currentLine == rhs.currentLine &&
        lhs.modified    == rhs.modified    &&
        lhs.fileName    == rhs.fileName;
}

inline bool operator != (const DocumentStatus & lhs, const DocumentStatus & rhs) {
    return !(lhs == rhs);
}

#endif // COMMON__DOCUMENT_STATUS__HXX
