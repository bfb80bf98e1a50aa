// vi:noai:sw=4
// Copyright © 2013 David Bryant

#ifndef SUPPORT__SYS__HXX
#define SUPPORT__SYS__HXX

#include <string>

// Write the whole buffer, retrying on short writes and EAGAIN.
void writeAll(int fd, const std::string & data);

#endif // SUPPORT__SYS__HXX
