// vi:noai:sw=4
// Copyright © 2015 David Bryant

#include "termed/support/test.hxx"
#include "termed/support/escape.hxx"

#include <cstdlib>
#include <exception>
#include <iostream>

#include <unistd.h>

namespace {

void label(std::ostream & ost, bool success) {
    if (::isatty(STDERR_FILENO)) {
        ost << (success ? CSIEsc::fg24bit(0x00, 0xA0, 0x00) : CSIEsc::fg24bit(0xD0, 0x00, 0x00))
            << (success ? "PASS" : "FAIL")
            << SGR::RESET_ALL;
    }
    else {
        ost << (success ? "PASS" : "FAIL");
    }
}

} // namespace {anonymous}

Test::~Test() {
    // A check threw; let the exception report itself.
    if (std::uncaught_exceptions() != 0) { return; }

    std::cerr << (_checks - static_cast<int>(_failed.size())) << "/" << _checks
              << " passed" << std::endl;

    if (!_failed.empty()) {
        for (auto & failure : _failed) {
            std::cerr << "  failed: " << failure << std::endl;
        }
        std::exit(EXIT_FAILURE);
    }
}

void Test::record(bool success, const std::string & description) {
    ++_checks;

    if (!success) { _failed.push_back(path() + " - " + description); }

    label(std::cerr, success);
    std::cerr << " " << _checks << " " << path() << " - " << description << std::endl;
}

std::string Test::path() const {
    std::string str;
    for (auto & name : _path) {
        if (!str.empty()) { str += '/'; }
        str += name;
    }
    return str;
}
