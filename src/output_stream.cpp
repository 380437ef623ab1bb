#include "statusview/output_stream.hpp"

#include <iostream>

#include <unistd.h>

namespace statusview {

StdoutStream::StdoutStream() : is_terminal_(::isatty(STDOUT_FILENO) != 0) {}

std::ostream& StdoutStream::stream() { return std::cout; }

int StdoutStream::fd() const { return STDOUT_FILENO; }

} // namespace statusview
