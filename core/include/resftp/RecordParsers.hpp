#pragma once
#include "RemoteSession.hpp"
#include <functional>
#include <string>

namespace resftp {

// Turns an open remote file into records. Return false and fill err to fail.
using RecordParser = std::function<bool(RemoteFile &, Records &, Error &)>;

// Splits text into rows and fields; blank lines are skipped. Double-quoted fields may contain the
// delimiter, newlines and "" escapes. "\r\n" line ends are accepted.
Records parseDelimited(const std::string &text, char delimiter = ',');

// Reads the whole file and parses it with parseDelimited.
RecordParser delimitedRecordParser(char delimiter = ',');

} // namespace resftp
