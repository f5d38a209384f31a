#include "resftp/RecordParsers.hpp"

namespace resftp {

Records parseDelimited(const std::string &text, char delimiter) {
    Records rows;
    std::vector<std::string> row;
    std::string field;
    bool quoted = false;
    bool rowStarted = false;

    auto endField = [&]() {
        row.push_back(std::move(field));
        field.clear();
    };
    auto endRow = [&]() {
        endField();
        rows.push_back(std::move(row));
        row.clear();
        rowStarted = false;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        if (c == '"' && field.empty()) {
            quoted = true;
            rowStarted = true;
        } else if (c == delimiter) {
            endField();
            rowStarted = true;
        } else if (c == '\n') {
            if (rowStarted)
                endRow(); // blank lines are skipped
        } else if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            // handled by the '\n' that follows
        } else {
            field.push_back(c);
            rowStarted = true;
        }
    }
    if (rowStarted)
        endRow();
    return rows;
}

RecordParser delimitedRecordParser(char delimiter) {
    return [delimiter](RemoteFile &file, Records &out, Error &err) {
        std::string text;
        if (!readAll(file, text, err))
            return false;
        out = parseDelimited(text, delimiter);
        return true;
    };
}

} // namespace resftp
