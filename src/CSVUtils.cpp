#include "CSVUtils.h"

#include <unordered_set>
#include <utility>

namespace CSVUtils {
namespace {
enum class FieldState { START, UNQUOTED, QUOTED, QUOTE_IN_QUOTED };

bool isLineBreak(int ch) {
    return ch == '\n' || ch == '\r';
}

// Consumes "\r\n" as one break after the caller has read '\r'.
void finishLineBreak(std::istream& is, char ch) {
    if (ch == '\r' && is.peek() == '\n') is.get();
}
}

std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    return value.substr(start, value.find_last_not_of(" \t") - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    const std::istream::pos_type start = is.tellg();
    char bytes[3] = {0, 0, 0};
    if (is.read(bytes, 3) &&
        static_cast<unsigned char>(bytes[0]) == 0xEF &&
        static_cast<unsigned char>(bytes[1]) == 0xBB &&
        static_cast<unsigned char>(bytes[2]) == 0xBF) {
        return;
    }
    is.clear();
    is.seekg(start);
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      bool* limitExceeded,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (limitExceeded) *limitExceeded = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string field;
    FieldState state = FieldState::START;
    bool sawContent = false;

    auto endField = [&]() {
        row.push_back(state == FieldState::UNQUOTED || state == FieldState::START ? trimUnquotedField(field) : field);
        field.clear();
        state = FieldState::START;
        return limits.maxColumns == 0 || row.size() <= limits.maxColumns;
    };

    char ch;
    bool withinLimits = true;
    bool endOfRecord = false;
    while (withinLimits && !endOfRecord && is.get(ch)) {
        switch (state) {
            case FieldState::START:
            case FieldState::UNQUOTED:
                if (ch == delimiter) {
                    sawContent = true;
                    withinLimits = endField();
                    continue;
                }
                if (isLineBreak(ch)) {
                    finishLineBreak(is, ch);
                    endOfRecord = true;
                    continue;
                }
                sawContent = true;
                if (ch == '"' && state == FieldState::START) {
                    state = FieldState::QUOTED;
                    continue;
                }
                state = FieldState::UNQUOTED;
                field += ch;
                break;

            case FieldState::QUOTED:
                if (ch == '"') {
                    state = FieldState::QUOTE_IN_QUOTED;
                    continue;
                }
                if (isLineBreak(ch)) {
                    finishLineBreak(is, ch);
                    ch = '\n';
                }
                field += ch;
                break;

            case FieldState::QUOTE_IN_QUOTED:
                if (ch == '"') {
                    field += '"';
                    state = FieldState::QUOTED;
                } else if (ch == delimiter) {
                    withinLimits = endField();
                } else if (isLineBreak(ch)) {
                    finishLineBreak(is, ch);
                    endOfRecord = true;
                } else {
                    // A stray quote inside a quoted field is kept literally.
                    field += '"';
                    field += ch;
                    state = FieldState::QUOTED;
                }
                break;
        }
        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) withinLimits = false;
    }

    if (!withinLimits) {
        if (limitExceeded) *limitExceeded = true;
        return {};
    }
    if (state == FieldState::QUOTED && malformed) *malformed = true;
    if (!sawContent) return {};

    if (state == FieldState::QUOTE_IN_QUOTED) state = FieldState::QUOTED;
    if (!endField()) {
        if (limitExceeded) *limitExceeded = true;
        return {};
    }
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> taken;

    for (size_t i = 0; i < header.size(); ++i) {
        const std::string base = header[i].empty() ? "column_" + std::to_string(i + 1) : header[i];
        std::string name = base;
        for (size_t suffix = 2; taken.count(name) > 0; ++suffix) {
            name = base + "_" + std::to_string(suffix);
        }
        taken.insert(name);
        out.push_back(std::move(name));
    }
    return out;
}
} // namespace CSVUtils
