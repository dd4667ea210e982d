#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char bom[3] = {0xEF, 0xBB, 0xBF};
    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != bom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3 || matched == 0) return;

    // Partial BOM: put back what we consumed.
    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (size_t i = 0; i < matched; ++i) is.unget();
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
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    bool sawNewline = false;
    size_t recordBytes = 0;
    size_t physicalLines = 1;
    bool overLimit = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) overLimit = true;
    };

    while (!overLimit && is.get(c)) {
        if (limits.maxRecordBytes > 0 && ++recordBytes > limits.maxRecordBytes) {
            overLimit = true;
            break;
        }

        if (c == '"') {
            if (!inQuotes && val.empty()) {
                inQuotes = true;
                fieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                val += '"';
            } else if (inQuotes) {
                const int next = is.peek();
                if (next == EOF || next == delimiter || next == '\n' || next == '\r') {
                    inQuotes = false;
                } else {
                    val += c;
                }
            } else {
                val += c;
            }
        } else if (c == delimiter && !inQuotes) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            sawNewline = true;
            if (!inQuotes) break;
            if (limits.maxPhysicalLinesPerRecord > 0 && ++physicalLines > limits.maxPhysicalLinesPerRecord) {
                overLimit = true;
                break;
            }
            val += '\n';
        } else {
            val += c;
        }

        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) overLimit = true;
    }

    if (overLimit && limitExceeded) *limitExceeded = true;
    if (inQuotes && malformed) *malformed = true;

    const bool blankLine = !sawDelimiter && !fieldQuoted && val.empty() && row.empty();
    if (blankLine && sawNewline) return {};
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        const std::string original = out[i];
        if (seen.count(out[i]) != 0) {
            size_t suffix = 2;
            while (seen.count(original + "_" + std::to_string(suffix)) != 0) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}
} // namespace CSVUtils
