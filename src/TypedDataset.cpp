#include "TypedDataset.h"
#include "CSVUtils.h"
#include "CogniaExceptions.h"
#include "CommonUtils.h"
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>

TypedDataset::TypedDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

bool TypedDataset::isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

bool TypedDataset::parseDouble(const std::string& v, double& out) {
    std::string cleaned = CommonUtils::trim(v);
    if (isMissingToken(cleaned)) return false;
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    if (p != e) return false;
    if (ec == std::errc::result_out_of_range) {
        // Overflow saturates to +-inf, underflow flushes toward zero.
        out = std::strtod(cleaned.c_str(), nullptr);
        return true;
    }
    return ec == std::errc{} && !std::isnan(out);
}

void TypedDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw Cognia::IOException("Could not open file: " + filename_);
    load(in);
}

void TypedDataset::load(std::istream& in) {
    CSVUtils::skipBOM(in);

    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
    if (malformed || header.empty()) throw Cognia::DatasetException("Malformed or empty CSV header");
    header = CSVUtils::normalizeHeader(header);

    std::vector<std::vector<std::string>> raw(header.size());
    rowCount_ = 0;
    size_t lineNo = 1;
    while (in.peek() != EOF) {
        ++lineNo;
        bool limitExceeded = false;
        auto row = CSVUtils::parseCSVLine(in, delimiter_, &malformed, &limitExceeded);
        if (limitExceeded) {
            throw Cognia::DatasetException("Record exceeds parser limits near line " + std::to_string(lineNo));
        }
        if (malformed) {
            throw Cognia::DatasetException("Unterminated quoted field near line " + std::to_string(lineNo));
        }
        if (row.empty()) continue;
        if (row.size() > header.size()) {
            throw Cognia::DatasetException("Row " + std::to_string(rowCount_ + 1) + " has " + std::to_string(row.size()) +
                                           " fields, header has " + std::to_string(header.size()));
        }
        row.resize(header.size());
        for (size_t c = 0; c < header.size(); ++c) raw[c].push_back(std::move(row[c]));
        ++rowCount_;
    }

    columns_.clear();
    columns_.reserve(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        TypedColumn col;
        col.name = header[c];
        col.missing.assign(rowCount_, static_cast<uint8_t>(0));

        size_t observed = 0;
        size_t numericHits = 0;
        std::vector<double> numeric(rowCount_, std::numeric_limits<double>::quiet_NaN());
        for (size_t r = 0; r < rowCount_; ++r) {
            if (isMissingToken(raw[c][r])) {
                col.missing[r] = 1;
                continue;
            }
            ++observed;
            if (parseDouble(raw[c][r], numeric[r])) ++numericHits;
        }

        // All-missing columns carry no evidence of being numeric.
        if (observed > 0 && numericHits == observed) {
            col.type = ColumnType::NUMERIC;
            col.values = std::move(numeric);
        } else {
            col.type = ColumnType::CATEGORICAL;
            std::vector<std::string> text(rowCount_);
            for (size_t r = 0; r < rowCount_; ++r) {
                if (!col.missing[r]) text[r] = CommonUtils::trim(raw[c][r]);
            }
            col.values = std::move(text);
        }
        columns_.push_back(std::move(col));
    }
}

std::vector<size_t> TypedDataset::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::categoricalColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::CATEGORICAL) out.push_back(i);
    return out;
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

std::string TypedDataset::rowKey(size_t row) const {
    std::string key;
    for (const auto& col : columns_) {
        if (row < col.missing.size() && col.missing[row]) {
            key += "\x1f<NA>";
        } else if (col.type == ColumnType::NUMERIC) {
            double v = std::get<std::vector<double>>(col.values)[row];
            if (v == 0.0) v = 0.0; // folds -0
            char buf[32];
            const auto res = std::to_chars(buf, buf + sizeof(buf), v);
            key += '\x1f';
            key.append(buf, res.ptr);
        } else {
            key += '\x1f';
            key += std::get<std::vector<std::string>>(col.values)[row];
        }
    }
    return key;
}
