#pragma once
#include <cstdint>
#include <istream>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    // Numeric columns store NaN at missing positions; categorical columns store "".
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;
};

class TypedDataset {
public:
    explicit TypedDataset(std::string filename, char delimiter = ',');

    /**
     * @brief Loads CSV content from filename and infers per-column types.
     * @details CSV tokenization is delegated to CSVUtils; this class owns type inference and typed storage.
     * @throws Cognia::IOException when the file cannot be opened.
     * @throws Cognia::DatasetException on malformed header or records.
     */
    void load();

    /**
     * @brief Same as load() but reads from an already open stream.
     */
    void load(std::istream& in);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    const std::string& filename() const noexcept { return filename_; }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }

    std::vector<size_t> numericColumnIndices() const;
    std::vector<size_t> categoricalColumnIndices() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Canonical text of one row, used for duplicate detection.
     * Numbers are written in shortest round-trip form, so keys are equal iff the values are.
     */
    std::string rowKey(size_t row) const;

    static bool isMissingToken(const std::string& raw);
    /// Accepts inf/-inf and out-of-range literals (saturated); rejects NaN payloads and trailing text.
    static bool parseDouble(const std::string& v, double& out);

private:
    std::string filename_;
    char delimiter_;
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
