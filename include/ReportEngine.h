#pragma once
#include <string>
#include <vector>

/**
 * Accumulates an HTML document body. Content is escaped on insertion; images are
 * linked by path relative to the report file, never embedded.
 */
class ReportEngine {
public:
    explicit ReportEngine(std::string documentTitle = "Cognia EDA Report");

    void addTitle(const std::string& title);
    void beginSection(const std::string& title);
    void endSection();
    void addHeading(const std::string& title);
    void addParagraph(const std::string& text);
    void addKeyValue(const std::string& key, const std::string& value);

    /**
     * @brief Appends a table; an empty title omits the caption heading.
     * @details Rows with no entries render the "No data available" placeholder. Tables taller than
     *          the preview cap show the first rows and tuck the full table into a details block.
     */
    void addTable(const std::string& title,
                  const std::vector<std::string>& headers,
                  const std::vector<std::vector<std::string>>& rows);

    void addImage(const std::string& title, const std::string& imagePath);
    void beginCollapsible(const std::string& summary);
    void endCollapsible();
    void addList(const std::vector<std::string>& items, const std::string& cssClass);

    /**
     * @brief Complete HTML document. Image paths are rewritten relative to reportDir.
     */
    std::string render(const std::string& reportDir = "") const;

    /**
     * @throws Cognia::IOException when the file cannot be written.
     */
    void save(const std::string& filePath) const;

    static std::string escapeHtml(const std::string& text);

    static constexpr size_t kTallTableRowCap = 120;

private:
    struct ImageRef {
        size_t offset;
        std::string path;
    };

    std::string documentTitle_;
    std::string body_;
    // Image src attributes are resolved at render time, once the report location is known.
    std::vector<ImageRef> images_;
    int openSections_ = 0;
    int openCollapsibles_ = 0;
};
