#include "ReportEngine.h"
#include "CogniaExceptions.h"

#include <filesystem>
#include <fstream>
#include <utility>

namespace {
bool hasUriScheme(const std::string& target) {
    const size_t colon = target.find(':');
    if (colon == std::string::npos) return false;
    if (colon == 0) return false;
    for (size_t i = 0; i < colon; ++i) {
        const char ch = target[i];
        const bool ok = (ch >= 'a' && ch <= 'z') ||
                        (ch >= 'A' && ch <= 'Z') ||
                        (ch >= '0' && ch <= '9') ||
                        ch == '+' || ch == '-' || ch == '.';
        if (!ok) return false;
    }
    return true;
}

bool isExternalOrAnchorLink(const std::string& target) {
    if (target.empty()) return true;
    if (target[0] == '#') return true;
    if (hasUriScheme(target)) return true;
    return false;
}

// Chart paths are produced relative to the working directory; the report may live elsewhere.
std::string relativeToReport(const std::string& target, const std::filesystem::path& reportDir) {
    if (isExternalOrAnchorLink(target) || reportDir.empty()) return target;

    std::error_code ec;
    const std::filesystem::path rawPath(target);
    std::filesystem::path absolute = rawPath;
    if (!rawPath.is_absolute()) {
        const std::filesystem::path cwd = std::filesystem::current_path(ec);
        if (ec) return rawPath.generic_string();
        absolute = cwd / rawPath;
    }

    const std::filesystem::path base = std::filesystem::absolute(reportDir, ec);
    if (ec) return rawPath.generic_string();
    const std::filesystem::path rel = absolute.lexically_normal().lexically_relative(base.lexically_normal());
    if (rel.empty()) return rawPath.generic_string();
    return rel.generic_string();
}

void appendHtmlTable(std::string& body,
                     const std::vector<std::string>& headers,
                     const std::vector<std::vector<std::string>>& rows,
                     size_t rowLimit) {
    body += "<div class=\"table-wrap\">\n";
    body += "<table class=\"table\">\n";
    body += "  <thead>\n";
    body += "    <tr>\n";
    for (const auto& h : headers) {
        body += "      <th>" + ReportEngine::escapeHtml(h) + "</th>\n";
    }
    body += "    </tr>\n";
    body += "  </thead>\n";
    body += "  <tbody>\n";
    for (size_t r = 0; r < rows.size() && r < rowLimit; ++r) {
        const auto& row = rows[r];
        body += "    <tr>\n";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += "      <td>" + ReportEngine::escapeHtml(i < row.size() ? row[i] : "") + "</td>\n";
        }
        body += "    </tr>\n";
    }
    body += "  </tbody>\n";
    body += "</table>\n";
    body += "</div>\n";
}
} // namespace

ReportEngine::ReportEngine(std::string documentTitle)
    : documentTitle_(std::move(documentTitle)) {}

std::string ReportEngine::escapeHtml(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 16);
    for (char ch : value) {
        switch (ch) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            case '\n': escaped += "<br>"; break;
            case '\r': break;
            default: escaped.push_back(ch); break;
        }
    }
    return escaped;
}

void ReportEngine::addTitle(const std::string& title) {
    body_ += "<h1>" + escapeHtml(title) + "</h1>\n";
}

void ReportEngine::beginSection(const std::string& title) {
    body_ += "<div class=\"section\">\n<h2>" + escapeHtml(title) + "</h2>\n";
    ++openSections_;
}

void ReportEngine::endSection() {
    if (openSections_ == 0) return;
    body_ += "</div>\n\n";
    --openSections_;
}

void ReportEngine::addHeading(const std::string& title) {
    body_ += "<h3>" + escapeHtml(title) + "</h3>\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += "<p>" + escapeHtml(text) + "</p>\n";
}

void ReportEngine::addKeyValue(const std::string& key, const std::string& value) {
    body_ += "<p><b>" + escapeHtml(key) + ":</b> " + escapeHtml(value) + "</p>\n";
}

void ReportEngine::addTable(const std::string& title,
                            const std::vector<std::string>& headers,
                            const std::vector<std::vector<std::string>>& rows) {
    if (!title.empty()) addHeading(title);
    if (headers.empty() || rows.empty()) {
        body_ += "<p><i>No data available</i></p>\n";
        return;
    }

    const bool tallTable = rows.size() > kTallTableRowCap;
    if (tallTable) {
        body_ += "<p><i>Tall table preview shown (" + std::to_string(kTallTableRowCap) + " of " +
                 std::to_string(rows.size()) + " rows).</i></p>\n";
    }

    appendHtmlTable(body_, headers, rows, tallTable ? kTallTableRowCap : rows.size());

    if (tallTable) {
        body_ += "<details>\n";
        body_ += "<summary>Show full table (" + std::to_string(rows.size()) + " rows)</summary>\n";
        appendHtmlTable(body_, headers, rows, rows.size());
        body_ += "</details>\n";
    }
}

void ReportEngine::addImage(const std::string& title, const std::string& imagePath) {
    if (!title.empty()) addHeading(title);
    body_ += "<img alt=\"" + escapeHtml(title) + "\" src=\"";
    images_.push_back({body_.size(), imagePath});
    body_ += "\" />\n";
}

void ReportEngine::beginCollapsible(const std::string& summary) {
    body_ += "<details>\n<summary>" + escapeHtml(summary) + "</summary>\n";
    ++openCollapsibles_;
}

void ReportEngine::endCollapsible() {
    if (openCollapsibles_ == 0) return;
    body_ += "</details>\n";
    --openCollapsibles_;
}

void ReportEngine::addList(const std::vector<std::string>& items, const std::string& cssClass) {
    body_ += "<ul class=\"" + escapeHtml(cssClass) + "\">\n";
    for (const auto& item : items) {
        body_ += "  <li>" + escapeHtml(item) + "</li>\n";
    }
    body_ += "</ul>\n";
}

std::string ReportEngine::render(const std::string& reportDir) const {
    const std::filesystem::path dir(reportDir);

    std::string out;
    out.reserve(body_.size() + 512);
    out += "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n";
    out += "<title>" + escapeHtml(documentTitle_) + "</title>\n";
    out += "</head>\n<body>\n";

    size_t cursor = 0;
    for (const auto& image : images_) {
        out.append(body_, cursor, image.offset - cursor);
        out += escapeHtml(relativeToReport(image.path, dir));
        cursor = image.offset;
    }
    out.append(body_, cursor, std::string::npos);

    for (int i = 0; i < openCollapsibles_; ++i) out += "</details>\n";
    for (int i = 0; i < openSections_; ++i) out += "</div>\n";

    out += "</body>\n</html>\n";
    return out;
}

void ReportEngine::save(const std::string& filePath) const {
    const std::filesystem::path target(filePath);
    std::error_code ec;
    const std::filesystem::path reportDir = target.parent_path().empty()
        ? std::filesystem::current_path(ec)
        : target.parent_path();
    if (ec) {
        throw Cognia::IOException("Cannot resolve working directory: " + ec.message());
    }

    std::ofstream out(filePath, std::ios::binary);
    if (!out) {
        throw Cognia::IOException("Cannot open report file for writing: " + filePath);
    }
    out << render(reportDir.string());
    if (!out) {
        throw Cognia::IOException("Failed while writing report file: " + filePath);
    }
}
