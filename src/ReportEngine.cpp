#include "ReportEngine.h"
#include "MenderExceptions.h"
#include <fstream>

namespace {
constexpr size_t kTallTableRowCap = 120;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows,
                         size_t rowLimit) {
    body += "|";
    for (const auto& h : headers) body += " " + ReportEngine::escapeTableCell(h) + " |";
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) body += " --- |";
    body += "\n";

    for (size_t r = 0; r < rows.size() && r < rowLimit; ++r) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + ReportEngine::escapeTableCell(i < rows[r].size() ? rows[r][i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}
} // namespace

std::string ReportEngine::escapeTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addHeading(const std::string& heading) {
    body_ += "## " + heading + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addBulletList(const std::vector<std::string>& items) {
    if (items.empty()) return;
    for (const auto& item : items) body_ += "- " + item + "\n";
    body_ += "\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "## " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }
    body_ += "\n";

    if (rows.size() <= kTallTableRowCap) {
        appendMarkdownTable(body_, headers, rows, rows.size());
        return;
    }

    body_ += "_Tall table preview shown (" + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows)._\n\n";
    appendMarkdownTable(body_, headers, rows, kTallTableRowCap);
    body_ += "<details>\n";
    body_ += "<summary>Show full table (" + std::to_string(rows.size()) + " rows)</summary>\n\n";
    appendMarkdownTable(body_, headers, rows, rows.size());
    body_ += "</details>\n\n";
}

void ReportEngine::save(const std::string& filePath) const {
    std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw Mender::IOException("Could not open " + filePath + " for writing");
    out << body_;
    if (!out) throw Mender::IOException("Report write failed: " + filePath);
}
