#pragma once
#include <string>
#include <vector>

/**
 * @brief Accumulates a markdown document section by section.
 */
class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addHeading(const std::string& heading);
    void addParagraph(const std::string& text);
    void addBulletList(const std::vector<std::string>& items);
    /// Tables taller than the preview cap show a preview followed by a collapsible full copy.
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);

    const std::string& markdown() const noexcept { return body_; }

    /// @throws Mender::IOException when the file cannot be written.
    void save(const std::string& filePath) const;

    static std::string escapeTableCell(const std::string& value);

private:
    std::string body_;
};
