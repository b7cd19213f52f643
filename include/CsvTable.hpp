#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <unordered_map>

// One GTFS text file: a header row followed by comma separated records.
// Fields may be double-quoted ("" escapes a quote, quoted fields may span
// lines). A leading UTF-8 byte order mark and CRLF line ends are accepted.
class CsvTable
{
private:
    std::string name;
    std::vector<std::string> header;
    std::unordered_map<std::string, std::size_t> columnIndex;
    std::vector<std::vector<std::string>> rows;

public:
    using Row = std::vector<std::string>;

    static CsvTable parse(std::string tableName, std::string_view content);

    [[nodiscard]] std::string const& getName() const noexcept { return name; }
    [[nodiscard]] std::vector<std::string> const& getHeader() const noexcept { return header; }
    [[nodiscard]] std::vector<Row> const& getRows() const noexcept { return rows; }
    [[nodiscard]] std::size_t size() const noexcept { return rows.size(); }

    std::optional<std::size_t> findColumn(std::string const& column) const;

    // Throws DataFormatError naming the table when the column is absent.
    std::size_t requireColumn(std::string const& column) const;

    // Value of the column in this row; nullopt when the row is too short.
    static std::optional<std::string> field(Row const& row, std::optional<std::size_t> column);
};
