#include <iterator>
#include <utility>
#include "CsvTable.hpp"
#include "Errors.hpp"

namespace
{
    std::string trim(std::string const& s)
    {
        auto const first = s.find_first_not_of(" \t");
        if (first == std::string::npos)
            return "";
        auto const last = s.find_last_not_of(" \t");
        return s.substr(first, last - first + 1);
    }

    std::vector<CsvTable::Row> splitRecords(std::string_view content)
    {
        std::vector<CsvTable::Row> records;
        CsvTable::Row current;
        std::string fieldValue;
        bool inQuotes = false;
        bool lineHasData = false;
        bool fieldStart = true;

        auto endField = [&]()
        {
            current.push_back(std::move(fieldValue));
            fieldValue.clear();
            fieldStart = true;
        };

        auto endRecord = [&]()
        {
            if (lineHasData)
            {
                endField();
                records.push_back(std::move(current));
            }
            current.clear();
            fieldValue.clear();
            lineHasData = false;
            fieldStart = true;
        };

        for (std::size_t i = 0; i < content.size(); ++i)
        {
            char const c = content[i];

            if (inQuotes)
            {
                if (c == '"')
                {
                    if (i + 1 < content.size() && content[i + 1] == '"')
                    {
                        fieldValue += '"';
                        ++i;
                    }
                    else
                    {
                        inQuotes = false;
                    }
                }
                else
                {
                    fieldValue += c;
                }
                continue;
            }

            switch (c)
            {
                case '"':
                    // Only an opening quote starts a quoted section; 12" Street stays literal.
                    if (fieldStart)
                        inQuotes = true;
                    else
                        fieldValue += c;
                    fieldStart = false;
                    lineHasData = true;
                    break;
                case ',':
                    endField();
                    lineHasData = true;
                    break;
                case '\r':
                    break;
                case '\n':
                    endRecord();
                    break;
                default:
                    fieldValue += c;
                    fieldStart = false;
                    lineHasData = true;
            }
        }

        endRecord();
        return records;
    }
}

CsvTable CsvTable::parse(std::string tableName, std::string_view content)
{
    static constexpr std::string_view BOM = "\xEF\xBB\xBF";
    if (content.substr(0, BOM.size()) == BOM)
        content.remove_prefix(BOM.size());

    CsvTable table;
    table.name = std::move(tableName);

    auto records = splitRecords(content);
    if (records.empty())
        return table;

    for (auto const& column : records.front())
    {
        table.columnIndex.emplace(trim(column), table.header.size());
        table.header.push_back(trim(column));
    }

    table.rows.assign(std::make_move_iterator(records.begin() + 1),
                      std::make_move_iterator(records.end()));
    return table;
}

std::optional<std::size_t> CsvTable::findColumn(std::string const& column) const
{
    auto it = columnIndex.find(column);
    if (it == columnIndex.end())
        return std::nullopt;
    return it->second;
}

std::size_t CsvTable::requireColumn(std::string const& column) const
{
    auto index = findColumn(column);
    if (!index)
        throw DataFormatError(name + " is missing required column '" + column + "'");
    return *index;
}

std::optional<std::string> CsvTable::field(Row const& row, std::optional<std::size_t> column)
{
    if (!column || *column >= row.size())
        return std::nullopt;
    return row[*column];
}
