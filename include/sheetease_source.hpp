// sheetease_source.hpp - SheetEase - Workbook Source
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

// Workbooks arrive as JSON exports of a spreadsheet:
//
//     { "sheets": [ { "name": "Hero", "rows": [ [cell, ...], ... ] }, ... ] }
//
// The first sheet is the table; further sheets named "Enum-X" describe enums.

#ifndef SHEETEASE_SOURCE_HPP
#define SHEETEASE_SOURCE_HPP

#include "sheetease_core.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace sheetease
{
    struct workbook
    {
        std::string        origin;   // file path or a label
        std::vector<sheet> sheets;

        sheet const * main_sheet() const noexcept
        {
            return sheets.empty() ? nullptr : &sheets.front();
        }
    };

    enum class source_error_kind
    {
        unreadable,
        invalid_json,
        invalid_layout,
        invalid_cell,
        skipped_file
    };

    using source_error   = error<source_error_kind>;
    using source_context = context<std::optional<workbook>, source_error>;
    using scan_context   = context<std::vector<std::filesystem::path>, source_error>;

    source_context load_workbook(std::string_view text, std::string const & origin);
    source_context read_workbook(std::filesystem::path const & path);
    scan_context   scan_workbooks(std::filesystem::path const & folder);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        constexpr int64_t EXACT_DOUBLE_LIMIT = int64_t{1} << 53;

        // Integers a double cannot hold exactly are kept as their digits.
        inline bool exceeds_double(value const & v)
        {
            if (v.is_number_unsigned())
                return v.get<uint64_t>() > static_cast<uint64_t>(EXACT_DOUBLE_LIMIT);
            if (v.is_number_integer())
            {
                auto i = v.get<int64_t>();
                return i > EXACT_DOUBLE_LIMIT || i < -EXACT_DOUBLE_LIMIT;
            }
            return false;
        }

        inline std::optional<cell_value> json_to_cell(value const & v)
        {
            if (v.is_null())    return cell_value{};
            if (exceeds_double(v)) return cell_value{ v.dump() };
            if (v.is_number())  return cell_value{ v.get<double>() };
            if (v.is_string())  return cell_value{ v.get<std::string>() };
            if (v.is_boolean()) return cell_value{ std::string(v.get<bool>() ? "true" : "false") };
            return std::nullopt;
        }
    }

    inline source_context load_workbook(std::string_view text, std::string const & origin)
    {
        source_context out{};

        auto layout = [&](std::string table, std::string message)
        {
            out.errors.push_back({
                source_error_kind::invalid_layout,
                severity::fatal,
                { std::move(table), npos(), npos(), {} },
                origin + ": " + std::move(message)
            });
        };

        value root = value::parse(text, nullptr, false);
        if (root.is_discarded())
        {
            out.errors.push_back({
                source_error_kind::invalid_json,
                severity::fatal,
                { {}, npos(), npos(), {} },
                origin + ": not valid JSON"
            });
            return out;
        }

        auto sheets = root.is_object() ? root.find("sheets") : root.end();
        if (!root.is_object() || sheets == root.end() || !sheets->is_array())
        {
            layout({}, "expected an object with a 'sheets' array");
            return out;
        }

        workbook book;
        book.origin = origin;

        for (auto const & s : *sheets)
        {
            if (!s.is_object() || !s.contains("name") || !s["name"].is_string())
            {
                layout({}, "every sheet needs a string 'name'");
                continue;
            }

            sheet sh;
            sh.name = s["name"].get<std::string>();

            auto rows = s.find("rows");
            if (rows == s.end() || !rows->is_array())
            {
                layout(sh.name, "sheet '" + sh.name + "' needs a 'rows' array");
                continue;
            }

            for (size_t r = 0; r < rows->size(); ++r)
            {
                auto const & row = (*rows)[r];
                if (!row.is_array())
                {
                    layout(sh.name, "row " + std::to_string(r + 1) + " of sheet '" + sh.name + "' is not an array");
                    break;
                }

                cell_row cells;
                cells.reserve(row.size());
                for (size_t c = 0; c < row.size(); ++c)
                {
                    auto cell = detail::json_to_cell(row[c]);
                    if (!cell)
                    {
                        out.errors.push_back({
                            source_error_kind::invalid_cell,
                            severity::fatal,
                            { sh.name, r + 1, c, {} },
                            origin + ": cell holds " + std::string(row[c].type_name()) + "; expected null, number or string"
                        });
                        cells.emplace_back();
                        continue;
                    }
                    cells.push_back(std::move(*cell));
                }
                sh.rows.push_back(std::move(cells));
            }

            book.sheets.push_back(std::move(sh));
        }

        if (book.sheets.empty() && !out.has_fatal())
            layout({}, "workbook has no sheets");

        if (!out.has_fatal())
            out.result = std::move(book);
        return out;
    }

    inline source_context read_workbook(std::filesystem::path const & path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            source_context out{};
            out.errors.push_back({
                source_error_kind::unreadable,
                severity::fatal,
                { {}, npos(), npos(), {} },
                path.string() + ": cannot open workbook"
            });
            return out;
        }

        std::stringstream buffer;
        buffer << in.rdbuf();
        return load_workbook(buffer.str(), path.string());
    }

    // Workbook files must start with an upper-case letter; others are skipped.
    inline scan_context scan_workbooks(std::filesystem::path const & folder)
    {
        namespace fs = std::filesystem;
        scan_context out{};

        std::error_code ec;
        if (!fs::is_directory(folder, ec))
        {
            out.errors.push_back({
                source_error_kind::unreadable,
                severity::fatal,
                { {}, npos(), npos(), {} },
                folder.string() + ": not a directory"
            });
            return out;
        }

        fs::recursive_directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            std::error_code entry_ec;
            if (!it->is_regular_file(entry_ec) || it->path().extension() != ".json")
                continue;

            auto stem = it->path().filename().string();
            if (stem.empty() || !std::isupper(static_cast<unsigned char>(stem.front())))
            {
                out.errors.push_back({
                    source_error_kind::skipped_file,
                    severity::info,
                    { {}, npos(), npos(), {} },
                    it->path().string() + ": skipped, workbook names start with an upper-case letter"
                });
                continue;
            }

            out.result.push_back(it->path());
        }

        if (ec)
        {
            out.errors.push_back({
                source_error_kind::unreadable,
                severity::fatal,
                { {}, npos(), npos(), {} },
                folder.string() + ": " + ec.message()
            });
        }

        std::sort(out.result.begin(), out.result.end());
        return out;
    }

} // namespace sheetease

#endif // SHEETEASE_SOURCE_HPP
