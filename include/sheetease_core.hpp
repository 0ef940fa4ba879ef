// sheetease_core.hpp - SheetEase - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SHEETEASE_CORE_HPP
#define SHEETEASE_CORE_HPP

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

namespace sheetease
{
//========================================================================
// Positions
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    // Rows are numbered the way the spreadsheet shows them: the six header
    // rows are 1..6 and the first data row is 7.
    constexpr size_t HEADER_ROW_COUNT = 6;
    constexpr size_t FIRST_DATA_ROW   = HEADER_ROW_COUNT + 1;

    enum class header_row : size_t
    {
        remark = 0,
        header,
        type,
        label,
        name,
        default_value
    };

    inline constexpr size_t data_row_number(size_t ordinal)
    {
        return FIRST_DATA_ROW + ordinal;
    }

//========================================================================
// Values
//========================================================================

    // What the tabular source hands over: Null, Number or Text.
    using cell_value = std::variant<std::monostate, double, std::string>;
    using cell_row   = std::vector<cell_value>;

    // Typed values, records and documents. Objects keep insertion order.
    using value = nlohmann::ordered_json;

    struct sheet
    {
        std::string           name;
        std::vector<cell_row> rows;   // header rows first, then data rows

        size_t data_row_count() const noexcept
        {
            return rows.size() > HEADER_ROW_COUNT ? rows.size() - HEADER_ROW_COUNT : 0;
        }
    };

//========================================================================
// Diagnostics
//========================================================================

    enum class severity
    {
        fatal,        // abort this table
        recoverable,  // value dropped or check skipped, run continues
        info
    };

    struct source_location
    {
        std::string table;
        size_t      row    = npos();
        size_t      column = npos();
        std::string field;
    };

    template <typename Kind>
    struct error
    {
        Kind            kind;
        severity        level = severity::fatal;
        source_location loc;
        std::string     message;
    };

    template <typename Kind>
    severity level_of(error<Kind> const & e)
    {
        return e.level;
    }

    template <typename... Errors>
    severity level_of(std::variant<Errors...> const & e)
    {
        return std::visit([](auto const & x) { return x.level; }, e);
    }

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }

        bool has_fatal() const
        {
            return std::any_of(errors.begin(), errors.end(),
                [](Error const & e) { return level_of(e) == severity::fatal; });
        }

        size_t count(severity level) const
        {
            return static_cast<size_t>(std::count_if(errors.begin(), errors.end(),
                [level](Error const & e) { return level_of(e) == level; }));
        }
    };

    inline std::string to_string(severity s)
    {
        switch (s)
        {
            case severity::fatal:       return "error";
            case severity::recoverable: return "warning";
            case severity::info:        return "info";
        }
        return "error";
    }

    inline std::string to_string(source_location const & loc)
    {
        std::string out = loc.table.empty() ? std::string("<batch>") : loc.table;

        if (loc.row != npos())
            out += ":" + std::to_string(loc.row);

        if (!loc.field.empty())
            out += ":" + loc.field;
        else if (loc.column != npos())
            out += ":col " + std::to_string(loc.column);

        return out;
    }

    template <typename Kind>
    std::string to_string(error<Kind> const & e)
    {
        return "[" + to_string(e.level) + "] " + to_string(e.loc) + ": " + e.message;
    }

    template <typename... Errors>
    std::string to_string(std::variant<Errors...> const & e)
    {
        return std::visit([](auto const & x) { return to_string(x); }, e);
    }

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string trim(std::string_view s)
        {
            return std::string(trim_sv(s));
        }

        inline std::string to_lower(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        inline std::vector<std::string_view> split(std::string_view s, char sep)
        {
            std::vector<std::string_view> parts;
            size_t start = 0;
            while (true)
            {
                size_t pos = s.find(sep, start);
                if (pos == std::string_view::npos)
                {
                    parts.push_back(s.substr(start));
                    break;
                }
                parts.push_back(s.substr(start, pos - start));
                start = pos + 1;
            }
            return parts;
        }

        inline std::string format_number(double d)
        {
            if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 1e15)
                return std::to_string(static_cast<int64_t>(d));

            char buf[64];
            auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{})
                return std::to_string(d);
            return std::string(buf, end);
        }

        inline bool is_null(cell_value const & c)
        {
            return std::holds_alternative<std::monostate>(c);
        }

        inline bool is_blank(cell_value const & c)
        {
            if (is_null(c))
                return true;
            if (auto s = std::get_if<std::string>(&c))
                return trim_sv(*s).empty();
            return false;
        }

        inline std::string stringify(cell_value const & c)
        {
            if (auto d = std::get_if<double>(&c))
                return format_number(*d);
            if (auto s = std::get_if<std::string>(&c))
                return *s;
            return {};
        }

        inline std::optional<int64_t> parse_integer(std::string_view sv)
        {
            auto s = trim_sv(sv);
            if (!s.empty() && s.front() == '+')
            {
                s.remove_prefix(1);
                if (!s.empty() && s.front() == '-')
                    return std::nullopt;
            }
            if (s.empty())
                return std::nullopt;

            int64_t v = 0;
            auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
            if (ec != std::errc{} || p != s.data() + s.size())
                return std::nullopt;
            return v;
        }

        inline std::optional<double> parse_decimal(std::string_view sv)
        {
            std::string s = trim(sv);
            if (s.empty())
                return std::nullopt;

            char* end = nullptr;
            double v = std::strtod(s.c_str(), &end);
            if (end != s.c_str() + s.size())
                return std::nullopt;
            return v;
        }

        // Strict: fractional numbers and non-numeric text are rejected.
        inline std::optional<int64_t> cell_to_integer(cell_value const & c)
        {
            if (auto d = std::get_if<double>(&c))
            {
                if (!std::isfinite(*d) || *d != std::trunc(*d) || std::fabs(*d) >= 9.2e18)
                    return std::nullopt;
                return static_cast<int64_t>(*d);
            }
            if (auto s = std::get_if<std::string>(&c))
                return parse_integer(*s);
            return std::nullopt;
        }

        inline value cell_to_json(cell_value const & c)
        {
            if (auto d = std::get_if<double>(&c))
            {
                if (std::isfinite(*d) && *d == std::trunc(*d) && std::fabs(*d) < 9.2e18)
                    return value(static_cast<int64_t>(*d));
                return value(*d);
            }
            if (auto s = std::get_if<std::string>(&c))
                return value(*s);
            return value(nullptr);
        }

        // Pads with Null or truncates to `count`; returns true when non-Null
        // content was dropped.
        inline bool align_cells(cell_row & row, size_t count)
        {
            bool dropped = false;
            if (row.size() > count)
            {
                dropped = std::any_of(row.begin() + static_cast<std::ptrdiff_t>(count), row.end(),
                    [](cell_value const & c) { return !is_blank(c); });
            }
            row.resize(count);
            return dropped;
        }

        inline cell_value const & cell_at(cell_row const & row, size_t index)
        {
            static const cell_value null_cell{};
            return index < row.size() ? row[index] : null_cell;
        }

        //----------------------------------------------------------------
        // Identifiers
        //----------------------------------------------------------------

        inline bool is_symbol_name(std::string_view s)
        {
            if (s.empty())
                return false;

            auto head = static_cast<unsigned char>(s.front());
            if (!(std::isalpha(head) || head == '_'))
                return false;

            return std::all_of(s.begin(), s.end(), [](char ch)
            {
                auto c = static_cast<unsigned char>(ch);
                return std::isalnum(c) || c == '_';
            });
        }

        // Keywords of the language the access classes are generated for.
        inline bool is_reserved_word(std::string_view s)
        {
            static const std::unordered_set<std::string_view> keywords =
            {
                "abstract", "as", "base", "bool", "break", "byte", "case", "catch",
                "char", "checked", "class", "const", "continue", "decimal", "default",
                "delegate", "do", "double", "else", "enum", "event", "explicit",
                "extern", "false", "finally", "fixed", "float", "for", "foreach",
                "goto", "if", "implicit", "in", "int", "interface", "internal", "is",
                "lock", "long", "namespace", "new", "null", "object", "operator",
                "out", "override", "params", "private", "protected", "public",
                "readonly", "ref", "return", "sbyte", "sealed", "short", "sizeof",
                "stackalloc", "static", "string", "struct", "switch", "this", "throw",
                "true", "try", "typeof", "uint", "ulong", "unchecked", "unsafe",
                "ushort", "using", "virtual", "void", "volatile", "while"
            };
            return keywords.count(s) != 0;
        }

        inline bool is_identifier(std::string_view s)
        {
            return is_symbol_name(s) && !is_reserved_word(s);
        }
    }

} // namespace sheetease

#endif // SHEETEASE_CORE_HPP
