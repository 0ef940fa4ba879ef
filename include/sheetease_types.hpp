// sheetease_types.hpp - SheetEase - Type Grammar
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Grammar of the type row:
//
//     int | float | bool | string          primitives (plus a few aliases)
//     list(P)                              one level, primitive element
//     dict(P, P)                           one level, primitive key and value
//     Some.Qualified.Name                  custom, resolved by the registry

#ifndef SHEETEASE_TYPES_HPP
#define SHEETEASE_TYPES_HPP

#include "sheetease_core.hpp"

#include <unordered_map>

namespace sheetease
{
//========================================================================
// Type descriptors
//========================================================================

    enum class primitive_type
    {
        integer,
        decimal,
        boolean,
        string
    };

    enum class type_kind
    {
        unresolved,
        primitive,
        list,
        map,
        custom
    };

    struct type_descriptor
    {
        type_kind      kind    = type_kind::unresolved;
        primitive_type element = primitive_type::string;   // primitive, list element
        primitive_type key     = primitive_type::string;   // map only
        primitive_type mapped  = primitive_type::string;   // map only
        std::string    custom_name;
        std::string    annotation;                          // as authored

        bool is_primitive(primitive_type t) const noexcept
        {
            return kind == type_kind::primitive && element == t;
        }

        bool is_container() const noexcept
        {
            return kind == type_kind::list || kind == type_kind::map;
        }

        // The primitive a scalar, a list element or a map value resolves to.
        std::optional<primitive_type> scalar() const noexcept
        {
            switch (kind)
            {
                case type_kind::primitive:
                case type_kind::list:
                    return element;
                case type_kind::map:
                    return mapped;
                default:
                    return std::nullopt;
            }
        }
    };

    inline type_descriptor make_primitive(primitive_type p)
    {
        type_descriptor t;
        t.kind    = type_kind::primitive;
        t.element = p;
        return t;
    }

//========================================================================
// Errors
//========================================================================

    enum class type_error_kind
    {
        malformed_annotation,
        conversion_failed,
        unknown_custom_type,
        custom_parse_failed
    };

    using type_error         = error<type_error_kind>;
    using type_context       = context<std::optional<type_descriptor>, type_error>;
    using conversion_context = context<value, type_error>;

//========================================================================
// Names
//========================================================================

    inline std::string to_string(primitive_type p)
    {
        switch (p)
        {
            case primitive_type::integer: return "int";
            case primitive_type::decimal: return "float";
            case primitive_type::boolean: return "bool";
            case primitive_type::string:  return "string";
        }
        return "string";
    }

    inline std::string to_string(type_descriptor const & t)
    {
        switch (t.kind)
        {
            case type_kind::primitive: return to_string(t.element);
            case type_kind::list:      return "list(" + to_string(t.element) + ")";
            case type_kind::map:       return "dict(" + to_string(t.key) + "," + to_string(t.mapped) + ")";
            case type_kind::custom:    return t.custom_name;
            case type_kind::unresolved: break;
        }
        return "<unresolved>";
    }

    inline std::optional<primitive_type> parse_primitive(std::string_view s)
    {
        static const std::unordered_map<std::string, primitive_type> names =
        {
            {"int",     primitive_type::integer},
            {"int32",   primitive_type::integer},
            {"integer", primitive_type::integer},
            {"float",   primitive_type::decimal},
            {"double",  primitive_type::decimal},
            {"bool",    primitive_type::boolean},
            {"boolean", primitive_type::boolean},
            {"str",     primitive_type::string},
            {"string",  primitive_type::string},
        };

        if (auto it = names.find(detail::to_lower(detail::trim_sv(s))); it != names.end())
            return it->second;
        return std::nullopt;
    }

//========================================================================
// Annotation parser
//========================================================================

    inline type_context parse_type(std::string_view annotation)
    {
        type_context out{};
        auto text = detail::trim_sv(annotation);

        auto fail = [&](std::string const & why) -> type_context &
        {
            out.errors.push_back({
                type_error_kind::malformed_annotation,
                severity::fatal,
                {},
                "type annotation '" + std::string(annotation) + "' " + why
            });
            return out;
        };

        if (text.empty())
            return fail("is empty");

        int depth = 0;
        for (char c : text)
        {
            if (c == '(') ++depth;
            if (c == ')') --depth;
            if (depth < 0)
                return fail("has unbalanced parentheses");
        }
        if (depth != 0)
            return fail("has unbalanced parentheses");

        type_descriptor t;
        t.annotation = std::string(text);

        if (auto open = text.find('('); open != std::string_view::npos)
        {
            if (text.back() != ')')
                return fail("has trailing characters after the container");

            auto head  = detail::to_lower(detail::trim_sv(text.substr(0, open)));
            auto inner = text.substr(open + 1, text.size() - open - 2);

            if (head == "list")
            {
                auto elem = parse_primitive(inner);
                if (!elem)
                    return fail("must have a primitive list element");

                t.kind    = type_kind::list;
                t.element = *elem;
                out.result = t;
                return out;
            }

            if (head == "dict")
            {
                auto parts = detail::split(inner, ',');
                if (parts.size() != 2)
                    return fail("must name exactly a key and a value type");

                auto k = parse_primitive(parts[0]);
                auto v = parse_primitive(parts[1]);
                if (!k || !v)
                    return fail("must have primitive key and value types");

                t.kind   = type_kind::map;
                t.key    = *k;
                t.mapped = *v;
                out.result = t;
                return out;
            }

            return fail("uses unknown container '" + head + "'");
        }

        if (auto p = parse_primitive(text))
        {
            t.kind    = type_kind::primitive;
            t.element = *p;
            out.result = t;
            return out;
        }

        if (text.find('.') != std::string_view::npos)
        {
            auto segments = detail::split(text, '.');
            bool valid = std::all_of(segments.begin(), segments.end(),
                [](std::string_view s) { return detail::is_symbol_name(s); });
            if (!valid)
                return fail("is not a valid qualified type name");

            t.kind        = type_kind::custom;
            t.custom_name = std::string(text);
            out.result = t;
            return out;
        }

        return fail("names an unknown type");
    }

//========================================================================
// Primitive conversion
//========================================================================

    namespace detail
    {
        inline conversion_context conversion_failure(source_location const & where, std::string message)
        {
            conversion_context out{};
            out.result = value(nullptr);
            out.errors.push_back({
                type_error_kind::conversion_failed,
                severity::recoverable,
                where,
                std::move(message)
            });
            return out;
        }

        inline bool is_true_literal(std::string_view s)
        {
            auto l = to_lower(trim_sv(s));
            return l == "1" || l == "true" || l == "yes";
        }

        // JSON object keys are strings; map keys use their converted form.
        inline std::string map_key_text(value const & k)
        {
            if (k.is_string())
                return k.get<std::string>();
            return k.dump();
        }
    }

    inline conversion_context convert_primitive(primitive_type t, cell_value const & raw, source_location const & where)
    {
        conversion_context out{};

        if (detail::is_null(raw))
        {
            switch (t)
            {
                case primitive_type::integer: out.result = value(int64_t{0}); break;
                case primitive_type::decimal: out.result = value(0.0);         break;
                case primitive_type::boolean: out.result = value(false);       break;
                case primitive_type::string:  out.result = value("");          break;
            }
            return out;
        }

        switch (t)
        {
            case primitive_type::integer:
            {
                if (auto d = std::get_if<double>(&raw))
                {
                    if (!std::isfinite(*d) || std::fabs(*d) >= 9.2e18)
                        return detail::conversion_failure(where, "number " + detail::format_number(*d) + " does not fit an int");
                    out.result = value(static_cast<int64_t>(std::trunc(*d)));
                    return out;
                }

                auto const & s = std::get<std::string>(raw);
                auto v = detail::parse_integer(s);
                if (!v)
                    return detail::conversion_failure(where, "'" + s + "' is not an int");
                out.result = value(*v);
                return out;
            }

            case primitive_type::decimal:
            {
                if (auto d = std::get_if<double>(&raw))
                {
                    out.result = value(*d);
                    return out;
                }

                auto const & s = std::get<std::string>(raw);
                auto v = detail::parse_decimal(s);
                if (!v)
                    return detail::conversion_failure(where, "'" + s + "' is not a float");
                out.result = value(*v);
                return out;
            }

            case primitive_type::boolean:
                out.result = value(detail::is_true_literal(detail::stringify(raw)));
                return out;

            case primitive_type::string:
                out.result = value(detail::stringify(raw));
                return out;
        }

        return detail::conversion_failure(where, "unsupported primitive");
    }

    inline conversion_context convert_list(primitive_type elem, cell_value const & raw, source_location const & where)
    {
        conversion_context out{};
        out.result = value::array();

        if (detail::is_null(raw))
            return out;

        if (std::holds_alternative<double>(raw))
        {
            auto single = convert_primitive(elem, raw, where);
            if (single.has_errors())
                return single;
            out.result.push_back(std::move(single.result));
            return out;
        }

        auto const & text = std::get<std::string>(raw);
        size_t position = 0;
        for (auto segment : detail::split(text, ','))
        {
            auto trimmed = detail::trim(segment);
            if (trimmed.empty())
                continue;

            ++position;
            auto item = convert_primitive(elem, cell_value{trimmed}, where);
            if (item.has_errors())
            {
                return detail::conversion_failure(where,
                    "element " + std::to_string(position) + " of list(" + to_string(elem) + "): " +
                    item.errors.front().message);
            }
            out.result.push_back(std::move(item.result));
        }

        return out;
    }

    inline conversion_context convert_map(primitive_type key, primitive_type mapped, cell_value const & raw, source_location const & where)
    {
        conversion_context out{};
        out.result = value::object();

        if (detail::is_null(raw))
            return out;

        auto text = detail::stringify(raw);
        for (auto line : detail::split(text, '\n'))
        {
            auto colon = line.find(':');
            if (colon == std::string_view::npos)
                continue;

            auto k = convert_primitive(key, cell_value{detail::trim(line.substr(0, colon))}, where);
            auto v = convert_primitive(mapped, cell_value{detail::trim(line.substr(colon + 1))}, where);
            if (k.has_errors() || v.has_errors())
            {
                auto const & cause = k.has_errors() ? k.errors.front().message : v.errors.front().message;
                return detail::conversion_failure(where,
                    "line '" + detail::trim(line) + "' of dict(" + to_string(key) + "," + to_string(mapped) + "): " + cause);
            }

            auto name = detail::map_key_text(k.result);
            if (out.result.contains(name))
                return detail::conversion_failure(where, "duplicate dict key '" + name + "'");

            out.result[name] = std::move(v.result);
        }

        return out;
    }

} // namespace sheetease

#endif // SHEETEASE_TYPES_HPP
