// sheetease_registry.hpp - SheetEase - Custom Type Registry
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SHEETEASE_REGISTRY_HPP
#define SHEETEASE_REGISTRY_HPP

#include "sheetease_types.hpp"

#include <exception>
#include <functional>
#include <map>

namespace sheetease
{
    enum class fallback_policy
    {
        structural,  // unregistered names become {type, raw, segments}
        reject       // unregistered names are errors
    };

//========================================================================
// custom_type_registry
//========================================================================

    // Populated once before a run. Every stage takes it by const reference,
    // so nothing can register types while tables are being built.
    class custom_type_registry
    {
    public:
        using parser = std::function<value(cell_value const &)>;

        explicit custom_type_registry(fallback_policy policy = fallback_policy::structural)
            : policy_(policy)
        {}

        custom_type_registry & add(std::string name, parser p)
        {
            parsers_[std::move(name)] = std::move(p);
            return *this;
        }

        bool contains(std::string_view name) const
        {
            return parsers_.find(name) != parsers_.end();
        }

        fallback_policy policy() const noexcept { return policy_; }

        std::vector<std::string> names() const
        {
            std::vector<std::string> out;
            out.reserve(parsers_.size());
            for (auto const & [name, _] : parsers_)
                out.push_back(name);
            return out;
        }

        conversion_context parse(std::string const & name, cell_value const & raw, source_location const & where) const;

    private:
        fallback_policy                              policy_;
        std::map<std::string, parser, std::less<>>   parsers_;
    };

//========================================================================
// Implementation
//========================================================================

    inline value structural_fallback(std::string const & name, cell_value const & raw)
    {
        value out = value::object();
        out["type"]     = name;
        out["raw"]      = detail::cell_to_json(raw);
        out["segments"] = value::array();

        if (!detail::is_null(raw))
        {
            for (auto segment : detail::split(detail::stringify(raw), '#'))
                out["segments"].push_back(detail::trim(segment));
        }

        return out;
    }

    inline conversion_context custom_type_registry::parse(std::string const & name, cell_value const & raw, source_location const & where) const
    {
        conversion_context out{};
        out.result = value(nullptr);

        auto it = parsers_.find(name);
        if (it == parsers_.end())
        {
            if (policy_ == fallback_policy::structural)
            {
                out.result = structural_fallback(name, raw);
                return out;
            }

            out.errors.push_back({
                type_error_kind::unknown_custom_type,
                severity::fatal,
                where,
                "custom type '" + name + "' is not registered (field '" + where.field + "', table '" + where.table + "')"
            });
            return out;
        }

        auto failed = [&](std::string const & reason)
        {
            out.result = value(nullptr);
            out.errors.push_back({
                type_error_kind::custom_parse_failed,
                severity::recoverable,
                where,
                "custom type '" + name + "' rejected '" + detail::stringify(raw) + "' (field '" +
                    where.field + "', table '" + where.table + "'): " + reason
            });
        };

        // Parsers are user code; nothing they throw may leave the library.
        try
        {
            out.result = it->second(raw);
        }
        catch (std::exception const & e)
        {
            failed(e.what());
        }
        catch (...)
        {
            failed("unknown exception");
        }

        return out;
    }

//========================================================================
// Full conversion (type grammar + registry dispatch)
//========================================================================

    inline conversion_context convert(
        type_descriptor const & type,
        cell_value const & raw,
        custom_type_registry const & registry,
        source_location const & where
    )
    {
        switch (type.kind)
        {
            case type_kind::primitive:
                return convert_primitive(type.element, raw, where);

            case type_kind::list:
                return convert_list(type.element, raw, where);

            case type_kind::map:
                return convert_map(type.key, type.mapped, raw, where);

            case type_kind::custom:
                return registry.parse(type.custom_name, raw, where);

            case type_kind::unresolved:
                break;
        }

        return detail::conversion_failure(where, "column type '" + type.annotation + "' is unresolved");
    }

} // namespace sheetease

#endif // SHEETEASE_REGISTRY_HPP
